#include "document/pptx_package.hpp"
#include "document/document_error.hpp"
#include "document/xml_dom.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

using Poco::AutoPtr;
using Poco::XML::Element;

const std::string PptxPackage::CONTENT_TYPES_PART = "[Content_Types].xml";
const std::string PptxPackage::PRESENTATION_PART = "ppt/presentation.xml";
const std::string PptxPackage::IMAGE_RELATIONSHIP = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/image";
const std::string PptxPackage::SLIDE_RELATIONSHIP = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slide";

namespace
{
    const std::string PACKAGE_RELATIONSHIPS_NS = "http://schemas.openxmlformats.org/package/2006/relationships";

    std::string directoryOf(const std::string &part)
    {
        auto slash = part.rfind('/');
        return slash == std::string::npos ? "" : part.substr(0, slash);
    }

    std::vector<std::string> splitPath(const std::string &path)
    {
        std::vector<std::string> segments;
        size_t start = 0;
        while (start <= path.size())
        {
            auto slash = path.find('/', start);
            if (slash == std::string::npos)
                slash = path.size();
            if (slash > start)
                segments.push_back(path.substr(start, slash - start));
            start = slash + 1;
        }
        return segments;
    }

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

PptxPackage PptxPackage::load(const std::vector<uint8_t> &bytes)
{
    PptxPackage package;
    package.parts_ = ZipContainer::read(bytes);
    for (size_t i = 0; i < package.parts_.size(); ++i)
    {
        package.index_[package.parts_[i].path] = i;
    }

    if (!package.hasPart(CONTENT_TYPES_PART))
    {
        throw DocumentError("Not an Office Open XML package: missing " + CONTENT_TYPES_PART);
    }
    if (!package.hasPart(PRESENTATION_PART))
    {
        throw DocumentError("Not a presentation: missing " + PRESENTATION_PART);
    }

    Logger::debug("Loaded package with " + std::to_string(package.parts_.size()) + " parts");
    return package;
}

std::vector<uint8_t> PptxPackage::save() const
{
    return ZipContainer::write(parts_);
}

bool PptxPackage::hasPart(const std::string &name) const
{
    return index_.find(name) != index_.end();
}

const std::vector<uint8_t> &PptxPackage::partData(const std::string &name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
    {
        throw DocumentError("Missing package part: " + name);
    }
    return parts_[it->second].data;
}

std::string PptxPackage::partText(const std::string &name) const
{
    const auto &data = partData(name);
    return std::string(data.begin(), data.end());
}

void PptxPackage::setPart(const std::string &name, std::vector<uint8_t> data)
{
    auto it = index_.find(name);
    if (it != index_.end())
    {
        parts_[it->second].data = std::move(data);
        return;
    }
    index_[name] = parts_.size();
    parts_.emplace_back(name, std::move(data));
}

void PptxPackage::setPartText(const std::string &name, const std::string &text)
{
    setPart(name, std::vector<uint8_t>(text.begin(), text.end()));
}

std::vector<std::string> PptxPackage::partNames() const
{
    std::vector<std::string> names;
    names.reserve(parts_.size());
    for (const auto &part : parts_)
    {
        names.push_back(part.path);
    }
    return names;
}

std::vector<std::string> PptxPackage::slidePartNames() const
{
    std::vector<std::string> slides;
    try
    {
        AutoPtr<Poco::XML::Document> presentation = XmlDom::parse(partText(PRESENTATION_PART), PRESENTATION_PART);
        Element *list = XmlDom::firstChild(presentation->documentElement(), "sldIdLst");
        for (Element *slide_id : XmlDom::children(list, "sldId"))
        {
            auto target = resolveTarget(PRESENTATION_PART, XmlDom::prefixedAttribute(slide_id, "id"));
            if (target && hasPart(*target))
            {
                slides.push_back(*target);
            }
            else
            {
                Logger::warn("Slide id list references a missing slide part");
            }
        }
        if (!slides.empty())
        {
            return slides;
        }
    }
    catch (const DocumentError &e)
    {
        Logger::warn("Falling back to slide part numbering: " + std::string(e.what()));
    }

    // Fallback: ppt/slides/slideN.xml in numeric order
    static const std::regex slide_pattern(R"(^ppt/slides/slide(\d+)\.xml$)");
    std::vector<std::pair<long, std::string>> numbered;
    for (const auto &part : parts_)
    {
        std::smatch match;
        if (std::regex_match(part.path, match, slide_pattern))
        {
            numbered.emplace_back(std::stol(match[1].str()), part.path);
        }
    }
    std::sort(numbered.begin(), numbered.end());
    slides.clear();
    for (const auto &entry : numbered)
    {
        slides.push_back(entry.second);
    }
    return slides;
}

std::vector<Relationship> PptxPackage::relationships(const std::string &source_part) const
{
    std::vector<Relationship> out;
    const std::string rels_part = relationshipsPartFor(source_part);
    if (!hasPart(rels_part))
    {
        return out;
    }

    AutoPtr<Poco::XML::Document> rels = XmlDom::parse(partText(rels_part), rels_part);
    for (Element *element : XmlDom::children(rels->documentElement(), "Relationship"))
    {
        Relationship relationship;
        relationship.id = element->getAttribute("Id");
        relationship.type = element->getAttribute("Type");
        relationship.target = element->getAttribute("Target");
        relationship.external = element->getAttribute("TargetMode") == "External";
        out.push_back(relationship);
    }
    return out;
}

std::optional<std::string> PptxPackage::resolveTarget(const std::string &source_part, const std::string &relationship_id) const
{
    if (relationship_id.empty())
    {
        return std::nullopt;
    }
    for (const auto &relationship : relationships(source_part))
    {
        if (relationship.id == relationship_id)
        {
            if (relationship.external)
                return std::nullopt;
            return resolvePath(source_part, relationship.target);
        }
    }
    return std::nullopt;
}

std::string PptxPackage::addRelationship(const std::string &source_part, const std::string &type, const std::string &target_part)
{
    const std::string rels_part = relationshipsPartFor(source_part);
    std::string xml = hasPart(rels_part)
                          ? partText(rels_part)
                          : "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
                            "<Relationships xmlns=\"" + PACKAGE_RELATIONSHIPS_NS + "\"/>";

    AutoPtr<Poco::XML::Document> rels = XmlDom::parse(xml, rels_part);
    Element *root = rels->documentElement();

    long highest = 0;
    static const std::regex id_pattern(R"(^rId(\d+)$)");
    for (Element *element : XmlDom::children(root, "Relationship"))
    {
        std::smatch match;
        const std::string id = element->getAttribute("Id");
        if (std::regex_match(id, match, id_pattern))
        {
            highest = std::max(highest, std::stol(match[1].str()));
        }
    }

    const std::string new_id = "rId" + std::to_string(highest + 1);
    Element *relationship = XmlDom::appendChild(root, root->namespaceURI(), "Relationship");
    relationship->setAttribute("Id", new_id);
    relationship->setAttribute("Type", type);
    relationship->setAttribute("Target", relativePath(source_part, target_part));

    setPartText(rels_part, XmlDom::serialize(rels));
    return new_id;
}

void PptxPackage::ensureDefaultContentType(const std::string &extension, const std::string &content_type)
{
    AutoPtr<Poco::XML::Document> types = XmlDom::parse(partText(CONTENT_TYPES_PART), CONTENT_TYPES_PART);
    Element *root = types->documentElement();

    const std::string wanted = toLower(extension);
    for (Element *element : XmlDom::children(root, "Default"))
    {
        if (toLower(element->getAttribute("Extension")) == wanted)
        {
            return;
        }
    }

    // Defaults are conventionally listed before Overrides
    Element *first_override = XmlDom::firstChild(root, "Override");
    Element *entry = XmlDom::insertChild(root, first_override, root->namespaceURI(), "Default");
    entry->setAttribute("Extension", extension);
    entry->setAttribute("ContentType", content_type);
    setPartText(CONTENT_TYPES_PART, XmlDom::serialize(types));
}

std::string PptxPackage::uniquePartName(const std::string &directory, const std::string &stem, const std::string &extension) const
{
    for (int n = 1;; ++n)
    {
        std::string candidate = directory + "/" + stem + std::to_string(n) + "." + extension;
        if (!hasPart(candidate))
        {
            return candidate;
        }
    }
}

std::string PptxPackage::relationshipsPartFor(const std::string &part)
{
    const std::string dir = directoryOf(part);
    const std::string file = part.substr(dir.empty() ? 0 : dir.size() + 1);
    return (dir.empty() ? "" : dir + "/") + "_rels/" + file + ".rels";
}

std::string PptxPackage::resolvePath(const std::string &source_part, const std::string &target)
{
    std::vector<std::string> segments;
    if (target.empty() || target[0] != '/')
    {
        segments = splitPath(directoryOf(source_part));
    }
    for (const auto &segment : splitPath(target))
    {
        if (segment == ".")
            continue;
        if (segment == "..")
        {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string resolved;
    for (const auto &segment : segments)
    {
        if (!resolved.empty())
            resolved += "/";
        resolved += segment;
    }
    return resolved;
}

std::string PptxPackage::relativePath(const std::string &source_part, const std::string &target_part)
{
    const auto from = splitPath(directoryOf(source_part));
    const auto to = splitPath(target_part);

    size_t common = 0;
    while (common < from.size() && common + 1 < to.size() && from[common] == to[common])
    {
        ++common;
    }

    std::string relative;
    for (size_t i = common; i < from.size(); ++i)
    {
        relative += "../";
    }
    for (size_t i = common; i < to.size(); ++i)
    {
        relative += to[i];
        if (i + 1 < to.size())
            relative += "/";
    }
    return relative;
}
