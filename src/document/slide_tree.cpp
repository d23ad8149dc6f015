#include "document/slide_tree.hpp"
#include "core/inversion_config.hpp"
#include "document/document_error.hpp"
#include "document/xml_dom.hpp"
#include "logging/logger.hpp"
#include <set>

using Poco::AutoPtr;
using Poco::XML::Element;

namespace
{
    const std::set<std::string> FILL_ELEMENTS = {"noFill", "solidFill", "gradFill", "blipFill", "pattFill", "grpFill"};
    const std::set<std::string> COLOR_ELEMENTS = {"srgbClr", "schemeClr", "sysClr", "prstClr", "hslClr", "scrgbClr"};

    // Children that must follow the fill inside spPr and bgPr
    const std::set<std::string> AFTER_FILL_ELEMENTS = {"ln", "effectLst", "effectDag", "scene3d", "sp3d", "extLst"};

    Element *firstColorChild(const Element *fill)
    {
        for (Element *child : XmlDom::childElements(fill))
        {
            if (COLOR_ELEMENTS.count(XmlDom::localName(child)))
                return child;
        }
        return nullptr;
    }

    std::string shapeName(const Element *shape)
    {
        // Non-visual properties: p:nvSpPr, p:nvPicPr, p:nvGrpSpPr, ...
        for (Element *child : XmlDom::childElements(shape))
        {
            const std::string local = XmlDom::localName(child);
            if (local.compare(0, 2, "nv") == 0)
            {
                Element *properties = XmlDom::firstChild(child, "cNvPr");
                if (properties && !properties->getAttribute("name").empty())
                    return properties->getAttribute("name");
                if (properties && !properties->getAttribute("id").empty())
                    return "shape #" + properties->getAttribute("id");
            }
        }
        return "unnamed " + XmlDom::localName(shape);
    }
}

PaintKind PaintSlot::kind() const
{
    Element *fill = fillElement();
    if (!fill)
        return PaintKind::NONE;

    const std::string local = XmlDom::localName(fill);
    if (local == "noFill")
        return PaintKind::NO_FILL;
    if (local == "gradFill")
        return PaintKind::GRADIENT;
    if (local == "pattFill")
        return PaintKind::PATTERN;
    if (local == "blipFill")
        return PaintKind::PICTURE;
    if (local == "grpFill")
        return PaintKind::GROUP;

    Element *color = firstColorChild(fill);
    if (color && XmlDom::localName(color) == "srgbClr")
        return PaintKind::SOLID_RGB;
    return PaintKind::SOLID_THEME;
}

RgbColor PaintSlot::color() const
{
    Element *rgb = rgbElement();
    const std::string value = rgb->getAttribute("val");
    try
    {
        return RgbColor::fromHex(value);
    }
    catch (const ConfigError &)
    {
        throw DocumentError("Invalid srgbClr value '" + value + "'");
    }
}

void PaintSlot::setColor(const RgbColor &color)
{
    rgbElement()->setAttribute("val", color.toHex(false));
}

void PaintSlot::setSolidColor(const RgbColor &color)
{
    Element *existing = fillElement();
    Element *before = existing;
    if (!before)
    {
        for (Element *child : XmlDom::childElements(host_))
        {
            if (AFTER_FILL_ELEMENTS.count(XmlDom::localName(child)))
            {
                before = child;
                break;
            }
        }
    }

    Element *solid = XmlDom::insertChild(host_, before, XmlDom::DRAWINGML_NS, "a:solidFill");
    Element *rgb = XmlDom::appendChild(solid, XmlDom::DRAWINGML_NS, "a:srgbClr");
    rgb->setAttribute("val", color.toHex(false));

    if (existing)
    {
        host_->removeChild(existing);
    }
}

std::string PaintSlot::describe() const
{
    switch (kind())
    {
    case PaintKind::NONE:
        return "inherited fill";
    case PaintKind::NO_FILL:
        return "no fill";
    case PaintKind::SOLID_RGB:
        return "solid colour #" + rgbElement()->getAttribute("val");
    case PaintKind::SOLID_THEME:
    {
        Element *color = firstColorChild(fillElement());
        return color ? "theme colour (" + XmlDom::localName(color) + ")" : "solid fill without a colour";
    }
    case PaintKind::GRADIENT:
        return "gradient fill";
    case PaintKind::PATTERN:
        return "pattern fill";
    case PaintKind::PICTURE:
        return "picture fill";
    case PaintKind::GROUP:
        return "group fill";
    }
    return "unknown fill";
}

Element *PaintSlot::fillElement() const
{
    for (Element *child : XmlDom::childElements(host_))
    {
        if (FILL_ELEMENTS.count(XmlDom::localName(child)))
            return child;
    }
    return nullptr;
}

Element *PaintSlot::rgbElement() const
{
    Element *fill = fillElement();
    Element *color = fill && XmlDom::localName(fill) == "solidFill" ? firstColorChild(fill) : nullptr;
    if (!color || XmlDom::localName(color) != "srgbClr")
    {
        throw DocumentError("Fill is not a solid RGB colour: " + describe());
    }
    return color;
}

std::string PictureRef::embedId() const
{
    return XmlDom::prefixedAttribute(blip_, "embed");
}

std::string PictureRef::linkId() const
{
    return XmlDom::prefixedAttribute(blip_, "link");
}

void PictureRef::setEmbedId(const std::string &relationship_id)
{
    XmlDom::setPrefixedAttribute(blip_, "embed", relationship_id);
}

bool PictureRef::dropVectorAlternative()
{
    Element *extensions = XmlDom::firstChild(blip_, "extLst");
    if (!extensions)
    {
        return false;
    }

    bool removed = false;
    for (Element *extension : XmlDom::children(extensions, "ext"))
    {
        if (XmlDom::firstChild(extension, "svgBlip"))
        {
            extensions->removeChild(extension);
            removed = true;
        }
    }
    if (removed && XmlDom::childElements(extensions).empty())
    {
        blip_->removeChild(extensions);
    }
    return removed;
}

SlideTree SlideTree::parse(AutoPtr<Poco::XML::Document> document)
{
    SlideTree tree;
    tree.document_ = document;
    tree.common_slide_data_ = XmlDom::firstChild(document->documentElement(), "cSld");
    Element *shape_tree = XmlDom::firstChild(tree.common_slide_data_, "spTree");
    if (!shape_tree)
    {
        throw DocumentError("Slide has no shape tree (p:cSld/p:spTree)");
    }

    tree.collect(shape_tree, tree.roots_);
    Logger::trace("Parsed slide tree with " + std::to_string(tree.nodes_.size()) + " shapes");
    return tree;
}

SlideTree SlideTree::parse(const std::string &xml, const std::string &part_name)
{
    return parse(XmlDom::parse(xml, part_name));
}

size_t SlideTree::addNode(Element *element, ShapeKind kind)
{
    ShapeNode node;
    node.kind_ = kind;
    node.name_ = shapeName(element);

    Element *properties = XmlDom::firstChild(element, kind == ShapeKind::GROUP ? "grpSpPr" : "spPr");
    if (properties && kind != ShapeKind::GRAPHIC_FRAME)
    {
        node.fill_.emplace(properties);
        if (Element *line = XmlDom::firstChild(properties, "ln"))
        {
            node.line_.emplace(line);
        }
    }

    if (Element *body = XmlDom::firstChild(element, "txBody"))
    {
        for (Element *paragraph : XmlDom::children(body, "p"))
        {
            if (Element *defaults = XmlDom::path(paragraph, {"pPr", "defRPr"}))
            {
                node.text_runs_.emplace_back(defaults);
            }
            for (Element *run : XmlDom::childElements(paragraph))
            {
                const std::string local = XmlDom::localName(run);
                if (local == "endParaRPr")
                {
                    node.text_runs_.emplace_back(run);
                    continue;
                }
                if (local != "r" && local != "fld")
                    continue;
                if (Element *run_properties = XmlDom::firstChild(run, "rPr"))
                {
                    node.text_runs_.emplace_back(run_properties);
                }
            }
        }
    }

    if (kind == ShapeKind::PICTURE)
    {
        if (Element *blip = XmlDom::path(element, {"blipFill", "blip"}))
        {
            node.picture_.emplace(blip);
        }
    }

    nodes_.push_back(std::move(node));
    return nodes_.size() - 1;
}

void SlideTree::collect(Element *container, std::vector<size_t> &into)
{
    for (Element *child : XmlDom::childElements(container))
    {
        const std::string local = XmlDom::localName(child);
        if (local == "sp")
        {
            into.push_back(addNode(child, ShapeKind::SHAPE));
        }
        else if (local == "cxnSp")
        {
            into.push_back(addNode(child, ShapeKind::CONNECTOR));
        }
        else if (local == "pic")
        {
            into.push_back(addNode(child, ShapeKind::PICTURE));
        }
        else if (local == "graphicFrame")
        {
            into.push_back(addNode(child, ShapeKind::GRAPHIC_FRAME));
        }
        else if (local == "grpSp")
        {
            size_t index = addNode(child, ShapeKind::GROUP);
            std::vector<size_t> members;
            collect(child, members);
            nodes_[index].children_ = std::move(members);
            into.push_back(index);
        }
        else if (local == "AlternateContent")
        {
            // Both branches are edited so the slide looks the same whichever one renders
            for (Element *branch : XmlDom::childElements(child))
            {
                collect(branch, into);
            }
        }
    }
}

std::optional<PaintSlot> SlideTree::background() const
{
    if (Element *properties = XmlDom::path(common_slide_data_, {"bg", "bgPr"}))
    {
        return PaintSlot(properties);
    }
    return std::nullopt;
}

bool SlideTree::hasBackgroundReference() const
{
    return XmlDom::path(common_slide_data_, {"bg", "bgRef"}) != nullptr;
}

void SlideTree::forceBackground(const RgbColor &color)
{
    if (Element *existing = XmlDom::firstChild(common_slide_data_, "bg"))
    {
        common_slide_data_->removeChild(existing);
    }

    Poco::XML::Node *first = common_slide_data_->firstChild();
    Element *background = XmlDom::insertChild(common_slide_data_, first, XmlDom::PRESENTATIONML_NS, "p:bg");
    Element *properties = XmlDom::appendChild(background, XmlDom::PRESENTATIONML_NS, "p:bgPr");
    XmlDom::appendChild(properties, XmlDom::DRAWINGML_NS, "a:effectLst");
    PaintSlot(properties).setSolidColor(color);
}

std::string SlideTree::serialize() const
{
    return XmlDom::serialize(document_.get());
}
