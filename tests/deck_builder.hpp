#pragma once

#include "core/color.hpp"
#include "document/zip_container.hpp"
#include <Poco/Checksum.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Builds minimal but well-formed .pptx packages in memory for tests
 */
class DeckBuilder
{
public:
    static constexpr const char *NAMESPACES =
        " xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\""
        " xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\""
        " xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\"";

    /**
     * @brief Append a slide
     * @param shapes Shape elements placed inside p:spTree
     * @param background Optional p:bg element placed before the shape tree
     * @return Zero-based slide index
     */
    size_t addSlide(const std::string &shapes, const std::string &background = "")
    {
        slides_.push_back({shapes, background, {}});
        return slides_.size() - 1;
    }

    /// Add raw slide XML as is, e.g. to produce a slide without a shape tree
    size_t addRawSlide(const std::string &xml)
    {
        slides_.push_back({"", "", {}});
        slides_.back().raw = xml;
        return slides_.size() - 1;
    }

    /// Store bytes as ppt/media/<file_name>
    DeckBuilder &addMedia(const std::string &file_name, std::vector<uint8_t> data)
    {
        media_.emplace_back(file_name, std::move(data));
        return *this;
    }

    /// Relate a slide to a media file with the given relationship id
    DeckBuilder &linkMedia(size_t slide, const std::string &relationship_id, const std::string &file_name)
    {
        slides_.at(slide).images.emplace_back(relationship_id, file_name);
        return *this;
    }

    /// Leave p:sldIdLst out of presentation.xml
    DeckBuilder &withoutSlideList()
    {
        slide_list_ = false;
        return *this;
    }

    std::vector<uint8_t> build() const
    {
        std::vector<ZipEntry> entries;
        entries.emplace_back("[Content_Types].xml", bytes(contentTypes()));
        entries.emplace_back("_rels/.rels", bytes(std::string(XML_DECL) +
                                                  "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
                                                  "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" Target=\"ppt/presentation.xml\"/>"
                                                  "</Relationships>"));
        entries.emplace_back("ppt/presentation.xml", bytes(presentation()));
        entries.emplace_back("ppt/_rels/presentation.xml.rels", bytes(presentationRels()));

        for (size_t i = 0; i < slides_.size(); ++i)
        {
            const std::string number = std::to_string(i + 1);
            entries.emplace_back("ppt/slides/slide" + number + ".xml", bytes(slideXml(slides_[i])));
            if (!slides_[i].images.empty())
            {
                std::string rels = std::string(XML_DECL) +
                                   "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
                for (const auto &image : slides_[i].images)
                {
                    rels += "<Relationship Id=\"" + image.first +
                            "\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/image\""
                            " Target=\"../media/" + image.second + "\"/>";
                }
                rels += "</Relationships>";
                entries.emplace_back("ppt/slides/_rels/slide" + number + ".xml.rels", bytes(rels));
            }
        }

        for (const auto &media : media_)
        {
            entries.emplace_back("ppt/media/" + media.first, media.second);
        }
        return ZipContainer::write(entries);
    }

    // Fill snippets

    static std::string solidFill(const std::string &hex)
    {
        return "<a:solidFill><a:srgbClr val=\"" + hex + "\"/></a:solidFill>";
    }

    static std::string schemeFill(const std::string &scheme)
    {
        return "<a:solidFill><a:schemeClr val=\"" + scheme + "\"/></a:solidFill>";
    }

    static std::string gradientFill()
    {
        return "<a:gradFill><a:gsLst>"
               "<a:gs pos=\"0\"><a:srgbClr val=\"FF0000\"/></a:gs>"
               "<a:gs pos=\"100000\"><a:srgbClr val=\"0000FF\"/></a:gs>"
               "</a:gsLst><a:lin ang=\"0\" scaled=\"1\"/></a:gradFill>";
    }

    static std::string noFill() { return "<a:noFill/>"; }

    // Shape snippets

    /**
     * @param fill Fill element inside p:spPr (empty for an inherited fill)
     * @param line Fill element inside a:ln (no outline if empty)
     * @param run_fill Fill inside the a:rPr of one text run (no text body if empty)
     */
    static std::string shape(int id, const std::string &name, const std::string &fill,
                             const std::string &line = "", const std::string &run_fill = "")
    {
        std::string xml = "<p:sp><p:nvSpPr><p:cNvPr id=\"" + std::to_string(id) + "\" name=\"" + name +
                          "\"/><p:cNvSpPr/><p:nvPr/></p:nvSpPr><p:spPr>"
                          "<a:xfrm><a:off x=\"0\" y=\"0\"/><a:ext cx=\"914400\" cy=\"914400\"/></a:xfrm>"
                          "<a:prstGeom prst=\"rect\"><a:avLst/></a:prstGeom>" +
                          fill;
        if (!line.empty())
        {
            xml += "<a:ln w=\"12700\">" + line + "</a:ln>";
        }
        xml += "</p:spPr>";
        if (!run_fill.empty())
        {
            xml += "<p:txBody><a:bodyPr/><a:lstStyle/><a:p><a:r><a:rPr lang=\"en-US\" dirty=\"0\">" + run_fill +
                   "</a:rPr><a:t>Hello</a:t></a:r></a:p></p:txBody>";
        }
        return xml + "</p:sp>";
    }

    static std::string picture(int id, const std::string &name, const std::string &relationship_id, bool linked = false)
    {
        return "<p:pic><p:nvPicPr><p:cNvPr id=\"" + std::to_string(id) + "\" name=\"" + name +
               "\"/><p:cNvPicPr/><p:nvPr/></p:nvPicPr><p:blipFill><a:blip " +
               (linked ? "r:link=\"" : "r:embed=\"") + relationship_id +
               "\"/><a:stretch><a:fillRect/></a:stretch></p:blipFill>"
               "<p:spPr><a:prstGeom prst=\"rect\"><a:avLst/></a:prstGeom></p:spPr></p:pic>";
    }

    static std::string group(int id, const std::string &name, const std::string &fill, const std::string &children)
    {
        return "<p:grpSp><p:nvGrpSpPr><p:cNvPr id=\"" + std::to_string(id) + "\" name=\"" + name +
               "\"/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr><p:grpSpPr>" + fill + "</p:grpSpPr>" +
               children + "</p:grpSp>";
    }

    static std::string background(const std::string &fill)
    {
        return "<p:bg><p:bgPr>" + fill + "<a:effectLst/></p:bgPr></p:bg>";
    }

    static std::string backgroundReference()
    {
        return "<p:bg><p:bgRef idx=\"1001\"><a:schemeClr val=\"bg1\"/></p:bgRef></p:bg>";
    }

    static std::string slideXml(const std::string &shapes, const std::string &background = "")
    {
        return std::string(XML_DECL) + "<p:sld" + NAMESPACES + "><p:cSld>" + background +
               "<p:spTree><p:nvGrpSpPr><p:cNvPr id=\"1\" name=\"\"/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>"
               "<p:grpSpPr/>" +
               shapes + "</p:spTree></p:cSld><p:clrMapOvr><a:masterClrMapping/></p:clrMapOvr></p:sld>";
    }

    // Images

    /**
     * @brief Encode a solid image; alpha below 255 produces a BGRA PNG
     */
    static std::vector<uint8_t> solidImage(int width, int height, const RgbColor &color,
                                           int alpha = 255, const std::string &extension = ".png")
    {
        cv::Mat image;
        if (alpha == 255)
        {
            image = cv::Mat(height, width, CV_8UC3, cv::Scalar(color.b, color.g, color.r));
        }
        else
        {
            image = cv::Mat(height, width, CV_8UC4, cv::Scalar(color.b, color.g, color.r, alpha));
        }
        std::vector<uchar> encoded;
        cv::imencode(extension, image, encoded);
        return std::vector<uint8_t>(encoded.begin(), encoded.end());
    }

    static cv::Mat decodeImage(const std::vector<uint8_t> &data)
    {
        return cv::imdecode(cv::Mat(1, static_cast<int>(data.size()), CV_8UC1,
                                    const_cast<uint8_t *>(data.data())),
                            cv::IMREAD_UNCHANGED);
    }

    static std::vector<uint8_t> bytes(const std::string &text)
    {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    /**
     * @brief Store-only zip written byte by byte. Entry names go in verbatim,
     * including ones a zip writer would refuse (e.g. "../deck.pptx").
     */
    static std::vector<uint8_t> storedZip(const std::vector<ZipEntry> &entries)
    {
        std::vector<uint8_t> out;
        std::vector<uint8_t> directory;
        const uint16_t dos_date = (0 << 9) | (1 << 5) | 1; // 1980-01-01

        for (const auto &entry : entries)
        {
            Poco::Checksum crc(Poco::Checksum::TYPE_CRC32);
            if (!entry.data.empty())
            {
                crc.update(reinterpret_cast<const char *>(entry.data.data()), static_cast<unsigned>(entry.data.size()));
            }
            const auto size = static_cast<uint32_t>(entry.data.size());
            const auto name_length = static_cast<uint16_t>(entry.path.size());
            const auto offset = static_cast<uint32_t>(out.size());

            put32(out, 0x04034b50);
            put16(out, 20);
            put16(out, 0);
            put16(out, 0);
            put16(out, 0);
            put16(out, dos_date);
            put32(out, crc.checksum());
            put32(out, size);
            put32(out, size);
            put16(out, name_length);
            put16(out, 0);
            out.insert(out.end(), entry.path.begin(), entry.path.end());
            out.insert(out.end(), entry.data.begin(), entry.data.end());

            put32(directory, 0x02014b50);
            put16(directory, 20);
            put16(directory, 20);
            put16(directory, 0);
            put16(directory, 0);
            put16(directory, 0);
            put16(directory, dos_date);
            put32(directory, crc.checksum());
            put32(directory, size);
            put32(directory, size);
            put16(directory, name_length);
            put16(directory, 0);
            put16(directory, 0);
            put16(directory, 0);
            put16(directory, 0);
            put32(directory, 0);
            put32(directory, offset);
            directory.insert(directory.end(), entry.path.begin(), entry.path.end());
        }

        const auto directory_offset = static_cast<uint32_t>(out.size());
        out.insert(out.end(), directory.begin(), directory.end());
        put32(out, 0x06054b50);
        put16(out, 0);
        put16(out, 0);
        put16(out, static_cast<uint16_t>(entries.size()));
        put16(out, static_cast<uint16_t>(entries.size()));
        put32(out, static_cast<uint32_t>(directory.size()));
        put32(out, directory_offset);
        put16(out, 0);
        return out;
    }

private:
    static void put16(std::vector<uint8_t> &out, uint16_t value)
    {
        out.push_back(static_cast<uint8_t>(value & 0xFF));
        out.push_back(static_cast<uint8_t>(value >> 8));
    }

    static void put32(std::vector<uint8_t> &out, uint32_t value)
    {
        put16(out, static_cast<uint16_t>(value & 0xFFFF));
        put16(out, static_cast<uint16_t>(value >> 16));
    }

    static constexpr const char *XML_DECL = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>";

    struct Slide
    {
        std::string shapes;
        std::string background;
        std::vector<std::pair<std::string, std::string>> images;
        std::string raw;
    };

    std::string contentTypes() const
    {
        std::string xml = std::string(XML_DECL) +
                          "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
                          "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
                          "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
                          "<Default Extension=\"png\" ContentType=\"image/png\"/>"
                          "<Override PartName=\"/ppt/presentation.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.presentationml.presentation.main+xml\"/>";
        for (size_t i = 0; i < slides_.size(); ++i)
        {
            xml += "<Override PartName=\"/ppt/slides/slide" + std::to_string(i + 1) +
                   ".xml\" ContentType=\"application/vnd.openxmlformats-officedocument.presentationml.slide+xml\"/>";
        }
        return xml + "</Types>";
    }

    std::string presentation() const
    {
        std::string xml = std::string(XML_DECL) + "<p:presentation" + NAMESPACES + ">";
        if (slide_list_ && !slides_.empty())
        {
            xml += "<p:sldIdLst>";
            for (size_t i = 0; i < slides_.size(); ++i)
            {
                xml += "<p:sldId id=\"" + std::to_string(256 + i) + "\" r:id=\"rId" + std::to_string(i + 2) + "\"/>";
            }
            xml += "</p:sldIdLst>";
        }
        return xml + "<p:sldSz cx=\"12192000\" cy=\"6858000\"/><p:notesSz cx=\"6858000\" cy=\"9144000\"/></p:presentation>";
    }

    std::string presentationRels() const
    {
        std::string xml = std::string(XML_DECL) +
                          "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
        for (size_t i = 0; i < slides_.size(); ++i)
        {
            xml += "<Relationship Id=\"rId" + std::to_string(i + 2) +
                   "\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/slide\""
                   " Target=\"slides/slide" + std::to_string(i + 1) + ".xml\"/>";
        }
        return xml + "</Relationships>";
    }

    static std::string slideXml(const Slide &slide)
    {
        return slide.raw.empty() ? slideXml(slide.shapes, slide.background) : slide.raw;
    }

    std::vector<Slide> slides_;
    std::vector<std::pair<std::string, std::vector<uint8_t>>> media_;
    bool slide_list_ = true;
};
