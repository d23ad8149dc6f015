#pragma once

#include "core/color.hpp"
#include <Poco/AutoPtr.h>
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Element.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief How a paintable attribute is filled
 */
enum class PaintKind
{
    NONE,        // no explicit fill, inherited from layout or theme
    NO_FILL,     // explicit a:noFill
    SOLID_RGB,   // a:solidFill/a:srgbClr, the only rewritable kind
    SOLID_THEME, // a:solidFill with schemeClr, sysClr, prstClr, hslClr or scrgbClr
    GRADIENT,
    PATTERN,
    PICTURE,
    GROUP // a:grpFill, takes the parent group's fill
};

/**
 * @brief One fill-bearing property element of a slide (a:spPr, a:ln, a:rPr,
 * p:bgPr, ...) viewed through its fill child.
 *
 * Holds a raw pointer into a DOM owned by the SlideTree.
 */
class PaintSlot
{
public:
    explicit PaintSlot(Poco::XML::Element *host) : host_(host) {}

    PaintKind kind() const;

    /**
     * @brief Current colour of a SOLID_RGB slot
     * @throws DocumentError if the slot is not SOLID_RGB or its value is malformed
     */
    RgbColor color() const;

    /**
     * @brief Rewrite the colour of a SOLID_RGB slot. Colour transform
     * children (alpha, lumMod, ...) are left in place.
     * @throws DocumentError if the slot is not SOLID_RGB
     */
    void setColor(const RgbColor &color);

    /**
     * @brief Replace whatever fill the host has with a solid RGB fill
     */
    void setSolidColor(const RgbColor &color);

    /**
     * @brief Human readable fill type, e.g. "gradient fill" or "theme colour (schemeClr)"
     */
    std::string describe() const;

    Poco::XML::Element *host() const { return host_; }

private:
    Poco::XML::Element *fillElement() const;
    Poco::XML::Element *rgbElement() const;

    Poco::XML::Element *host_;
};

/**
 * @brief Embedded picture of a p:pic shape (its a:blip element)
 */
class PictureRef
{
public:
    explicit PictureRef(Poco::XML::Element *blip) : blip_(blip) {}

    /// Relationship id of the embedded image part, empty for linked pictures
    std::string embedId() const;
    /// Relationship id of an externally linked image, empty if embedded
    std::string linkId() const;
    void setEmbedId(const std::string &relationship_id);

    /**
     * @brief Remove an asvg:svgBlip extension so the raster embed is what renders
     * @return true if one was removed
     */
    bool dropVectorAlternative();

private:
    Poco::XML::Element *blip_;
};

enum class ShapeKind
{
    SHAPE,        // p:sp
    CONNECTOR,    // p:cxnSp
    PICTURE,      // p:pic
    GROUP,        // p:grpSp
    GRAPHIC_FRAME // p:graphicFrame (tables, charts, diagrams); opaque
};

/**
 * @brief One node of a slide's shape tree.
 *
 * A closed set of variants exposed through capability accessors; callers
 * check hasX() before using X().
 */
class ShapeNode
{
public:
    ShapeKind kind() const { return kind_; }
    const std::string &name() const { return name_; }

    bool hasFill() const { return fill_.has_value(); }
    PaintSlot &fill() { return *fill_; }

    bool hasLine() const { return line_.has_value(); }
    PaintSlot &line() { return *line_; }

    bool hasTextRuns() const { return !text_runs_.empty(); }
    std::vector<PaintSlot> &textRuns() { return text_runs_; }

    bool isPicture() const { return picture_.has_value(); }
    PictureRef &picture() { return *picture_; }

    bool isGroup() const { return kind_ == ShapeKind::GROUP; }
    /// Arena indices of the group's direct children, in document order
    const std::vector<size_t> &children() const { return children_; }

private:
    friend class SlideTree;

    ShapeKind kind_ = ShapeKind::SHAPE;
    std::string name_;
    std::optional<PaintSlot> fill_;
    std::optional<PaintSlot> line_;
    std::vector<PaintSlot> text_runs_;
    std::optional<PictureRef> picture_;
    std::vector<size_t> children_;
};

/**
 * @brief Parsed shape tree of one slide part.
 *
 * Nodes live in an arena and refer to each other by index. The tree owns
 * the DOM its paint slots point into; serialize() writes the edited DOM back.
 */
class SlideTree
{
public:
    /**
     * @brief Build the tree of a slide document
     * @throws DocumentError if the document has no p:cSld/p:spTree
     */
    static SlideTree parse(Poco::AutoPtr<Poco::XML::Document> document);

    /**
     * @brief Parse and build from slide XML text
     * @throws DocumentError on malformed XML or a missing shape tree
     */
    static SlideTree parse(const std::string &xml, const std::string &part_name);

    const std::vector<size_t> &roots() const { return roots_; }
    ShapeNode &node(size_t index) { return nodes_.at(index); }
    const ShapeNode &node(size_t index) const { return nodes_.at(index); }
    size_t size() const { return nodes_.size(); }

    /**
     * @brief The slide's own background properties (p:bg/p:bgPr), if any
     */
    std::optional<PaintSlot> background() const;

    /**
     * @brief True if the background refers to a theme style (p:bg/p:bgRef)
     */
    bool hasBackgroundReference() const;

    /**
     * @brief Replace the slide background with an explicit solid colour
     */
    void forceBackground(const RgbColor &color);

    std::string serialize() const;

private:
    SlideTree() = default;

    size_t addNode(Poco::XML::Element *element, ShapeKind kind);
    void collect(Poco::XML::Element *container, std::vector<size_t> &into);

    Poco::AutoPtr<Poco::XML::Document> document_;
    Poco::XML::Element *common_slide_data_ = nullptr;
    std::vector<ShapeNode> nodes_;
    std::vector<size_t> roots_;
};
