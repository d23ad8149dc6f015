#pragma once

#include "core/diagnostics.hpp"
#include "core/image_transformer.hpp"
#include "core/inversion_config.hpp"
#include "document/slide_tree.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Access to the image parts a slide's pictures refer to
 */
class PictureStore
{
public:
    virtual ~PictureStore() = default;

    /**
     * @brief Bytes of the image a relationship id points at
     * @return std::nullopt if the id does not resolve to an image part
     */
    virtual std::optional<std::vector<uint8_t>> loadPicture(const std::string &relationship_id) = 0;

    /**
     * @brief Store a replacement image next to the original
     * @return Relationship id the picture should refer to from now on
     */
    virtual std::string storePicture(const std::string &relationship_id, const TransformedImage &image) = 0;
};

/**
 * @brief Rewrites the explicit colours of one slide.
 *
 * Solid RGB fills, outlines and text run colours are mapped by polarity:
 * light colours to the foreground colour, dark colours to the background
 * colour. Gradient, pattern, picture and theme colours are left as they are
 * with one warning each. Pictures are handed to the ImageTransformer.
 */
class ShapeRecolorer
{
public:
    ShapeRecolorer(const InversionConfig &config, PictureStore &pictures);

    /**
     * @brief Recolour every shape of a slide, groups in post-order
     * @param slide Parsed slide, edited in place
     * @param diagnostics Collector for the owning document
     * @return The warnings added while processing this slide, in order
     */
    std::vector<std::string> recolorSlide(SlideTree &slide, DiagnosticsCollector &diagnostics);

    /**
     * @brief Polarity-preserving target for an explicit colour
     */
    RgbColor mapColor(const RgbColor &color) const;

private:
    void recolorNode(SlideTree &slide, size_t index, DiagnosticsCollector &diagnostics);
    void recolorAttributes(ShapeNode &node, DiagnosticsCollector &diagnostics);
    void recolorPaint(PaintSlot &slot, const std::string &attribute, DiagnosticsCollector &diagnostics);
    void recolorPicture(ShapeNode &node, DiagnosticsCollector &diagnostics);
    void recolorBackground(SlideTree &slide, DiagnosticsCollector &diagnostics);

    const InversionConfig &config_;
    PictureStore &pictures_;
};
