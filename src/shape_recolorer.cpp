#include "core/shape_recolorer.hpp"
#include "core/contrast_validator.hpp"
#include "logging/logger.hpp"
#include <cstddef>
#include <exception>

ShapeRecolorer::ShapeRecolorer(const InversionConfig &config, PictureStore &pictures)
    : config_(config), pictures_(pictures)
{
}

RgbColor ShapeRecolorer::mapColor(const RgbColor &color) const
{
    return ContrastValidator::isLight(color) ? config_.lightTarget() : config_.darkTarget();
}

std::vector<std::string> ShapeRecolorer::recolorSlide(SlideTree &slide, DiagnosticsCollector &diagnostics)
{
    const size_t first_warning = diagnostics.size();

    recolorBackground(slide, diagnostics);
    for (size_t root : slide.roots())
    {
        recolorNode(slide, root, diagnostics);
    }

    const auto &all = diagnostics.warnings();
    return std::vector<std::string>(all.begin() + static_cast<std::ptrdiff_t>(first_warning), all.end());
}

void ShapeRecolorer::recolorNode(SlideTree &slide, size_t index, DiagnosticsCollector &diagnostics)
{
    // Children first; a group's own properties come last
    if (slide.node(index).isGroup())
    {
        for (size_t child : slide.node(index).children())
        {
            recolorNode(slide, child, diagnostics);
        }
    }

    ShapeNode &node = slide.node(index);
    DiagnosticsCollector::Scope scope(diagnostics, "Shape '" + node.name() + "': ");
    try
    {
        recolorAttributes(node, diagnostics);
    }
    catch (const std::exception &e)
    {
        Logger::debug("Shape '" + node.name() + "' failed: " + e.what());
        diagnostics.warn("could not be recoloured (" + std::string(e.what()) + ")");
    }
}

void ShapeRecolorer::recolorAttributes(ShapeNode &node, DiagnosticsCollector &diagnostics)
{
    if (node.hasFill())
    {
        recolorPaint(node.fill(), "fill", diagnostics);
    }
    if (node.hasLine())
    {
        recolorPaint(node.line(), "line", diagnostics);
    }
    if (node.hasTextRuns())
    {
        auto &runs = node.textRuns();
        for (size_t i = 0; i < runs.size(); ++i)
        {
            recolorPaint(runs[i], "text run " + std::to_string(i + 1), diagnostics);
        }
    }
    if (node.isPicture())
    {
        recolorPicture(node, diagnostics);
    }
}

void ShapeRecolorer::recolorPaint(PaintSlot &slot, const std::string &attribute, DiagnosticsCollector &diagnostics)
{
    switch (slot.kind())
    {
    case PaintKind::SOLID_RGB:
        slot.setColor(mapColor(slot.color()));
        break;
    case PaintKind::SOLID_THEME:
    case PaintKind::GRADIENT:
    case PaintKind::PATTERN:
    case PaintKind::PICTURE:
        diagnostics.warn(attribute + " uses " + slot.describe() + ", left unchanged");
        break;
    case PaintKind::NONE:
    case PaintKind::NO_FILL:
    case PaintKind::GROUP:
        break;
    }
}

void ShapeRecolorer::recolorPicture(ShapeNode &node, DiagnosticsCollector &diagnostics)
{
    if (!config_.invertImages())
    {
        return;
    }

    PictureRef &picture = node.picture();
    const std::string embed_id = picture.embedId();
    if (embed_id.empty())
    {
        if (!picture.linkId().empty())
        {
            diagnostics.warn("linked picture left unchanged");
        }
        return;
    }

    auto source = pictures_.loadPicture(embed_id);
    if (!source)
    {
        diagnostics.warn("picture data not found for relationship " + embed_id);
        return;
    }

    auto transformed = ImageTransformer::transform(*source, config_, diagnostics);
    if (!transformed)
    {
        return;
    }
    picture.setEmbedId(pictures_.storePicture(embed_id, *transformed));
    if (picture.dropVectorAlternative())
    {
        diagnostics.warn("vector version of picture replaced by recoloured raster");
    }
}

void ShapeRecolorer::recolorBackground(SlideTree &slide, DiagnosticsCollector &diagnostics)
{
    if (config_.forceSlideBackground())
    {
        slide.forceBackground(config_.backgroundColor());
        return;
    }

    auto background = slide.background();
    if (background)
    {
        try
        {
            recolorPaint(*background, "Background", diagnostics);
        }
        catch (const std::exception &e)
        {
            diagnostics.warn("Background could not be recoloured (" + std::string(e.what()) + ")");
        }
    }
    else if (slide.hasBackgroundReference())
    {
        diagnostics.warn("Background uses a theme style, left unchanged");
    }
}
