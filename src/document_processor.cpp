#include "core/document_processor.hpp"
#include "core/diagnostics.hpp"
#include "core/shape_recolorer.hpp"
#include "document/document_error.hpp"
#include "document/pptx_package.hpp"
#include "document/slide_tree.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <opencv2/core.hpp>
#include <chrono>
#include <map>

namespace
{
    /**
     * Image parts of one slide. Replacements are added as new media parts
     * with a new relationship so other slides sharing the original keep it.
     */
    class SlidePictureStore : public PictureStore
    {
    public:
        SlidePictureStore(PptxPackage &package, const std::string &slide_part)
            : package_(package), slide_part_(slide_part) {}

        std::optional<std::vector<uint8_t>> loadPicture(const std::string &relationship_id) override
        {
            auto target = package_.resolveTarget(slide_part_, relationship_id);
            if (!target || !package_.hasPart(*target))
            {
                return std::nullopt;
            }
            return package_.partData(*target);
        }

        std::string storePicture(const std::string &relationship_id, const TransformedImage &image) override
        {
            auto known = replaced_.find(relationship_id);
            if (known != replaced_.end())
            {
                return known->second;
            }

            std::string stem = "image";
            if (auto source = package_.resolveTarget(slide_part_, relationship_id))
            {
                auto slash = source->rfind('/');
                stem = source->substr(slash == std::string::npos ? 0 : slash + 1);
                auto dot = stem.rfind('.');
                if (dot != std::string::npos)
                    stem.erase(dot);
            }

            const std::string part = package_.uniquePartName("ppt/media", stem + "_recolored", image.extension());
            package_.setPart(part, image.data);
            package_.ensureDefaultContentType(image.extension(), image.contentType());
            const std::string new_id = package_.addRelationship(slide_part_, PptxPackage::IMAGE_RELATIONSHIP, part);

            replaced_[relationship_id] = new_id;
            return new_id;
        }

    private:
        PptxPackage &package_;
        std::string slide_part_;
        std::map<std::string, std::string> replaced_;
    };

    long long elapsedMs(std::chrono::steady_clock::time_point start)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    }

    ProcessingResult failed(const std::string &name, DiagnosticsCollector &diagnostics, const std::string &reason,
                            std::chrono::steady_clock::time_point start)
    {
        Logger::error("Failed to process " + name + ": " + reason);
        ProcessingResult result(name, false);
        result.warnings = diagnostics.take();
        result.warnings.push_back(reason);
        result.processing_time_ms = elapsedMs(start);
        return result;
    }
}

ProcessingResult DocumentProcessor::processOne(const std::vector<uint8_t> &bytes,
                                               const std::string &name,
                                               const InversionConfig &config)
{
    const auto start = std::chrono::steady_clock::now();
    DiagnosticsCollector diagnostics;
    Logger::debug("Processing " + name + " (" + std::to_string(bytes.size()) + " bytes)");

    try
    {
        PptxPackage package = PptxPackage::load(bytes);
        const auto slides = package.slidePartNames();
        if (slides.empty())
        {
            diagnostics.warn("Presentation has no slides");
        }

        for (size_t i = 0; i < slides.size(); ++i)
        {
            const std::string &part = slides[i];
            DiagnosticsCollector::Scope scope(diagnostics, "Slide " + std::to_string(i + 1) + ": ");
            try
            {
                SlideTree tree = SlideTree::parse(package.partText(part), part);
                SlidePictureStore pictures(package, part);
                ShapeRecolorer recolorer(config, pictures);
                recolorer.recolorSlide(tree, diagnostics);
                package.setPartText(part, tree.serialize());
            }
            catch (const DocumentError &e)
            {
                // The slide keeps its original XML
                diagnostics.warn("could not be processed (" + std::string(e.what()) + ")");
            }
        }

        ProcessingResult result(name, true);
        result.output_bytes = package.save();
        result.warnings = diagnostics.take();
        result.processing_time_ms = elapsedMs(start);
        Logger::info("Processed " + name + ": " + std::to_string(slides.size()) + " slides, " +
                     std::to_string(result.warnings.size()) + " warnings, " +
                     std::to_string(result.processing_time_ms) + " ms");
        return result;
    }
    catch (const DocumentError &e)
    {
        return failed(name, diagnostics, "Could not read presentation: " + std::string(e.what()), start);
    }
    catch (const Poco::Exception &e)
    {
        return failed(name, diagnostics, "Could not read presentation: " + e.displayText(), start);
    }
    catch (const cv::Exception &e)
    {
        return failed(name, diagnostics, "Image library error: " + std::string(e.what()), start);
    }
    catch (const std::exception &e)
    {
        return failed(name, diagnostics, "Unexpected error: " + std::string(e.what()), start);
    }
}

ProcessingResult DocumentProcessor::processSerialized(const std::vector<uint8_t> &bytes,
                                                      const std::string &name,
                                                      const SerializedConfig &config)
{
    try
    {
        return processOne(bytes, name, config.decode());
    }
    catch (const ConfigError &e)
    {
        return ProcessingResult::failure(name, "Invalid worker configuration: " + std::string(e.what()));
    }
}
