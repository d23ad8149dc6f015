#pragma once

#include "core/color.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Raised for malformed colours, out-of-range values or undecodable
 * serialized configuration. Fatal to the whole batch call.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Recolouring settings shared by every document of a batch.
 *
 * Immutable once constructed; construct through the constructor or
 * fromHex() so the value ranges are checked.
 */
class InversionConfig
{
public:
    static constexpr int MIN_IMAGE_QUALITY = 1;
    static constexpr int MAX_IMAGE_QUALITY = 100;
    static constexpr int DEFAULT_IMAGE_QUALITY = 85;

    InversionConfig();
    InversionConfig(const RgbColor &background_color,
                    const RgbColor &foreground_color,
                    bool invert_images = true,
                    int image_quality = DEFAULT_IMAGE_QUALITY,
                    const std::string &file_suffix = "(inverted)",
                    const std::string &output_folder = "Inverted Presentations",
                    bool force_slide_background = false);

    /**
     * @brief Build a config from hex colour strings (e.g. "#1A1A1A")
     * @throws ConfigError if either colour is malformed or quality is out of range
     */
    static InversionConfig fromHex(const std::string &background_hex,
                                   const std::string &foreground_hex,
                                   bool invert_images = true,
                                   int image_quality = DEFAULT_IMAGE_QUALITY);

    const RgbColor &backgroundColor() const { return background_color_; }
    const RgbColor &foregroundColor() const { return foreground_color_; }
    bool invertImages() const { return invert_images_; }
    int imageQuality() const { return image_quality_; }
    const std::string &fileSuffix() const { return file_suffix_; }
    const std::string &outputFolder() const { return output_folder_; }
    bool forceSlideBackground() const { return force_slide_background_; }

    /**
     * @brief Target for source colours that classify as light. This is the
     * foreground colour, so with the default white-on-black scheme light
     * stays light; swapping the two colours swaps every mapped colour.
     */
    const RgbColor &lightTarget() const;

    /**
     * @brief Target for source colours that classify as dark (the background colour)
     */
    const RgbColor &darkTarget() const;

    bool operator==(const InversionConfig &other) const;
    bool operator!=(const InversionConfig &other) const { return !(*this == other); }

private:
    RgbColor background_color_;
    RgbColor foreground_color_;
    bool invert_images_;
    int image_quality_;
    std::string file_suffix_;
    std::string output_folder_;
    bool force_slide_background_;
};

enum class WorkerBackend
{
    PROCESS,
    THREAD
};

/**
 * @brief Worker pool settings for a batch call
 */
struct ConcurrencyOptions
{
    static constexpr size_t DEFAULT_MAX_WORKERS = 2;
    static constexpr size_t MAX_ALLOWED_WORKERS = 64;

    WorkerBackend worker_backend = WorkerBackend::PROCESS;
    size_t max_workers = DEFAULT_MAX_WORKERS;

    /**
     * @throws ConfigError if max_workers is zero or above MAX_ALLOWED_WORKERS
     */
    void validate() const;

    /**
     * @brief Parse "process" or "thread"
     * @throws ConfigError for any other value
     */
    static WorkerBackend parseBackend(const std::string &name);
    static std::string backendName(WorkerBackend backend);
};

/**
 * @brief Versioned flat tuple encoding of InversionConfig, passed by value
 * into each worker invocation.
 *
 * Layout (JSON array): [version, bg.r, bg.g, bg.b, fg.r, fg.g, fg.b,
 * invert_images, image_quality, file_suffix, output_folder,
 * force_slide_background]
 */
class SerializedConfig
{
public:
    static constexpr int VERSION = 1;

    static SerializedConfig encode(const InversionConfig &config);

    /**
     * @throws ConfigError if the payload is not a well-formed tuple of this version
     */
    InversionConfig decode() const;

    const std::string &payload() const { return payload_; }
    static SerializedConfig fromPayload(const std::string &payload);

private:
    explicit SerializedConfig(std::string payload) : payload_(std::move(payload)) {}
    std::string payload_;
};

/**
 * @brief Advisory contrast check of the configured colour pair
 * @return Zero or one warning string
 */
std::vector<std::string> validateConfig(const InversionConfig &config);

/**
 * @brief Checks that make a batch call fail before anything is scheduled
 * @throws ConfigError if the concurrency options are out of range or the
 * config does not survive the worker serialization round trip
 */
void validateConfigOrThrow(const InversionConfig &config, const ConcurrencyOptions &options);
