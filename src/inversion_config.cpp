#include "core/inversion_config.hpp"
#include "core/contrast_validator.hpp"
#include <nlohmann/json.hpp>

InversionConfig::InversionConfig()
    : InversionConfig(RgbColor(0, 0, 0), RgbColor(255, 255, 255))
{
}

InversionConfig::InversionConfig(const RgbColor &background_color,
                                 const RgbColor &foreground_color,
                                 bool invert_images,
                                 int image_quality,
                                 const std::string &file_suffix,
                                 const std::string &output_folder,
                                 bool force_slide_background)
    : background_color_(background_color),
      foreground_color_(foreground_color),
      invert_images_(invert_images),
      image_quality_(image_quality),
      file_suffix_(file_suffix),
      output_folder_(output_folder),
      force_slide_background_(force_slide_background)
{
    if (image_quality < MIN_IMAGE_QUALITY || image_quality > MAX_IMAGE_QUALITY)
    {
        throw ConfigError("Image quality must be between 1 and 100 (got " + std::to_string(image_quality) + ")");
    }
    if (output_folder.find("..") != std::string::npos)
    {
        throw ConfigError("Output folder must not contain '..': " + output_folder);
    }
}

InversionConfig InversionConfig::fromHex(const std::string &background_hex,
                                         const std::string &foreground_hex,
                                         bool invert_images,
                                         int image_quality)
{
    return InversionConfig(RgbColor::fromHex(background_hex),
                           RgbColor::fromHex(foreground_hex),
                           invert_images,
                           image_quality);
}

const RgbColor &InversionConfig::lightTarget() const
{
    return foreground_color_;
}

const RgbColor &InversionConfig::darkTarget() const
{
    return background_color_;
}

bool InversionConfig::operator==(const InversionConfig &other) const
{
    return background_color_ == other.background_color_ &&
           foreground_color_ == other.foreground_color_ &&
           invert_images_ == other.invert_images_ &&
           image_quality_ == other.image_quality_ &&
           file_suffix_ == other.file_suffix_ &&
           output_folder_ == other.output_folder_ &&
           force_slide_background_ == other.force_slide_background_;
}

void ConcurrencyOptions::validate() const
{
    if (max_workers < 1 || max_workers > MAX_ALLOWED_WORKERS)
    {
        throw ConfigError("max_workers must be between 1 and " + std::to_string(MAX_ALLOWED_WORKERS) +
                          " (got " + std::to_string(max_workers) + ")");
    }
}

WorkerBackend ConcurrencyOptions::parseBackend(const std::string &name)
{
    if (name == "process")
        return WorkerBackend::PROCESS;
    if (name == "thread")
        return WorkerBackend::THREAD;
    throw ConfigError("Unknown worker backend '" + name + "' (expected \"process\" or \"thread\")");
}

std::string ConcurrencyOptions::backendName(WorkerBackend backend)
{
    return backend == WorkerBackend::THREAD ? "thread" : "process";
}

SerializedConfig SerializedConfig::encode(const InversionConfig &config)
{
    const RgbColor &bg = config.backgroundColor();
    const RgbColor &fg = config.foregroundColor();
    nlohmann::json tuple = nlohmann::json::array({VERSION,
                                                  bg.r, bg.g, bg.b,
                                                  fg.r, fg.g, fg.b,
                                                  config.invertImages(),
                                                  config.imageQuality(),
                                                  config.fileSuffix(),
                                                  config.outputFolder(),
                                                  config.forceSlideBackground()});
    return SerializedConfig(tuple.dump());
}

SerializedConfig SerializedConfig::fromPayload(const std::string &payload)
{
    return SerializedConfig(payload);
}

InversionConfig SerializedConfig::decode() const
{
    nlohmann::json tuple;
    try
    {
        tuple = nlohmann::json::parse(payload_);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ConfigError("Serialized config is not valid JSON: " + std::string(e.what()));
    }

    if (!tuple.is_array() || tuple.size() != 12)
    {
        throw ConfigError("Serialized config must be a 12-element tuple");
    }
    if (!tuple[0].is_number_integer() || tuple[0].get<int>() != VERSION)
    {
        throw ConfigError("Unsupported serialized config version: " + tuple[0].dump());
    }

    auto channel = [&tuple](size_t index)
    {
        if (!tuple[index].is_number_integer())
            throw ConfigError("Serialized config channel at position " + std::to_string(index) + " is not an integer");
        int value = tuple[index].get<int>();
        if (value < 0 || value > 255)
            throw ConfigError("Serialized config channel out of range: " + std::to_string(value));
        return static_cast<uint8_t>(value);
    };

    try
    {
        return InversionConfig(RgbColor(channel(1), channel(2), channel(3)),
                               RgbColor(channel(4), channel(5), channel(6)),
                               tuple[7].get<bool>(),
                               tuple[8].get<int>(),
                               tuple[9].get<std::string>(),
                               tuple[10].get<std::string>(),
                               tuple[11].get<bool>());
    }
    catch (const nlohmann::json::type_error &e)
    {
        throw ConfigError("Serialized config has a field of the wrong type: " + std::string(e.what()));
    }
}

std::vector<std::string> validateConfig(const InversionConfig &config)
{
    return ContrastValidator::validate(config.foregroundColor(), config.backgroundColor());
}

void validateConfigOrThrow(const InversionConfig &config, const ConcurrencyOptions &options)
{
    options.validate();
    if (SerializedConfig::encode(config).decode() != config)
    {
        throw ConfigError("Configuration does not survive serialization for worker dispatch");
    }
}
