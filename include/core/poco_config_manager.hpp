#pragma once

#include "core/inversion_config.hpp"
#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Process-wide configuration store backed by Poco's JSONConfiguration.
 *
 * Files ending in .yaml or .yml are read and written with yaml-cpp and
 * converted to the same JSON tree. Recognised top-level keys:
 * background_color, foreground_color, invert_images, image_quality,
 * file_suffix, output_folder, force_slide_background, worker_backend,
 * max_workers, log_level.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    /**
     * @brief Replace the current configuration with a JSON or YAML file
     * @return false if the file cannot be read or parsed (configuration unchanged)
     */
    bool load(const std::string &path);
    bool save(const std::string &path) const;

    nlohmann::json getAll() const;
    void update(const nlohmann::json &patch);

    /**
     * @brief Drop every value, back to built-in defaults
     */
    void clear();

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;

    /**
     * @brief Typed recolouring settings, defaults for missing keys
     * @throws ConfigError on malformed colours or out-of-range values
     */
    InversionConfig getInversionConfig() const;

    /**
     * @throws ConfigError on an unknown backend or a bad worker count
     */
    ConcurrencyOptions getConcurrencyOptions() const;

    std::string getLogLevel() const;

private:
    PocoConfigManager();
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
