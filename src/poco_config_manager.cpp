#include "core/poco_config_manager.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    bool isYamlFile(const std::string &path)
    {
        const std::string extension = FileUtils::getFileExtension(path);
        return extension == "yaml" || extension == "yml";
    }

    nlohmann::json yamlToJson(const YAML::Node &node)
    {
        switch (node.Type())
        {
        case YAML::NodeType::Map:
        {
            nlohmann::json object = nlohmann::json::object();
            for (const auto &item : node)
            {
                object[item.first.as<std::string>()] = yamlToJson(item.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence:
        {
            nlohmann::json array = nlohmann::json::array();
            for (const auto &item : node)
            {
                array.push_back(yamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar:
        {
            const std::string text = node.Scalar();
            // Quoted scalars and values like "000000" stay strings
            if (node.Tag() == "!" || (text.size() > 1 && text[0] == '0'))
                return text;
            bool flag;
            if (YAML::convert<bool>::decode(node, flag))
                return flag;
            long long integer;
            if (YAML::convert<long long>::decode(node, integer))
                return integer;
            double real;
            if (YAML::convert<double>::decode(node, real))
                return real;
            return text;
        }
        default:
            return nullptr;
        }
    }

    YAML::Node jsonToYaml(const nlohmann::json &value)
    {
        YAML::Node node;
        if (value.is_object())
        {
            for (auto it = value.begin(); it != value.end(); ++it)
                node[it.key()] = jsonToYaml(it.value());
        }
        else if (value.is_array())
        {
            for (const auto &item : value)
                node.push_back(jsonToYaml(item));
        }
        else if (value.is_boolean())
            node = value.get<bool>();
        else if (value.is_number_integer())
            node = value.get<long long>();
        else if (value.is_number_float())
            node = value.get<double>();
        else if (value.is_string())
            node = value.get<std::string>();
        return node;
    }
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
}

bool PocoConfigManager::load(const std::string &path)
{
    try
    {
        std::stringstream json_text;
        if (isYamlFile(path))
        {
            json_text << yamlToJson(YAML::LoadFile(path)).dump();
        }
        else
        {
            std::ifstream in(path);
            if (!in.good())
            {
                Logger::error("Could not open config file: " + path);
                return false;
            }
            json_text << in.rdbuf();
        }

        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(json_text);

        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = tmp;
        Logger::info("Configuration loaded from: " + path);
        return true;
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("Error loading YAML config " + path + ": " + e.what());
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Error loading config " + path + ": " + e.displayText());
    }
    return false;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::ofstream out(path);
    if (!out.is_open())
    {
        Logger::error("Could not open config file for writing: " + path);
        return false;
    }
    if (isYamlFile(path))
    {
        out << jsonToYaml(getAll());
    }
    else
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_->save(out);
    }
    Logger::info("Configuration saved to: " + path);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

void PocoConfigManager::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

InversionConfig PocoConfigManager::getInversionConfig() const
{
    const InversionConfig defaults;
    try
    {
        RgbColor background = RgbColor::fromHex(getString("background_color", defaults.backgroundColor().toHex()));
        RgbColor foreground = RgbColor::fromHex(getString("foreground_color", defaults.foregroundColor().toHex()));
        return InversionConfig(background,
                               foreground,
                               getBool("invert_images", defaults.invertImages()),
                               getInt("image_quality", defaults.imageQuality()),
                               getString("file_suffix", defaults.fileSuffix()),
                               getString("output_folder", defaults.outputFolder()),
                               getBool("force_slide_background", defaults.forceSlideBackground()));
    }
    catch (const Poco::Exception &e)
    {
        throw ConfigError("Invalid configuration value: " + e.displayText());
    }
}

ConcurrencyOptions PocoConfigManager::getConcurrencyOptions() const
{
    ConcurrencyOptions options;
    try
    {
        options.worker_backend = ConcurrencyOptions::parseBackend(
            getString("worker_backend", ConcurrencyOptions::backendName(options.worker_backend)));
        int max_workers = getInt("max_workers", static_cast<int>(options.max_workers));
        if (max_workers < 1)
        {
            throw ConfigError("max_workers must be a positive integer (got " + std::to_string(max_workers) + ")");
        }
        options.max_workers = static_cast<size_t>(max_workers);
    }
    catch (const Poco::Exception &e)
    {
        throw ConfigError("Invalid configuration value: " + e.displayText());
    }
    options.validate();
    return options;
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}
