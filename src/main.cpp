#include "core/batch_orchestrator.hpp"
#include "core/file_utils.hpp"
#include "core/inversion_config.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Slide Recolor - remap slide decks to a two-colour scheme" << std::endl;
        std::cout << "Usage: " << program << " [options] <file.pptx|archive.zip|directory>..." << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --bg, --background HEX   Background colour (default #000000)" << std::endl;
        std::cout << "  --fg, --foreground HEX   Foreground colour (default #FFFFFF)" << std::endl;
        std::cout << "  --no-invert-images       Leave embedded pictures untouched" << std::endl;
        std::cout << "  --quality N              JPEG quality for recoloured pictures, 1-100 (default 85)" << std::endl;
        std::cout << "  --suffix S               Suffix added to output names (default \"(inverted)\")" << std::endl;
        std::cout << "  --force-background       Give every slide a solid background of the background colour" << std::endl;
        std::cout << "  --output DIR             Output directory (default \"Inverted Presentations\")" << std::endl;
        std::cout << "  --zip FILE               Also write every result into one zip archive" << std::endl;
        std::cout << "  --workers N              Concurrent documents, 1-64 (default 2)" << std::endl;
        std::cout << "  --backend process|thread Worker isolation (default process)" << std::endl;
        std::cout << "  --config FILE            JSON or YAML configuration file" << std::endl;
        std::cout << "  --log-level LEVEL        TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --help, -h               Show this help message" << std::endl;
    }

    void collectInputs(const std::string &path, std::vector<std::string> &files)
    {
        if (!FileUtils::isValidDirectory(path))
        {
            files.push_back(path);
            return;
        }
        FileUtils::listInputFilesAsObservable(path, true)
            .subscribe([&files](const std::string &file)
                       { files.push_back(file); },
                       [&path](const std::exception &e)
                       { Logger::error("Cannot scan " + path + ": " + e.what()); },
                       nullptr);
    }

    std::string baseName(const std::string &path)
    {
        return fs::path(path).filename().string();
    }
}

int main(int argc, char *argv[])
{
    Logger::init("INFO");

    nlohmann::json overrides = nlohmann::json::object();
    std::vector<std::string> paths;
    std::string config_path;
    std::string output_dir;
    std::string zip_path;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        auto value = [&](const std::string &option) -> std::string
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << option << " requires a value" << std::endl;
                std::exit(2);
            }
            return argv[++i];
        };
        auto number = [&](const std::string &option) -> int
        {
            std::string text = value(option);
            try
            {
                size_t used = 0;
                int parsed = std::stoi(text, &used);
                if (used == text.size())
                    return parsed;
            }
            catch (const std::exception &)
            {
            }
            std::cerr << "Error: " << option << " expects a number, got '" << text << "'" << std::endl;
            std::exit(2);
        };

        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--bg" || arg == "--background")
            overrides["background_color"] = value(arg);
        else if (arg == "--fg" || arg == "--foreground")
            overrides["foreground_color"] = value(arg);
        else if (arg == "--no-invert-images")
            overrides["invert_images"] = false;
        else if (arg == "--quality" || arg == "--jpeg-quality")
            overrides["image_quality"] = number(arg);
        else if (arg == "--suffix")
            overrides["file_suffix"] = value(arg);
        else if (arg == "--force-background")
            overrides["force_slide_background"] = true;
        else if (arg == "--output" || arg == "-o")
            output_dir = value(arg);
        else if (arg == "--zip")
            zip_path = value(arg);
        else if (arg == "--workers")
            overrides["max_workers"] = number(arg);
        else if (arg == "--backend")
            overrides["worker_backend"] = value(arg);
        else if (arg == "--config")
            config_path = value(arg);
        else if (arg == "--log-level")
            overrides["log_level"] = value(arg);
        else if (arg == "-v" || arg == "--verbose")
            overrides["log_level"] = "DEBUG";
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            std::cerr << "Use --help or -h for more options." << std::endl;
            return 2;
        }
        else
            paths.push_back(arg);
    }

    if (paths.empty())
    {
        printUsage(argv[0]);
        return 2;
    }

    auto &config_manager = PocoConfigManager::getInstance();
    if (!config_path.empty() && !config_manager.load(config_path))
    {
        std::cerr << "Error: could not load configuration from " << config_path << std::endl;
        return 2;
    }
    config_manager.update(overrides);
    Logger::setLevel(config_manager.getLogLevel());

    InversionConfig config;
    ConcurrencyOptions options;
    try
    {
        config = config_manager.getInversionConfig();
        options = config_manager.getConcurrencyOptions();
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    for (const auto &warning : validateConfig(config))
    {
        Logger::warn("Color: " + warning);
    }

    if (output_dir.empty())
    {
        output_dir = config.outputFolder().empty() ? "." : config.outputFolder();
    }

    std::vector<std::string> files;
    for (const auto &path : paths)
    {
        collectInputs(path, files);
    }

    std::vector<InputDocument> inputs;
    for (const auto &file : files)
    {
        try
        {
            inputs.emplace_back(FileUtils::readFileBytes(file), baseName(file));
        }
        catch (const std::runtime_error &e)
        {
            Logger::error(e.what());
            return 1;
        }
    }
    Logger::info("Found " + std::to_string(inputs.size()) + " input file(s)");

    std::vector<ProcessingResult> results;
    try
    {
        ResultStream stream = BatchOrchestrator::processBatchStreaming(inputs, config, options);
        size_t done = 0;
        while (auto result = stream.next())
        {
            ++done;
            std::cout << "[" << done << "/" << stream.total() << "] " << result->name << ": "
                      << (result->succeeded ? "done" : "FAILED") << std::endl;
            for (const auto &warning : result->warnings)
            {
                std::cout << "    - " << warning << std::endl;
            }
            if (result->succeeded && result->output_bytes)
            {
                std::string target = output_dir + "/" + FileUtils::outputFileName(result->name, config.fileSuffix());
                FileUtils::writeFileBytes(target, *result->output_bytes);
                Logger::debug("Wrote " + target);
            }
            results.push_back(std::move(*result));
        }
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
    catch (const std::runtime_error &e)
    {
        Logger::error("Could not write output: " + std::string(e.what()));
        return 1;
    }

    if (!zip_path.empty())
    {
        try
        {
            FileUtils::writeFileBytes(zip_path, BatchOrchestrator::assembleArchive(results, config));
            Logger::info("Wrote archive " + zip_path);
        }
        catch (const std::runtime_error &e)
        {
            Logger::error("Could not write archive: " + std::string(e.what()));
            return 1;
        }
    }

    size_t succeeded = 0;
    for (const auto &result : results)
    {
        if (result.succeeded)
            ++succeeded;
    }
    Logger::info("Successfully processed " + std::to_string(succeeded) + "/" + std::to_string(results.size()) + " files");
    return succeeded == results.size() ? 0 : 1;
}
