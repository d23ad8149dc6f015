#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

std::vector<uint8_t> FileUtils::readFileBytes(const std::string &file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error("Cannot open file: " + file_path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
    {
        throw std::runtime_error("Error reading file: " + file_path);
    }
    return data;
}

void FileUtils::writeFileBytes(const std::string &file_path, const std::vector<uint8_t> &data)
{
    fs::path path(file_path);
    if (path.has_parent_path())
    {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec)
        {
            throw std::runtime_error("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
    if (!file)
    {
        throw std::runtime_error("Cannot open file for writing: " + file_path);
    }
    file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file)
    {
        throw std::runtime_error("Error writing file: " + file_path);
    }
}

std::string FileUtils::getFileExtension(const std::string &file_name)
{
    auto slash = file_name.find_last_of("/\\");
    auto dot = file_name.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash) || dot + 1 == file_name.size())
    {
        return "";
    }
    std::string extension = file_name.substr(dot + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return extension;
}

bool FileUtils::isPresentationFile(const std::string &file_name)
{
    return getFileExtension(file_name) == "pptx";
}

bool FileUtils::isArchiveFile(const std::string &file_name)
{
    return getFileExtension(file_name) == "zip";
}

bool FileUtils::isMacMetadataEntry(const std::string &entry_path)
{
    if (entry_path.compare(0, 8, "__MACOSX") == 0)
    {
        return true;
    }
    auto slash = entry_path.rfind('/');
    std::string base = slash == std::string::npos ? entry_path : entry_path.substr(slash + 1);
    return base.compare(0, 2, "._") == 0;
}

std::string FileUtils::sanitizeRelativePath(const std::string &entry_path)
{
    std::string normalized = entry_path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    std::string result;
    size_t start = 0;
    while (start <= normalized.size())
    {
        size_t end = normalized.find('/', start);
        if (end == std::string::npos)
            end = normalized.size();
        const std::string segment = normalized.substr(start, end - start);
        if (!segment.empty() && segment != "." && segment != "..")
        {
            if (!result.empty())
                result += '/';
            result += segment;
        }
        start = end + 1;
    }
    return result;
}

std::string FileUtils::outputFileName(const std::string &file_name, const std::string &suffix)
{
    if (suffix.empty())
    {
        return file_name;
    }
    auto slash = file_name.rfind('/');
    auto dot = file_name.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash) || dot == 0 || dot == slash + 1)
    {
        return file_name + " " + suffix;
    }
    return file_name.substr(0, dot) + " " + suffix + file_name.substr(dot);
}

SimpleObservable<std::string> FileUtils::listInputFilesAsObservable(const std::string &dir_path, bool recursive)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }

                    std::vector<std::string> found;
                    auto consider = [&found](const fs::directory_entry &entry)
                    {
                        const std::string name = entry.path().filename().string();
                        if (entry.is_regular_file() && !isMacMetadataEntry(name) &&
                            (isPresentationFile(name) || isArchiveFile(name)))
                        {
                            found.push_back(entry.path().string());
                        }
                    };
                    if (recursive)
                    {
                        for (const auto &entry : fs::recursive_directory_iterator(dir_path, fs::directory_options::skip_permission_denied))
                            consider(entry);
                    }
                    else
                    {
                        for (const auto &entry : fs::directory_iterator(dir_path))
                            consider(entry);
                    }

                    // Stable order regardless of directory iteration order
                    std::sort(found.begin(), found.end());
                    for (const auto &path : found)
                    {
                        onNext(path);
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    fs::path dir_path(path);
    return fs::exists(dir_path, ec) && fs::is_directory(dir_path, ec);
}
