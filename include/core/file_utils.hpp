#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

    void subscribe(Observer onNext)
    {
        subscribe(onNext, nullptr, nullptr);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief File and file-name helpers shared by the orchestrator and the CLI
 */
class FileUtils
{
public:
    /**
     * @brief Read a whole file into memory
     * @throws std::runtime_error if the file cannot be opened or read
     */
    static std::vector<uint8_t> readFileBytes(const std::string &file_path);

    /**
     * @brief Write bytes to a file, creating parent directories as needed
     * @throws std::runtime_error if the file cannot be written
     */
    static void writeFileBytes(const std::string &file_path, const std::vector<uint8_t> &data);

    /**
     * @brief Lower-case extension without the dot ("pptx"), empty if none
     */
    static std::string getFileExtension(const std::string &file_name);

    static bool isPresentationFile(const std::string &file_name);
    static bool isArchiveFile(const std::string &file_name);

    /**
     * @brief True for macOS resource fork and metadata entries ("__MACOSX/...", "._deck.pptx")
     */
    static bool isMacMetadataEntry(const std::string &entry_path);

    /**
     * @brief Normalise an archive entry path so it stays below the directory it is
     * written into: backslashes become '/', empty, "." and ".." segments are
     * dropped, leading slashes go. Returns "" if nothing is left.
     */
    static std::string sanitizeRelativePath(const std::string &entry_path);

    /**
     * @brief Insert a suffix before the extension
     *
     * outputFileName("talk.pptx", "(inverted)") == "talk (inverted).pptx".
     * An empty suffix returns the name unchanged.
     */
    static std::string outputFileName(const std::string &file_name, const std::string &suffix);

    /**
     * @brief Lists presentations and archives in a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @param recursive Whether to scan recursively
     * @return SimpleObservable that emits file paths
     */
    static SimpleObservable<std::string> listInputFilesAsObservable(const std::string &dir_path, bool recursive = false);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);
};
