#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief One named file inside a zip container
 */
struct ZipEntry
{
    std::string path;
    std::vector<uint8_t> data;

    ZipEntry() = default;
    ZipEntry(std::string p, std::vector<uint8_t> d) : path(std::move(p)), data(std::move(d)) {}
};

/**
 * @brief In-memory zip read/write on top of Poco::Zip
 */
class ZipContainer
{
public:
    /**
     * @brief True if the buffer starts with a zip local file header signature
     */
    static bool hasZipSignature(const std::vector<uint8_t> &bytes);

    /**
     * @brief Read every file entry (directories skipped) in archive order
     * @throws DocumentError if the bytes are not a readable zip archive
     */
    static std::vector<ZipEntry> read(const std::vector<uint8_t> &bytes);

    /**
     * @brief Read only the entry names, in archive order
     * @throws DocumentError if the bytes are not a readable zip archive
     */
    static std::vector<std::string> listEntries(const std::vector<uint8_t> &bytes);

    /**
     * @brief Write entries into a new deflated archive
     * @throws DocumentError on duplicate or invalid entry names
     */
    static std::vector<uint8_t> write(const std::vector<ZipEntry> &entries);
};
