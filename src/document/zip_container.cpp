#include "document/zip_container.hpp"
#include "document/document_error.hpp"
#include "logging/logger.hpp"
#include <Poco/Zip/ZipArchive.h>
#include <Poco/Zip/ZipStream.h>
#include <Poco/Zip/Compress.h>
#include <Poco/Zip/ZipLocalFileHeader.h>
#include <Poco/StreamCopier.h>
#include <Poco/DateTime.h>
#include <Poco/Path.h>
#include <Poco/Exception.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace
{
    using HeaderList = std::vector<const Poco::Zip::ZipLocalFileHeader *>;

    HeaderList orderedHeaders(const Poco::Zip::ZipArchive &archive)
    {
        HeaderList headers;
        for (auto it = archive.headerBegin(); it != archive.headerEnd(); ++it)
        {
            if (!it->second.isDirectory())
            {
                headers.push_back(&it->second);
            }
        }
        std::sort(headers.begin(), headers.end(),
                  [](const Poco::Zip::ZipLocalFileHeader *a, const Poco::Zip::ZipLocalFileHeader *b)
                  { return a->getStartPos() < b->getStartPos(); });
        return headers;
    }

    bool isAlreadyCompressed(const std::string &path)
    {
        std::string lower = path;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        for (const char *ext : {".png", ".jpg", ".jpeg", ".gif", ".pptx", ".zip"})
        {
            const std::string suffix(ext);
            if (lower.size() >= suffix.size() && lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0)
                return true;
        }
        return false;
    }
}

bool ZipContainer::hasZipSignature(const std::vector<uint8_t> &bytes)
{
    return bytes.size() >= 4 && bytes[0] == 'P' && bytes[1] == 'K' && bytes[2] == 0x03 && bytes[3] == 0x04;
}

std::vector<ZipEntry> ZipContainer::read(const std::vector<uint8_t> &bytes)
{
    if (!hasZipSignature(bytes))
    {
        throw DocumentError("Not a zip archive (" + std::to_string(bytes.size()) + " bytes)");
    }

    try
    {
        std::istringstream in(std::string(bytes.begin(), bytes.end()), std::ios::binary);
        Poco::Zip::ZipArchive archive(in);

        std::vector<ZipEntry> entries;
        for (const auto *header : orderedHeaders(archive))
        {
            in.clear();
            Poco::Zip::ZipInputStream zip_in(in, *header, true);
            std::ostringstream out(std::ios::binary);
            Poco::StreamCopier::copyStream(zip_in, out);
            std::string data = out.str();
            entries.emplace_back(header->getFileName(), std::vector<uint8_t>(data.begin(), data.end()));
        }
        return entries;
    }
    catch (const Poco::Exception &e)
    {
        throw DocumentError("Unreadable zip archive: " + e.displayText());
    }
}

std::vector<std::string> ZipContainer::listEntries(const std::vector<uint8_t> &bytes)
{
    if (!hasZipSignature(bytes))
    {
        throw DocumentError("Not a zip archive (" + std::to_string(bytes.size()) + " bytes)");
    }

    try
    {
        std::istringstream in(std::string(bytes.begin(), bytes.end()), std::ios::binary);
        Poco::Zip::ZipArchive archive(in);

        std::vector<std::string> names;
        for (const auto *header : orderedHeaders(archive))
        {
            names.push_back(header->getFileName());
        }
        return names;
    }
    catch (const Poco::Exception &e)
    {
        throw DocumentError("Unreadable zip archive: " + e.displayText());
    }
}

std::vector<uint8_t> ZipContainer::write(const std::vector<ZipEntry> &entries)
{
    std::set<std::string> seen;
    try
    {
        std::ostringstream out(std::ios::binary);
        Poco::Zip::Compress compress(out, true);
        const Poco::DateTime now;

        for (const auto &entry : entries)
        {
            if (entry.path.empty() || entry.path.back() == '/')
            {
                throw DocumentError("Invalid zip entry name: '" + entry.path + "'");
            }
            if (!seen.insert(entry.path).second)
            {
                throw DocumentError("Duplicate zip entry: " + entry.path);
            }

            std::istringstream data(std::string(entry.data.begin(), entry.data.end()), std::ios::binary);
            auto level = isAlreadyCompressed(entry.path) ? Poco::Zip::ZipCommon::CL_SUPERFAST
                                                          : Poco::Zip::ZipCommon::CL_NORMAL;
            compress.addFile(data, now, Poco::Path(entry.path, Poco::Path::PATH_UNIX),
                             Poco::Zip::ZipCommon::CM_DEFLATE, level);
        }

        compress.close();
        std::string archive = out.str();
        Logger::debug("Wrote zip archive with " + std::to_string(entries.size()) + " entries (" +
                      std::to_string(archive.size()) + " bytes)");
        return std::vector<uint8_t>(archive.begin(), archive.end());
    }
    catch (const Poco::Exception &e)
    {
        throw DocumentError("Failed to write zip archive: " + e.displayText());
    }
}
