#pragma once

#include "document/zip_container.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief A package relationship as found in a part's .rels file
 */
struct Relationship
{
    std::string id;
    std::string type;
    std::string target;
    bool external = false;
};

/**
 * @brief Office Open XML presentation package held in memory.
 *
 * Parts are kept in their original archive order and addressed by their
 * zip path without a leading slash ("ppt/slides/slide1.xml").
 */
class PptxPackage
{
public:
    static const std::string CONTENT_TYPES_PART;
    static const std::string PRESENTATION_PART;
    static const std::string IMAGE_RELATIONSHIP;
    static const std::string SLIDE_RELATIONSHIP;

    /**
     * @brief Open a package from raw .pptx bytes
     * @throws DocumentError if the bytes are not a zip or lack the presentation parts
     */
    static PptxPackage load(const std::vector<uint8_t> &bytes);

    /**
     * @brief Serialize every part back into a .pptx archive
     */
    std::vector<uint8_t> save() const;

    bool hasPart(const std::string &name) const;

    /**
     * @throws DocumentError if the part does not exist
     */
    const std::vector<uint8_t> &partData(const std::string &name) const;
    std::string partText(const std::string &name) const;

    void setPart(const std::string &name, std::vector<uint8_t> data);
    void setPartText(const std::string &name, const std::string &text);
    std::vector<std::string> partNames() const;

    /**
     * @brief Slide part names in presentation order
     *
     * Taken from the slide id list of ppt/presentation.xml; falls back to the
     * numeric order of ppt/slides/slideN.xml when the list is unusable.
     */
    std::vector<std::string> slidePartNames() const;

    /**
     * @brief Relationships declared by a part (empty if it has no .rels)
     */
    std::vector<Relationship> relationships(const std::string &source_part) const;

    /**
     * @brief Absolute part name an internal relationship points at
     */
    std::optional<std::string> resolveTarget(const std::string &source_part, const std::string &relationship_id) const;

    /**
     * @brief Add an internal relationship from source_part to target_part
     * @return The new relationship id
     */
    std::string addRelationship(const std::string &source_part, const std::string &type, const std::string &target_part);

    /**
     * @brief Register a Default content type for an extension if missing
     */
    void ensureDefaultContentType(const std::string &extension, const std::string &content_type);

    /**
     * @brief A part name in directory that does not exist yet, e.g.
     * "ppt/media/image3_recolored1.png"
     */
    std::string uniquePartName(const std::string &directory, const std::string &stem, const std::string &extension) const;

    static std::string relationshipsPartFor(const std::string &part);
    static std::string resolvePath(const std::string &source_part, const std::string &target);
    static std::string relativePath(const std::string &source_part, const std::string &target_part);

private:
    PptxPackage() = default;

    std::vector<ZipEntry> parts_;
    std::map<std::string, size_t> index_;
};
