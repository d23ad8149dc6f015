#pragma once

#include "core/inversion_config.hpp"
#include "core/processing_result.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Recolours one complete presentation.
 *
 * This is the unit of work a worker slot runs. It never throws: every
 * document-level problem becomes a failed ProcessingResult.
 */
class DocumentProcessor
{
public:
    /**
     * @brief Load, recolour slide by slide and re-serialize one document
     * @param bytes Raw .pptx bytes (not modified)
     * @param name Display name carried into the result
     * @param config Batch configuration
     * @return Result with output bytes on success, a descriptive warning on failure
     */
    static ProcessingResult processOne(const std::vector<uint8_t> &bytes,
                                       const std::string &name,
                                       const InversionConfig &config);

    /**
     * @brief Worker entry point: decode the serialized config, then processOne()
     */
    static ProcessingResult processSerialized(const std::vector<uint8_t> &bytes,
                                              const std::string &name,
                                              const SerializedConfig &config);
};
