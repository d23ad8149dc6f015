#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Outcome of recolouring one document
 *
 * output_bytes is present only when succeeded is true. warnings is always
 * present and lists non-fatal issues in the order they were met.
 */
struct ProcessingResult
{
    std::string name;
    bool succeeded;
    std::optional<std::vector<uint8_t>> output_bytes;
    std::vector<std::string> warnings;
    long long processing_time_ms = 0;

    ProcessingResult() : succeeded(false) {}
    ProcessingResult(const std::string &n, bool s) : name(n), succeeded(s) {}

    static ProcessingResult failure(const std::string &name, const std::string &warning)
    {
        ProcessingResult result(name, false);
        result.warnings.push_back(warning);
        return result;
    }
};

/**
 * @brief Aggregate outcome of a batch call
 */
struct BatchResult
{
    std::vector<ProcessingResult> results;
    std::vector<uint8_t> output_archive;
    size_t total_files = 0;
    size_t successful_files = 0;

    /// Problems that concern the batch as a whole, such as a failed archive assembly
    std::vector<std::string> warnings;

    /**
     * @brief Batch warnings, then every warning of every document prefixed
     * with the document name
     */
    std::vector<std::string> allWarnings() const
    {
        std::vector<std::string> all(warnings);
        for (const auto &result : results)
        {
            for (const auto &warning : result.warnings)
            {
                all.push_back(result.name + ": " + warning);
            }
        }
        return all;
    }
};
