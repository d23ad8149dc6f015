#pragma once

#include "core/file_utils.hpp"
#include "core/inversion_config.hpp"
#include "core/processing_result.hpp"
#include "core/worker_pool.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One named input buffer: a presentation or an archive of presentations
 */
struct InputDocument
{
    std::vector<uint8_t> bytes;
    std::string name;

    InputDocument() = default;
    InputDocument(std::vector<uint8_t> b, std::string n) : bytes(std::move(b)), name(std::move(n)) {}
};

/**
 * @brief Lazily produced results of one streaming batch call.
 *
 * next() blocks until another document finishes and yields results in
 * completion order. Single pass; std::nullopt once every document was
 * reported. Destroying the stream early still waits for documents already
 * handed to the pool.
 */
class ResultStream
{
public:
    ResultStream(ResultStream &&) = default;
    ResultStream &operator=(ResultStream &&) = default;

    std::optional<ProcessingResult> next();

    /// Number of results the stream will yield in total
    size_t total() const { return total_; }
    size_t remaining() const { return ready_.size() + unreported_; }

private:
    friend class BatchOrchestrator;
    ResultStream() : completions_(std::make_shared<Completions>()) {}

    /// Indices of pending_ in the order their documents finished
    struct Completions
    {
        std::mutex mutex;
        std::condition_variable finished;
        std::deque<size_t> order;
    };

    std::unique_ptr<WorkerPool> pool_;
    std::deque<ProcessingResult> ready_;
    std::vector<std::future<ProcessingResult>> pending_;
    std::shared_ptr<Completions> completions_;
    size_t unreported_ = 0;
    size_t total_ = 0;
};

/**
 * @brief Fans documents out to a bounded worker pool and collects their results
 */
class BatchOrchestrator
{
public:
    /**
     * @brief Recolour one document in the calling thread
     */
    static ProcessingResult processOne(const std::vector<uint8_t> &bytes,
                                       const std::string &name,
                                       const InversionConfig &config);

    /**
     * @brief Recolour every document and assemble the output archive
     *
     * Blocks until all documents are done. Results are in input order, one
     * per effective document, failures included. The archive holds every
     * successful document under output_folder with file_suffix applied.
     * @throws ConfigError before anything is scheduled if the options are invalid
     */
    static BatchResult processBatch(const std::vector<InputDocument> &documents,
                                    const InversionConfig &config,
                                    const ConcurrencyOptions &options = ConcurrencyOptions());

    /**
     * @brief Schedule every document and return their results as they complete
     * @throws ConfigError before anything is scheduled if the options are invalid
     */
    static ResultStream processBatchStreaming(const std::vector<InputDocument> &documents,
                                              const InversionConfig &config,
                                              const ConcurrencyOptions &options = ConcurrencyOptions());

    /**
     * @brief processBatchStreaming() as a SimpleObservable. Invalid options are
     * reported through onError.
     */
    static SimpleObservable<ProcessingResult> observeBatch(std::vector<InputDocument> documents,
                                                           InversionConfig config,
                                                           ConcurrencyOptions options = ConcurrencyOptions());

    /**
     * @brief Expand archive inputs into their presentations
     * @param failures Receives one failed result per archive that cannot be opened
     * @return Effective documents; names of extracted ones are "container/entry path".
     * Every name passes through FileUtils::sanitizeRelativePath.
     */
    static std::vector<InputDocument> discoverDocuments(const std::vector<InputDocument> &inputs,
                                                        std::vector<ProcessingResult> &failures);

    /**
     * @brief Make names unique (case-insensitively) by numbering repeats:
     * "deck.pptx", "deck (2).pptx", ...
     */
    static std::vector<std::string> disambiguateNames(const std::vector<std::string> &names);

    /**
     * @brief Zip the successful results under the configured folder and suffix
     */
    static std::vector<uint8_t> assembleArchive(const std::vector<ProcessingResult> &results,
                                                const InversionConfig &config);

    /**
     * @brief True if an input should be expanded rather than processed
     */
    static bool isArchiveInput(const InputDocument &input);
};
