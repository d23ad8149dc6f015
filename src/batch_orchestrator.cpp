#include "core/batch_orchestrator.hpp"
#include "core/document_processor.hpp"
#include "document/document_error.hpp"
#include "document/pptx_package.hpp"
#include "document/zip_container.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>

namespace
{
    std::string lowerCase(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string numbered(const std::string &name, int n)
    {
        auto slash = name.rfind('/');
        auto dot = name.rfind('.');
        if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        {
            return name + " (" + std::to_string(n) + ")";
        }
        return name.substr(0, dot) + " (" + std::to_string(n) + ")" + name.substr(dot);
    }
}

std::optional<ProcessingResult> ResultStream::next()
{
    if (!ready_.empty())
    {
        ProcessingResult result = std::move(ready_.front());
        ready_.pop_front();
        return result;
    }
    if (unreported_ == 0)
    {
        return std::nullopt;
    }

    size_t index;
    {
        std::unique_lock<std::mutex> lock(completions_->mutex);
        completions_->finished.wait(lock, [this]
                                    { return !completions_->order.empty(); });
        index = completions_->order.front();
        completions_->order.pop_front();
    }
    --unreported_;
    return pending_[index].get();
}

ProcessingResult BatchOrchestrator::processOne(const std::vector<uint8_t> &bytes,
                                               const std::string &name,
                                               const InversionConfig &config)
{
    return DocumentProcessor::processOne(bytes, name, config);
}

bool BatchOrchestrator::isArchiveInput(const InputDocument &input)
{
    if (FileUtils::isArchiveFile(input.name))
        return true;
    if (FileUtils::isPresentationFile(input.name) || !ZipContainer::hasZipSignature(input.bytes))
        return false;

    // Unknown extension: a zip without a content types part is an archive
    try
    {
        auto entries = ZipContainer::listEntries(input.bytes);
        return std::find(entries.begin(), entries.end(), PptxPackage::CONTENT_TYPES_PART) == entries.end();
    }
    catch (const DocumentError &)
    {
        return false;
    }
}

std::vector<InputDocument> BatchOrchestrator::discoverDocuments(const std::vector<InputDocument> &inputs,
                                                                std::vector<ProcessingResult> &failures)
{
    std::vector<InputDocument> documents;
    for (const auto &input : inputs)
    {
        std::string input_name = FileUtils::sanitizeRelativePath(input.name);
        if (input_name.empty())
        {
            input_name = "document";
        }
        if (input_name != input.name)
        {
            Logger::warn("Input name " + input.name + " normalised to " + input_name);
        }

        if (!isArchiveInput(input))
        {
            documents.emplace_back(input.bytes, input_name);
            continue;
        }

        std::vector<ZipEntry> entries;
        try
        {
            entries = ZipContainer::read(input.bytes);
        }
        catch (const DocumentError &e)
        {
            Logger::warn("Cannot open archive " + input_name + ": " + e.what());
            failures.push_back(ProcessingResult::failure(input_name, "Could not open archive: " + std::string(e.what())));
            continue;
        }

        size_t found = 0;
        for (auto &entry : entries)
        {
            // Entry paths come from the archive and may climb out with ".." or absolute paths
            const std::string path = FileUtils::sanitizeRelativePath(entry.path);
            if (path.empty() || FileUtils::isMacMetadataEntry(path) || !FileUtils::isPresentationFile(path))
            {
                continue;
            }
            if (path != entry.path)
            {
                Logger::warn("Archive " + input_name + ": entry " + entry.path + " normalised to " + path);
            }
            documents.emplace_back(std::move(entry.data), input_name + "/" + path);
            ++found;
        }
        if (found == 0)
        {
            Logger::warn("Archive " + input_name + " contains no presentations");
        }
        else
        {
            Logger::info("Archive " + input_name + ": " + std::to_string(found) + " presentations");
        }
    }
    return documents;
}

std::vector<std::string> BatchOrchestrator::disambiguateNames(const std::vector<std::string> &names)
{
    std::set<std::string> taken;
    for (const auto &name : names)
    {
        taken.insert(lowerCase(name));
    }

    std::set<std::string> used;
    std::vector<std::string> unique;
    unique.reserve(names.size());
    for (const auto &name : names)
    {
        std::string candidate = name;
        if (used.count(lowerCase(candidate)))
        {
            // Skip numbers that another input already carries
            for (int n = 2;; ++n)
            {
                candidate = numbered(name, n);
                const std::string key = lowerCase(candidate);
                if (!used.count(key) && !taken.count(key))
                    break;
            }
            Logger::debug("Renamed duplicate " + name + " to " + candidate);
        }
        used.insert(lowerCase(candidate));
        unique.push_back(candidate);
    }
    return unique;
}

std::vector<uint8_t> BatchOrchestrator::assembleArchive(const std::vector<ProcessingResult> &results,
                                                        const InversionConfig &config)
{
    const std::string prefix = config.outputFolder().empty() ? "" : config.outputFolder() + "/";
    std::vector<ZipEntry> entries;
    for (const auto &result : results)
    {
        if (!result.succeeded || !result.output_bytes)
        {
            continue;
        }
        entries.emplace_back(prefix + FileUtils::outputFileName(result.name, config.fileSuffix()), *result.output_bytes);
    }
    return ZipContainer::write(entries);
}

ResultStream BatchOrchestrator::processBatchStreaming(const std::vector<InputDocument> &documents,
                                                      const InversionConfig &config,
                                                      const ConcurrencyOptions &options)
{
    validateConfigOrThrow(config, options);
    const SerializedConfig serialized = SerializedConfig::encode(config);

    ResultStream stream;
    std::vector<ProcessingResult> failures;
    std::vector<InputDocument> effective = discoverDocuments(documents, failures);

    std::vector<std::string> names;
    names.reserve(effective.size());
    for (const auto &document : effective)
    {
        names.push_back(document.name);
    }
    names = disambiguateNames(names);

    for (auto &failure : failures)
    {
        stream.ready_.push_back(std::move(failure));
    }

    stream.pool_ = WorkerPool::create(options);
    for (size_t i = 0; i < effective.size(); ++i)
    {
        auto document = std::make_shared<const InputDocument>(std::move(effective[i].bytes), names[i]);
        auto completions = stream.completions_;
        const size_t index = stream.pending_.size();
        stream.pending_.push_back(stream.pool_->submit(
            document->name,
            [document, serialized]()
            { return DocumentProcessor::processSerialized(document->bytes, document->name, serialized); },
            [completions, index]()
            {
                {
                    std::lock_guard<std::mutex> lock(completions->mutex);
                    completions->order.push_back(index);
                }
                completions->finished.notify_one();
            }));
    }

    stream.unreported_ = stream.pending_.size();
    stream.total_ = stream.ready_.size() + stream.pending_.size();
    Logger::info("Scheduled " + std::to_string(stream.pending_.size()) + " documents on " +
                 std::to_string(stream.pool_->capacity()) + " " + stream.pool_->backendName() + " workers");
    return stream;
}

BatchResult BatchOrchestrator::processBatch(const std::vector<InputDocument> &documents,
                                            const InversionConfig &config,
                                            const ConcurrencyOptions &options)
{
    const auto start = std::chrono::steady_clock::now();
    ResultStream stream = processBatchStreaming(documents, config, options);

    BatchResult batch;
    batch.total_files = stream.total();

    // Discovery failures first, then documents in submission order
    while (!stream.ready_.empty())
    {
        batch.results.push_back(std::move(stream.ready_.front()));
        stream.ready_.pop_front();
    }
    for (auto &future : stream.pending_)
    {
        batch.results.push_back(future.get());
    }
    stream.unreported_ = 0;

    for (const auto &result : batch.results)
    {
        if (result.succeeded)
            ++batch.successful_files;
    }
    try
    {
        batch.output_archive = assembleArchive(batch.results, config);
    }
    catch (const DocumentError &e)
    {
        Logger::error("Could not assemble output archive: " + std::string(e.what()));
        batch.warnings.push_back("Could not assemble output archive: " + std::string(e.what()));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    Logger::info("Batch finished: " + std::to_string(batch.successful_files) + "/" + std::to_string(batch.total_files) +
                 " documents succeeded in " + std::to_string(elapsed) + " ms");
    return batch;
}

SimpleObservable<ProcessingResult> BatchOrchestrator::observeBatch(std::vector<InputDocument> documents,
                                                                   InversionConfig config,
                                                                   ConcurrencyOptions options)
{
    using Observer = std::function<void(const ProcessingResult &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    auto inputs = std::make_shared<std::vector<InputDocument>>(std::move(documents));
    return SimpleObservable<ProcessingResult>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [inputs, config, options](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    ResultStream stream = processBatchStreaming(*inputs, config, options);
                    while (auto result = stream.next())
                    {
                        onNext(*result);
                    }
                }
                catch (const ConfigError &e)
                {
                    Logger::error("Batch rejected: " + std::string(e.what()));
                    if (onError)
                    {
                        onError(e);
                    }
                    return;
                }
                if (onComplete)
                {
                    onComplete();
                }
            }));
}
