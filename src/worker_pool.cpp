#include "core/worker_pool.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    nlohmann::json resultToJson(const ProcessingResult &result)
    {
        nlohmann::json j;
        j["name"] = result.name;
        j["succeeded"] = result.succeeded;
        j["warnings"] = result.warnings;
        j["processing_time_ms"] = result.processing_time_ms;
        if (result.output_bytes)
        {
            j["output_bytes"] = nlohmann::json::binary(*result.output_bytes);
        }
        return j;
    }

    ProcessingResult resultFromJson(const nlohmann::json &j)
    {
        ProcessingResult result(j.at("name").get<std::string>(), j.at("succeeded").get<bool>());
        result.warnings = j.at("warnings").get<std::vector<std::string>>();
        result.processing_time_ms = j.at("processing_time_ms").get<long long>();
        if (j.contains("output_bytes"))
        {
            const auto &binary = j.at("output_bytes").get_binary();
            result.output_bytes = std::vector<uint8_t>(binary.begin(), binary.end());
        }
        return result;
    }

    bool writeAll(int fd, const std::vector<uint8_t> &data)
    {
        size_t written = 0;
        while (written < data.size())
        {
            ssize_t n = ::write(fd, data.data() + written, data.size() - written);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            written += static_cast<size_t>(n);
        }
        return true;
    }

    bool readAll(int fd, std::vector<uint8_t> &out)
    {
        uint8_t buffer[65536];
        while (true)
        {
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n == 0)
                return true;
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            out.insert(out.end(), buffer, buffer + n);
        }
    }
}

void WorkerPool::markStarted()
{
    size_t now = active_.fetch_add(1) + 1;
    size_t peak = peak_active_.load();
    while (now > peak && !peak_active_.compare_exchange_weak(peak, now))
    {
    }
}

std::unique_ptr<WorkerPool> WorkerPool::create(const ConcurrencyOptions &options)
{
    options.validate();
    Logger::info("Creating " + ConcurrencyOptions::backendName(options.worker_backend) +
                 " worker pool with " + std::to_string(options.max_workers) + " slots");
    if (options.worker_backend == WorkerBackend::THREAD)
    {
        return std::make_unique<ThreadWorkerPool>(options.max_workers);
    }
    return std::make_unique<ProcessWorkerPool>(options.max_workers);
}

// ThreadWorkerPool

ThreadWorkerPool::ThreadWorkerPool(size_t max_workers)
    : WorkerPool(max_workers), arena_(static_cast<int>(max_workers), 0)
{
}

ThreadWorkerPool::~ThreadWorkerPool()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this]
               { return in_flight_ == 0; });
}

std::future<ProcessingResult> ThreadWorkerPool::submit(const std::string &name, Task task, Callback on_finished)
{
    auto promise = std::make_shared<std::promise<ProcessingResult>>();
    auto future = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++in_flight_;
    }

    arena_.enqueue([this, promise, name, task = std::move(task), on_finished = std::move(on_finished)]()
                   {
        markStarted();
        ProcessingResult result;
        try
        {
            result = task();
        }
        catch (const std::exception &e)
        {
            Logger::error("Worker task for " + name + " threw: " + e.what());
            result = ProcessingResult::failure(name, "Worker task failed: " + std::string(e.what()));
        }
        markFinished();
        promise->set_value(std::move(result));
        if (on_finished)
        {
            on_finished();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
        idle_.notify_all(); });

    return future;
}

// ProcessWorkerPool

ProcessWorkerPool::ProcessWorkerPool(size_t max_workers)
    : WorkerPool(max_workers)
{
    supervisors_.reserve(max_workers);
    for (size_t i = 0; i < max_workers; ++i)
    {
        supervisors_.emplace_back(&ProcessWorkerPool::supervise, this);
    }
}

ProcessWorkerPool::~ProcessWorkerPool()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    available_.notify_all();
    for (auto &supervisor : supervisors_)
    {
        if (supervisor.joinable())
            supervisor.join();
    }
}

std::future<ProcessingResult> ProcessWorkerPool::submit(const std::string &name, Task task, Callback on_finished)
{
    Job job;
    job.name = name;
    job.task = std::move(task);
    job.on_finished = std::move(on_finished);
    auto future = job.promise.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(job));
    }
    available_.notify_one();
    return future;
}

void ProcessWorkerPool::supervise()
{
    while (true)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            available_.wait(lock, [this]
                            { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
                return;
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        markStarted();
        ProcessingResult result = runInChild(job.name, job.task);
        markFinished();
        job.promise.set_value(std::move(result));
        if (job.on_finished)
        {
            job.on_finished();
        }
    }
}

ProcessingResult ProcessWorkerPool::runInChild(const std::string &name, const Task &task)
{
    int fds[2];
    pid_t pid;
    {
        // pipe, fork and closing the parent's write end happen under one lock
        // so no other child inherits this pipe's write end
        Logger::ForkGuard guard;
        if (::pipe(fds) != 0)
        {
            return ProcessingResult::failure(name, "Could not create worker pipe: " + std::string(std::strerror(errno)));
        }
        pid = ::fork();
        if (pid > 0)
        {
            ::close(fds[1]);
        }
    }

    if (pid < 0)
    {
        int error = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return ProcessingResult::failure(name, "Could not start worker process: " + std::string(std::strerror(error)));
    }

    if (pid == 0)
    {
        ::close(fds[0]);
        int status = 0;
        try
        {
            if (!writeAll(fds[1], nlohmann::json::to_cbor(resultToJson(task()))))
                status = 3;
        }
        catch (const std::exception &e)
        {
            auto failure = ProcessingResult::failure(name, "Worker task failed: " + std::string(e.what()));
            status = writeAll(fds[1], nlohmann::json::to_cbor(resultToJson(failure))) ? 0 : 3;
        }
        ::close(fds[1]);
        ::_exit(status);
    }

    std::vector<uint8_t> payload;
    bool read_ok = readAll(fds[0], payload);
    ::close(fds[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            return ProcessingResult::failure(name, "Lost track of worker process: " + std::string(std::strerror(errno)));
        }
    }

    if (WIFSIGNALED(status))
    {
        Logger::error("Worker process for " + name + " killed by signal " + std::to_string(WTERMSIG(status)));
        return ProcessingResult::failure(name, "Worker process crashed (signal " + std::to_string(WTERMSIG(status)) + ")");
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0 || !read_ok || payload.empty())
    {
        Logger::error("Worker process for " + name + " exited without a result");
        return ProcessingResult::failure(name, "Worker process exited without a result (status " +
                                                   std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1) + ")");
    }

    try
    {
        return resultFromJson(nlohmann::json::from_cbor(payload));
    }
    catch (const nlohmann::json::exception &e)
    {
        return ProcessingResult::failure(name, "Could not decode worker result: " + std::string(e.what()));
    }
}
