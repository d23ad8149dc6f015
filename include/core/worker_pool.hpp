#pragma once

#include "core/inversion_config.hpp"
#include "core/processing_result.hpp"
#include <tbb/task_arena.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Bounded pool that runs one document per worker slot.
 *
 * At most capacity() tasks run at any instant; further submissions queue.
 * A task that throws or whose worker dies resolves to a failed result for
 * that document only. Destroying the pool waits for queued work to finish.
 */
class WorkerPool
{
public:
    using Task = std::function<ProcessingResult()>;
    using Callback = std::function<void()>;

    virtual ~WorkerPool() = default;

    /**
     * @brief Queue a document task
     * @param name Document name, used for the result if the worker fails
     * @param task Work to run on a worker slot
     * @param on_finished Called in this process right after the handle is resolved
     * @return Handle resolved once the task has finished
     */
    virtual std::future<ProcessingResult> submit(const std::string &name, Task task,
                                                 Callback on_finished = Callback()) = 0;

    virtual std::string backendName() const = 0;

    size_t capacity() const { return capacity_; }
    size_t activeCount() const { return active_.load(); }

    /// Highest number of simultaneously running tasks seen so far
    size_t peakActiveCount() const { return peak_active_.load(); }

    /**
     * @brief Create the pool selected by the options
     * @throws ConfigError if the options are invalid
     */
    static std::unique_ptr<WorkerPool> create(const ConcurrencyOptions &options);

protected:
    explicit WorkerPool(size_t capacity) : capacity_(capacity) {}

    void markStarted();
    void markFinished() { active_.fetch_sub(1); }

private:
    size_t capacity_;
    std::atomic<size_t> active_{0};
    std::atomic<size_t> peak_active_{0};
};

/**
 * @brief Runs tasks on TBB worker threads inside an arena limited to
 * max_workers slots.
 */
class ThreadWorkerPool : public WorkerPool
{
public:
    explicit ThreadWorkerPool(size_t max_workers);
    ~ThreadWorkerPool() override;

    std::future<ProcessingResult> submit(const std::string &name, Task task,
                                         Callback on_finished = Callback()) override;
    std::string backendName() const override { return "thread"; }

private:
    ThreadWorkerPool(const ThreadWorkerPool &) = delete;
    ThreadWorkerPool &operator=(const ThreadWorkerPool &) = delete;

    tbb::task_arena arena_;
    std::mutex mutex_;
    std::condition_variable idle_;
    size_t in_flight_ = 0;
};

/**
 * @brief Runs every task in a forked child process.
 *
 * One supervisor thread per slot takes the next task, forks, and reads the
 * child's result back over a pipe (CBOR encoded). A child that crashes or
 * exits without a result produces a failed result.
 */
class ProcessWorkerPool : public WorkerPool
{
public:
    explicit ProcessWorkerPool(size_t max_workers);
    ~ProcessWorkerPool() override;

    std::future<ProcessingResult> submit(const std::string &name, Task task,
                                         Callback on_finished = Callback()) override;
    std::string backendName() const override { return "process"; }

private:
    ProcessWorkerPool(const ProcessWorkerPool &) = delete;
    ProcessWorkerPool &operator=(const ProcessWorkerPool &) = delete;

    struct Job
    {
        std::string name;
        Task task;
        Callback on_finished;
        std::promise<ProcessingResult> promise;
    };

    void supervise();
    ProcessingResult runInChild(const std::string &name, const Task &task);

    std::vector<std::thread> supervisors_;
    std::deque<Job> queue_;
    std::mutex mutex_;
    std::condition_variable available_;
    bool stopping_ = false;
};
