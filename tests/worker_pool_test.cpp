#include "test_base.hpp"
#include "core/worker_pool.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <csignal>
#include <stdexcept>
#include <thread>
#include <unistd.h>

class WorkerPoolTest : public TestBase
{
protected:
    static ConcurrencyOptions options(WorkerBackend backend, size_t workers)
    {
        ConcurrencyOptions opts;
        opts.worker_backend = backend;
        opts.max_workers = workers;
        return opts;
    }

    static WorkerPool::Task sleepy(const std::string &name, int millis)
    {
        return [name, millis]()
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(millis));
            ProcessingResult result(name, true);
            result.output_bytes = std::vector<uint8_t>{1, 2, 3};
            result.warnings.push_back("done " + name);
            return result;
        };
    }
};

TEST_F(WorkerPoolTest, CreateHonoursBackendAndRejectsBadOptions)
{
    auto threads = WorkerPool::create(options(WorkerBackend::THREAD, 3));
    EXPECT_EQ(threads->backendName(), "thread");
    EXPECT_EQ(threads->capacity(), 3u);

    auto processes = WorkerPool::create(options(WorkerBackend::PROCESS, 1));
    EXPECT_EQ(processes->backendName(), "process");

    EXPECT_THROW(WorkerPool::create(options(WorkerBackend::THREAD, 0)), ConfigError);
}

TEST_F(WorkerPoolTest, ThreadPoolRunsTasksWithinCapacity)
{
    auto pool = WorkerPool::create(options(WorkerBackend::THREAD, 2));

    std::vector<std::future<ProcessingResult>> futures;
    for (int i = 0; i < 5; ++i)
    {
        futures.push_back(pool->submit("doc" + std::to_string(i), sleepy("doc" + std::to_string(i), 50)));
    }
    for (int i = 0; i < 5; ++i)
    {
        ProcessingResult result = futures[i].get();
        EXPECT_TRUE(result.succeeded);
        EXPECT_EQ(result.name, "doc" + std::to_string(i));
    }

    EXPECT_LE(pool->peakActiveCount(), 2u);
    EXPECT_GE(pool->peakActiveCount(), 1u);
    EXPECT_EQ(pool->activeCount(), 0u);
}

TEST_F(WorkerPoolTest, ThreadPoolTurnsExceptionsIntoFailures)
{
    auto pool = WorkerPool::create(options(WorkerBackend::THREAD, 2));

    auto bad = pool->submit("bad.pptx", []() -> ProcessingResult
                            { throw std::runtime_error("boom"); });
    auto good = pool->submit("good.pptx", sleepy("good.pptx", 1));

    ProcessingResult failed = bad.get();
    EXPECT_FALSE(failed.succeeded);
    EXPECT_EQ(failed.name, "bad.pptx");
    ASSERT_EQ(failed.warnings.size(), 1u);
    EXPECT_NE(failed.warnings[0].find("boom"), std::string::npos);
    EXPECT_TRUE(good.get().succeeded);
}

TEST_F(WorkerPoolTest, ProcessPoolReturnsChildResults)
{
    auto pool = WorkerPool::create(options(WorkerBackend::PROCESS, 2));
    const pid_t parent = ::getpid();

    std::vector<std::future<ProcessingResult>> futures;
    for (int i = 0; i < 5; ++i)
    {
        const std::string name = "deck" + std::to_string(i) + ".pptx";
        futures.push_back(pool->submit(name, [name, parent]()
                                       {
            ProcessingResult result(name, true);
            result.output_bytes = std::vector<uint8_t>(1000, static_cast<uint8_t>(name[4]));
            result.warnings.push_back(::getpid() == parent ? "same process" : "child process");
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            return result; }));
    }

    for (int i = 0; i < 5; ++i)
    {
        ProcessingResult result = futures[i].get();
        ASSERT_TRUE(result.succeeded);
        EXPECT_EQ(result.name, "deck" + std::to_string(i) + ".pptx");
        ASSERT_TRUE(result.output_bytes.has_value());
        EXPECT_EQ(result.output_bytes->size(), 1000u);
        EXPECT_EQ((*result.output_bytes)[0], static_cast<uint8_t>('0' + i));
        ASSERT_EQ(result.warnings.size(), 1u);
        EXPECT_EQ(result.warnings[0], "child process");
    }
    EXPECT_LE(pool->peakActiveCount(), 2u);
}

TEST_F(WorkerPoolTest, ProcessPoolSurvivesCrashingWorker)
{
    auto pool = WorkerPool::create(options(WorkerBackend::PROCESS, 2));

    auto crash = pool->submit("crash.pptx", []() -> ProcessingResult
                              {
        std::raise(SIGKILL);
        return ProcessingResult("crash.pptx", true); });
    auto silent = pool->submit("silent.pptx", []() -> ProcessingResult
                               { ::_exit(0); });
    auto thrown = pool->submit("thrown.pptx", []() -> ProcessingResult
                               { throw std::runtime_error("bad slide"); });
    auto fine = pool->submit("fine.pptx", sleepy("fine.pptx", 1));

    ProcessingResult crashed = crash.get();
    EXPECT_FALSE(crashed.succeeded);
    EXPECT_EQ(crashed.name, "crash.pptx");
    ASSERT_FALSE(crashed.warnings.empty());
    EXPECT_NE(crashed.warnings[0].find("signal"), std::string::npos);

    ProcessingResult no_result = silent.get();
    EXPECT_FALSE(no_result.succeeded);
    EXPECT_EQ(no_result.name, "silent.pptx");

    ProcessingResult threw = thrown.get();
    EXPECT_FALSE(threw.succeeded);
    ASSERT_FALSE(threw.warnings.empty());
    EXPECT_NE(threw.warnings[0].find("bad slide"), std::string::npos);

    EXPECT_TRUE(fine.get().succeeded);
}

TEST_F(WorkerPoolTest, FinishCallbackFollowsResolvedResult)
{
    for (WorkerBackend backend : {WorkerBackend::THREAD, WorkerBackend::PROCESS})
    {
        auto pool = WorkerPool::create(options(backend, 2));

        std::mutex mutex;
        std::condition_variable finished;
        std::vector<std::string> order;
        std::vector<std::future<ProcessingResult>> futures;
        for (const char *name : {"slow.pptx", "fast.pptx"})
        {
            const std::string doc(name);
            futures.push_back(pool->submit(doc, sleepy(doc, doc == "slow.pptx" ? 200 : 1), [&, doc]()
                                           {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    order.push_back(doc);
                }
                finished.notify_one(); }));
        }

        {
            std::unique_lock<std::mutex> lock(mutex);
            ASSERT_TRUE(finished.wait_for(lock, std::chrono::seconds(10), [&order]
                                          { return !order.empty(); }));
            EXPECT_EQ(order[0], "fast.pptx") << pool->backendName();
        }
        EXPECT_EQ(futures[1].wait_for(std::chrono::seconds(0)), std::future_status::ready);

        EXPECT_TRUE(futures[0].get().succeeded);
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(finished.wait_for(lock, std::chrono::seconds(10), [&order]
                                      { return order.size() == 2; }));
    }
}

TEST_F(WorkerPoolTest, DestructorWaitsForQueuedWork)
{
    std::vector<std::future<ProcessingResult>> futures;
    {
        auto pool = WorkerPool::create(options(WorkerBackend::THREAD, 1));
        for (int i = 0; i < 3; ++i)
        {
            futures.push_back(pool->submit("doc", sleepy("doc", 20)));
        }
    }
    for (auto &future : futures)
    {
        ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
        EXPECT_TRUE(future.get().succeeded);
    }
}
