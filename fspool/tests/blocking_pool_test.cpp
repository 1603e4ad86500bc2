//
// Created by Yao ACHI on 19/10/2025.
//

#include "fspool/core/blocking_pool.h"

#include <atomic>
#include <chrono>
#include <future>
#include <latch>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

#include <gtest/gtest.h>

#include "fspool/core/async_logger.h"

using namespace fspool;
using namespace std::chrono_literals;

class BlockingPoolTest : public ::testing::Test
{
protected:
    void SetUp() override { alog::Configure(1024, LogLevel::kDisabled); }
};

TEST_F(BlockingPoolTest, RunsEverySubmittedJob)
{
    constexpr int kJobs = 500;
    std::atomic<int> ran{0};
    std::latch done(kJobs);

    BlockingPool pool(PoolConfig{.threads = 4});
    for (int i = 0; i < kJobs; ++i)
    {
        ASSERT_TRUE(pool.Submit([&]() noexcept {
                            ran.fetch_add(1, std::memory_order_relaxed);
                            done.count_down();
                        }).has_value());
    }
    done.wait();
    EXPECT_EQ(ran.load(), kJobs);
}

TEST_F(BlockingPoolTest, UsesConfiguredNumberOfThreads)
{
    constexpr size_t kThreads = 3;
    BlockingPool pool(PoolConfig{.threads = kThreads});
    EXPECT_EQ(pool.NumThreads(), kThreads);

    // Every thread blocks until all of them have picked up a job.
    std::latch all_running(kThreads);
    std::mutex m;
    std::set<std::thread::id> ids;
    for (size_t i = 0; i < kThreads; ++i)
    {
        ASSERT_TRUE(pool.Submit([&]() noexcept {
                            {
                                std::scoped_lock lk(m);
                                ids.insert(std::this_thread::get_id());
                            }
                            all_running.arrive_and_wait();
                        }).has_value());
    }
    pool.Stop();
    EXPECT_EQ(ids.size(), kThreads);
    EXPECT_EQ(ids.count(std::this_thread::get_id()), 0u);
}

TEST_F(BlockingPoolTest, StopDrainsQueuedJobs)
{
    std::atomic<int> ran{0};
    BlockingPool pool(PoolConfig{.threads = 1});

    std::latch gate(1);
    ASSERT_TRUE(pool.Submit([&]() noexcept { gate.wait(); }).has_value());
    for (int i = 0; i < 10; ++i)
    {
        ASSERT_TRUE(pool.Submit([&]() noexcept { ran.fetch_add(1); }).has_value());
    }

    std::jthread stopper([&] { pool.Stop(); });
    std::this_thread::sleep_for(10ms);
    gate.count_down();
    stopper.join();

    EXPECT_EQ(ran.load(), 10);
    EXPECT_TRUE(pool.IsStopped());
}

TEST_F(BlockingPoolTest, RefusesJobsAfterStop)
{
    BlockingPool pool(PoolConfig{.threads = 2});
    pool.Stop();

    bool ran = false;
    const auto submitted = pool.Submit([&]() noexcept { ran = true; });
    ASSERT_FALSE(submitted.has_value());
    EXPECT_TRUE(submitted.error().IsDispatchRefused());
    EXPECT_FALSE(ran);

    // stays refused
    EXPECT_FALSE(pool.Submit([]() noexcept {}).has_value());
}

TEST_F(BlockingPoolTest, StopIsIdempotent)
{
    BlockingPool pool(PoolConfig{.threads = 2});
    pool.Stop();
    pool.Stop();
    EXPECT_TRUE(pool.IsStopped());
}

TEST_F(BlockingPoolTest, DestructorDoesNotWaitForRunningJob)
{
    auto release = std::make_shared<std::latch>(1);
    auto finished = std::make_shared<std::promise<void>>();
    auto finished_future = finished->get_future();

    auto pool = std::make_unique<BlockingPool>(PoolConfig{.threads = 1});
    ASSERT_TRUE(pool->Submit([release, finished]() noexcept {
                        release->wait();
                        finished->set_value();
                    }).has_value());

    auto dropped = std::async(std::launch::async, [&pool] { pool.reset(); });
    EXPECT_EQ(dropped.wait_for(2s), std::future_status::ready);

    // the detached thread still completes the job
    release->count_down();
    EXPECT_EQ(finished_future.wait_for(2s), std::future_status::ready);
    dropped.wait();
}

TEST_F(BlockingPoolTest, DestroyedPoolStillRunsQueuedJobs)
{
    constexpr int kJobs = 8;
    auto gate = std::make_shared<std::latch>(1);
    auto done = std::make_shared<std::latch>(kJobs);
    auto ran = std::make_shared<std::atomic<int>>(0);

    {
        BlockingPool pool(PoolConfig{.threads = 2});
        for (int i = 0; i < kJobs; ++i)
        {
            ASSERT_TRUE(pool.Submit([gate, done, ran]() noexcept {
                                gate->wait();
                                ran->fetch_add(1);
                                done->count_down();
                            }).has_value());
        }
    }

    gate->count_down();
    done->wait();
    EXPECT_EQ(ran->load(), kJobs);
}

TEST_F(BlockingPoolTest, InvalidConfigThrows)
{
    EXPECT_THROW(BlockingPool(PoolConfig{.threads = 0}), std::invalid_argument);
    EXPECT_THROW(BlockingPool(PoolConfig{.threads = 1, .thread_name = "much-too-long-name"}), std::invalid_argument);
}
