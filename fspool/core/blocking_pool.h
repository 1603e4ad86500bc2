//
// Created by Yao ACHI on 19/10/2025.
//

#ifndef FSPOOL_CORE_BLOCKING_POOL_H
#define FSPOOL_CORE_BLOCKING_POOL_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fspool/core/executor.h"

namespace fspool
{
constexpr size_t kDefaultPoolThreads = 4;

struct PoolConfig
{
    size_t threads{kDefaultPoolThreads};
    // Linux limits thread names to 15 chars, the index is appended.
    std::string thread_name{"fspool-io"};

    void Check() const
    {
        if (threads == 0)
        {
            throw std::invalid_argument("PoolConfig: threads must be at least 1");
        }
        if (thread_name.size() > 11)
        {
            throw std::invalid_argument("PoolConfig: thread_name must be at most 11 characters");
        }
    }
};

/**
 * Fixed-size pool of OS threads running blocking jobs in FIFO order.
 *
 * Stop() lets already queued jobs run to completion, then joins the threads;
 * jobs submitted afterwards are refused with kDispatchRefused.
 *
 * The destructor only signals shutdown: the threads are detached, finish the
 * queued jobs and exit on their own, so dropping the last reference never
 * waits for a syscall in flight.
 */
class BlockingPool final : public Executor
{
public:
    explicit BlockingPool(const PoolConfig& config = {});

    ~BlockingPool() override;

    BlockingPool(const BlockingPool&) = delete;
    BlockingPool& operator=(const BlockingPool&) = delete;
    BlockingPool(BlockingPool&&) = delete;
    BlockingPool& operator=(BlockingPool&&) = delete;

    Result<void> Submit(Job job) override;

    // Blocks until every queued job ran. Never call it from a pool thread.
    void Stop();

    [[nodiscard]] bool IsStopped() const;

    [[nodiscard]] size_t NumThreads() const noexcept { return workers_.size(); }

private:
    // Outlives the pool object while detached threads still drain the queue.
    struct SharedState
    {
        std::mutex m;
        std::condition_variable cv;
        std::deque<Job> queue;
        bool stopping{false};
    };

    // False if shutdown had already been requested.
    bool RequestStop();

    static void WorkerLoop(const std::shared_ptr<SharedState>& state, const std::string& name);

    PoolConfig config_;
    std::shared_ptr<SharedState> state_;
    std::vector<std::thread> workers_;
};
}  // namespace fspool

#endif  // FSPOOL_CORE_BLOCKING_POOL_H
