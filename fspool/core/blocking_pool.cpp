//
// Created by Yao ACHI on 19/10/2025.
//
#include "blocking_pool.h"

#include <pthread.h>

#include <fmt/format.h>

#include "async_logger.h"

namespace fspool
{
BlockingPool::BlockingPool(const PoolConfig& config) : config_(config), state_(std::make_shared<SharedState>())
{
    config_.Check();

    workers_.reserve(config_.threads);
    for (size_t i = 0; i < config_.threads; ++i)
    {
        workers_.emplace_back(WorkerLoop, state_, fmt::format("{}-{}", config_.thread_name, i));
    }

    ALOG_INFO("BlockingPool started with {} threads", config_.threads);
}

BlockingPool::~BlockingPool()
{
    RequestStop();

    // Joined threads (after Stop()) are no longer joinable; the others keep the shared state alive.
    for (auto& t : workers_)
    {
        if (t.joinable())
        {
            t.detach();
        }
    }
}

Result<void> BlockingPool::Submit(Job job)
{
    {
        std::scoped_lock lk(state_->m);
        // Checked under the lock so no job slips in after the workers drained the queue.
        if (state_->stopping)
        {
            ALOG_WARN("BlockingPool refused a job: pool is stopped");
            return std::unexpected(Error::custom(kDispatchRefused));
        }
        state_->queue.push_back(std::move(job));
    }
    state_->cv.notify_one();
    return {};
}

bool BlockingPool::RequestStop()
{
    {
        std::scoped_lock lk(state_->m);
        if (state_->stopping)
        {
            return false;
        }
        state_->stopping = true;
    }
    state_->cv.notify_all();
    return true;
}

void BlockingPool::Stop()
{
    if (!RequestStop())
    {
        ALOG_DEBUG("BlockingPool::Stop() called but pool is already stopped");
        return;
    }

    for (auto& t : workers_)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
    ALOG_INFO("BlockingPool has stopped.");
}

bool BlockingPool::IsStopped() const
{
    std::scoped_lock lk(state_->m);
    return state_->stopping;
}

void BlockingPool::WorkerLoop(const std::shared_ptr<SharedState>& state, const std::string& name)
{
    if (const int rc = ::pthread_setname_np(::pthread_self(), name.c_str()); rc != 0)
    {
        ALOG_DEBUG("pthread_setname_np({}) failed: {}", name, Error::from_errno(rc));
    }

    while (true)
    {
        Job job;
        {
            std::unique_lock lk(state->m);
            state->cv.wait(lk, [&] { return state->stopping || !state->queue.empty(); });
            if (state->queue.empty())
            {
                // stopping and drained
                return;
            }
            job = std::move(state->queue.front());
            state->queue.pop_front();
        }

        // Execute outside lock
        job();
    }
}
}  // namespace fspool
