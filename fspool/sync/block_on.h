//
// Created by Yao ACHI on 05/02/2026.
//

#ifndef FSPOOL_SYNC_BLOCK_ON_H
#define FSPOOL_SYNC_BLOCK_ON_H

#include <condition_variable>
#include <memory>
#include <mutex>
#include <utility>

#include "fspool/core/waker.h"

namespace fspool::sync
{
namespace internal
{
class ThreadParker
{
    std::mutex m_;
    std::condition_variable cv_;
    bool notified_{false};

public:
    void Unpark()
    {
        {
            std::scoped_lock lk(m_);
            notified_ = true;
        }
        cv_.notify_one();
    }

    // Returns at once if Unpark() happened since the last Park().
    void Park()
    {
        std::unique_lock lk(m_);
        cv_.wait(lk, [this] { return notified_; });
        notified_ = false;
    }
};
}  // namespace internal

/**
 * Drives `poll_fn(const Waker&)` to completion on the calling thread, sleeping
 * between polls until woken. Returns the ready value.
 *
 * This blocks, so it belongs in tests, tools and main(), never inside a
 * cooperative scheduler.
 */
template<typename PollFn>
auto BlockOn(PollFn&& poll_fn)
{
    // shared: a job may still hold a copy of the waker after we return
    auto parker = std::make_shared<internal::ThreadParker>();
    const Waker waker([parker] { parker->Unpark(); });

    while (true)
    {
        auto polled = poll_fn(waker);
        if (polled.IsReady())
        {
            return std::move(polled).Value();
        }
        parker->Park();
    }
}
}  // namespace fspool::sync

#endif  // FSPOOL_SYNC_BLOCK_ON_H
