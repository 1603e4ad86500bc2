//
// Created by Yao ACHI on 02/02/2026.
//

#ifndef FSPOOL_FS_FS_FUTURE_H
#define FSPOOL_FS_FS_FUTURE_H

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include "fspool/core/async_logger.h"
#include "fspool/core/errors.h"
#include "fspool/core/executor.h"
#include "fspool/core/poll.h"
#include "fspool/core/waker.h"
#include "fspool/fs/file.h"
#include "fspool/sync/oneshot.h"

namespace fspool
{
/**
 * @brief Completion handle of one job running on the pool.
 *
 * Polled from the scheduler thread. Resolves to the job's Result, to
 * kChannelBroken if the job vanished without answering, or to the dispatch
 * error if the executor refused the job in the first place. Dropping it is
 * inert: the job still runs and its result is discarded.
 */
template<typename T>
class FsFuture
{
public:
    explicit FsFuture(sync::OneshotReceiver<Result<T>> rx) : rx_(std::move(rx)) {}

    static FsFuture Failed(Error error) { return FsFuture(error); }

    FsFuture(FsFuture&&) noexcept = default;
    FsFuture& operator=(FsFuture&&) noexcept = default;
    FsFuture(const FsFuture&) = delete;
    FsFuture& operator=(const FsFuture&) = delete;
    ~FsFuture() = default;

    Poll<Result<T>> PollResult(const Waker& waker)
    {
        if (failed_)
        {
            return std::unexpected(*failed_);
        }

        auto polled = rx_->PollRecv(waker);
        if (polled.IsPending())
        {
            return kPending;
        }

        // Result<Result<T>>: the outer error is the channel, the inner one the job
        auto received = std::move(polled).Value();
        if (!received)
        {
            return std::unexpected(received.error());
        }
        return std::move(*received);
    }

private:
    explicit FsFuture(const Error error) : failed_(error) {}

    std::optional<sync::OneshotReceiver<Result<T>>> rx_;
    std::optional<Error> failed_;
};

/**
 * Runs `fn` (returning Result<T>) on the executor and returns its completion handle.
 *
 * Any exception escaping `fn` is logged and drops the sender, so the handle
 * reports kChannelBroken.
 */
template<typename F>
auto SpawnBlocking(Executor& executor, F&& fn) -> FsFuture<typename std::invoke_result_t<std::decay_t<F>&>::value_type>
{
    using T = typename std::invoke_result_t<std::decay_t<F>&>::value_type;

    auto [tx, rx] = sync::MakeOneshot<Result<T>>();
    auto job = [tx = std::move(tx), fn = std::forward<F>(fn)]() mutable noexcept
    {
        try
        {
            if (!tx.Send(fn()))
            {
                ALOG_DEBUG("blocking job completed after its consumer went away, result dropped");
            }
        }
        catch (const std::exception& e)
        {
            ALOG_ERROR("blocking job terminated by exception: {}", e.what());
        }
        catch (...)
        {
            ALOG_ERROR("blocking job terminated by a non-standard exception");
        }
    };

    if (auto submitted = executor.Submit(std::move(job)); !submitted)
    {
        return FsFuture<T>::Failed(submitted.error());
    }
    return FsFuture<T>(std::move(rx));
}

/**
 * Closes `file` on the executor so the caller never blocks in close(2).
 * Falls back to closing inline when the executor refuses the job.
 */
inline void CloseInBackground(Executor* executor, File file)
{
    if (!file.IsOpen())
    {
        return;
    }

    auto close_job = [file = std::move(file)]() mutable noexcept
    {
        if (auto closed = file.Close(); !closed)
        {
            ALOG_WARN("closing fd in background failed: {}", closed.error());
        }
    };

    if (executor == nullptr)
    {
        close_job();
        return;
    }

    // A refused job is destroyed right away, and the File destructor closes the fd inline.
    if (auto submitted = executor->Submit(std::move(close_job)); !submitted)
    {
        ALOG_DEBUG("background close refused ({}), fd closed inline", submitted.error());
    }
}
}  // namespace fspool

#endif  // FSPOOL_FS_FS_FUTURE_H
