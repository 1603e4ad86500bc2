//
// Created by Yao ACHI on 04/02/2026.
//
#include "write_sink.h"

#include <utility>

#include "fspool/core/async_logger.h"

namespace fspool
{
WriteSink::WriteSink(std::shared_ptr<Executor> executor, std::filesystem::path path, WriteOptions options)
    : executor_(std::move(executor)), path_(std::move(path)), options_(options), state_(Idle{})
{
    options_.Check();
}

WriteSink::WriteSink(std::shared_ptr<Executor> executor, File file, WriteOptions options)
    : executor_(std::move(executor)), options_(options), state_(Idle{std::move(file), BytesMut{}})
{
    options_.Check();
}

WriteSink::~WriteSink()
{
    if (auto* idle = std::get_if<Idle>(&state_); idle != nullptr)
    {
        if (!idle->staged.IsEmpty())
        {
            ALOG_DEBUG("write sink dropped with {} unwritten bytes", idle->staged.Remaining());
        }
        if (idle->file)
        {
            CloseInBackground(executor_.get(), std::move(*idle->file));
        }
    }
}

Poll<Result<void>> WriteSink::PollReady(const Waker& waker)
{
    while (true)
    {
        if (auto* idle = std::get_if<Idle>(&state_))
        {
            if (idle->staged.IsEmpty())
            {
                return Result<void>{};
            }
            // tail of a short write goes out before anything new is accepted
            state_ = Pending{DispatchWrite(std::move(idle->file), std::move(idle->staged))};
            continue;
        }

        if (auto* pending = std::get_if<Pending>(&state_))
        {
            auto polled = pending->write.PollResult(waker);
            if (polled.IsPending())
            {
                return kPending;
            }

            auto outcome = std::move(polled).Value();
            if (!outcome)
            {
                return std::unexpected(Fail(outcome.error()));
            }

            bytes_written_ += outcome->written;
            state_ = Idle{std::move(outcome->file), std::move(outcome->staged)};
            continue;
        }

        if (const auto* closed = std::get_if<Closed>(&state_); closed != nullptr && closed->error)
        {
            return std::unexpected(*closed->error);
        }
        // Closing, or closed cleanly
        return std::unexpected(Error::custom(kAppSinkClosed));
    }
}

Poll<Result<void>> WriteSink::PollAccept(std::span<const char> chunk, const Waker& waker)
{
    auto ready = PollReady(waker);
    if (ready.IsPending() || !ready.Value())
    {
        return ready;
    }

    if (chunk.empty())
    {
        return Result<void>{};
    }

    auto& idle = std::get<Idle>(state_);
    idle.staged.ExtendFromSlice(chunk);
    state_ = Pending{DispatchWrite(std::move(idle.file), std::move(idle.staged))};
    return Result<void>{};
}

Poll<Result<void>> WriteSink::PollFlush(const Waker& waker)
{
    return PollReady(waker);
}

Poll<Result<void>> WriteSink::PollClose(const Waker& waker)
{
    while (true)
    {
        if (const auto* closed = std::get_if<Closed>(&state_))
        {
            if (closed->error)
            {
                return std::unexpected(*closed->error);
            }
            return Result<void>{};
        }

        if (auto* closing = std::get_if<Closing>(&state_))
        {
            auto polled = closing->close.PollResult(waker);
            if (polled.IsPending())
            {
                return kPending;
            }
            if (auto closed = std::move(polled).Value(); !closed)
            {
                return std::unexpected(Fail(closed.error()));
            }
            state_ = Closed{};
            return Result<void>{};
        }

        auto flushed = PollFlush(waker);
        if (flushed.IsPending() || !flushed.Value())
        {
            return flushed;
        }

        auto& idle = std::get<Idle>(state_);
        state_ = Closing{DispatchClose(std::move(idle.file))};
    }
}

Error WriteSink::Fail(const Error error)
{
    ALOG_DEBUG("write sink on '{}' failed: {}", path_.string(), error);
    state_ = Closed{error};
    return error;
}

FsFuture<WriteSink::WriteOutcome> WriteSink::DispatchWrite(std::optional<File> file, BytesMut staged)
{
    return SpawnBlocking(*executor_,
                         [file = std::move(file), staged = std::move(staged), path = path_,
                          flags = options_.OpenFlags(), mode = options_.FileMode()]() mutable -> Result<WriteOutcome>
                         {
                             if (!file)
                             {
                                 file = FSPOOL_TRY(File::Open(path, flags, mode));
                             }

                             const size_t n = FSPOOL_TRY(file->WriteSome(staged.ReadableSpan()));
                             if (n == 0)
                             {
                                 return std::unexpected(Error::custom(kFileWriteZero));
                             }
                             staged.Advance(n);
                             return WriteOutcome{std::move(*file), std::move(staged), n};
                         });
}

FsFuture<void> WriteSink::DispatchClose(std::optional<File> file)
{
    return SpawnBlocking(*executor_,
                         [file = std::move(file), path = path_, flags = options_.OpenFlags(),
                          mode = options_.FileMode(), sync = options_.ShouldSyncOnClose()]() mutable -> Result<void>
                         {
                             if (!file)
                             {
                                 file = FSPOOL_TRY(File::Open(path, flags, mode));
                             }
                             if (sync)
                             {
                                 FSPOOL_TRY(file->Sync());
                             }
                             return file->Close();
                         });
}
}  // namespace fspool
