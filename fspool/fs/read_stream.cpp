//
// Created by Yao ACHI on 03/02/2026.
//
#include "read_stream.h"

#include <utility>

#include "fspool/core/async_logger.h"

namespace fspool
{
ReadStream::ReadStream(std::shared_ptr<Executor> executor, std::filesystem::path path, ReadOptions options)
    : executor_(std::move(executor)), path_(std::move(path)), options_(options), state_(Idle{})
{
    options_.Check();
}

ReadStream::ReadStream(std::shared_ptr<Executor> executor, File file, ReadOptions options)
    : executor_(std::move(executor)), options_(options), state_(Idle{std::move(file)})
{
    options_.Check();
}

ReadStream::~ReadStream()
{
    // A job in flight keeps the file and closes it on its own thread.
    if (auto* idle = std::get_if<Idle>(&state_); idle != nullptr && idle->file)
    {
        CloseInBackground(executor_.get(), std::move(*idle->file));
    }
}

Poll<Result<std::optional<Chunk>>> ReadStream::PollNext(const Waker& waker)
{
    while (true)
    {
        if (auto* idle = std::get_if<Idle>(&state_))
        {
            state_ = Pending{DispatchRead(std::move(idle->file))};
            continue;
        }

        if (auto* pending = std::get_if<Pending>(&state_))
        {
            auto polled = pending->read.PollResult(waker);
            if (polled.IsPending())
            {
                return kPending;
            }

            auto outcome = std::move(polled).Value();
            if (!outcome)
            {
                ALOG_DEBUG("read stream on '{}' failed: {}", path_.string(), outcome.error());
                state_ = Closed{};
                return std::unexpected(outcome.error());
            }

            if (outcome->chunk.empty())
            {
                state_ = Closed{};
                return std::optional<Chunk>{};
            }

            bytes_read_ += outcome->chunk.size();
            state_ = Idle{std::move(outcome->file)};
            return std::optional<Chunk>{std::move(outcome->chunk)};
        }

        // Closed
        return std::optional<Chunk>{};
    }
}

FsFuture<ReadStream::ReadOutcome> ReadStream::DispatchRead(std::optional<File> file)
{
    return SpawnBlocking(*executor_,
                         [file = std::move(file), path = path_, chunk_size = options_.chunk_size,
                          flags = options_.flags]() mutable -> Result<ReadOutcome>
                         {
                             if (!file)
                             {
                                 file = FSPOOL_TRY(File::Open(path, flags));
                             }

                             Chunk chunk(chunk_size);
                             const size_t n = FSPOOL_TRY(file->ReadSome(chunk));
                             chunk.resize(n);

                             if (n == 0)
                             {
                                 // end of file: release the descriptor here rather than on the scheduler thread
                                 if (auto closed = file->Close(); !closed)
                                 {
                                     ALOG_WARN("close after end of file failed: {}", closed.error());
                                 }
                                 return ReadOutcome{File{}, std::move(chunk)};
                             }
                             return ReadOutcome{std::move(*file), std::move(chunk)};
                         });
}
}  // namespace fspool
