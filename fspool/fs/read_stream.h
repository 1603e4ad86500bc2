//
// Created by Yao ACHI on 03/02/2026.
//

#ifndef FSPOOL_FS_READ_STREAM_H
#define FSPOOL_FS_READ_STREAM_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include "fspool/core/errors.h"
#include "fspool/core/executor.h"
#include "fspool/core/poll.h"
#include "fspool/core/waker.h"
#include "fspool/fs/file.h"
#include "fspool/fs/fs_future.h"
#include "fspool/fs/options.h"

namespace fspool
{
/**
 * @brief Finite sequence of chunks read from a file on the pool.
 *
 * Each PollNext() call that finds the stream idle dispatches exactly one job
 * doing one read() of up to chunk_size bytes; the next job is dispatched only
 * after the consumer observed the previous chunk. The job owns the file while
 * it runs, so no lock guards the file position. The path is opened by the
 * first job, never on the caller's thread.
 *
 * Not thread safe: poll from a single scheduler thread.
 */
class ReadStream
{
public:
    ReadStream(std::shared_ptr<Executor> executor, std::filesystem::path path, ReadOptions options);

    ReadStream(std::shared_ptr<Executor> executor, File file, ReadOptions options);

    ReadStream(ReadStream&&) noexcept = default;
    ReadStream& operator=(ReadStream&&) noexcept = default;
    ReadStream(const ReadStream&) = delete;
    ReadStream& operator=(const ReadStream&) = delete;

    ~ReadStream();

    /**
     * Ready(chunk) for the next chunk in file order, Ready(nullopt) once the
     * sequence is over (end of file, or any poll after an error), Ready(error)
     * once if a job failed. Pending registers `waker`.
     */
    Poll<Result<std::optional<Chunk>>> PollNext(const Waker& waker);

    [[nodiscard]] bool IsTerminated() const noexcept { return std::holds_alternative<Closed>(state_); }

    [[nodiscard]] uint64_t BytesRead() const noexcept { return bytes_read_; }

private:
    struct ReadOutcome
    {
        File file;  // not open once end of file was reached
        Chunk chunk;
    };

    struct Idle
    {
        std::optional<File> file;  // nullopt until the first job opened the path
    };

    struct Pending
    {
        FsFuture<ReadOutcome> read;
    };

    struct Closed
    {
    };

    FsFuture<ReadOutcome> DispatchRead(std::optional<File> file);

    std::shared_ptr<Executor> executor_;
    std::filesystem::path path_;
    ReadOptions options_;
    std::variant<Idle, Pending, Closed> state_;
    uint64_t bytes_read_{0};
};
}  // namespace fspool

#endif  // FSPOOL_FS_READ_STREAM_H
