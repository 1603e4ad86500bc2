//
// Created by Yao ACHI on 04/02/2026.
//

#ifndef FSPOOL_FS_WRITE_SINK_H
#define FSPOOL_FS_WRITE_SINK_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <variant>

#include "fspool/core/bytes_mut.h"
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
 * @brief Accepts chunks and writes them to a file on the pool, in order,
 * with at most one write job in flight.
 *
 * PollAccept() is the backpressure point: it stays Pending until the previous
 * write and any unwritten tail of a short write have completed. The file is
 * opened by the first job; PollClose() opens it if nothing was written, so
 * create and truncate still take effect.
 *
 * After a failure every operation reports that failure; the file keeps
 * whatever the last successful write left in it.
 *
 * Not thread safe: poll from a single scheduler thread.
 */
class WriteSink
{
public:
    WriteSink(std::shared_ptr<Executor> executor, std::filesystem::path path, WriteOptions options);

    WriteSink(std::shared_ptr<Executor> executor, File file, WriteOptions options);

    WriteSink(WriteSink&&) noexcept = default;
    WriteSink& operator=(WriteSink&&) noexcept = default;
    WriteSink(const WriteSink&) = delete;
    WriteSink& operator=(const WriteSink&) = delete;

    ~WriteSink();

    /**
     * Ready(ok) once the sink can take a chunk without queueing a second write.
     */
    Poll<Result<void>> PollReady(const Waker& waker);

    /**
     * Takes `chunk` and dispatches its write if the sink is ready, otherwise
     * returns Pending without taking it; the caller offers the same chunk again
     * after being woken. The bytes are copied, `chunk` is not retained.
     */
    Poll<Result<void>> PollAccept(std::span<const char> chunk, const Waker& waker);

    /**
     * Ready(ok) once every accepted byte reached the file.
     */
    Poll<Result<void>> PollFlush(const Waker& waker);

    /**
     * Flushes, then closes the file on the pool (after fsync() when configured).
     * Idempotent once Ready.
     */
    Poll<Result<void>> PollClose(const Waker& waker);

    [[nodiscard]] bool IsClosed() const noexcept { return std::holds_alternative<Closed>(state_); }

    [[nodiscard]] uint64_t BytesWritten() const noexcept { return bytes_written_; }

private:
    struct WriteOutcome
    {
        File file;
        BytesMut staged;  // what the kernel did not take
        size_t written{0};
    };

    struct Idle
    {
        std::optional<File> file;  // nullopt until the first job opened the path
        BytesMut staged;
    };

    struct Pending
    {
        FsFuture<WriteOutcome> write;
    };

    struct Closing
    {
        FsFuture<void> close;
    };

    struct Closed
    {
        std::optional<Error> error;
    };

    FsFuture<WriteOutcome> DispatchWrite(std::optional<File> file, BytesMut staged);

    FsFuture<void> DispatchClose(std::optional<File> file);

    Error Fail(Error error);

    std::shared_ptr<Executor> executor_;
    std::filesystem::path path_;
    WriteOptions options_;
    std::variant<Idle, Pending, Closing, Closed> state_;
    uint64_t bytes_written_{0};
};
}  // namespace fspool

#endif  // FSPOOL_FS_WRITE_SINK_H
