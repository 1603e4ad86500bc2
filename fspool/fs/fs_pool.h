//
// Created by Yao ACHI on 06/10/2025.
//

#ifndef FSPOOL_FS_FS_POOL_H
#define FSPOOL_FS_FS_POOL_H

#include <filesystem>
#include <memory>

#include "fspool/core/blocking_pool.h"
#include "fspool/core/executor.h"
#include "fspool/fs/file.h"
#include "fspool/fs/fs_future.h"
#include "fspool/fs/options.h"
#include "fspool/fs/read_stream.h"
#include "fspool/fs/write_sink.h"

namespace fspool
{
/**
 * Entry point for file I/O from a cooperative, single-threaded scheduler.
 *
 * FsPool shares one executor among all its copies and among every stream,
 * sink and future it creates; the executor lives until the last of them is
 * gone. None of the methods block: Delete() queues its job immediately,
 * streams and sinks queue theirs when polled.
 *
 * The executor should be dedicated to blocking work, not shared with
 * latency-sensitive tasks.
 */
class FsPool
{
public:
    // 4 threads
    FsPool();

    explicit FsPool(size_t threads);

    explicit FsPool(const PoolConfig& config);

    /**
     * Backs the pool with an executor owned by the application, for example
     * one pool of blocking threads shared by several subsystems.
     */
    static FsPool WithExecutor(std::shared_ptr<Executor> executor);

    [[nodiscard]] ReadStream Read(std::filesystem::path path, ReadOptions options = {}) const;

    [[nodiscard]] ReadStream ReadFile(File file, ReadOptions options = {}) const;

    [[nodiscard]] WriteSink Write(std::filesystem::path path, WriteOptions options = {}) const;

    [[nodiscard]] WriteSink WriteFile(File file, WriteOptions options = {}) const;

    /**
     * Removes the file at `path`. Resolves to the unlink() error, if any.
     */
    [[nodiscard]] FsFuture<void> Delete(std::filesystem::path path) const;

    [[nodiscard]] const std::shared_ptr<Executor>& GetExecutor() const noexcept { return executor_; }

private:
    explicit FsPool(std::shared_ptr<Executor> executor);

    std::shared_ptr<Executor> executor_;
};
}  // namespace fspool

#endif  // FSPOOL_FS_FS_POOL_H
