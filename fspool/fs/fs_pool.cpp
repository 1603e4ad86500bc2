//
// Created by Yao ACHI on 06/10/2025.
//
#include "fs_pool.h"

#include <stdexcept>
#include <utility>

#include "fspool/core/async_logger.h"

namespace fspool
{
FsPool::FsPool() : FsPool(PoolConfig{}) {}

FsPool::FsPool(const size_t threads) : FsPool(PoolConfig{.threads = threads}) {}

FsPool::FsPool(const PoolConfig& config) : executor_(std::make_shared<BlockingPool>(config)) {}

FsPool::FsPool(std::shared_ptr<Executor> executor) : executor_(std::move(executor)) {}

FsPool FsPool::WithExecutor(std::shared_ptr<Executor> executor)
{
    if (!executor)
    {
        throw std::invalid_argument("FsPool::WithExecutor: executor must not be null");
    }
    return FsPool(std::move(executor));
}

ReadStream FsPool::Read(std::filesystem::path path, const ReadOptions options) const
{
    return {executor_, std::move(path), options};
}

ReadStream FsPool::ReadFile(File file, const ReadOptions options) const
{
    return {executor_, std::move(file), options};
}

WriteSink FsPool::Write(std::filesystem::path path, const WriteOptions options) const
{
    return {executor_, std::move(path), options};
}

WriteSink FsPool::WriteFile(File file, const WriteOptions options) const
{
    return {executor_, std::move(file), options};
}

FsFuture<void> FsPool::Delete(std::filesystem::path path) const
{
    ALOG_DEBUG("deleting '{}'", path.string());
    return SpawnBlocking(*executor_, [path = std::move(path)] { return RemoveFile(path); });
}
}  // namespace fspool
