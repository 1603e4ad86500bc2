//
// Created by Yao ACHI on 05/02/2026.
//

#ifndef FSPOOL_FS_BLOCKING_H
#define FSPOOL_FS_BLOCKING_H

#include <span>

#include "fspool/core/errors.h"
#include "fspool/fs/fs_future.h"
#include "fspool/fs/read_stream.h"
#include "fspool/fs/write_sink.h"
#include "fspool/sync/block_on.h"

namespace fspool
{
/**
 * Blocking conveniences built on sync::BlockOn, for tools and tests.
 * Never call them from a cooperative scheduler thread.
 */

// Concatenates every remaining chunk of the stream.
[[nodiscard]] Result<Chunk> CollectAll(ReadStream& stream);

// Offers `data` to the sink in slices of at most `slice` bytes, then closes it.
[[nodiscard]] Result<void> WriteAll(WriteSink& sink, std::span<const char> data, size_t slice = kDefaultChunkSize);

// Blocks until the completion resolves.
template<typename T>
[[nodiscard]] Result<T> Wait(FsFuture<T>& future)
{
    return sync::BlockOn([&](const Waker& waker) { return future.PollResult(waker); });
}
}  // namespace fspool

#endif  // FSPOOL_FS_BLOCKING_H
