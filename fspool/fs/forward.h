//
// Created by Yao ACHI on 05/02/2026.
//

#ifndef FSPOOL_FS_FORWARD_H
#define FSPOOL_FS_FORWARD_H

#include <cstdint>
#include <optional>

#include "fspool/core/errors.h"
#include "fspool/core/poll.h"
#include "fspool/core/waker.h"
#include "fspool/fs/read_stream.h"
#include "fspool/fs/write_sink.h"

namespace fspool
{
/**
 * Pipes every chunk of a ReadStream into a WriteSink, then closes the sink.
 * Resolves to the number of bytes copied. The next read is in flight while
 * the previous chunk is being written.
 *
 * @code
 *   fspool::FsPool fs;
 *   fspool::Forward copy(fs.Read("in.bin"), fs.Write("out.bin"));
 *   auto copied = fspool::sync::BlockOn([&](const fspool::Waker& w) { return copy.PollResult(w); });
 * @endcode
 */
class Forward
{
public:
    Forward(ReadStream source, WriteSink sink);

    Poll<Result<uint64_t>> PollResult(const Waker& waker);

private:
    ReadStream source_;
    WriteSink sink_;
    std::optional<Chunk> buffered_;
    bool source_done_{false};
    uint64_t copied_{0};
};
}  // namespace fspool

#endif  // FSPOOL_FS_FORWARD_H
