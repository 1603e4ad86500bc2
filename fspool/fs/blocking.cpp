//
// Created by Yao ACHI on 05/02/2026.
//
#include "blocking.h"

#include <algorithm>

#include "fspool/sync/block_on.h"

namespace fspool
{
Result<Chunk> CollectAll(ReadStream& stream)
{
    Chunk all;
    while (true)
    {
        auto next = sync::BlockOn([&](const Waker& waker) { return stream.PollNext(waker); });
        if (!next)
        {
            return std::unexpected(next.error());
        }
        if (!*next)
        {
            return all;
        }
        all.insert(all.end(), (*next)->begin(), (*next)->end());
    }
}

Result<void> WriteAll(WriteSink& sink, std::span<const char> data, const size_t slice)
{
    if (slice == 0)
    {
        return std::unexpected(Error::custom(kAppInvalidArg));
    }

    while (!data.empty())
    {
        const auto part = data.first(std::min(slice, data.size()));
        if (auto accepted = sync::BlockOn([&](const Waker& waker) { return sink.PollAccept(part, waker); });
            !accepted)
        {
            return std::unexpected(accepted.error());
        }
        data = data.subspan(part.size());
    }
    return sync::BlockOn([&](const Waker& waker) { return sink.PollClose(waker); });
}
}  // namespace fspool
