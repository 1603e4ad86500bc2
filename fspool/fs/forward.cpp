//
// Created by Yao ACHI on 05/02/2026.
//
#include "forward.h"

#include <utility>

namespace fspool
{
Forward::Forward(ReadStream source, WriteSink sink) : source_(std::move(source)), sink_(std::move(sink)) {}

Poll<Result<uint64_t>> Forward::PollResult(const Waker& waker)
{
    while (true)
    {
        if (buffered_)
        {
            auto accepted = sink_.PollAccept(*buffered_, waker);
            if (accepted.IsPending())
            {
                return kPending;
            }
            if (!accepted.Value())
            {
                return std::unexpected(accepted.Value().error());
            }
            copied_ += buffered_->size();
            buffered_.reset();
        }

        if (source_done_)
        {
            auto closed = sink_.PollClose(waker);
            if (closed.IsPending())
            {
                return kPending;
            }
            if (!closed.Value())
            {
                return std::unexpected(closed.Value().error());
            }
            return copied_;
        }

        auto next = source_.PollNext(waker);
        if (next.IsPending())
        {
            return kPending;
        }

        auto item = std::move(next).Value();
        if (!item)
        {
            return std::unexpected(item.error());
        }
        if (!*item)
        {
            source_done_ = true;
            continue;
        }
        buffered_ = std::move(**item);
    }
}
}  // namespace fspool
