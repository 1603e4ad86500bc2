//
// Created by Yao ACHI on 19/10/2025.
//

#ifndef FSPOOL_SYNC_BATCH_QUEUE_H
#define FSPOOL_SYNC_BATCH_QUEUE_H

#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fspool::sync
{
/**
 * Bounded multi-producer queue drained in batches by a single consumer.
 * Producers append under a mutex; the consumer swaps the whole pending
 * vector out, so it holds the lock for a swap, not for the processing.
 */
template <typename T>
class BatchQueue
{
public:
    explicit BatchQueue(const size_t capacity) : capacity_(capacity)
    {
        if (capacity_ == 0)
        {
            throw std::invalid_argument("BatchQueue capacity must be greater than 0");
        }
        pending_.reserve(capacity_);
    }

    BatchQueue(const BatchQueue&) = delete;
    BatchQueue& operator=(const BatchQueue&) = delete;

    // Returns false, leaving item untouched, when capacity items are already pending.
    bool TryPush(T&& item)
    {
        std::scoped_lock lk(m_);
        if (pending_.size() >= capacity_)
        {
            return false;
        }
        pending_.push_back(std::move(item));
        return true;
    }

    // Replaces the content of out with every pending item, oldest first.
    size_t Drain(std::vector<T>& out)
    {
        out.clear();
        {
            std::scoped_lock lk(m_);
            pending_.swap(out);
        }
        return out.size();
    }

    [[nodiscard]] size_t Capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::mutex m_;
    std::vector<T> pending_;
};
}  // namespace fspool::sync

#endif  // FSPOOL_SYNC_BATCH_QUEUE_H
