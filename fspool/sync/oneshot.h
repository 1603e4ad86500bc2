//
// Created by Yao ACHI on 02/02/2026.
//

#ifndef FSPOOL_SYNC_ONESHOT_H
#define FSPOOL_SYNC_ONESHOT_H

#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "fspool/core/errors.h"
#include "fspool/core/poll.h"
#include "fspool/core/waker.h"

namespace fspool::sync
{
namespace detail
{
    template<typename T>
    struct OneshotCell
    {
        std::mutex m;
        std::optional<T> value;
        Waker waker;
        bool sender_alive{true};
        bool receiver_alive{true};
    };
}  // namespace detail

/**
 * @brief Producer half of a one-shot channel. Lives inside the pool job.
 *
 * Sends at most one value. Destroying it without sending (the job threw, or
 * the executor dropped the job) wakes the receiver, which then observes
 * kChannelBroken.
 */
template<typename T>
class OneshotSender
{
public:
    explicit OneshotSender(std::shared_ptr<detail::OneshotCell<T>> cell) : cell_(std::move(cell)) {}

    OneshotSender(const OneshotSender&) = delete;
    OneshotSender& operator=(const OneshotSender&) = delete;

    OneshotSender(OneshotSender&& other) noexcept = default;

    OneshotSender& operator=(OneshotSender&& other) noexcept
    {
        if (this != &other)
        {
            Close();
            cell_ = std::move(other.cell_);
        }
        return *this;
    }

    ~OneshotSender() { Close(); }

    /**
     * Hands the value to the receiver and wakes it. Returns false when the
     * receiver is already gone; the value is then destroyed on this thread.
     */
    bool Send(T value)
    {
        if (!cell_)
        {
            return false;
        }

        Waker waker;
        {
            std::scoped_lock lk(cell_->m);
            if (!cell_->receiver_alive)
            {
                cell_.reset();
                return false;
            }
            cell_->value.emplace(std::move(value));
            cell_->sender_alive = false;
            waker = std::move(cell_->waker);
        }
        cell_.reset();
        waker.Wake();
        return true;
    }

private:
    void Close() noexcept
    {
        if (!cell_)
        {
            return;
        }

        Waker waker;
        {
            std::scoped_lock lk(cell_->m);
            cell_->sender_alive = false;
            waker = std::move(cell_->waker);
        }
        cell_.reset();
        waker.Wake();
    }

    std::shared_ptr<detail::OneshotCell<T>> cell_;
};

/**
 * @brief Consumer half of a one-shot channel. Polled from the scheduler thread.
 */
template<typename T>
class OneshotReceiver
{
public:
    explicit OneshotReceiver(std::shared_ptr<detail::OneshotCell<T>> cell) : cell_(std::move(cell)) {}

    OneshotReceiver(const OneshotReceiver&) = delete;
    OneshotReceiver& operator=(const OneshotReceiver&) = delete;

    OneshotReceiver(OneshotReceiver&& other) noexcept = default;

    OneshotReceiver& operator=(OneshotReceiver&& other) noexcept
    {
        if (this != &other)
        {
            Detach();
            cell_ = std::move(other.cell_);
        }
        return *this;
    }

    ~OneshotReceiver() { Detach(); }

    /**
     * Takes the value if it was sent. Otherwise stores the waker (replacing a
     * previous one) and returns Pending; the sender wakes it exactly once.
     * Polling again after the value was taken reports kChannelBroken.
     */
    Poll<Result<T>> PollRecv(const Waker& waker)
    {
        if (!cell_)
        {
            return std::unexpected(Error::custom(kChannelBroken));
        }

        std::unique_lock lk(cell_->m);
        if (cell_->value)
        {
            T value = std::move(*cell_->value);
            cell_->value.reset();
            lk.unlock();
            cell_.reset();
            return Result<T>(std::move(value));
        }
        if (!cell_->sender_alive)
        {
            lk.unlock();
            cell_.reset();
            return std::unexpected(Error::custom(kChannelBroken));
        }
        if (!cell_->waker.WillWakeSame(waker))
        {
            cell_->waker = waker;
        }
        return kPending;
    }

private:
    void Detach() noexcept
    {
        if (!cell_)
        {
            return;
        }
        std::optional<T> orphan;
        {
            std::scoped_lock lk(cell_->m);
            cell_->receiver_alive = false;
            cell_->waker = Waker{};
            orphan = std::move(cell_->value);
        }
        cell_.reset();
    }

    std::shared_ptr<detail::OneshotCell<T>> cell_;
};

template<typename T>
std::pair<OneshotSender<T>, OneshotReceiver<T>> MakeOneshot()
{
    auto cell = std::make_shared<detail::OneshotCell<T>>();
    return {OneshotSender<T>(cell), OneshotReceiver<T>(cell)};
}
}  // namespace fspool::sync

#endif  // FSPOOL_SYNC_ONESHOT_H
