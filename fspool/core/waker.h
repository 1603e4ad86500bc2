//
// Created by Yao ACHI on 02/02/2026.
//

#ifndef FSPOOL_CORE_WAKER_H
#define FSPOOL_CORE_WAKER_H

#include <functional>
#include <memory>
#include <utility>

namespace fspool
{
/**
 * @brief Handle used by a completion to tell its poller that polling again
 * will make progress.
 *
 * The scheduler that drives streams and sinks creates one per task. It is
 * cheap to copy and may be invoked from any thread, typically a pool thread
 * that just finished a blocking call. Waking a default constructed Waker is a no-op.
 */
class Waker
{
public:
    Waker() = default;

    explicit Waker(std::function<void()> fn) : fn_(std::make_shared<const std::function<void()>>(std::move(fn))) {}

    void Wake() const
    {
        if (fn_ && *fn_)
        {
            (*fn_)();
        }
    }

    /**
     * True if both wakers resume the same poller, so re-registration can be skipped.
     */
    [[nodiscard]] bool WillWakeSame(const Waker& other) const noexcept { return fn_ == other.fn_; }

    explicit operator bool() const noexcept { return fn_ != nullptr; }

    static const Waker& Noop()
    {
        static const Waker kNoop;
        return kNoop;
    }

private:
    std::shared_ptr<const std::function<void()>> fn_;
};
}  // namespace fspool

#endif  // FSPOOL_CORE_WAKER_H
