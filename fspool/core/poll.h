//
// Created by Yao ACHI on 02/02/2026.
//

#ifndef FSPOOL_CORE_POLL_H
#define FSPOOL_CORE_POLL_H

#include <cassert>
#include <optional>
#include <type_traits>
#include <utility>

namespace fspool
{
struct PendingTag
{
};

inline constexpr PendingTag kPending{};

/**
 * @brief Outcome of polling a non-blocking operation: either a value is Ready,
 * or the operation is Pending and the waker passed to the poll call will be
 * invoked once progress is possible.
 */
template<typename T>
class Poll
{
public:
    Poll(PendingTag) noexcept {}  // NOLINT(google-explicit-constructor)
    Poll(T value) : value_(std::move(value)) {}  // NOLINT(google-explicit-constructor)

    // Lets `return std::unexpected(err);` and friends produce a ready poll directly.
    template<typename U>
        requires(!std::is_same_v<std::remove_cvref_t<U>, Poll> && !std::is_same_v<std::remove_cvref_t<U>, PendingTag> &&
                 !std::is_same_v<std::remove_cvref_t<U>, T> && std::is_constructible_v<T, U &&>)
    Poll(U&& value) : value_(std::in_place, std::forward<U>(value))  // NOLINT(google-explicit-constructor)
    {
    }

    [[nodiscard]] bool IsReady() const noexcept { return value_.has_value(); }
    [[nodiscard]] bool IsPending() const noexcept { return !value_.has_value(); }

    T& Value() &
    {
        assert(IsReady() && "Value() on a pending poll");
        return *value_;
    }

    const T& Value() const&
    {
        assert(IsReady() && "Value() on a pending poll");
        return *value_;
    }

    T&& Value() &&
    {
        assert(IsReady() && "Value() on a pending poll");
        return std::move(*value_);
    }

private:
    std::optional<T> value_;
};
}  // namespace fspool

#endif  // FSPOOL_CORE_POLL_H
