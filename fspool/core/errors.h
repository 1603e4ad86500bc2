//
// Created by Yao ACHI on 05/10/2025.
// Reworked for the blocking file pool error taxonomy.
//

#ifndef FSPOOL_CORE_ERRORS_H
#define FSPOOL_CORE_ERRORS_H

#include <cerrno>
#include <cstdint>
#include <expected>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace fspool
{
    // -------------------------------------------------------------------------
    // Specific Error Codes (Constants)
    // -------------------------------------------------------------------------

    // completion channel errors (1000-1999)
    constexpr int kChannelBroken = 1000;

    // executor dispatch errors (2000-2999)
    constexpr int kDispatchRefused = 2000;

    // Custom application errors (3000-3999)
    constexpr int kAppInvalidArg = 3002;
    constexpr int kAppSinkClosed = 3003;

    // file level errors that have no errno (4000-4999)
    constexpr int kFileWriteZero = 4000;

    // -------------------------------------------------------------------------
    // Top-Level Categories
    // -------------------------------------------------------------------------

    enum class ErrorCategory : int8_t
    {
        Success = 0,
        File,
        SystemResource,
        Device,
        Channel,  // the producer side of a completion went away
        Dispatch,  // the executor refused new work
        Application,
        Unknown
    };

    // -------------------------------------------------------------------------
    // Helper Functions (Internal)
    // -------------------------------------------------------------------------

    constexpr std::string_view CategoryToString(const ErrorCategory cat)
    {
        using enum ErrorCategory;
        switch (cat)
        {
            case Success:
                return "Success";
            case File:
                return "File";
            case SystemResource:
                return "SystemResource";
            case Device:
                return "Device";
            case Channel:
                return "Channel";
            case Dispatch:
                return "Dispatch";
            case Application:
                return "Application";
            case Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    constexpr ErrorCategory CategoryFromErrno(const int err)
    {
        using enum ErrorCategory;
        if (err == 0) return Success;

        // Custom Ranges
        if (err >= 1000 && err < 2000) return Channel;
        if (err >= 2000 && err < 3000) return Dispatch;
        if (err >= 3000 && err < 4000) return Application;
        if (err >= 4000 && err < 5000) return File;

        // Standard POSIX mapping
        switch (err)  // NOSONAR on number of switch cases
        {
            // File
            case ENOENT:
            case EACCES:
            case EPERM:
            case EEXIST:
            case EISDIR:
            case ENOTDIR:
            case ENAMETOOLONG:
            case ELOOP:
            case EROFS:
            case EBADF:
            case EIO:
            case ENOSPC:
            case EDQUOT:
            case ESPIPE:
            case EFBIG:
            case ENOTEMPTY:
            case EXDEV:
            case EINVAL:
            case ETXTBSY:
                return File;

            // System Resource
            case ENOMEM:
            case EMFILE:
            case ENFILE:
            case EAGAIN:
            case EDEADLK:
            case ENOLCK:
            case ENOSYS:
            case ECANCELED:
            case EINTR:
                return SystemResource;

            // Device
            case ENODEV:
            case ENXIO:
            case EBUSY:
                return Device;

            default:
                return Unknown;
        }
    }

    inline std::string ErrorValueToString(const int value)
    {
        // Handle Custom Codes
        switch (value)
        {
            case kChannelBroken:
                return "Completion producer dropped without sending";

            case kDispatchRefused:
                return "Executor refused the task (shut down)";

            case kAppInvalidArg:
                return "Invalid argument";
            case kAppSinkClosed:
                return "Sink is closed";

            case kFileWriteZero:
                return "Write made no progress";

            default:
                break;
        }

        // Handle POSIX Codes - thread-safe using std::system_error
        if (value > 0 && value < 1000)
        {
            return std::generic_category().message(value);
        }

        return "Unknown code";
    }

    // -------------------------------------------------------------------------
    // The Error Class
    // -------------------------------------------------------------------------

    struct Error
    {
        ErrorCategory category;
        int value;  // The specific errno or custom code

        constexpr Error() : category(ErrorCategory::Success), value(0) {}
        constexpr Error(const ErrorCategory cat, const int val) : category(cat), value(val) {}

        static Error from_errno(int err) { return {CategoryFromErrno(err), err}; }

        // Helper for custom codes, the category is derived from the code range
        static Error custom(int val) { return {CategoryFromErrno(val), val}; }

        // A failure of the file operation itself (errno, or the File custom range),
        // as opposed to the plumbing around it.
        [[nodiscard]] constexpr bool IsIo() const
        {
            return (value > 0 && value < 1000) || (value >= 4000 && value < 5000);
        }

        [[nodiscard]] constexpr bool IsChannelBroken() const { return value == kChannelBroken; }

        [[nodiscard]] constexpr bool IsDispatchRefused() const { return value == kDispatchRefused; }

        [[nodiscard]] std::string message() const { return ErrorValueToString(value); }

        constexpr bool operator==(const Error& other) const = default;
    };

    template<typename T>
    using Result = std::expected<T, Error>;

}  // namespace fspool

// -------------------------------------------------------------------------
// fmt Specialization
// -------------------------------------------------------------------------

template<>
struct fmt::formatter<fspool::Error>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const fspool::Error& err, FormatContext& ctx) const
    {
        // Example output: "File: No such file or directory (2)"
        // Example output: "Channel: Completion producer dropped without sending (1000)"
        return fmt::format_to(ctx.out(), "{}: {} ({})", fspool::CategoryToString(err.category),
                              fspool::ErrorValueToString(err.value), err.value);
    }
};

// -------------------------------------------------------------------------
// FSPOOL_TRY Macro
// -------------------------------------------------------------------------

namespace fspool_try_internal
{
    template<typename Exp>
    auto fspool_try_unwrap_impl(Exp&& exp)
    {
        using ValueT = std::decay_t<Exp>::value_type;

        if constexpr (!std::is_void_v<ValueT>)
        {
            return std::move(*std::forward<Exp>(exp));
        }
        // else: void return, no-op
    }
}  // namespace fspool_try_internal

#define FSPOOL_TRY(expr)                                                     \
    ({                                                                       \
        auto __fspool_internal_res = (expr);                                 \
        if (!__fspool_internal_res)                                          \
        {                                                                    \
            return std::unexpected(__fspool_internal_res.error());           \
        }                                                                    \
        ::fspool_try_internal::fspool_try_unwrap_impl(__fspool_internal_res); \
    })

#endif  // FSPOOL_CORE_ERRORS_H
