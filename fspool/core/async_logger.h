// Created by Yao ACHI on 25/10/2025.

#ifndef FSPOOL_CORE_ASYNC_LOGGER_H
#define FSPOOL_CORE_ASYNC_LOGGER_H

#include "fspool/sync/batch_queue.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <iostream>
#include <iterator>
#include <memory>
#include <source_location>
#include <stop_token>
#include <string>
#include <string_view>
#include <syncstream>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

#include <sys/eventfd.h>
#include <sys/syscall.h>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace fspool
{

constexpr auto kLoggerSleepInterval = std::chrono::milliseconds(50);

inline int64_t GetThreadId() noexcept
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
    thread_local const int64_t kTid = syscall(SYS_gettid);
    return kTid;
}

enum class LogLevel : uint8_t
{
    kDisabled = 0,
    kTrace,
    kDebug,
    kInfo,
    kWarn,
    kError,
};

struct LogMessage
{
    static constexpr size_t kInlineCapacity = 256;

    std::chrono::system_clock::time_point timestamp;
    LogLevel level{LogLevel::kInfo};
    std::string_view file;
    uint64_t line{};
    int64_t thread_id{};
    std::string text;
};

/**
 * Asynchronous logger. Any thread may log: the scheduler thread that polls
 * streams and sinks as well as the pool threads that run the blocking calls.
 * Formatting happens on the caller, writing happens on a dedicated consumer thread.
 */
class Logger
{
public:
    explicit Logger(const size_t queue_size = 1024, const LogLevel level = LogLevel::kInfo,
                    std::ostream& output_stream = std::cout)
        : queue_(queue_size),
          level_(level),
          wakeup_fd_(eventfd(0, EFD_CLOEXEC)),
          output_stream_(output_stream)
    {
        if (wakeup_fd_ < 0)
        {
            std::osyncstream(std::cerr) << "Failed to create logger eventfd: " << strerror(errno) << '\n';
        }

        if (&output_stream_ == &std::cout)
        {
            use_color_ = ::isatty(STDOUT_FILENO) != 0;
        }

        consumer_thread_ = std::jthread([this](const std::stop_token& st) { ConsumeLoop(st); });
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    ~Logger()
    {
        consumer_thread_.request_stop();
        Wakeup();

        if (consumer_thread_.joinable())
        {
            consumer_thread_.join();
        }

        if (wakeup_fd_ >= 0)
        {
            ::close(wakeup_fd_);
            wakeup_fd_ = -1;
        }
    }

    void SetLevel(const LogLevel level) { level_.store(level, std::memory_order_relaxed); }

    [[nodiscard]]
    LogLevel Level() const noexcept
    {
        return level_.load(std::memory_order_relaxed);
    }

    [[nodiscard]]
    bool ShouldLog(LogLevel lvl) const noexcept
    {
        const auto current = level_.load(std::memory_order_relaxed);
        if (current == LogLevel::kDisabled)
        {
            return false;
        }
        return static_cast<int>(lvl) >= static_cast<int>(current);
    }

    template <typename... Args>
    void Trace(const std::source_location& loc, fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        Log<LogLevel::kTrace>(loc, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Debug(const std::source_location& loc, fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        Log<LogLevel::kDebug>(loc, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Info(const std::source_location& loc, fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        Log<LogLevel::kInfo>(loc, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Warn(const std::source_location& loc, fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        Log<LogLevel::kWarn>(loc, fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Error(const std::source_location& loc, fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        Log<LogLevel::kError>(loc, fmt_str, std::forward<Args>(args)...);
    }

    // Drains pending records. Only the consumer thread calls this while the logger is running.
    void Flush()
    {
        std::vector<LogMessage> batch;
        while (queue_.Drain(batch) > 0)
        {
            for (const auto& entry : batch)
            {
                Write(entry);
            }
        }
        output_stream_.flush();
    }

private:
    template <LogLevel L, typename... Args>
    void Log(const std::source_location& loc, fmt::format_string<Args...> fmt_str, Args&&... args)
    {
        if (!ShouldLog(L))
        {
            return;
        }

        LogMessage entry{};
        entry.timestamp = std::chrono::system_clock::now();
        entry.level = L;
        entry.file = loc.file_name();
        entry.line = loc.line();
        entry.thread_id = GetThreadId();

        try
        {
            entry.text.reserve(LogMessage::kInlineCapacity);
            fmt::format_to(std::back_inserter(entry.text), fmt_str, std::forward<Args>(args)...);
        }
        catch (const std::exception& e)
        {
            entry.text = std::string("<log format error: ") + e.what() + ">";
        }

        if (!queue_.TryPush(std::move(entry)))
        {
            std::osyncstream(std::cerr) << "Logger queue full. Dropping message.\n";
            return;
        }
        Wakeup();
    }

    void Wakeup() const noexcept
    {
        if (wakeup_fd_ < 0)
        {
            return;
        }
        constexpr uint64_t val = 1;
        if (const ssize_t ret = ::write(wakeup_fd_, &val, sizeof(val)); ret < 0 && errno != EAGAIN)
        {
            std::osyncstream(std::cerr) << "Logger wakeup write() error: " << strerror(errno) << '\n';
        }
    }

    void ConsumeLoop(const std::stop_token& st)
    {
        uint64_t val = 0;
        while (!st.stop_requested())
        {
            if (wakeup_fd_ < 0)
            {
                std::this_thread::sleep_for(kLoggerSleepInterval);
            }
            else if (const ssize_t ret = ::read(wakeup_fd_, &val, sizeof(val)); ret < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                std::osyncstream(std::cerr) << "Logger wakeup read() error: " << strerror(errno) << '\n';
                break;
            }
            Flush();
        }
        Flush();
    }

    void Write(const LogMessage& msg) const
    {
        const char* color = LevelColor(msg.level);
        const char* reset = use_color_ ? "\033[0m" : "";

        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
        const auto secs = std::chrono::floor<std::chrono::seconds>(msg.timestamp);

        std::string_view filename = msg.file;
        if (const auto pos = filename.find_last_of("/\\"); pos != std::string_view::npos)
        {
            filename = filename.substr(pos + 1);
        }

        output_stream_ << fmt::format("{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{:<5}] [tid:{}] {}:{} - {}{}\n", color, secs,
                                      ms.count(), LevelName(msg.level), msg.thread_id, filename, msg.line, msg.text,
                                      reset);
    }

    static const char* LevelName(const LogLevel lvl)
    {
        switch (lvl)
        {
            case LogLevel::kTrace:
                return "TRACE";
            case LogLevel::kDebug:
                return "DEBUG";
            case LogLevel::kInfo:
                return "INFO";
            case LogLevel::kWarn:
                return "WARN";
            case LogLevel::kError:
                return "ERROR";
            default:
                return "DISA";
        }
    }

    [[nodiscard]] const char* LevelColor(const LogLevel lvl) const noexcept
    {
        if (!use_color_)
        {
            return "";
        }
        switch (lvl)
        {
            case LogLevel::kTrace:
                return "\033[37m";
            case LogLevel::kDebug:
                return "\033[36m";
            case LogLevel::kInfo:
                return "\033[32m";
            case LogLevel::kWarn:
                return "\033[33m";
            case LogLevel::kError:
                return "\033[31m";
            default:
                return "\033[0m";
        }
    }

    sync::BatchQueue<LogMessage> queue_;
    std::atomic<LogLevel> level_;
    int wakeup_fd_{-1};
    std::ostream& output_stream_;
    bool use_color_{false};
    // Declared last so the consumer starts after every other member is initialized.
    std::jthread consumer_thread_;
};

#define FSPOOL_LOG_TRACE(logger_instance, ...)                                     \
    do                                                                             \
    {                                                                              \
        if ((logger_instance).ShouldLog(::fspool::LogLevel::kTrace))               \
            (logger_instance).Trace(std::source_location::current(), __VA_ARGS__); \
    } while (0)

#define FSPOOL_LOG_DEBUG(logger_instance, ...)                                     \
    do                                                                             \
    {                                                                              \
        if ((logger_instance).ShouldLog(::fspool::LogLevel::kDebug))               \
            (logger_instance).Debug(std::source_location::current(), __VA_ARGS__); \
    } while (0)

#define FSPOOL_LOG_INFO(logger_instance, ...)                                     \
    do                                                                            \
    {                                                                             \
        if ((logger_instance).ShouldLog(::fspool::LogLevel::kInfo))               \
            (logger_instance).Info(std::source_location::current(), __VA_ARGS__); \
    } while (0)

#define FSPOOL_LOG_WARN(logger_instance, ...)                                     \
    do                                                                            \
    {                                                                             \
        if ((logger_instance).ShouldLog(::fspool::LogLevel::kWarn))               \
            (logger_instance).Warn(std::source_location::current(), __VA_ARGS__); \
    } while (0)

#define FSPOOL_LOG_ERROR(logger_instance, ...)                                     \
    do                                                                             \
    {                                                                              \
        if ((logger_instance).ShouldLog(::fspool::LogLevel::kError))               \
            (logger_instance).Error(std::source_location::current(), __VA_ARGS__); \
    } while (0)
}  // namespace fspool

/* ──────────────────────────────────────────────────────────────
 * Global logging API, used by the library itself.
 * Namespace: fspool::alog
 * ────────────────────────────────────────────────────────────── */
namespace fspool::alog
{
constexpr size_t kDefaultLoggerQueueSize = 1024;

inline std::unique_ptr<Logger>& GlobalLoggerPtr()
{
    static std::unique_ptr<Logger> instance = nullptr;
    return instance;
}

inline Logger& Get()
{
    if (const auto& ptr = GlobalLoggerPtr())
    {
        return *ptr;
    }

    // Configure() was never called
    static Logger default_instance(kDefaultLoggerQueueSize, LogLevel::kInfo, std::cout);
    return default_instance;
}

// Not thread safe: call at startup, before pools are created.
inline void Configure(size_t queue_size = kDefaultLoggerQueueSize, LogLevel level = LogLevel::kInfo,
                      std::ostream& os = std::cout)
{
    GlobalLoggerPtr() = std::make_unique<Logger>(queue_size, level, os);
}

#define ALOG_TRACE(...) FSPOOL_LOG_TRACE(::fspool::alog::Get(), __VA_ARGS__)
#define ALOG_DEBUG(...) FSPOOL_LOG_DEBUG(::fspool::alog::Get(), __VA_ARGS__)
#define ALOG_INFO(...)  FSPOOL_LOG_INFO(::fspool::alog::Get(), __VA_ARGS__)
#define ALOG_WARN(...)  FSPOOL_LOG_WARN(::fspool::alog::Get(), __VA_ARGS__)
#define ALOG_ERROR(...) FSPOOL_LOG_ERROR(::fspool::alog::Get(), __VA_ARGS__)
}  // namespace fspool::alog

#endif  // FSPOOL_CORE_ASYNC_LOGGER_H
