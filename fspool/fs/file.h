//
// Created by Yao ACHI on 06/10/2025.
//

#ifndef FSPOOL_FS_FILE_H
#define FSPOOL_FS_FILE_H

#include <filesystem>
#include <span>
#include <utility>

#include <sys/types.h>

#include "fspool/core/errors.h"

namespace fspool
{
/**
 * Owning wrapper around a file descriptor. Every method is a plain blocking
 * syscall: the library only calls them from pool jobs.
 */
class File
{
    int fd_{-1};

public:
    File() = default;

    // Takes ownership of an already open descriptor.
    explicit File(const int fd) : fd_(fd) {}

    File(const File &) = delete;
    File &operator=(const File &) = delete;

    File(File &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    File &operator=(File &&other) noexcept
    {
        if (this != &other)
        {
            CloseQuietly();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    ~File() { CloseQuietly(); }

    [[nodiscard]]
    static Result<File> Open(const std::filesystem::path &path, int flags, mode_t mode = 0);

    [[nodiscard]]
    static Result<File> FromFd(int fd);

    [[nodiscard]]
    int fd() const noexcept
    {
        return fd_;
    }

    [[nodiscard]]
    bool IsOpen() const noexcept
    {
        return fd_ >= 0;
    }

    /**
     * One read() at the current file position. It may fill less than the buffer;
     * that is not an error. 0 means end of file.
     */
    [[nodiscard]]
    Result<size_t> ReadSome(std::span<char> buf) const;

    /**
     * One write() at the current file position (or the end, for O_APPEND).
     * It may write less than the whole buffer.
     */
    [[nodiscard]]
    Result<size_t> WriteSome(std::span<const char> buf) const;

    [[nodiscard]]
    Result<void> Sync() const;

    /**
     * Closes the descriptor and reports close(2) failures, which the destructor cannot.
     */
    [[nodiscard]]
    Result<void> Close();

private:
    void CloseQuietly() noexcept;
};

[[nodiscard]]
Result<void> RemoveFile(const std::filesystem::path &path);
}  // namespace fspool

#endif  // FSPOOL_FS_FILE_H
