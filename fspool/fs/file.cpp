//
// Created by Yao ACHI on 06/10/2025.
//
#include "file.h"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include "fspool/core/async_logger.h"

namespace fspool
{
Result<File> File::Open(const std::filesystem::path &path, const int flags, const mode_t mode)
{
    int fd = -1;
    do
    {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0)
    {
        const int err = errno;
        ALOG_DEBUG("open({}) failed: {}", path.string(), Error::from_errno(err));
        return std::unexpected(Error::from_errno(err));
    }
    return File(fd);
}

Result<File> File::FromFd(const int fd)
{
    if (fd < 0 || ::fcntl(fd, F_GETFD) < 0)
    {
        return std::unexpected(Error::from_errno(EBADF));
    }
    return File(fd);
}

Result<size_t> File::ReadSome(std::span<char> buf) const
{
    ssize_t n = 0;
    do
    {
        n = ::read(fd_, buf.data(), buf.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0)
    {
        return std::unexpected(Error::from_errno(errno));
    }
    return static_cast<size_t>(n);
}

Result<size_t> File::WriteSome(std::span<const char> buf) const
{
    ssize_t n = 0;
    do
    {
        n = ::write(fd_, buf.data(), buf.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0)
    {
        return std::unexpected(Error::from_errno(errno));
    }
    return static_cast<size_t>(n);
}

Result<void> File::Sync() const
{
    if (::fsync(fd_) < 0)
    {
        return std::unexpected(Error::from_errno(errno));
    }
    return {};
}

Result<void> File::Close()
{
    if (fd_ < 0)
    {
        return {};
    }
    // The descriptor is released even when close() fails.
    if (::close(std::exchange(fd_, -1)) < 0 && errno != EINTR)
    {
        return std::unexpected(Error::from_errno(errno));
    }
    return {};
}

void File::CloseQuietly() noexcept
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<void> RemoveFile(const std::filesystem::path &path)
{
    if (::unlink(path.c_str()) < 0)
    {
        return std::unexpected(Error::from_errno(errno));
    }
    return {};
}
}  // namespace fspool
