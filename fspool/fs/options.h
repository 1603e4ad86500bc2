//
// Created by Yao ACHI on 10/11/2025.
//

#ifndef FSPOOL_FS_OPTIONS_H
#define FSPOOL_FS_OPTIONS_H

#include <cstddef>
#include <stdexcept>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>

namespace fspool
{
constexpr size_t kDefaultChunkSize = 8 * 1024;  // 8kB
constexpr mode_t kDefaultFileMode = 0666;

// One read() worth of bytes, owned by the consumer.
using Chunk = std::vector<char>;

struct ReadOptions
{
    // Upper bound of a single read(); the stream may emit shorter chunks.
    size_t chunk_size{kDefaultChunkSize};
    int flags{O_RDONLY};

    void Check() const
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("ReadOptions: chunk_size must be at least 1");
        }
        if (chunk_size > Chunk().max_size())
        {
            throw std::invalid_argument("ReadOptions: chunk_size exceeds the largest allocatable chunk");
        }
    }
};

/**
 * Open policy of a WriteSink. Defaults create the file, or truncate it if it
 * exists, with mode 0666 (minus umask).
 */
class WriteOptions
{
public:
    WriteOptions& Create(const bool create)
    {
        create_ = create;
        return *this;
    }

    WriteOptions& Truncate(const bool truncate)
    {
        truncate_ = truncate;
        return *this;
    }

    // Turns truncation off; setting Truncate(true) afterwards fails Check().
    WriteOptions& Append(const bool append)
    {
        append_ = append;
        if (append) truncate_ = false;
        return *this;
    }

    WriteOptions& Mode(const mode_t mode)
    {
        mode_ = mode;
        return *this;
    }

    // Extra open(2) flags, such as O_DSYNC or O_NOFOLLOW. Access mode bits are ignored.
    WriteOptions& CustomFlags(const int flags)
    {
        custom_flags_ = flags;
        return *this;
    }

    // fsync() the file before closing it.
    WriteOptions& SyncOnClose(const bool sync)
    {
        sync_on_close_ = sync;
        return *this;
    }

    [[nodiscard]] int OpenFlags() const
    {
        int flags = O_WRONLY | (custom_flags_ & ~O_ACCMODE);
        if (create_) flags |= O_CREAT;
        if (truncate_) flags |= O_TRUNC;
        if (append_) flags |= O_APPEND;
        return flags;
    }

    [[nodiscard]] mode_t FileMode() const { return mode_; }
    [[nodiscard]] bool ShouldSyncOnClose() const { return sync_on_close_; }

    void Check() const
    {
        if (append_ && truncate_)
        {
            throw std::invalid_argument("WriteOptions: append and truncate are mutually exclusive");
        }
    }

private:
    bool create_{true};
    bool truncate_{true};
    bool append_{false};
    bool sync_on_close_{false};
    mode_t mode_{kDefaultFileMode};
    int custom_flags_{0};
};
}  // namespace fspool

#endif  // FSPOOL_FS_OPTIONS_H
