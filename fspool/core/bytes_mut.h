//
// Created by Yao ACHI on 23/11/2025.
//

#ifndef FSPOOL_CORE_BYTES_MUT_H
#define FSPOOL_CORE_BYTES_MUT_H

#include <algorithm>
#include <cstring>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fspool
{
/**
 * @brief Growable byte buffer with a consume cursor.
 *
 * WriteSink stages accepted bytes here; a pool job writes from the front and
 * advances past whatever the kernel took, so a short write leaves the tail in
 * place for the next job.
 *
 * Memory layout:
 * [consumed | readable | writable]
 *           ^read_pos  ^write_pos  ^size
 */
class BytesMut
{
public:
    BytesMut() = default;

    BytesMut(const BytesMut&) = default;
    BytesMut& operator=(const BytesMut&) = default;

    BytesMut(BytesMut&& other) noexcept
        : buffer_(std::move(other.buffer_)),
          read_pos_(std::exchange(other.read_pos_, 0)),
          write_pos_(std::exchange(other.write_pos_, 0))
    {
    }

    BytesMut& operator=(BytesMut&& other) noexcept
    {
        if (this != &other)
        {
            buffer_ = std::move(other.buffer_);
            read_pos_ = std::exchange(other.read_pos_, 0);
            write_pos_ = std::exchange(other.write_pos_, 0);
        }
        return *this;
    }

    ~BytesMut() = default;

    /**
     * @brief Ensures at least `additional` bytes of writable space.
     */
    void Reserve(const size_t additional)
    {
        if (Writable() >= additional)
        {
            return;
        }

        // Reuse the consumed prefix before growing
        if (read_pos_ > 0)
        {
            Compact();
            if (Writable() >= additional)
            {
                return;
            }
        }

        buffer_.resize(std::max(buffer_.size() * 2, write_pos_ + additional));
    }

    /**
     * @brief Appends data after the readable region.
     */
    void ExtendFromSlice(std::span<const char> data)
    {
        if (data.empty())
        {
            return;
        }
        Reserve(data.size());
        std::memcpy(buffer_.data() + write_pos_, data.data(), data.size());
        write_pos_ += data.size();
    }

    [[nodiscard]] std::span<const char> ReadableSpan() const
    {
        return {buffer_.data() + read_pos_, write_pos_ - read_pos_};
    }

    [[nodiscard]] size_t Remaining() const { return write_pos_ - read_pos_; }

    [[nodiscard]] size_t Writable() const { return buffer_.size() - write_pos_; }

    [[nodiscard]] bool IsEmpty() const { return read_pos_ == write_pos_; }

    /**
     * @brief Consumes `n` bytes from the read position.
     * Once everything is consumed the cursors rewind, keeping the allocation.
     */
    void Advance(const size_t n)
    {
        if (n > Remaining())
        {
            throw std::out_of_range("BytesMut::Advance() beyond available data");
        }
        read_pos_ += n;
        if (read_pos_ == write_pos_)
        {
            Clear();
        }
    }

    /**
     * @brief Moves unconsumed data to the front of the buffer.
     */
    void Compact()
    {
        if (read_pos_ == 0)
        {
            return;
        }
        const size_t remaining = Remaining();
        if (remaining > 0)
        {
            std::memmove(buffer_.data(), buffer_.data() + read_pos_, remaining);
        }
        read_pos_ = 0;
        write_pos_ = remaining;
    }

    void Clear()
    {
        read_pos_ = 0;
        write_pos_ = 0;
    }

private:
    std::vector<char> buffer_;
    size_t read_pos_ = 0;
    size_t write_pos_ = 0;
};
}  // namespace fspool

#endif  // FSPOOL_CORE_BYTES_MUT_H
