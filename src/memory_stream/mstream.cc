#include "kvwire/memory_stream/mstream.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <string>

namespace kvwire
{
    using lock_guard = std::lock_guard<photon_std::mutex>;

    ssize_t MemoryStream::Pipe::read(void* buf, const size_t count)
    {
        lock_guard lock(mu);
        if (buffer.empty()) return is_closed ? 0 : -EAGAIN;
        const size_t real_count = std::min(count, buffer.size());
        std::memcpy(buf, buffer.data(), real_count);
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<int64_t>(real_count));
        return static_cast<ssize_t>(real_count);
    }

    ssize_t MemoryStream::Pipe::write(const void* buf, const size_t count)
    {
        lock_guard lock(mu);
        // writing to a closed pipe is an error
        if (is_closed) return -1;
        // no enough space, write as much as possible
        const auto real_count = std::min(max_buffer_size - buffer.size(), count);
        const auto char_buf = static_cast<const char*>(buf);
        buffer.insert(buffer.end(), char_buf, char_buf + real_count);
        return static_cast<ssize_t>(real_count);
    }

    void MemoryStream::Pipe::close()
    {
        lock_guard lock(mu);
        is_closed = true;
    }

    ssize_t MemoryStream::readv(const struct iovec* iov, const int iovcnt)
    {
        ssize_t total_bytes_read = 0;
        for (int i = 0; i < iovcnt; ++i)
        {
            const ssize_t bytes_read = read(iov[i].iov_base, iov[i].iov_len);
            if (bytes_read <= 0)
            {
                return total_bytes_read > 0 ? total_bytes_read : bytes_read;
            }
            total_bytes_read += bytes_read;
        }
        return total_bytes_read;
    }

    ssize_t MemoryStream::writev(const struct iovec* iov, const int iovcnt)
    {
        ssize_t total_bytes_written = 0;
        for (int i = 0; i < iovcnt; ++i)
        {
            const ssize_t bytes_written = write(iov[i].iov_base, iov[i].iov_len);
            if (bytes_written < 0)
            {
                return bytes_written;
            }
            total_bytes_written += bytes_written;
            if (static_cast<size_t>(bytes_written) < iov[i].iov_len)
            {
                break;
            }
        }
        return total_bytes_written;
    }

    ssize_t MemoryStream::sendfile(int in_fd, off_t offset, size_t count)
    {
        // Simplifying assumption: this operation is not supported for in-memory streams.
        return -1;
    }

    int MemoryStream::close()
    {
        read_end_->close();
        write_end_->close();
        return 0;
    }

    int MemoryStream::setsockopt(int level, int option_name, const void* option_value, socklen_t option_len)
    {
        // For simplicity, don't handle socket options
        return 0;
    }

    int MemoryStream::getsockopt(int level, int option_name, void* option_value, socklen_t* option_len)
    {
        // For simplicity, don't handle socket options
        return 0;
    }

    std::string MemoryStream::drain()
    {
        std::string out;
        char chunk[256];
        for (;;)
        {
            const auto rd = read(chunk, sizeof(chunk));
            if (rd <= 0) break;
            out.append(chunk, static_cast<size_t>(rd));
        }
        return out;
    }

    std::pair<std::unique_ptr<MemoryStream>, std::unique_ptr<MemoryStream>> MemoryStream::duplex(
            const size_t max_buffer_size)
    {
        auto one = std::make_shared<Pipe>(max_buffer_size);
        auto two = std::make_shared<Pipe>(max_buffer_size);
        auto stream1 = std::make_unique<MemoryStream>(one, two);
        auto stream2 = std::make_unique<MemoryStream>(two, one);

        return std::make_pair(std::move(stream1), std::move(stream2));
    }

}  // namespace kvwire
