#ifndef KVWIRE_MEMORY_STREAM_MSTREAM_H
#define KVWIRE_MEMORY_STREAM_MSTREAM_H

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "photon/net/socket.h"
#include "photon/thread/std-compat.h"

namespace kvwire
{
    /**
     * @class MemoryStream
     * @brief An in-memory stream implementing the photon ISocketStream interface. It is purely used for testing.
     *
     * @details
     * Two MemoryStreams built by duplex() share a pair of byte pipes, what one end writes the other end reads.
     * Reads never block: an empty pipe returns -EAGAIN while it is open and 0 (end of stream) once its writer closed
     * it, so a test writes its whole input, closes the writing side and then lets the code under test run to
     * completion. Data already in a pipe stays readable after the pipe is closed.
     */
    class MemoryStream final : public photon::net::ISocketStream
    {
    public:
        struct Pipe
        {
            std::vector<char> buffer;
            bool is_closed = false;
            size_t max_buffer_size = 1024;
            photon_std::mutex mu;

            Pipe(const Pipe&) = delete;
            Pipe& operator=(const Pipe&) = delete;
            Pipe(Pipe&&) = delete;
            Pipe& operator=(Pipe&&) = delete;

            explicit Pipe(const size_t max_buffer_size) : max_buffer_size(max_buffer_size)
            {
                buffer.reserve(max_buffer_size);
            }

            ssize_t read(void* buf, size_t count);

            ssize_t write(const void* buf, size_t count);

            void close();
        };

        MemoryStream(std::shared_ptr<Pipe> read_end, std::shared_ptr<Pipe> write_end) :
            read_end_(std::move(read_end)), write_end_(std::move(write_end)) {};

        ssize_t read(void* buf, size_t count) override { return read_end_->read(buf, count); }

        ssize_t write(const void* buf, size_t count) override { return write_end_->write(buf, count); }

        ssize_t readv(const struct iovec* iov, int iovcnt) override;
        ssize_t writev(const struct iovec* iov, int iovcnt) override;

        ssize_t recv(void* buf, size_t count, int flags = 0) override { return read(buf, count); }
        ssize_t recv(const struct iovec* iov, int iovcnt, int flags = 0) override { return readv(iov, iovcnt); }

        ssize_t send(const void* buf, size_t count, int flags = 0) override { return write(buf, count); }
        ssize_t send(const struct iovec* iov, int iovcnt, int flags = 0) override { return writev(iov, iovcnt); }

        ssize_t sendfile(int in_fd, off_t offset, size_t count) override;

        // close both directions
        int close() override;

        // close_write closes only the outgoing pipe, the peer sees end of stream once it drained it.
        void close_write() { write_end_->close(); }

        int setsockopt(int level, int option_name, const void* option_value, socklen_t option_len) override;
        int getsockopt(int level, int option_name, void* option_value, socklen_t* option_len) override;
        Object* get_underlay_object(uint64_t recursion) override { return nullptr; }

        // Reads never block, the timeout is only kept to honour the interface.
        uint64_t timeout() const { return timeout_; }
        void timeout(uint64_t tm) { timeout_ = tm; }

        int getsockname(photon::net::EndPoint& addr) override { return 0; }
        int getsockname(char* path, size_t count) override { return 0; }
        int getpeername(photon::net::EndPoint& addr) override { return 0; }
        int getpeername(char* path, size_t count) override { return 0; }

        // send_string writes the whole string, a test helper
        ssize_t send_string(std::string_view data) { return write(data.data(), data.size()); }

        // drain reads everything currently readable
        std::string drain();

        static std::pair<std::unique_ptr<MemoryStream>, std::unique_ptr<MemoryStream>> duplex(size_t max_buffer_size);

    private:
        std::shared_ptr<Pipe> read_end_;
        std::shared_ptr<Pipe> write_end_;
        uint64_t timeout_ = -1UL;
    };
}  // namespace kvwire

#endif  // KVWIRE_MEMORY_STREAM_MSTREAM_H
