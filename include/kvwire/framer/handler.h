#ifndef KVWIRE_FRAMER_HANDLER_H
#define KVWIRE_FRAMER_HANDLER_H

#include <memory>
#include <photon/net/socket.h>
#include <span>
#include <vector>

#include "frame.h"
#include "kvwire/errors.h"

namespace kvwire
{

    constexpr int MAX_RECURSION_DEPTH = 30;
    constexpr int64_t DEFAULT_MAX_BULK_LENGTH = 512 * 1024 * 1024;
    // elements of an array or a set, pairs of a map
    constexpr int64_t DEFAULT_MAX_AGGREGATE_LENGTH = 1024 * 1024;
    // bytes of a simple string, an error or an integer line, CRLF excluded
    constexpr size_t DEFAULT_MAX_LINE_LENGTH = 64 * 1024;

    /**
     * @brief Handler owns a socket stream and translates between it and frames.
     *
     * Incoming data is pulled from the stream in chunks and accumulated in an internal buffer, frames are decoded
     * from the front of that buffer. Outgoing frames are encoded in full before a single write to the stream.
     */
    class Handler
    {
    public:
        Handler(const Handler&) = delete;
        Handler& operator=(const Handler&) = delete;
        Handler(Handler&&) = default;
        Handler& operator=(Handler&&) = default;

        Handler(std::unique_ptr<photon::net::ISocketStream> stream, size_t chunk_size,
                int64_t max_bulk_length = DEFAULT_MAX_BULK_LENGTH,
                int64_t max_aggregate_length = DEFAULT_MAX_AGGREGATE_LENGTH,
                size_t max_line_length = DEFAULT_MAX_LINE_LENGTH);

        /**
         * seen_eof reports whether the upstream stream returned end of stream. The buffer can still hold data.
         */
        [[nodiscard]] bool seen_eof() const noexcept { return eof_reached_; }

        [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }

        [[nodiscard]] const std::vector<char>& get_buffer() const noexcept { return buffer_; }

        /**
         * read_until reads from the handler buffer or/and the upstream stream until char c is reached.
         * This method consumes the buffer. The answer contains the delimiter.
         * @return the bytes read or an error. EOF is returned only if nothing at all was left to read.
         * frame_too_large is returned once more than the line limit was read without seeing c.
         * */
        Result<bytes> read_until(char c);

        /**
         * read_exact attempts to read exactly n bytes from the handler buffer or/and the upstream stream.
         * This method consumes the buffer.
         * @return the bytes read. Can return EOF if the buffer is empty and the EOF was seen, not_enough_data if the
         * stream ended before n bytes were available, or network IO errors.
         * */
        Result<bytes> read_exact(int64_t n);

        void add_more_data(std::span<const char> data) noexcept
        {
            buffer_.insert(buffer_.end(), data.begin(), data.end());
        }

        /**
         * decode reads exactly one frame. Returns KvError::eof when the stream ended cleanly before the first byte of
         * the frame. Any other error means the stream does not carry a valid frame and cannot be resynchronized.
         */
        Result<Frame> decode(uint8_t depth, uint8_t max_depth);

        /**
         * send_frame encodes the whole frame first, then writes it to the stream at once.
         * @return the number of bytes written or generic_network_error if the stream did not take all of them.
         */
        Result<size_t> send_frame(const Frame& frame);

        // close the underlying stream. Further reads see EOF and writes fail.
        void close();

    private:
        Result<ssize_t> get_more_data_upstream_();
        Result<bytes> get_simple_string_();
        Result<Frame> get_bulk_frame_(FrameID frame_id);
        Result<int64_t> get_integer_();
        Result<FrameID> get_frame_id_();
        Result<Frame> decode_aggregate_(FrameID frame_id, uint8_t depth, uint8_t max_depth);

        // Choose chunk size wisely. Initially, a buffer of 2 * chunk_size will be allocated for reading
        // on the network stream.
        size_t chunk_size_ = 1024;
        int64_t max_bulk_length_ = DEFAULT_MAX_BULK_LENGTH;
        int64_t max_aggregate_length_ = DEFAULT_MAX_AGGREGATE_LENGTH;
        size_t max_line_length_ = DEFAULT_MAX_LINE_LENGTH;
        bytes buffer_;
        std::unique_ptr<photon::net::ISocketStream> stream_;
        bool eof_reached_ = false;
    };
}  // namespace kvwire

#endif  // KVWIRE_FRAMER_HANDLER_H
