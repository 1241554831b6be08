#include "kvwire/framer/handler.h"

#include <algorithm>
#include <charconv>
#include <limits>
#include <photon/common/alog.h>

namespace kvwire
{
    constexpr char CR = '\r';
    constexpr char LF = '\n';

    namespace
    {
        // Once the tag byte of a frame is consumed, running out of data is a truncated frame, not a clean EOF.
        KvError truncated(const KvError err) noexcept { return err == KvError::eof ? KvError::incomplete_frame : err; }
    }  // namespace

    Handler::Handler(std::unique_ptr<photon::net::ISocketStream> stream, const size_t chunk_size,
                     const int64_t max_bulk_length, const int64_t max_aggregate_length, const size_t max_line_length) :
        chunk_size_(chunk_size), max_bulk_length_(max_bulk_length), max_aggregate_length_(max_aggregate_length),
        max_line_length_(max_line_length), stream_(std::move(stream))
    {
        buffer_.reserve(chunk_size_ * 2);
    }

    Result<ssize_t> Handler::get_more_data_upstream_()
    {
        const auto old_size = buffer_.size();
        buffer_.resize(old_size + chunk_size_);
        const auto rd = stream_->recv(buffer_.data() + old_size, chunk_size_);
        if (rd < 0)
        {
            buffer_.resize(old_size);
            LOG_WARN("failed to read from stream, error: `", rd);
            return {KvError::generic_network_error};
        }
        buffer_.resize(old_size + static_cast<size_t>(rd));
        if (rd == 0)
        {
            eof_reached_ = true;
        }
        return {rd};
    }

    Result<bytes> Handler::read_until(const char c)
    {
        size_t cursor{0};
        for (;;)
        {
            if (auto it = std::ranges::find(buffer_.begin() + static_cast<int64_t>(cursor), buffer_.end(), c);
                it != buffer_.end())
            {
                if (static_cast<size_t>(it - buffer_.begin()) > max_line_length_ + 1)
                {
                    return {KvError::frame_too_large};
                }
                bytes data{buffer_.begin(), it + 1};
                buffer_.erase(buffer_.begin(), it + 1);
                return {data};
            }
            if (eof_reached_)
            {
                const auto err = buffer_.empty() ? KvError::eof : KvError::incomplete_frame;
                return {err};
            }
            // the CR of a CRLF may already be buffered, hence the + 1
            if (buffer_.size() > max_line_length_ + 1)
            {
                LOG_DEBUG("read_until: ` bytes without a delimiter, the limit is `", buffer_.size(), max_line_length_);
                return {KvError::frame_too_large};
            }
            cursor = buffer_.size();
            auto maybe_error = this->get_more_data_upstream_();
            if (maybe_error.is_error())
            {
                return {maybe_error.error()};
            }
            LOG_DEBUG("poured ` bytes from source stream", maybe_error.value());
        }
    }

    Result<bytes> Handler::read_exact(const int64_t n)
    {
        if (n <= 0)
        {
            return {bytes{}};
        }
        const auto wanted = static_cast<size_t>(n);
        while (buffer_.size() < wanted && !seen_eof())
        {
            if (auto maybe_error = this->get_more_data_upstream_(); maybe_error.is_error())
            {
                return {maybe_error.error()};
            }
        }
        if (buffer_.size() < wanted)
        {
            return {buffer_.empty() ? KvError::eof : KvError::not_enough_data};
        }
        auto ans = bytes(buffer_.begin(), buffer_.begin() + n);
        buffer_.erase(buffer_.begin(), buffer_.begin() + n);
        return {ans};
    }

    Result<bytes> Handler::get_simple_string_()
    {
        const auto maybe_ans = this->read_until(LF);
        if (maybe_ans.is_error())
        {
            return {maybe_ans.error()};
        }
        const auto ans_view = std::span(maybe_ans.value());
        if (ans_view.size() < 2 || ans_view[ans_view.size() - 2] != CR)
        {
            LOG_DEBUG("get_simple_string: found a standalone LF in the frame, this should not be in simple frames");
            return {KvError::invalid_frame};
        }
        if (std::ranges::find(ans_view.begin(), ans_view.end() - 2, CR) != ans_view.end() - 2)
        {
            LOG_DEBUG("get_simple_string: found a standalone CR in the frame, this should not be in simple frames");
            return {KvError::invalid_frame};
        }
        return {bytes(ans_view.begin(), ans_view.end() - 2)};
    }

    Result<int64_t> Handler::get_integer_()
    {
        const auto maybe_ans = this->get_simple_string_();
        if (maybe_ans.is_error())
        {
            return {maybe_ans.error()};
        }
        const auto& str = maybe_ans.value();
        int64_t ans{0};
        const auto* last = str.data() + str.size();
        if (auto [ptr, ec] = std::from_chars(str.data(), last, ans); ec == std::errc() && ptr == last && !str.empty())
        {
            return {ans};
        }
        return {KvError::atoi};
    }

    Result<Frame> Handler::get_bulk_frame_(const FrameID frame_id)
    {
        const auto size_result = this->get_integer_();
        if (size_result.is_error())
        {
            return {size_result.error()};
        }
        const auto size = size_result.value();
        if (size == -1)
        {
            return {Frame{frame_id, std::monostate{}}};
        }
        if (size < -1)
        {
            LOG_DEBUG("decode: got a bulk frame with a negative size ", size);
            return {KvError::invalid_frame};
        }
        if (size > max_bulk_length_)
        {
            LOG_DEBUG("decode: bulk frame of ` bytes is above the limit of `", size, max_bulk_length_);
            return {KvError::frame_too_large};
        }

        // also read the CRLF, hence, size + 2. The terminator is dropped without looking at it.
        auto interim_read = this->read_exact(size + 2);
        if (interim_read.is_error())
        {
            return {interim_read.error()};
        }
        auto& content = interim_read.value();
        content.resize(static_cast<size_t>(size));
        return {Frame{frame_id, std::move(content)}};
    }

    Result<FrameID> Handler::get_frame_id_()
    {
        if (this->empty() && !this->seen_eof())
        {
            if (auto maybe_err = this->get_more_data_upstream_(); maybe_err.is_error())
            {
                return {maybe_err.error()};
            }
        }
        if (this->empty())
        {
            return {KvError::eof};
        }
        const auto c = this->buffer_[0];
        this->buffer_.erase(this->buffer_.begin());
        const auto id = frame_id_from_char(c);
        if (id == FrameID::Undefined)
        {
            LOG_DEBUG("decode: unknown frame tag ", static_cast<int>(c));
            return {KvError::unknown_frame_id};
        }
        return {id};
    }

    Result<Frame> Handler::decode(const uint8_t depth, const uint8_t max_depth)
    {
        if (depth >= max_depth)
        {
            return {KvError::max_recursion_depth};
        }
        const auto maybe_id = this->get_frame_id_();
        if (maybe_id.is_error())
        {
            // an element missing inside an aggregate is a cut frame
            return {depth > 0 ? truncated(maybe_id.error()) : maybe_id.error()};
        }
        switch (const auto id = maybe_id.value())
        {
            case FrameID::Integer:
            {
                const auto int_ans = this->get_integer_();
                if (int_ans.is_error())
                {
                    return {truncated(int_ans.error())};
                }
                return {Frame{id, int_ans.value()}};
            }
            case FrameID::SimpleString:
            case FrameID::SimpleError:
            {
                const auto simple_str_ans = this->get_simple_string_();
                if (simple_str_ans.is_error())
                {
                    LOG_DEBUG("decode: got an error while decoding a simple frame variant: `",
                              static_cast<int>(simple_str_ans.error()));
                    return {truncated(simple_str_ans.error())};
                }
                return {Frame{id, simple_str_ans.value()}};
            }
            case FrameID::BulkString:
            {
                auto content = this->get_bulk_frame_(id);
                if (content.is_error())
                {
                    return {truncated(content.error())};
                }
                return content;
            }
            case FrameID::Array:
            case FrameID::Map:
            case FrameID::Set:
            {
                return decode_aggregate_(id, depth, max_depth);
            }
            default:
                return {KvError::unknown_frame_id};
        }
    }

    Result<Frame> Handler::decode_aggregate_(const FrameID frame_id, const uint8_t depth, const uint8_t max_depth)
    {
        const auto size_result = this->get_integer_();
        if (size_result.is_error())
        {
            return {truncated(size_result.error())};
        }
        const auto size = size_result.value();
        if (size < 0)
        {
            LOG_DEBUG("decode: got an aggregate frame with a negative count ", size);
            return {KvError::invalid_frame};
        }
        if (size > max_aggregate_length_)
        {
            LOG_DEBUG("decode: aggregate frame of ` elements is above the limit of `", size, max_aggregate_length_);
            return {KvError::frame_too_large};
        }
        if (frame_id == FrameID::Map && size > std::numeric_limits<int64_t>::max() / 2)
        {
            return {KvError::invalid_frame};
        }
        // a map announces pairs, each pair is two frames on the wire
        const auto frame_count = frame_id == FrameID::Map ? size * 2 : size;
        std::vector<Frame> frames;
        frames.reserve(static_cast<size_t>(std::min<int64_t>(frame_count, 1024)));
        for (int64_t i = 0; i < frame_count; ++i)
        {
            auto frame = this->decode(depth + 1, max_depth);
            if (frame.is_error())
            {
                return {frame.error()};
            }
            frames.emplace_back(std::move(frame.value()));
        }

        switch (frame_id)
        {
            case FrameID::Map:
            {
                std::vector<std::pair<Frame, Frame>> pairs;
                pairs.reserve(frames.size() / 2);
                for (size_t i = 0; i + 1 < frames.size(); i += 2)
                {
                    pairs.emplace_back(std::move(frames[i]), std::move(frames[i + 1]));
                }
                return {Frame::map(std::move(pairs))};
            }
            case FrameID::Set:
                return {Frame::set(std::move(frames))};
            default:
                return {Frame::array(std::move(frames))};
        }
    }

    Result<size_t> Handler::send_frame(const Frame& frame)
    {
        const auto out = frame.as_bytes();
        const auto written = stream_->write(out.data(), out.size());
        if (written < 0 || static_cast<size_t>(written) != out.size())
        {
            LOG_WARN("could only write ` bytes out of `", written, out.size());
            return {KvError::generic_network_error};
        }
        return {static_cast<size_t>(written)};
    }

    void Handler::close()
    {
        if (stream_ != nullptr)
        {
            stream_->close();
        }
    }

}  // namespace kvwire
