#ifndef KVWIRE_FRAMER_FRAME_H
#define KVWIRE_FRAMER_FRAME_H

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace kvwire
{
    using bytes = std::vector<char>;

    constexpr char kInteger = ':';
    constexpr char kSimpleString = '+';
    constexpr char kSimpleError = '-';
    constexpr char kBulkString = '$';
    constexpr char kArray = '*';
    constexpr char kMap = '%';
    constexpr char kSet = '&';
    // Only produced by the encoder. A decoder seeing it treats it as any other unknown tag.
    constexpr char kText = '^';

    enum class FrameID : char
    {
        Integer = kInteger,  // ':'
        SimpleString = kSimpleString,  // '+'
        SimpleError = kSimpleError,  // '-'
        BulkString = kBulkString,  // '$'
        Array = kArray,  // '*'
        Map = kMap,  // '%'
        Set = kSet,  // '&'
        Text = kText,  // '^'
        Undefined
    };

    /**
     * frame_id_from_char maps a tag byte read from the wire to a frame id. Text is not part of the decodable set,
     * so '^' maps to Undefined as well as any other unknown byte.
     */
    FrameID frame_id_from_char(char from);

    inline bool is_aggregate_frame(const FrameID frame_id) noexcept
    {
        return frame_id == FrameID::Array || frame_id == FrameID::Map || frame_id == FrameID::Set;
    }

    inline bool is_bulk_frame(const FrameID frame_id) noexcept
    {
        return frame_id == FrameID::BulkString || frame_id == FrameID::Text;
    }

    inline bool is_simple_frame(const FrameID frame_id) noexcept
    {
        return frame_id == FrameID::SimpleString || frame_id == FrameID::SimpleError;
    }

    inline bytes to_bytes(std::string_view str) { return {str.begin(), str.end()}; }

    struct Frame;

    struct FrameHash
    {
        size_t operator()(const Frame& frame) const noexcept;
    };

    struct Frame
    {
        FrameID frame_id;
        // monostate is only used by a BulkString to represent the absent value.
        // Vector is used for all aggregate frames. For maps, we double the number of elements:
        // each k,v is adjacent in the vector.
        std::variant<std::monostate, bytes, int64_t, std::vector<Frame>> data;

        static Frame make_frame(const FrameID& frame_id);

        static Frame simple(std::string_view str) { return Frame{FrameID::SimpleString, to_bytes(str)}; }
        static Frame error(std::string_view message) { return Frame{FrameID::SimpleError, to_bytes(message)}; }
        static Frame integer(const int64_t value) { return Frame{FrameID::Integer, value}; }
        static Frame bulk(std::string_view str) { return Frame{FrameID::BulkString, to_bytes(str)}; }
        static Frame bulk(bytes data) { return Frame{FrameID::BulkString, std::move(data)}; }
        static Frame null() { return Frame{FrameID::BulkString, std::monostate{}}; }
        static Frame text(std::string_view str) { return Frame{FrameID::Text, to_bytes(str)}; }
        static Frame array(std::vector<Frame> items) { return Frame{FrameID::Array, std::move(items)}; }

        // Later pairs overwrite earlier ones holding an equal key. The first position of the key is kept.
        static Frame map(std::vector<std::pair<Frame, Frame>> pairs);

        // Duplicated elements are dropped, the first occurrence is kept.
        static Frame set(std::vector<Frame> items);

        [[nodiscard]] bool is_null() const noexcept
        {
            return frame_id == FrameID::BulkString && std::holds_alternative<std::monostate>(data);
        }

        [[nodiscard]] bool is_error() const noexcept { return frame_id == FrameID::SimpleError; }

        // SimpleString, non-null BulkString and Text all carry a byte payload usable as a token.
        [[nodiscard]] bool is_string_like() const noexcept
        {
            return (frame_id == FrameID::SimpleString || is_bulk_frame(frame_id)) &&
                   std::holds_alternative<bytes>(data);
        }

        [[nodiscard]] const bytes& payload() const { return std::get<bytes>(data); }

        [[nodiscard]] int64_t as_integer() const { return std::get<int64_t>(data); }

        [[nodiscard]] const std::vector<Frame>& elements() const { return std::get<std::vector<Frame>>(data); }

        // Number of elements for arrays and sets, number of pairs for maps.
        [[nodiscard]] size_t count() const;

        /**
         * Map and Set frames are compared regardless of element order. Everything else is compared
         * member by member.
         */
        bool operator==(const Frame& other) const;

        // hash agrees with operator==, maps and sets hash the same whatever their order.
        [[nodiscard]] size_t hash() const noexcept;

        // use this for debug
        [[nodiscard]] std::string to_string() const;

        // as_bytes encodes the frame in its wire format. CR and LF inside a simple string or an error are written
        // as spaces, these frames are line terminated.
        [[nodiscard]] bytes as_bytes() const;

        // write_to appends the wire format of the frame to out.
        void write_to(bytes& out) const;
    };
}  // namespace kvwire

#endif  // KVWIRE_FRAMER_FRAME_H
