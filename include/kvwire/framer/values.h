#ifndef KVWIRE_FRAMER_VALUES_H
#define KVWIRE_FRAMER_VALUES_H

#include <cmath>
#include <concepts>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "frame.h"
#include "kvwire/errors.h"

namespace kvwire
{
    // An error value a handler wants to send back as a SimpleError frame.
    struct ErrorReply
    {
        std::string message;
    };

    template<typename T>
    concept Streamable = requires(std::ostream& os, const T& value) { os << value; };

    template<typename T>
    concept NativeValue = std::integral<T> || std::floating_point<T> || std::convertible_to<T, std::string_view> ||
                          std::same_as<T, Frame> || std::same_as<T, ErrorReply> || std::same_as<T, bytes> ||
                          std::same_as<T, std::nullopt_t>;

    // to_frame maps a C++ value to the frame a client receives for it.

    inline Frame to_frame(const Frame& frame) { return frame; }

    // Raw bytes are sent as a BulkString.
    inline Frame to_frame(const bytes& data) { return Frame::bulk(data); }

    // Text is sent with its own tag so that a decoder can tell text from raw bytes.
    inline Frame to_frame(std::string_view str) { return Frame::text(str); }
    inline Frame to_frame(const std::string& str) { return Frame::text(str); }
    inline Frame to_frame(const char* str) { return Frame::text(str); }

    inline Frame to_frame(const bool value) { return Frame::integer(value ? 1 : 0); }

    template<std::integral T>
    Frame to_frame(const T value)
    {
        return Frame::integer(static_cast<int64_t>(value));
    }

    // Floating values lose their fractional part and saturate at the int64 bounds. NaN has no integer form.
    template<std::floating_point T>
    Frame to_frame(const T value)
    {
        if (std::isnan(value))
        {
            throw CommandError("cannot send NaN as an integer");
        }
        constexpr auto lowest = std::numeric_limits<int64_t>::min();
        constexpr auto highest = std::numeric_limits<int64_t>::max();
        // highest rounds up to 2^63 as a floating value, which is already out of range
        if (value >= static_cast<T>(highest)) return Frame::integer(highest);
        if (value <= static_cast<T>(lowest)) return Frame::integer(lowest);
        return Frame::integer(static_cast<int64_t>(value));
    }

    inline Frame to_frame(const ErrorReply& err) { return Frame::error(err.message); }

    inline Frame to_frame(std::nullopt_t) { return Frame::null(); }

    template<typename T>
    Frame to_frame(const std::optional<T>& value)
    {
        if (!value.has_value()) return Frame::null();
        return to_frame(value.value());
    }

    template<typename T>
    Frame to_frame(const std::vector<T>& items)
    {
        std::vector<Frame> frames;
        frames.reserve(items.size());
        for (const auto& item: items)
        {
            frames.push_back(to_frame(item));
        }
        return Frame::array(std::move(frames));
    }

    template<typename K, typename V>
    Frame to_frame(const std::map<K, V>& items)
    {
        std::vector<std::pair<Frame, Frame>> pairs;
        pairs.reserve(items.size());
        for (const auto& [key, value]: items)
        {
            pairs.emplace_back(to_frame(key), to_frame(value));
        }
        return Frame::map(std::move(pairs));
    }

    template<typename K, typename V>
    Frame to_frame(const std::unordered_map<K, V>& items)
    {
        std::vector<std::pair<Frame, Frame>> pairs;
        pairs.reserve(items.size());
        for (const auto& [key, value]: items)
        {
            pairs.emplace_back(to_frame(key), to_frame(value));
        }
        return Frame::map(std::move(pairs));
    }

    template<typename T>
    Frame to_frame(const std::set<T>& items)
    {
        std::vector<Frame> frames;
        frames.reserve(items.size());
        for (const auto& item: items)
        {
            frames.push_back(to_frame(item));
        }
        return Frame::set(std::move(frames));
    }

    template<typename T>
    Frame to_frame(const std::unordered_set<T>& items)
    {
        std::vector<Frame> frames;
        frames.reserve(items.size());
        for (const auto& item: items)
        {
            frames.push_back(to_frame(item));
        }
        return Frame::set(std::move(frames));
    }

    // Anything else which can be printed, e.g. a timestamp, goes out as its text representation.
    template<typename T>
        requires(Streamable<T> && !NativeValue<T>)
    Frame to_frame(const T& value)
    {
        std::ostringstream out;
        out << value;
        return Frame::text(out.str());
    }

}  // namespace kvwire

#endif  // KVWIRE_FRAMER_VALUES_H
