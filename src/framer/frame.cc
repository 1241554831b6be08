#include "kvwire/framer/frame.h"

#include <algorithm>
#include <functional>
#include <unordered_map>
#include <unordered_set>

namespace kvwire
{
    constexpr char CR = '\r';
    constexpr char LF = '\n';

    namespace
    {
        void append_crlf(bytes& out)
        {
            out.push_back(CR);
            out.push_back(LF);
        }

        // a simple frame ends at the first CRLF, so line breaks in its content must not reach the wire
        void append_line(bytes& out, const bytes& content)
        {
            for (const auto c: content)
            {
                out.push_back(c == CR || c == LF ? ' ' : c);
            }
            append_crlf(out);
        }

        size_t combine(const size_t seed, const size_t h) noexcept
        {
            return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
        }

        struct PtrHash
        {
            size_t operator()(const Frame* frame) const noexcept { return frame->hash(); }
        };

        struct PtrEqual
        {
            bool operator()(const Frame* a, const Frame* b) const { return *a == *b; }
        };

        void append_number(bytes& out, const int64_t n)
        {
            const auto str = std::to_string(n);
            out.insert(out.end(), str.begin(), str.end());
            append_crlf(out);
        }

        // every pair of a is found in b, both spans are k,v adjacent
        bool same_pairs(const std::vector<Frame>& a, const std::vector<Frame>& b)
        {
            for (size_t i = 0; i + 1 < a.size(); i += 2)
            {
                bool found = false;
                for (size_t j = 0; j + 1 < b.size(); j += 2)
                {
                    if (a[i] == b[j] && a[i + 1] == b[j + 1])
                    {
                        found = true;
                        break;
                    }
                }
                if (!found) return false;
            }
            return true;
        }

        bool same_members(const std::vector<Frame>& a, const std::vector<Frame>& b)
        {
            return std::ranges::all_of(a, [&b](const Frame& item) { return std::ranges::find(b, item) != b.end(); });
        }
    }  // namespace

    FrameID frame_id_from_char(const char from)
    {
        switch (from)
        {
            using enum FrameID;
            case kInteger:
                return Integer;
            case kSimpleString:
                return SimpleString;
            case kSimpleError:
                return SimpleError;
            case kBulkString:
                return BulkString;
            case kArray:
                return Array;
            case kMap:
                return Map;
            case kSet:
                return Set;
            default:
                return Undefined;
        }
    }

    Frame Frame::make_frame(const FrameID& frame_id)
    {
        switch (frame_id)
        {
            case FrameID::Integer:
                return Frame{frame_id, int64_t{0}};
            case FrameID::SimpleString:
            case FrameID::SimpleError:
            case FrameID::BulkString:
            case FrameID::Text:
                return Frame{frame_id, bytes{}};
            case FrameID::Array:
            case FrameID::Map:
            case FrameID::Set:
                return Frame{frame_id, std::vector<Frame>{}};
            case FrameID::Undefined:
                break;
        }
        // We should normally not reach this line
        return Frame{FrameID::Undefined, std::monostate()};
    }

    Frame Frame::map(std::vector<std::pair<Frame, Frame>> pairs)
    {
        // flat never reallocates, the index keeps pointers to the keys already placed in it
        std::vector<Frame> flat;
        flat.reserve(pairs.size() * 2);
        std::unordered_map<const Frame*, size_t, PtrHash, PtrEqual> index;
        index.reserve(pairs.size());
        for (auto& [key, value]: pairs)
        {
            if (const auto it = index.find(&key); it != index.end())
            {
                flat[it->second + 1] = std::move(value);
                continue;
            }
            const auto position = flat.size();
            flat.push_back(std::move(key));
            flat.push_back(std::move(value));
            index.emplace(&flat[position], position);
        }
        return Frame{FrameID::Map, std::move(flat)};
    }

    Frame Frame::set(std::vector<Frame> items)
    {
        std::vector<Frame> unique;
        unique.reserve(items.size());
        std::unordered_set<const Frame*, PtrHash, PtrEqual> seen;
        seen.reserve(items.size());
        for (auto& item: items)
        {
            if (seen.contains(&item)) continue;
            unique.push_back(std::move(item));
            seen.insert(&unique.back());
        }
        return Frame{FrameID::Set, std::move(unique)};
    }

    size_t Frame::hash() const noexcept
    {
        size_t seed = std::hash<char>{}(static_cast<char>(frame_id));
        if (const auto* content = std::get_if<bytes>(&data))
        {
            return combine(seed, std::hash<std::string_view>{}(std::string_view(content->data(), content->size())));
        }
        if (const auto* number = std::get_if<int64_t>(&data))
        {
            return combine(seed, std::hash<int64_t>{}(*number));
        }
        const auto* items = std::get_if<std::vector<Frame>>(&data);
        if (items == nullptr)
        {
            return seed;
        }
        switch (frame_id)
        {
            case FrameID::Map:
            {
                // summing keeps the result independent of the pair order
                size_t sum = 0;
                for (size_t i = 0; i + 1 < items->size(); i += 2)
                {
                    sum += combine((*items)[i].hash(), (*items)[i + 1].hash());
                }
                return combine(seed, sum);
            }
            case FrameID::Set:
            {
                size_t sum = 0;
                for (const auto& item: *items)
                {
                    sum += item.hash();
                }
                return combine(seed, sum);
            }
            default:
                for (const auto& item: *items)
                {
                    seed = combine(seed, item.hash());
                }
                return seed;
        }
    }

    size_t FrameHash::operator()(const Frame& frame) const noexcept { return frame.hash(); }

    size_t Frame::count() const
    {
        const auto& items = this->elements();
        return frame_id == FrameID::Map ? items.size() / 2 : items.size();
    }

    bool Frame::operator==(const Frame& other) const
    {
        if (frame_id != other.frame_id) return false;
        if (frame_id != FrameID::Map && frame_id != FrameID::Set) return data == other.data;

        const auto* mine = std::get_if<std::vector<Frame>>(&data);
        const auto* theirs = std::get_if<std::vector<Frame>>(&other.data);
        if (mine == nullptr || theirs == nullptr) return data == other.data;
        if (mine->size() != theirs->size()) return false;
        if (frame_id == FrameID::Map) return same_pairs(*mine, *theirs);
        return same_members(*mine, *theirs);
    }

    std::string Frame::to_string() const
    {
        const auto encoded = this->as_bytes();
        return std::string(encoded.begin(), encoded.end());
    }

    bytes Frame::as_bytes() const
    {
        bytes out;
        this->write_to(out);
        return out;
    }

    void Frame::write_to(bytes& out) const
    {
        out.push_back(static_cast<char>(frame_id));
        switch (this->frame_id)
        {
            case FrameID::Integer:
            {
                append_number(out, std::get<int64_t>(this->data));
                break;
            }
            case FrameID::SimpleString:
            case FrameID::SimpleError:
            {
                append_line(out, std::get<bytes>(this->data));
                break;
            }
            case FrameID::BulkString:
            case FrameID::Text:
            {
                if (this->is_null())
                {
                    append_number(out, -1);
                    break;
                }
                const auto& content = std::get<bytes>(this->data);
                append_number(out, static_cast<int64_t>(content.size()));
                out.insert(out.end(), content.begin(), content.end());
                append_crlf(out);
                break;
            }
            case FrameID::Array:
            case FrameID::Map:
            case FrameID::Set:
            {
                append_number(out, static_cast<int64_t>(this->count()));
                for (const auto& item: this->elements())
                {
                    item.write_to(out);
                }
                break;
            }
            case FrameID::Undefined:
            default:
            {
                append_crlf(out);
                break;
            }
        }
    }

}  // namespace kvwire
