#include "kvwire/client.h"

#include <cerrno>
#include <photon/common/alog.h>
#include <string_view>
#include <system_error>

#include "kvwire/errors.h"

namespace kvwire
{
    namespace
    {
        [[noreturn]] void unexpected_reply(const Frame& reply)
        {
            throw std::system_error(make_error_code(KvError::invalid_frame), "unexpected reply " + reply.to_string());
        }

        int64_t reply_integer(const Frame& reply)
        {
            if (reply.frame_id != FrameID::Integer) unexpected_reply(reply);
            return reply.as_integer();
        }

        std::optional<std::string> reply_string(const Frame& reply)
        {
            if (reply.is_null()) return std::nullopt;
            if (reply.is_string_like()) return std::string(reply.payload().begin(), reply.payload().end());
            if (reply.frame_id == FrameID::Integer) return std::to_string(reply.as_integer());
            unexpected_reply(reply);
        }
    }  // namespace

    Client::Client(std::unique_ptr<photon::net::ISocketStream> stream, const size_t chunk_size) :
        handler_(std::move(stream), chunk_size)
    {
    }

    std::unique_ptr<Client> Client::connect(const std::string& host, const uint16_t port, const size_t chunk_size)
    {
        const photon::net::IPAddr addr(host.c_str());
        if (addr.undefined())
        {
            throw std::system_error(std::make_error_code(std::errc::invalid_argument), "invalid host " + host);
        }
        std::unique_ptr<photon::net::ISocketClient> socket_client(photon::net::new_tcp_socket_client());
        if (socket_client == nullptr)
        {
            throw std::system_error(errno, std::generic_category(), "failed to create tcp client");
        }
        std::unique_ptr<photon::net::ISocketStream> stream(socket_client->connect(photon::net::EndPoint(addr, port)));
        if (stream == nullptr)
        {
            throw std::system_error(errno, std::generic_category(),
                                    "failed to connect to " + host + ":" + std::to_string(port));
        }
        LOG_DEBUG("connected to `:`", host.c_str(), port);
        return std::make_unique<Client>(std::move(stream), chunk_size);
    }

    Frame Client::execute_frame(const Frame& request)
    {
        if (const auto written = handler_.send_frame(request); written.is_error())
        {
            throw std::system_error(make_error_code(written.error()), "failed to send request");
        }
        auto reply = handler_.decode(0, MAX_RECURSION_DEPTH);
        if (reply.is_error())
        {
            throw std::system_error(make_error_code(reply.error()), "failed to read reply");
        }
        if (reply.value().is_error())
        {
            const auto& message = reply.value().payload();
            throw CommandError(std::string(message.begin(), message.end()));
        }
        return std::move(reply.value());
    }

    Frame Client::execute(const std::vector<std::string>& args)
    {
        std::vector<Frame> items;
        items.reserve(args.size());
        for (const auto& arg: args)
        {
            items.push_back(Frame::bulk(arg));
        }
        return execute_frame(Frame::array(std::move(items)));
    }

    std::optional<std::string> Client::get(const std::string& key) { return reply_string(execute({"GET", key})); }

    int64_t Client::set(const std::string& key, const std::string& value)
    {
        return reply_integer(execute({"SET", key, value}));
    }

    int64_t Client::del(const std::string& key) { return reply_integer(execute({"DELETE", key})); }

    int64_t Client::flush() { return reply_integer(execute({"FLUSH"})); }

    std::vector<std::optional<std::string>> Client::mget(const std::vector<std::string>& keys)
    {
        std::vector<std::string> args{"MGET"};
        args.insert(args.end(), keys.begin(), keys.end());
        const auto reply = execute(args);
        if (reply.frame_id != FrameID::Array) unexpected_reply(reply);

        std::vector<std::optional<std::string>> values;
        values.reserve(reply.count());
        for (const auto& item: reply.elements())
        {
            values.push_back(reply_string(item));
        }
        return values;
    }

    int64_t Client::mset(const std::vector<std::pair<std::string, std::string>>& pairs)
    {
        std::vector<std::string> args{"MSET"};
        args.reserve(1 + pairs.size() * 2);
        for (const auto& [key, value]: pairs)
        {
            args.push_back(key);
            args.push_back(value);
        }
        return reply_integer(execute(args));
    }

    std::string Client::ping()
    {
        const auto reply = reply_string(execute({"PING"}));
        return reply.value_or("");
    }

    void render_reply(std::ostream& out, const Frame& reply, const size_t indent)
    {
        switch (reply.frame_id)
        {
            case FrameID::Integer:
                out << "(integer) " << reply.as_integer() << '\n';
                break;
            case FrameID::SimpleString:
                out << std::string_view(reply.payload().data(), reply.payload().size()) << '\n';
                break;
            case FrameID::SimpleError:
                out << "(error) " << std::string_view(reply.payload().data(), reply.payload().size()) << '\n';
                break;
            case FrameID::BulkString:
            case FrameID::Text:
                if (reply.is_null())
                {
                    out << "(nil)\n";
                    break;
                }
                out << '"' << std::string_view(reply.payload().data(), reply.payload().size()) << "\"\n";
                break;
            case FrameID::Array:
            case FrameID::Set:
            {
                const auto& items = reply.elements();
                if (items.empty())
                {
                    out << (reply.frame_id == FrameID::Set ? "(empty set)\n" : "(empty array)\n");
                    break;
                }
                for (size_t i = 0; i < items.size(); ++i)
                {
                    const auto prefix = std::to_string(i + 1) + ") ";
                    if (i > 0) out << std::string(indent, ' ');
                    out << prefix;
                    render_reply(out, items[i], indent + prefix.size());
                }
                break;
            }
            case FrameID::Map:
            {
                const auto& items = reply.elements();
                if (items.empty())
                {
                    out << "(empty map)\n";
                    break;
                }
                for (size_t i = 0; i + 1 < items.size(); i += 2)
                {
                    const auto prefix = std::to_string(i / 2 + 1) + ") ";
                    if (i > 0) out << std::string(indent, ' ');
                    out << prefix;
                    render_reply(out, items[i], indent + prefix.size());
                    out << std::string(indent + prefix.size(), ' ') << "=> ";
                    render_reply(out, items[i + 1], indent + prefix.size() + 3);
                }
                break;
            }
            case FrameID::Undefined:
                out << "(undefined)\n";
                break;
        }
    }

}  // namespace kvwire
