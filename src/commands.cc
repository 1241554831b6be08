#include "kvwire/commands.h"

#include <photon/common/alog.h>

#include "kvwire/errors.h"
#include "kvwire/framer/values.h"
#include "kvwire/strings.h"

namespace kvwire
{
    namespace
    {
        std::string wrong_arity(std::string_view command)
        {
            return "wrong number of arguments for '" + std::string(command) + "' command";
        }

        void expect_arity(std::string_view command, CommandArgs args, const size_t n)
        {
            if (args.size() != n)
            {
                throw CommandError(wrong_arity(command));
            }
        }

        std::string payload_string(const Frame& frame)
        {
            const auto& payload = frame.payload();
            return {payload.begin(), payload.end()};
        }
    }  // namespace

    std::string key_from_frame(const Frame& frame)
    {
        if (frame.is_string_like())
        {
            return payload_string(frame);
        }
        if (frame.frame_id == FrameID::Integer)
        {
            return std::to_string(frame.as_integer());
        }
        throw CommandError("key must be a string or an integer");
    }

    Frame value_from_frame(const Frame& frame)
    {
        if (is_aggregate_frame(frame.frame_id) || frame.is_error())
        {
            throw CommandError("value must be a scalar");
        }
        return frame;
    }

    namespace commands
    {
        Frame get(Store& store, CommandArgs args)
        {
            expect_arity("GET", args, 1);
            return to_frame(store.get(key_from_frame(args[0])));
        }

        Frame set(Store& store, CommandArgs args)
        {
            expect_arity("SET", args, 2);
            auto key = key_from_frame(args[0]);
            store.set(std::move(key), value_from_frame(args[1]));
            return to_frame(1);
        }

        Frame del(Store& store, CommandArgs args)
        {
            expect_arity("DELETE", args, 1);
            return to_frame(store.del(key_from_frame(args[0])));
        }

        Frame flush(Store& store, CommandArgs args)
        {
            expect_arity("FLUSH", args, 0);
            return to_frame(store.clear());
        }

        Frame mget(Store& store, CommandArgs args)
        {
            std::vector<std::string> keys;
            keys.reserve(args.size());
            for (const auto& arg: args)
            {
                keys.push_back(key_from_frame(arg));
            }
            return to_frame(store.multi_get(keys));
        }

        Frame mset(Store& store, CommandArgs args)
        {
            if (args.size() % 2 != 0)
            {
                throw CommandError("MSET requires an even number of arguments");
            }
            // every pair is validated before the store sees any of them
            std::vector<std::pair<std::string, Frame>> pairs;
            pairs.reserve(args.size() / 2);
            for (size_t i = 0; i < args.size(); i += 2)
            {
                pairs.emplace_back(key_from_frame(args[i]), value_from_frame(args[i + 1]));
            }
            return to_frame(store.multi_set(std::move(pairs)));
        }

        Frame ping(Store&, CommandArgs args)
        {
            if (args.size() > 1)
            {
                throw CommandError(wrong_arity("PING"));
            }
            if (args.empty())
            {
                return Frame::simple("PONG");
            }
            return args[0].is_string_like() ? Frame::bulk(args[0].payload()) : args[0];
        }
    }  // namespace commands

    CommandRegistry CommandRegistry::with_default_commands()
    {
        CommandRegistry registry;
        registry.add("GET", commands::get)
                .add("SET", commands::set)
                .add("DELETE", commands::del)
                .add("FLUSH", commands::flush)
                .add("MGET", commands::mget)
                .add("MSET", commands::mset)
                .add("PING", commands::ping);
        return registry;
    }

    CommandRegistry& CommandRegistry::add(std::string_view name, CommandHandler handler)
    {
        handlers_.insert_or_assign(utils::to_upper(name), std::move(handler));
        return *this;
    }

    bool CommandRegistry::contains(std::string_view name) const { return handlers_.contains(utils::to_upper(name)); }

    std::vector<Frame> CommandRegistry::tokens_from_frame(const Frame& request)
    {
        if (request.frame_id == FrameID::Array)
        {
            return request.elements();
        }
        if (!request.is_string_like())
        {
            throw CommandError("Request must be list or simple string.");
        }
        std::vector<Frame> tokens;
        for (const auto& word: utils::split_whitespace(payload_string(request)))
        {
            tokens.push_back(Frame::bulk(word));
        }
        return tokens;
    }

    Frame CommandRegistry::dispatch(const Frame& request, Store& store) const
    {
        try
        {
            const auto tokens = tokens_from_frame(request);
            if (tokens.empty())
            {
                throw CommandError("Missing command");
            }
            if (!tokens[0].is_string_like())
            {
                throw CommandError("command name must be a string");
            }
            const auto command = utils::to_upper(payload_string(tokens[0]));
            const auto it = handlers_.find(command);
            if (it == handlers_.end())
            {
                throw CommandError("Unrecognized command: " + command);
            }
            LOG_DEBUG("dispatching command ` with ` arguments", command.c_str(), tokens.size() - 1);
            return it->second(store, CommandArgs(tokens).subspan(1));
        }
        catch (const CommandError& ex)
        {
            LOG_DEBUG("command error: `", ex.what());
            return Frame::error(ex.what());
        }
        catch (const std::exception& ex)
        {
            LOG_ERROR("command handler failed: `", ex.what());
            return Frame::error(std::string("internal error: ") + ex.what());
        }
    }

}  // namespace kvwire
