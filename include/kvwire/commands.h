#ifndef KVWIRE_COMMANDS_H
#define KVWIRE_COMMANDS_H

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "framer/frame.h"
#include "store.h"

namespace kvwire
{
    // Arguments of a command, the command name excluded.
    using CommandArgs = std::span<const Frame>;

    // A handler returns the frame to send back. It throws CommandError to report a recoverable failure.
    using CommandHandler = std::function<Frame(Store&, CommandArgs)>;

    /**
     * @brief CommandRegistry maps upper-case command names to their handlers.
     *
     * The registry is filled once, before the server starts accepting connections. Dispatching only reads it, so a
     * single registry is shared by every connection without locking.
     */
    class CommandRegistry
    {
    public:
        CommandRegistry() = default;

        // GET, SET, DELETE, FLUSH, MGET, MSET and PING.
        static CommandRegistry with_default_commands();

        // add registers handler under name, replacing an existing one. Names are case-insensitive.
        CommandRegistry& add(std::string_view name, CommandHandler handler);

        [[nodiscard]] bool contains(std::string_view name) const;

        [[nodiscard]] size_t size() const noexcept { return handlers_.size(); }

        /**
         * @brief dispatch runs the command carried by request and returns the response frame.
         *
         * Every failure is contained here: a CommandError or any other exception thrown while resolving or running
         * the command comes back as a SimpleError frame.
         */
        Frame dispatch(const Frame& request, Store& store) const;

        /**
         * tokens_from_frame returns the elements of an array request. Any other string-like request is taken as an
         * inline command line and split on whitespace, each word becoming a BulkString.
         */
        static std::vector<Frame> tokens_from_frame(const Frame& request);

    private:
        std::unordered_map<std::string, CommandHandler> handlers_;
    };

    // key_from_frame returns the bytes of a key argument. Integers are accepted in their decimal form.
    std::string key_from_frame(const Frame& frame);

    // value_from_frame checks that a value argument is a scalar which can be stored.
    Frame value_from_frame(const Frame& frame);

    namespace commands
    {
        Frame get(Store& store, CommandArgs args);
        Frame set(Store& store, CommandArgs args);
        Frame del(Store& store, CommandArgs args);
        Frame flush(Store& store, CommandArgs args);
        Frame mget(Store& store, CommandArgs args);
        Frame mset(Store& store, CommandArgs args);
        Frame ping(Store& store, CommandArgs args);
    }  // namespace commands

}  // namespace kvwire

#endif  // KVWIRE_COMMANDS_H
