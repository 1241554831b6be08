#ifndef KVWIRE_CONNECTION_H
#define KVWIRE_CONNECTION_H

#include <memory>
#include <ostream>
#include <photon/net/socket.h>

#include "commands.h"
#include "framer/handler.h"
#include "store.h"

namespace kvwire
{
    enum class ConnectionState
    {
        AwaitingFrame,
        Dispatching,
        Responding,
        // terminal: the peer closed the stream between two frames
        Disconnected,
        // terminal: malformed frame or transport failure
        Aborted,
    };

    std::ostream& operator<<(std::ostream& o, ConnectionState state);

    struct ConnectionOptions
    {
        size_t read_chunk_size = 1024;
        int64_t max_bulk_length = DEFAULT_MAX_BULK_LENGTH;
        uint8_t max_nesting_depth = MAX_RECURSION_DEPTH;
        int64_t max_aggregate_length = DEFAULT_MAX_AGGREGATE_LENGTH;
        size_t max_line_length = DEFAULT_MAX_LINE_LENGTH;
    };

    /**
     * @brief Connection drives one client: read a frame, dispatch it, write the response, repeat.
     *
     * Requests of a connection are served strictly one after the other. The stream is closed when run returns,
     * whether the client went away or the connection was aborted.
     */
    class Connection
    {
    public:
        Connection(std::unique_ptr<photon::net::ISocketStream> stream, const CommandRegistry& registry, Store& store,
                   const ConnectionOptions& options = {});

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;

        ~Connection();

        // run serves requests until a terminal state is reached and returns it.
        ConnectionState run();

        [[nodiscard]] ConnectionState state() const noexcept { return state_; }

        // number of responses fully written so far
        [[nodiscard]] size_t served() const noexcept { return served_; }

        // the decode or write error which aborted the connection, success otherwise
        [[nodiscard]] KvError abort_reason() const noexcept { return abort_reason_; }

    private:
        void await_frame_();
        void dispatch_();
        void respond_();
        void abort_(KvError reason);

        Handler handler_;
        const CommandRegistry& registry_;
        Store& store_;
        uint8_t max_nesting_depth_;
        ConnectionState state_ = ConnectionState::AwaitingFrame;
        Frame request_{Frame::null()};
        Frame response_{Frame::null()};
        size_t served_ = 0;
        KvError abort_reason_ = KvError::success;
        bool closed_ = false;
    };
}  // namespace kvwire

#endif  // KVWIRE_CONNECTION_H
