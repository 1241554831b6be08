#include "kvwire/connection.h"

#include <photon/common/alog.h>
#include <sched.h>
#include <sstream>

namespace kvwire
{
    std::ostream& operator<<(std::ostream& o, const ConnectionState state)
    {
        switch (state)
        {
            case ConnectionState::AwaitingFrame:
                return o << "AwaitingFrame";
            case ConnectionState::Dispatching:
                return o << "Dispatching";
            case ConnectionState::Responding:
                return o << "Responding";
            case ConnectionState::Disconnected:
                return o << "Disconnected";
            case ConnectionState::Aborted:
                return o << "Aborted";
        }
        return o << "ConnectionState::unknown";
    }

    Connection::Connection(std::unique_ptr<photon::net::ISocketStream> stream, const CommandRegistry& registry,
                           Store& store, const ConnectionOptions& options) :
        handler_(std::move(stream), options.read_chunk_size, options.max_bulk_length, options.max_aggregate_length,
                 options.max_line_length),
        registry_(registry),
        store_(store), max_nesting_depth_(options.max_nesting_depth)
    {
    }

    Connection::~Connection()
    {
        if (!closed_)
        {
            handler_.close();
        }
    }

    ConnectionState Connection::run()
    {
        LOG_DEBUG("starting a session on vcpu: ", sched_getcpu());
        for (;;)
        {
            switch (state_)
            {
                case ConnectionState::AwaitingFrame:
                    await_frame_();
                    break;
                case ConnectionState::Dispatching:
                    dispatch_();
                    break;
                case ConnectionState::Responding:
                    respond_();
                    break;
                case ConnectionState::Disconnected:
                case ConnectionState::Aborted:
                    handler_.close();
                    closed_ = true;
                    return state_;
            }
        }
    }

    void Connection::await_frame_()
    {
        auto maybe_frame = handler_.decode(0, max_nesting_depth_);
        if (!maybe_frame.is_error())
        {
            request_ = std::move(maybe_frame.value());
            state_ = ConnectionState::Dispatching;
            return;
        }
        if (const auto err = maybe_frame.error(); is_fatal(err))
        {
            abort_(err);
            return;
        }
        LOG_DEBUG("client disconnected after ` responses", served_);
        state_ = ConnectionState::Disconnected;
    }

    void Connection::dispatch_()
    {
        response_ = registry_.dispatch(request_, store_);
        state_ = ConnectionState::Responding;
    }

    void Connection::respond_()
    {
        if (const auto written = handler_.send_frame(response_); written.is_error())
        {
            abort_(written.error());
            return;
        }
        ++served_;
        state_ = ConnectionState::AwaitingFrame;
    }

    void Connection::abort_(const KvError reason)
    {
        std::ostringstream reason_name;
        reason_name << reason;
        LOG_WARN("aborting connection: ` (`)", reason_name.str().c_str(), make_error_code(reason).message().c_str());
        abort_reason_ = reason;
        state_ = ConnectionState::Aborted;
    }

}  // namespace kvwire
