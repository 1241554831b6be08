#include "kvwire/server.h"

#include <photon/common/alog.h>
#include <photon/common/utility.h>
#include <photon/thread/workerpool.h>

namespace kvwire
{
    std::optional<int> log_level_from_string(const std::string& level)
    {
        if (level == "debug") return ALOG_DEBUG;
        if (level == "info") return ALOG_INFO;
        if (level == "warn") return ALOG_WARN;
        if (level == "error") return ALOG_ERROR;
        return std::nullopt;
    }

    std::optional<std::string> ServerConfig::validate() const
    {
        if (photon::net::IPAddr(host_.c_str()).undefined())
        {
            return "host '" + host_ + "' is not a valid ip address";
        }
        if (port_ == 0)
        {
            return "port must be in 1..65535";
        }
        if (worker_thread_count_ == 0)
        {
            return "worker thread count must be positive";
        }
        if (max_concurrent_connections_ == 0)
        {
            return "max concurrent connections must be positive";
        }
        if (network_read_chunk_ == 0)
        {
            return "network read chunk must be positive";
        }
        if (max_bulk_length_ < 0)
        {
            return "max bulk length cannot be negative";
        }
        if (max_aggregate_length_ < 0)
        {
            return "max aggregate length cannot be negative";
        }
        if (max_line_length_ == 0)
        {
            return "max line length must be positive";
        }
        if (max_nesting_depth_ == 0)
        {
            return "max nesting depth must be positive";
        }
        if (!log_level_from_string(log_level_).has_value())
        {
            return "unknown log level '" + log_level_ + "'";
        }
        return std::nullopt;
    }

    Server::Server(const ServerConfig& config, std::shared_ptr<Store> store, CommandRegistry registry) :
        server_config_(config), store_(std::move(store)), registry_(std::move(registry)),
        socket_server_(photon::net::new_tcp_socket_server()), slots_(config.max_concurrent_connections_)
    {
        log_output_level = log_level_from_string(config.log_level_).value_or(ALOG_INFO);
        socket_server_->setsockopt<int>(SOL_SOCKET, SO_REUSEADDR, 1);
        LOG_DEBUG("Server::Server initialization finished with ` registered commands", registry_.size());
    }

    int Server::run()
    {
        if (listen() != 0) return -1;
        return serve();
    }

    int Server::listen()
    {
        const photon::net::IPAddr host(server_config_.host_.c_str());
        if (socket_server_->bind(server_config_.port_, host) != 0)
        {
            LOG_ERRNO_RETURN(0, -1, "failed to bind tcp socket to `:`", server_config_.host_.c_str(),
                             server_config_.port_);
        }
        if (socket_server_->listen() != 0)
        {
            LOG_ERRNO_RETURN(0, -1, "failed to listen on tcp socket");
        }
        LOG_INFO("listening on ` with up to ` concurrent connections", socket_server_->getsockname(),
                 server_config_.max_concurrent_connections_);
        return 0;
    }

    uint16_t Server::port() { return socket_server_->getsockname().port; }

    void Server::stop()
    {
        stopping_ = true;
        if (accept_thread_ != nullptr)
        {
            photon::thread_interrupt(accept_thread_);
        }
    }

    int Server::serve()
    {
        accept_thread_ = photon::CURRENT;
        DEFER(accept_thread_ = nullptr);

        // thread mode 0: every connection gets its own photon thread on one of the worker vcpus
        photon::WorkPool wp(server_config_.worker_thread_count_, static_cast<int>(server_config_.event_engine_),
                            photon::INIT_IO_NONE, 0);

        while (!stopping_)
        {
            if (slots_.wait(1) != 0)
            {
                if (stopping_) break;
                LOG_ERRNO_RETURN(0, -1, "failed to wait for a free connection slot");
            }
            photon::net::EndPoint remote;
            std::unique_ptr<photon::net::ISocketStream> stream(socket_server_->accept(&remote));
            if (stream == nullptr)
            {
                slots_.signal(1);
                if (stopping_) break;
                LOG_ERRNO_RETURN(0, -1, "failed to accept tcp socket");
            }
            LOG_INFO("accepted connection from `", remote);
            wp.async_call(new auto([this, remote, stream = std::move(stream)]() mutable {
                this->serve_(std::move(stream), remote);
            }));
        }
        LOG_INFO("stopped accepting connections");
        return 0;
    }

    void Server::serve_(std::unique_ptr<photon::net::ISocketStream> stream, const photon::net::EndPoint remote)
    {
        DEFER(slots_.signal(1));
        Connection connection(std::move(stream), registry_, *store_, server_config_.connection_options());
        if (const auto end = connection.run(); end == ConnectionState::Aborted)
        {
            LOG_WARN("connection from ` aborted after ` responses", remote, connection.served());
            return;
        }
        LOG_DEBUG("connection from ` closed after ` responses", remote, connection.served());
    }

}  // namespace kvwire
