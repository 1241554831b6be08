#ifndef KVWIRE_SERVER_H
#define KVWIRE_SERVER_H

#include <memory>
#include <optional>
#include <photon/net/socket.h>
#include <photon/photon.h>
#include <photon/thread/thread.h>
#include <string>
#include <thread>

#include "commands.h"
#include "connection.h"
#include "framer/handler.h"
#include "store.h"

namespace kvwire
{
    struct ServerConfig
    {
        size_t worker_thread_count_ = std::thread::hardware_concurrency();
        uint64_t event_engine_ = photon::INIT_EVENT_DEFAULT;
        std::string host_{"127.0.0.1"};
        uint16_t port_ = 31337;
        // connections beyond this bound wait at accept time until a slot frees
        size_t max_concurrent_connections_ = 64;
        size_t network_read_chunk_{1024};
        int64_t max_bulk_length_ = DEFAULT_MAX_BULK_LENGTH;
        uint8_t max_nesting_depth_ = MAX_RECURSION_DEPTH;
        int64_t max_aggregate_length_ = DEFAULT_MAX_AGGREGATE_LENGTH;
        size_t max_line_length_ = DEFAULT_MAX_LINE_LENGTH;
        // one of debug, info, warn, error
        std::string log_level_{"info"};

        // validate returns a description of the first invalid setting, nullopt if the configuration is usable.
        [[nodiscard]] std::optional<std::string> validate() const;

        [[nodiscard]] ConnectionOptions connection_options() const
        {
            return ConnectionOptions{network_read_chunk_, max_bulk_length_, max_nesting_depth_, max_aggregate_length_,
                                     max_line_length_};
        }
    };

    // log_level_from_string maps a level name to its alog value, nullopt for unknown names.
    std::optional<int> log_level_from_string(const std::string& level);

    /**
     * @brief Server accepts tcp connections and runs one Connection per client on a photon work pool.
     *
     * photon::init must have been called on the calling thread before a Server is built.
     */
    class Server
    {
    public:
        explicit Server(const ServerConfig& config, std::shared_ptr<Store> store = std::make_shared<MemoryStore>(),
                        CommandRegistry registry = CommandRegistry::with_default_commands());

        Server(const Server&) = delete;

        Server& operator=(const Server&) = delete;

        Server(Server&&) noexcept = delete;

        Server& operator=(Server&&) noexcept = delete;

        // run binds, listens and serves until accepting fails or stop is called. Returns 0 on success, -1 otherwise.
        int run();

        // listen binds the configured address. Port 0 picks an ephemeral port, see port().
        int listen();

        // serve accepts connections on a listening server until accepting fails or stop is called.
        int serve();

        // stop wakes up the accepting photon thread, serve returns once the worker pool drained.
        void stop();

        // the port the server is bound to, 0 before listen
        [[nodiscard]] uint16_t port();

        [[nodiscard]] const CommandRegistry& registry() const noexcept { return registry_; }

        [[nodiscard]] Store& store() noexcept { return *store_; }

    private:
        void serve_(std::unique_ptr<photon::net::ISocketStream> stream, photon::net::EndPoint remote);

        ServerConfig server_config_{};
        std::shared_ptr<Store> store_;
        CommandRegistry registry_;
        std::unique_ptr<photon::net::ISocketServer> socket_server_;
        photon::semaphore slots_;
        photon::thread* accept_thread_ = nullptr;
        bool stopping_ = false;
    };
}  // namespace kvwire

#endif  // KVWIRE_SERVER_H
