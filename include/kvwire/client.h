#ifndef KVWIRE_CLIENT_H
#define KVWIRE_CLIENT_H

#include <memory>
#include <optional>
#include <ostream>
#include <photon/net/socket.h>
#include <string>
#include <utility>
#include <vector>

#include "framer/handler.h"

namespace kvwire
{
    /**
     * @brief Client sends commands over a stream and waits for their replies, one at a time.
     *
     * Error replies are raised as CommandError. A reply which cannot be read, or a request which cannot be written,
     * raises std::system_error carrying the KvError.
     */
    class Client
    {
    public:
        explicit Client(std::unique_ptr<photon::net::ISocketStream> stream, size_t chunk_size = 1024);

        // connect opens a tcp connection to host:port. Throws std::system_error on failure.
        static std::unique_ptr<Client> connect(const std::string& host, uint16_t port, size_t chunk_size = 1024);

        // execute sends args as an array of bulk strings and returns the reply.
        Frame execute(const std::vector<std::string>& args);

        // execute_frame sends any request frame and returns the reply.
        Frame execute_frame(const Frame& request);

        std::optional<std::string> get(const std::string& key);
        int64_t set(const std::string& key, const std::string& value);
        int64_t del(const std::string& key);
        int64_t flush();
        std::vector<std::optional<std::string>> mget(const std::vector<std::string>& keys);
        int64_t mset(const std::vector<std::pair<std::string, std::string>>& pairs);
        std::string ping();

        void close() { handler_.close(); }

    private:
        Handler handler_;
    };

    // render_reply prints a reply the way an interactive client shows it.
    void render_reply(std::ostream& out, const Frame& reply, size_t indent = 0);

}  // namespace kvwire

#endif  // KVWIRE_CLIENT_H
