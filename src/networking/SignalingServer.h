#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace signalrelay::api {
class HttpApi;
}

namespace signalrelay::relay {
class RoomDirectory;
}

namespace signalrelay::networking {

using ClientId = std::uint64_t;

// HTTP + WebSocket front end on one port. Plain requests go to the HttpApi;
// upgrades on /room/<id> become relay connections in the RoomDirectory.
class SignalingServer {
public:
    struct Options {
        std::size_t max_message_bytes = 64 * 1024;
        std::size_t max_pending_writes = 256;
    };

    SignalingServer(boost::asio::io_context& ioc,
                    const boost::asio::ip::tcp::endpoint& endpoint,
                    relay::RoomDirectory& rooms,
                    const api::HttpApi& api,
                    Options options);
    ~SignalingServer();

    SignalingServer(const SignalingServer&) = delete;
    SignalingServer& operator=(const SignalingServer&) = delete;

    void start();  // start accepting
    void stop();   // stop accepting + close active relay connections

    unsigned short port() const;
    std::size_t connection_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace signalrelay::networking
