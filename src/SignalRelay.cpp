#include "api/HttpApi.h"
#include "config/Settings.h"
#include "networking/SignalingServer.h"
#include "pairing/PairingRegistry.h"
#include "relay/RoomDirectory.h"
#include "util/Log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <stdexcept>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    using namespace signalrelay;

    config::Settings settings = config::Settings::from_environment();
    try {
        if (config::apply_args(settings, argc, argv) == config::ArgsResult::Help) {
            std::cout << config::usage(argv[0]);
            return 0;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << config::usage(argv[0]);
        return 2;
    }
    util::set_verbose(settings.verbose);

    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(settings.host, ec);
    if (ec) {
        std::cerr << "Invalid bind address '" << settings.host << "': " << ec.message() << "\n";
        return 2;
    }

    boost::asio::io_context ioc(static_cast<int>(settings.threads));

    relay::RoomRelay::Options room_options;
    room_options.idle_ttl = std::chrono::seconds(settings.room_ttl_seconds);
    room_options.rate_limit = settings.rate_limit;

    relay::RoomDirectory rooms(ioc.get_executor(), room_options);
    pairing::PairingRegistry pairing(ioc.get_executor(), settings.pairing_ttl_seconds);
    api::HttpApi http_api(pairing);

    networking::SignalingServer::Options server_options;
    server_options.max_message_bytes = settings.max_message_bytes;
    server_options.max_pending_writes = settings.max_pending_writes;

    std::unique_ptr<networking::SignalingServer> server;
    try {
        server = std::make_unique<networking::SignalingServer>(
            ioc, boost::asio::ip::tcp::endpoint(addr, settings.port), rooms, http_api, server_options);
    } catch (const boost::system::system_error& e) {
        std::cerr << "Cannot listen on " << settings.host << ":" << settings.port << ": " << e.what() << "\n";
        return 1;
    }
    server->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        util::log("[signalrelay] shutting down...");
        server->stop();
        rooms.shutdown();
        ioc.stop();
    });

    util::log("[signalrelay] listening on " + settings.host + ":" + std::to_string(server->port()) +
              " (room ttl " + std::to_string(settings.room_ttl_seconds) + "s, rate limit " +
              std::to_string(settings.rate_limit) + "/s)");

    std::vector<std::thread> workers;
    workers.reserve(settings.threads - 1);
    for (unsigned i = 1; i < settings.threads; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : workers) t.join();

    util::log("[signalrelay] exit.");
    return 0;
}
