#include "networking/SignalingServer.h"

#include "api/HttpApi.h"
#include "networking/PeerAttachment.hpp"
#include "relay/PeerLink.hpp"
#include "relay/RoomDirectory.h"
#include "util/Log.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace signalrelay::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {
constexpr auto kHttpReadTimeout = std::chrono::seconds(30);
constexpr char kServerName[] = "signalrelay";
} // namespace

class SignalingServer::Impl {
public:
    Impl(asio::io_context& ioc, const tcp::endpoint& endpoint,
         relay::RoomDirectory& rooms, const api::HttpApi& api, Options options)
        : ioc_(ioc),
          acceptor_(asio::make_strand(ioc), endpoint),
          rooms_(rooms),
          api_(api),
          options_(options) {}

    void start() { do_accept(); }

    // Callable from any thread; the acceptor is only touched on its strand.
    void stop() {
        asio::dispatch(acceptor_.get_executor(), [this] {
            beast::error_code ec;
            acceptor_.close(ec);
        });

        std::vector<std::shared_ptr<RelaySession>> sessions;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& [id, weak] : sessions_) {
                if (auto s = weak.lock()) sessions.push_back(std::move(s));
            }
            sessions_.clear();
        }
        for (auto& s : sessions) s->close(websocket::close_code::going_away, "Server shutting down");
    }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    std::size_t connection_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return sessions_.size();
    }

private:
    // One WebSocket joined to one room. Reads and writes run on the session
    // strand, so its relays and its final leave are processed in order.
    class RelaySession : public relay::PeerLink,
                         public std::enable_shared_from_this<RelaySession> {
    public:
        // `socket` already runs on its own strand (see do_accept); the stream
        // keeps it, so Beast's internal timers share it with our handlers.
        RelaySession(Impl& server, tcp::socket socket, ClientId id, std::string room_id)
            : server_(server),
              id_(id),
              ws_(std::move(socket)),
              strand_(ws_.get_executor()) {
            attachment_.room_id = std::move(room_id);
        }

        void start(http::request<http::string_body> req) {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
                res.set(http::field::server, kServerName);
            }));
            ws_.read_message_max(server_.options_.max_message_bytes);

            ws_.async_accept(
                req,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) {
                            self->fail("accept", ec);
                            return self->depart();
                        }
                        self->join();
                    }));
        }

        // Never blocks the caller: the frame is handed to the strand.
        void deliver(relay::Frame frame) override {
            asio::post(
                strand_,
                [self = shared_from_this(), frame = std::move(frame)]() mutable {
                    if (self->closing_) return;
                    if (self->write_queue_.size() >= self->server_.options_.max_pending_writes) {
                        util::log("[ws " + self->name() + "] outbound queue full, dropping slow peer");
                        self->depart();
                        return self->begin_close(websocket::close_code::try_again_later, "Slow consumer");
                    }
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(std::move(frame));
                    if (!writing) self->do_write();
                });
        }

        void close(websocket::close_code code, std::string reason) {
            asio::post(
                strand_,
                [self = shared_from_this(), code, reason = std::move(reason)] {
                    self->begin_close(code, reason);
                });
        }

    private:
        void join() {
            attachment_.connected_at = PeerAttachment::Clock::now();
            try {
                auto joined = server_.rooms_.join(attachment_.room_id, shared_from_this());
                attachment_.peer_id = std::move(joined.peer_id);
            } catch (const std::exception& e) {
                util::log("[ws " + name() + "] join refused: " + e.what());
                depart();
                return begin_close(websocket::close_code::try_again_later, "Room unavailable");
            }
            do_read();
        }

        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        // Text and binary frames both carry UTF-8 JSON.
                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        auto outcome = self->server_.rooms_.relay(
                            self->attachment_.room_id, self->attachment_.peer_id, msg);
                        if (outcome == relay::RelayOutcome::UnknownPeer) {
                            self->depart();
                            return self->begin_close(websocket::close_code::policy_error, "Session not found");
                        }
                        if (outcome != relay::RelayOutcome::Relayed) {
                            util::debug("[ws " + self->name() + "] frame rejected: " + relay::to_string(outcome));
                        }

                        self->do_read();
                    }));
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(*write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) return self->do_write();
                        if (self->closing_) self->do_close();
                    }));
        }

        // Queued frames are dropped; a write already in flight finishes first.
        void begin_close(websocket::close_code code, std::string reason) {
            if (closing_) return;
            closing_ = true;
            close_reason_ = websocket::close_reason(code, reason);

            if (write_queue_.empty()) return do_close();
            write_queue_.erase(std::next(write_queue_.begin()), write_queue_.end());
        }

        void do_close() {
            ws_.async_close(
                close_reason_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) return self->on_close_or_fail(ec);
                        self->depart();
                    }));
        }

        // A transport failure is a leave like any other.
        void on_close_or_fail(beast::error_code ec) {
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                fail("io", ec);
            }
            depart();
        }

        void depart() {
            if (departed_) return;
            departed_ = true;
            if (attachment_.joined()) {
                server_.rooms_.leave(attachment_.room_id, attachment_.peer_id);
                util::debug("[ws " + name() + "] left room " + attachment_.room_id + " after " +
                            std::to_string(attachment_.age().count()) + "s");
            }
            server_.remove_session(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            util::debug("[ws " + name() + "] " + what + ": " + ec.message());
        }

        std::string name() const {
            return attachment_.joined() ? attachment_.peer_id : "client-" + std::to_string(id_);
        }

        Impl& server_;
        ClientId id_;
        PeerAttachment attachment_;

        websocket::stream<beast::tcp_stream> ws_;
        asio::any_io_executor strand_;

        beast::flat_buffer buffer_;
        std::deque<relay::Frame> write_queue_;
        websocket::close_reason close_reason_;
        bool closing_ = false;
        bool departed_ = false;
    };

    // Plain HTTP until the request turns out to be a room upgrade.
    class HttpSession : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(Impl& server, tcp::socket socket)
            : server_(server),
              stream_(std::move(socket)) {}

        void start() { do_read(); }

    private:
        void do_read() {
            parser_.emplace();
            parser_->body_limit(server_.options_.max_message_bytes);
            stream_.expires_after(kHttpReadTimeout);

            http::async_read(
                stream_, buffer_, *parser_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    self->on_read(ec);
                });
        }

        void on_read(beast::error_code ec) {
            if (ec == http::error::end_of_stream) return shutdown();
            if (ec) {
                if (ec != beast::error::timeout) util::debug(std::string("[http] read: ") + ec.message());
                return;
            }

            auto req = parser_->release();

            std::string room_id;
            if (api::HttpApi::wants_room_upgrade(req, room_id)) {
                stream_.expires_never();
                return server_.upgrade(stream_.release_socket(), std::move(req), std::move(room_id));
            }

            auto res = std::make_shared<api::Response>(server_.api_.handle(req));
            http::async_write(
                stream_, *res,
                [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                    if (ec) {
                        util::debug(std::string("[http] write: ") + ec.message());
                        return;
                    }
                    if (res->need_eof()) return self->shutdown();
                    self->do_read();
                });
        }

        void shutdown() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        Impl& server_;
        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
    };

    void do_accept() {
        // Every connection gets its own strand; the HTTP session and the
        // relay session that may follow both run on it.
        acceptor_.async_accept(
            asio::make_strand(ioc_),
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    util::log(std::string("[accept] ") + ec.message());
                    return do_accept();
                }

                std::make_shared<HttpSession>(*this, std::move(socket))->start();
                do_accept();
            });
    }

    void upgrade(tcp::socket socket, http::request<http::string_body> req, std::string room_id) {
        auto id = next_client_id_++;
        auto session = std::make_shared<RelaySession>(*this, std::move(socket), id, std::move(room_id));

        {
            std::lock_guard<std::mutex> lk(mu_);
            sessions_[id] = session;
        }

        session->start(std::move(req));
    }

    void remove_session(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_.erase(id);
    }

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    relay::RoomDirectory& rooms_;
    const api::HttpApi& api_;
    const Options options_;

    std::atomic<ClientId> next_client_id_{1};

    mutable std::mutex mu_;
    std::unordered_map<ClientId, std::weak_ptr<RelaySession>> sessions_;
};

// ---- SignalingServer wrapper ----

SignalingServer::SignalingServer(asio::io_context& ioc,
                                 const tcp::endpoint& endpoint,
                                 relay::RoomDirectory& rooms,
                                 const api::HttpApi& api,
                                 Options options)
    : impl_(new Impl(ioc, endpoint, rooms, api, options)) {}

void SignalingServer::start() { impl_->start(); }
void SignalingServer::stop() { impl_->stop(); }

unsigned short SignalingServer::port() const { return impl_->port(); }
std::size_t SignalingServer::connection_count() const { return impl_->connection_count(); }

SignalingServer::~SignalingServer() = default;

} // namespace signalrelay::networking
