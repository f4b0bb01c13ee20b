/**
 * PeerServer: Listens for incoming TCP connections from companions.
 *
 * Uses standalone ASIO for async I/O.
 * Each connected companion gets its own PeerSession that reads
 * length-prefixed JSON commands off the wire and writes one reply per
 * command.
 */

#include "network/peer_server.h"

#include "protocol/commands.h"
#include "protocol/errors.h"
#include "protocol/frame_codec.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lumi {

// ── PeerSession ─────────────────────────────────────────────────────────────

PeerSession::PeerSession(asio::ip::tcp::socket socket, CommandDispatcher& dispatcher,
                         std::chrono::milliseconds idle_timeout)
    : connection_(std::make_shared<FramedConnection>(std::move(socket))),
      dispatcher_(dispatcher),
      idle_timer_(connection_->executor()),
      idle_timeout_(idle_timeout) {
    context_.address = connection_->remote_address();
}

void PeerSession::start(CloseHandler on_close) {
    std::weak_ptr<PeerSession> weak = shared_from_this();
    connection_->start(
        [weak](std::string payload) {
            if (auto self = weak.lock()) self->handle_frame(payload);
        },
        [weak, on_close = std::move(on_close)](std::error_code reason) {
            auto self = weak.lock();
            if (!self) return;
            self->idle_timer_.cancel();
            if (on_close) on_close(self, reason);
        });
    asio::post(connection_->executor(), [self = shared_from_this()] { self->arm_idle_timer(); });
}

void PeerSession::close(std::error_code reason) {
    connection_->close(reason);
}

ClientInfo PeerSession::info() const {
    std::lock_guard<std::mutex> lock(context_mutex_);
    return ClientInfo{context_.address, context_.device_name, context_.approved};
}

void PeerSession::handle_frame(const std::string& payload) {
    arm_idle_timer();

    auto command = parse_command(payload);
    if (!command) {
        spdlog::error("Malformed command from {}, closing", connection_->remote_address());
        connection_->close(make_error_code(errc::malformed_message));
        return;
    }
    spdlog::debug("<- {} [{}] from {}", command->type, command->id, connection_->remote_address());

    std::weak_ptr<FramedConnection> weak_conn = connection_;
    auto reply = [weak_conn, type = command->type](Response response) {
        auto conn = weak_conn.lock();
        if (!conn) return;
        auto frame = encode_message(response);
        if (frame.size() - kFrameHeaderSize > kMaxFrameSize) {
            // The peer would drop the whole connection on a frame this size.
            spdlog::warn("Reply to {} [{}] is {} bytes, over the frame limit", type, response.id,
                         frame.size() - kFrameHeaderSize);
            frame = encode_message(Response::failure(response.id, kResponseTooLarge,
                                                     type + " reply exceeds the frame size limit"));
        }
        conn->write(std::move(frame));
    };

    // Dispatch on a copy so handlers never run under the lock.
    SessionContext context;
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        context = context_;
    }
    dispatcher_.dispatch(context, *command, std::move(reply));
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        context_ = context;
    }
}

void PeerSession::arm_idle_timer() {
    idle_timer_.expires_after(idle_timeout_);
    std::weak_ptr<PeerSession> weak = shared_from_this();
    idle_timer_.async_wait([weak](std::error_code ec) {
        if (ec == asio::error::operation_aborted) return;
        if (auto self = weak.lock()) {
            spdlog::info("Closing idle session from {}", self->connection_->remote_address());
            self->connection_->close(make_error_code(errc::timed_out));
        }
    });
}

// ── PeerServer ──────────────────────────────────────────────────────────────

PeerServer::PeerServer(asio::io_context& io, CommandDispatcher& dispatcher, ServerOptions options)
    : io_(io), dispatcher_(dispatcher), options_(options), acceptor_(io),
      alive_(std::make_shared<int>(0)) {}

PeerServer::~PeerServer() {
    stop();
}

bool PeerServer::start() {
    std::error_code ec;
    const asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), options_.listen_port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("Cannot listen on port {}: {}", options_.listen_port, ec.message());
        std::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = true;
    }
    spdlog::info("Remote server listening on port {}", port());
    do_accept();
    return true;
}

void PeerServer::stop() {
    std::vector<std::shared_ptr<PeerSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        sessions.swap(sessions_);
    }

    std::error_code ignored;
    acceptor_.close(ignored);
    for (auto& session : sessions) {
        session->close(make_error_code(errc::cancelled));
    }
    spdlog::info("Remote server stopped");
}

uint16_t PeerServer::port() const {
    std::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? options_.listen_port : ep.port();
}

bool PeerServer::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::vector<ClientInfo> PeerServer::connected_clients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClientInfo> out;
    out.reserve(sessions_.size());
    for (const auto& session : sessions_) out.push_back(session->info());
    return out;
}

void PeerServer::set_on_clients_changed(std::function<void()> cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_clients_changed_ = std::move(cb);
}

void PeerServer::do_accept() {
    acceptor_.async_accept(
        asio::make_strand(io_),
        [this, alive = std::weak_ptr<int>(alive_)](std::error_code ec, asio::ip::tcp::socket socket) {
            if (ec == asio::error::operation_aborted || alive.expired()) return;
            if (!is_running()) return;

            if (ec) {
                spdlog::warn("Accept failed: {}", ec.message());
            } else {
                std::error_code ignored;
                socket.set_option(asio::ip::tcp::no_delay(true), ignored);

                auto session = std::make_shared<PeerSession>(std::move(socket), dispatcher_,
                                                             options_.idle_timeout);
                spdlog::info("Companion connected from {}", session->info().address);

                std::function<void()> cb;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    sessions_.push_back(session);
                    cb = on_clients_changed_;
                }
                session->start([this, alive](const std::shared_ptr<PeerSession>& s, std::error_code reason) {
                    if (alive.expired()) return;
                    spdlog::info("Companion {} disconnected: {}", s->info().address, reason.message());
                    remove(s);
                });
                if (cb) cb();
            }
            do_accept();
        });
}

void PeerServer::remove(const std::shared_ptr<PeerSession>& session) {
    std::function<void()> cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(sessions_.begin(), sessions_.end(), session);
        if (it == sessions_.end()) return;
        sessions_.erase(it);
        cb = on_clients_changed_;
    }
    if (cb) cb();
}

} // namespace lumi
