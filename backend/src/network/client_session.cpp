/**
 * ClientSession: connect, approval handshake and command correlation.
 *
 *   connect():  resolve -> TCP connect (bounded by connect_timeout)
 *               -> "ping" probe, retried while the host says
 *                  "awaiting approval" (bounded by approval_attempts)
 *               -> connected
 *
 * Any failure on the way, or later, lands in fail(): the state becomes
 * `failed`, every pending request is completed with the error and the
 * connect handler (if still waiting) is told why.
 */

#include "network/client_session.h"

#include "protocol/errors.h"
#include "protocol/frame_codec.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace lumi {

namespace {

bool contains_ci(std::string haystack, std::string needle) {
    auto lower = [](std::string& s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    };
    lower(haystack);
    lower(needle);
    return haystack.find(needle) != std::string::npos;
}

} // namespace

ClientSession::ClientSession(asio::io_context& io, Peer peer, ClientOptions options)
    : strand_(asio::make_strand(io)),
      resolver_(strand_),
      socket_(strand_),
      connect_timer_(strand_),
      retry_timer_(strand_),
      pending_(strand_),
      peer_(std::move(peer)),
      options_(std::move(options)) {}

ClientSession::~ClientSession() = default;

std::string ClientSession::failure_reason() const {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    return failure_reason_;
}

void ClientSession::connect(ConnectHandler handler) {
    asio::post(strand_, [self = shared_from_this(), handler = std::move(handler)]() mutable {
        if (self->state_.load() != SessionState::discovered) {
            handler(make_error_code(errc::busy));
            return;
        }
        self->connect_handler_ = std::move(handler);
        self->advance(SessionState::connecting);
        self->status("Connecting to " + self->peer_.name + "...");
        spdlog::info("Connecting to {} ({}:{})", self->peer_.name, self->peer_.host, self->peer_.port);

        self->connect_timer_.expires_after(self->options_.connect_timeout);
        self->connect_timer_.async_wait([self](std::error_code ec) {
            if (ec == asio::error::operation_aborted) return;
            if (self->state_.load() == SessionState::connecting && !self->connection_) {
                self->fail(make_error_code(errc::connect_timeout),
                           "Connection timed out. Check Wi-Fi and the host pairing screen.");
            }
        });

        self->start_resolve();
    });
}

void ClientSession::start_resolve() {
    resolver_.async_resolve(
        peer_.host, std::to_string(peer_.port),
        [self = shared_from_this()](std::error_code ec,
                                    asio::ip::tcp::resolver::results_type results) {
            if (self->state_.load() != SessionState::connecting) return;
            if (ec) {
                self->fail(ec, "Cannot resolve " + self->peer_.host + ": " + ec.message());
                return;
            }
            asio::async_connect(
                self->socket_, results,
                [self](std::error_code ec, const asio::ip::tcp::endpoint&) {
                    if (self->state_.load() != SessionState::connecting) return;
                    if (ec) {
                        self->fail(ec, "Connect failed: " + ec.message());
                        return;
                    }
                    self->on_transport_ready(std::move(self->socket_));
                });
        });
}

void ClientSession::on_transport_ready(asio::ip::tcp::socket socket) {
    connect_timer_.cancel();

    std::error_code ignored;
    socket.set_option(asio::ip::tcp::no_delay(true), ignored);

    connection_ = std::make_shared<FramedConnection>(std::move(socket));
    std::weak_ptr<ClientSession> weak = shared_from_this();
    connection_->start(
        [weak](std::string payload) {
            if (auto self = weak.lock()) self->handle_frame(payload);
        },
        [weak](std::error_code reason) {
            if (auto self = weak.lock()) self->handle_close(reason);
        });

    spdlog::info("Transport ready to {}, requesting approval", peer_.name);
    status("Waiting for approval on " + peer_.name + "...");
    send_probe(1);
}

void ClientSession::send_probe(int attempt) {
    auto probe = Command::make(kProbeCommand, {{"device_name", options_.device_name}});
    send_command(std::move(probe), options_.probe_timeout,
                 [self = shared_from_this(), attempt](std::error_code ec, Response response) {
                     self->handle_probe(attempt, ec, response);
                 });
}

void ClientSession::handle_probe(int attempt, std::error_code ec, const Response& response) {
    if (state_.load() != SessionState::connecting) return;

    if (ec) {
        fail(ec, "Approval probe failed: " + ec.message());
        return;
    }

    if (response.success) {
        advance(SessionState::connected);
        spdlog::info("Approved by {} after {} probe(s)", peer_.name, attempt);
        status("Connected to " + peer_.name);
        complete_connect({});
        return;
    }

    const std::string text = response.error.value_or("Connection refused");
    status(text);

    if (!contains_ci(text, kAwaitingApproval)) {
        spdlog::warn("Host {} refused approval: {}", peer_.name, text);
        const auto code = contains_ci(text, "reject") ? errc::approval_rejected : errc::unauthorized;
        fail(make_error_code(code), text);
        return;
    }

    if (attempt >= options_.approval_attempts) {
        fail(make_error_code(errc::approval_timeout),
             "Approval timed out. Accept the request on the host and try again.");
        return;
    }

    retry_timer_.expires_after(options_.approval_retry);
    retry_timer_.async_wait([self = shared_from_this(), attempt](std::error_code ec) {
        if (ec == asio::error::operation_aborted) return;
        if (self->state_.load() == SessionState::connecting) self->send_probe(attempt + 1);
    });
}

void ClientSession::send(std::string type, Parameters parameters,
                         std::chrono::milliseconds timeout, ResponseHandler handler) {
    asio::post(strand_, [self = shared_from_this(), type = std::move(type),
                         parameters = std::move(parameters), timeout,
                         handler = std::move(handler)]() mutable {
        if (self->state_.load() != SessionState::connected) {
            handler(make_error_code(errc::not_connected), Response{});
            return;
        }
        self->send_command(Command::make(std::move(type), std::move(parameters)),
                           timeout, std::move(handler));
    });
}

void ClientSession::send_command(Command command, std::chrono::milliseconds timeout,
                                 ResponseHandler handler) {
    if (!connection_ || !connection_->is_open()) {
        handler(make_error_code(errc::not_connected), Response{});
        return;
    }
    auto frame = encode_message(command);
    if (frame.size() - kFrameHeaderSize > kMaxFrameSize) {
        spdlog::warn("Not sending {} [{}]: {} bytes exceeds the frame limit", command.type,
                     command.id, frame.size() - kFrameHeaderSize);
        handler(make_error_code(errc::message_too_large), Response{});
        return;
    }
    spdlog::debug("-> {} [{}]", command.type, command.id);
    pending_.add(command.id, timeout, std::move(handler));
    connection_->write(std::move(frame));
}

void ClientSession::handle_frame(const std::string& payload) {
    auto response = parse_response(payload);
    if (!response) {
        spdlog::error("Malformed response from {}, closing", peer_.name);
        connection_->close(make_error_code(errc::malformed_message));
        return;
    }
    pending_.resolve(std::move(*response));
}

void ClientSession::handle_close(std::error_code reason) {
    pending_.fail_all(reason);
    if (closing_) return;

    const auto current = state_.load();
    if (current == SessionState::connecting) {
        fail(reason, "Connection closed during handshake: " + reason.message());
    } else if (current == SessionState::connected) {
        spdlog::warn("Connection to {} lost: {}", peer_.name, reason.message());
        fail(reason, "Connection lost: " + reason.message());
    }
}

void ClientSession::disconnect() {
    asio::dispatch(strand_, [self = shared_from_this()] {
        if (is_terminal(self->state_.load())) return;
        self->closing_ = true;
        self->advance(SessionState::disconnected);

        const auto ec = make_error_code(errc::cancelled);
        self->connect_timer_.cancel();
        self->retry_timer_.cancel();
        self->resolver_.cancel();
        std::error_code ignored;
        self->socket_.close(ignored);
        if (self->connection_) self->connection_->close(ec);
        self->pending_.fail_all(ec);
        self->complete_connect(ec);
        self->status("Disconnected");
        spdlog::info("Disconnected from {}", self->peer_.name);
    });
}

void ClientSession::complete_connect(std::error_code ec) {
    if (!connect_handler_) return;
    auto handler = std::move(connect_handler_);
    connect_handler_ = nullptr;
    handler(ec);
}

void ClientSession::fail(std::error_code ec, const std::string& reason) {
    if (is_terminal(state_.load())) return;
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        failure_reason_ = reason;
    }
    closing_ = true;
    advance(SessionState::failed, reason);
    spdlog::warn("Session with {} failed ({}): {}", peer_.name, to_string(classify(ec)), reason);

    connect_timer_.cancel();
    retry_timer_.cancel();
    resolver_.cancel();
    std::error_code ignored;
    socket_.close(ignored);
    if (connection_) connection_->close(ec);

    pending_.fail_all(ec);
    status(reason);
    complete_connect(ec);
}

bool ClientSession::advance(SessionState next, const std::string& reason) {
    const auto current = state_.load();
    if (!can_transition(current, next)) return false;
    state_.store(next);
    if (on_state_) on_state_(next, reason);
    return true;
}

void ClientSession::status(const std::string& text) {
    if (on_status_) on_status_(text);
}

} // namespace lumi
