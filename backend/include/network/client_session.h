#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

#include "discovery/peer.h"
#include "network/connection.h"
#include "network/pending_requests.h"
#include "network/session_state.h"
#include "protocol/commands.h"
#include "protocol/messages.h"

namespace lumi {

struct ClientOptions {
    std::string device_name = "Companion";
    std::chrono::milliseconds connect_timeout{8000};
    int approval_attempts = 60;
    std::chrono::milliseconds approval_retry{1000};
    std::chrono::milliseconds probe_timeout{5000};
    std::chrono::milliseconds command_timeout{15000};
};

/**
 * One client-side connection attempt and, if it succeeds, the session that
 * follows. States only move forward; to reconnect, create a new object.
 *
 * All internal state lives on a private strand. Public methods are safe to
 * call from any thread and never block.
 */
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
    using ConnectHandler = std::function<void(std::error_code)>;
    using StateHandler = std::function<void(SessionState, const std::string& reason)>;
    using StatusHandler = std::function<void(const std::string& status)>;

    ClientSession(asio::io_context& io, Peer peer, ClientOptions options);
    ~ClientSession();

    /// Observers; set before connect().
    void set_on_state(StateHandler handler) { on_state_ = std::move(handler); }
    void set_on_status(StatusHandler handler) { on_status_ = std::move(handler); }

    /// Transport connect + approval handshake. `handler` fires exactly once.
    void connect(ConnectHandler handler);

    /// Send a command once connected; fails with errc::not_connected otherwise.
    void send(std::string type, Parameters parameters,
              std::chrono::milliseconds timeout, ResponseHandler handler);

    /// Tear down and fail everything outstanding with errc::cancelled.
    void disconnect();

    [[nodiscard]] SessionState state() const { return state_.load(); }
    [[nodiscard]] bool is_connected() const { return state_.load() == SessionState::connected; }
    [[nodiscard]] const Peer& peer() const { return peer_; }
    [[nodiscard]] std::string failure_reason() const;

private:
    void start_resolve();
    void on_transport_ready(asio::ip::tcp::socket socket);
    void send_probe(int attempt);
    void handle_probe(int attempt, std::error_code ec, const Response& response);
    void handle_frame(const std::string& payload);
    void handle_close(std::error_code reason);
    void send_command(Command command, std::chrono::milliseconds timeout, ResponseHandler handler);
    void complete_connect(std::error_code ec);
    void fail(std::error_code ec, const std::string& reason);
    bool advance(SessionState next, const std::string& reason = {});
    void status(const std::string& text);

    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::tcp::resolver resolver_;
    asio::ip::tcp::socket socket_;
    asio::steady_timer connect_timer_;
    asio::steady_timer retry_timer_;
    std::shared_ptr<FramedConnection> connection_;
    PendingRequests pending_;

    Peer peer_;
    ClientOptions options_;
    std::atomic<SessionState> state_{SessionState::discovered};
    bool closing_ = false;

    mutable std::mutex reason_mutex_;
    std::string failure_reason_;

    ConnectHandler connect_handler_;
    StateHandler on_state_;
    StatusHandler on_status_;
};

} // namespace lumi
