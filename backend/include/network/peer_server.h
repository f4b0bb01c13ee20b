#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "dispatch/command_dispatcher.h"
#include "network/connection.h"

namespace lumi {

struct ServerOptions {
    uint16_t listen_port = 47285;
    /// Drop a session that has sent nothing for this long.
    std::chrono::milliseconds idle_timeout{300000};
    /// Unanswered connection requests are dropped after this long.
    std::chrono::milliseconds approval_window{65000};
};

/// Snapshot of one connected companion.
struct ClientInfo {
    std::string address;
    std::string device_name;
    bool approved = false;
};

/**
 * One accepted connection on the host: decodes commands, hands them to the
 * dispatcher and writes back every reply.
 */
class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
    using CloseHandler = std::function<void(const std::shared_ptr<PeerSession>&, std::error_code)>;

    PeerSession(asio::ip::tcp::socket socket, CommandDispatcher& dispatcher,
                std::chrono::milliseconds idle_timeout);

    void start(CloseHandler on_close);
    void close(std::error_code reason);

    [[nodiscard]] ClientInfo info() const;

private:
    void handle_frame(const std::string& payload);
    void arm_idle_timer();

    std::shared_ptr<FramedConnection> connection_;
    CommandDispatcher& dispatcher_;
    asio::steady_timer idle_timer_;
    std::chrono::milliseconds idle_timeout_;

    mutable std::mutex context_mutex_;
    SessionContext context_;
};

/**
 * Async TCP server that accepts companion connections.
 */
class PeerServer {
public:
    PeerServer(asio::io_context& io, CommandDispatcher& dispatcher, ServerOptions options = {});
    ~PeerServer();

    /// Bind and start accepting. Returns false if the port is unavailable.
    bool start();
    void stop();

    /// Actual bound port (useful when configured with 0).
    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] bool is_running() const;
    [[nodiscard]] std::vector<ClientInfo> connected_clients() const;

    /// Fired whenever the set of connected clients changes.
    void set_on_clients_changed(std::function<void()> cb);

private:
    void do_accept();
    void remove(const std::shared_ptr<PeerSession>& session);

    asio::io_context& io_;
    CommandDispatcher& dispatcher_;
    ServerOptions options_;
    asio::ip::tcp::acceptor acceptor_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<PeerSession>> sessions_;
    std::function<void()> on_clients_changed_;
    bool running_ = false;

    // Expires with the server; late asio handlers check it before touching `this`.
    std::shared_ptr<int> alive_;
};

} // namespace lumi
