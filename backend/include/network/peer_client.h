#pragma once

#include <asio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "discovery/peer.h"
#include "network/client_session.h"

namespace lumi {

/**
 * Client side of the pairing: dials one host at a time.
 *
 * Every connect() builds a fresh ClientSession, so reconnecting from a
 * failed or disconnected state is always safe. Callbacks from a session
 * that has since been replaced are dropped.
 */
class PeerClient {
public:
    using ConnectHandler = ClientSession::ConnectHandler;
    using StateHandler = std::function<void(const Peer& peer, SessionState state,
                                            const std::string& reason)>;
    using StatusHandler = ClientSession::StatusHandler;

    PeerClient(asio::io_context& io, ClientOptions options);
    ~PeerClient();

    void connect(const Peer& peer, ConnectHandler handler);
    void connect(const std::string& host, uint16_t port, ConnectHandler handler);

    /// Send over the current session (errc::not_connected if there is none).
    void send(const std::string& type, const Parameters& parameters,
              std::chrono::milliseconds timeout, ResponseHandler handler);

    /// Same, using the configured default timeout.
    void send(const std::string& type, const Parameters& parameters, ResponseHandler handler);

    void disconnect();

    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] SessionState state() const;
    [[nodiscard]] std::shared_ptr<ClientSession> session() const;
    [[nodiscard]] const ClientOptions& options() const { return options_; }

    void set_on_state(StateHandler handler);
    void set_on_status(StatusHandler handler);

private:
    // Shared with session callbacks, which may run after this object is gone.
    struct Shared {
        std::mutex mutex;
        std::shared_ptr<ClientSession> session;
        StateHandler on_state;
        StatusHandler on_status;
    };

    asio::io_context& io_;
    ClientOptions options_;
    std::shared_ptr<Shared> shared_;
};

} // namespace lumi
