#pragma once

#include <asio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "auth/approval_gate.h"
#include "bridge/remote_bridge.h"
#include "config/config.h"
#include "discovery/service_discovery.h"
#include "dispatch/command_dispatcher.h"
#include "network/peer_client.h"
#include "network/peer_server.h"
#include "sync/sync_engine.h"
#include "sync/sync_store.h"

namespace lumi {

/**
 * Represents the local end of a pairing.
 *
 * A host owns the approval gate, the dispatcher (with the sync handlers
 * registered), the TCP server and the advertiser. A companion owns the
 * browser, the client, the remote bridge and the sync engine. Both own
 * the sync store.
 *
 * The companion wiring:
 *   session connected -> bridge attached, sync loop started
 *   session lost      -> bridge detached, sync loop and debounce cancelled
 *   local store edit  -> debounced sync
 */
class Node {
public:
    using ConnectHandler = PeerClient::ConnectHandler;
    using StatusHandler = std::function<void(const std::string& status)>;

    Node(asio::io_context& io, NodeConfig config);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /// Bring up the role's services. Returns false if the host cannot listen.
    bool start();
    void stop();

    [[nodiscard]] NodeRole role() const { return config_.role; }
    [[nodiscard]] const NodeConfig& config() const { return config_; }
    [[nodiscard]] SyncStore& store() { return store_; }

    /// Status lines for the operator ("Connecting to X...", sync progress).
    void set_on_status(StatusHandler handler) { on_status_ = std::move(handler); }

    // ── Host ────────────────────────────────────────────────────────────────

    [[nodiscard]] ApprovalGate* approvals() { return gate_.get(); }
    [[nodiscard]] CommandDispatcher* dispatcher() { return dispatcher_.get(); }
    [[nodiscard]] std::vector<ClientInfo> clients() const;
    [[nodiscard]] uint16_t listen_port() const;

    // ── Companion ───────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<Peer> peers() const;
    void connect(const Peer& peer, ConnectHandler handler = {});
    void dial(const std::string& host, uint16_t port = kDefaultPort, ConnectHandler handler = {});
    void disconnect();

    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] RemoteBridge& bridge() { return bridge_; }

    /// True while the sync loop runs, i.e. between approval and session loss.
    [[nodiscard]] bool is_syncing() const { return engine_ && engine_->is_running(); }

    void sync_now(SyncEngine::CycleHandler done = {});

private:
    void start_host();
    void start_companion();
    void on_session_state(const Peer& peer, SessionState state, const std::string& reason);
    void status(const std::string& text);

    asio::io_context& io_;
    NodeConfig config_;
    SyncStore store_;

    // Host
    std::unique_ptr<ApprovalGate> gate_;
    std::unique_ptr<CommandDispatcher> dispatcher_;
    std::unique_ptr<PeerServer> server_;
    std::shared_ptr<ServiceAdvertiser> advertiser_;

    // Companion
    RemoteBridge bridge_;
    std::unique_ptr<PeerClient> client_;
    std::shared_ptr<ServiceBrowser> browser_;
    std::shared_ptr<SyncEngine> engine_;

    StatusHandler on_status_;
    bool started_ = false;
};

} // namespace lumi
