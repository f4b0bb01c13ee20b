#include "node/node.h"

#include "protocol/errors.h"
#include "sync/sync_handlers.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace lumi {

Node::Node(asio::io_context& io, NodeConfig config)
    : io_(io), config_(std::move(config)), store_(config_.data_dir) {
    if (config_.role == NodeRole::host) {
        gate_ = std::make_unique<ApprovalGate>(config_.data_dir / "approved_devices.json",
                                               config_.server.approval_window);
        dispatcher_ = std::make_unique<CommandDispatcher>(*gate_);
        register_sync_handlers(*dispatcher_, store_);
        server_ = std::make_unique<PeerServer>(io_, *dispatcher_, config_.server);
    } else {
        client_ = std::make_unique<PeerClient>(io_, config_.client);
        engine_ = std::make_shared<SyncEngine>(io_, store_, bridge_.executor(), config_.sync);
    }
    spdlog::info("Node '{}' ({})", config_.device_name, to_string(config_.role));
}

Node::~Node() {
    stop();
}

bool Node::start() {
    if (started_) return true;
    if (config_.role == NodeRole::host) {
        if (!server_->start()) return false;
        start_host();
    } else {
        start_companion();
    }
    started_ = true;
    return true;
}

void Node::stop() {
    if (!started_) return;
    started_ = false;

    if (advertiser_) advertiser_->stop();
    if (server_) server_->stop();

    if (browser_) browser_->stop();
    if (engine_) engine_->stop();
    bridge_.detach();
    if (client_) client_->disconnect();
}

void Node::start_host() {
    gate_->set_on_request([this](const PendingApproval& request) {
        status("Device '" + request.device_name + "' (" + request.address +
               ") wants to connect. approve " + request.id + " / reject " + request.id);
    });

    if (config_.discovery_enabled) {
        advertiser_ = std::make_shared<ServiceAdvertiser>(io_, config_.discovery, config_.device_name,
                                                          pretty_service_name(config_.device_name),
                                                          server_->port());
        if (!advertiser_->start()) {
            spdlog::warn("Discovery unavailable, companions must dial this host directly");
            advertiser_.reset();
        }
    }
}

void Node::start_companion() {
    client_->set_on_state([this](const Peer& peer, SessionState state, const std::string& reason) {
        on_session_state(peer, state, reason);
    });
    client_->set_on_status([this](const std::string& text) { status(text); });

    engine_->set_on_progress([](double fraction, const std::string& detail) {
        spdlog::debug("Sync {:3.0f}% {}", std::round(fraction * 100.0), detail);
    });
    engine_->set_on_data_changed([this] { status("Synced data updated from host"); });

    std::weak_ptr<SyncEngine> weak_engine = engine_;
    store_.add_change_listener([weak_engine](const std::string& resource) {
        spdlog::debug("Local change to {}", resource);
        if (auto engine = weak_engine.lock()) engine->notify_local_change();
    });

    if (config_.discovery_enabled) {
        browser_ = std::make_shared<ServiceBrowser>(io_, config_.discovery);
        browser_->set_on_event([this](const PeerEvent& event) {
            if (event.kind == PeerEventKind::added) status("Found " + event.peer.name);
        });
        if (!browser_->start()) {
            spdlog::warn("Discovery unavailable, use a direct host instead");
            browser_.reset();
        }
    }

    if (!config_.direct_host.empty()) dial(config_.direct_host, config_.server.listen_port);
}

void Node::on_session_state(const Peer& peer, SessionState state, const std::string& reason) {
    if (browser_) browser_->set_state(peer.service_name, state);

    if (state == SessionState::connected) {
        // Bind the bridge to this exact session; a later one gets its own.
        std::weak_ptr<ClientSession> weak = client_->session();
        bridge_.attach([weak](const std::string& type, const Parameters& parameters,
                              std::chrono::milliseconds timeout, ResponseHandler handler) {
            auto session = weak.lock();
            if (!session) {
                handler(make_error_code(errc::not_connected), Response{});
                return;
            }
            session->send(type, parameters, timeout, std::move(handler));
        });
        engine_->start();
        return;
    }

    bridge_.detach();
    engine_->stop();
    if (state == SessionState::failed) {
        spdlog::warn("Session with {} failed: {}", peer.name, reason);
    }
}

std::vector<ClientInfo> Node::clients() const {
    return server_ ? server_->connected_clients() : std::vector<ClientInfo>{};
}

uint16_t Node::listen_port() const {
    return server_ ? server_->port() : 0;
}

std::vector<Peer> Node::peers() const {
    return browser_ ? browser_->peers() : std::vector<Peer>{};
}

void Node::connect(const Peer& peer, ConnectHandler handler) {
    if (!client_) {
        spdlog::warn("connect() called on a host node");
        if (handler) asio::post(io_, [handler] { handler(make_error_code(errc::not_connected)); });
        return;
    }
    client_->connect(peer, [handler = std::move(handler), name = peer.name](std::error_code ec) {
        if (ec) {
            spdlog::warn("Could not connect to {}: {} ({})", name, ec.message(),
                         to_string(classify(ec)));
        }
        if (handler) handler(ec);
    });
}

void Node::dial(const std::string& host, uint16_t port, ConnectHandler handler) {
    connect(direct_peer(host, port), std::move(handler));
}

void Node::disconnect() {
    if (client_) client_->disconnect();
}

bool Node::is_connected() const {
    return client_ && client_->is_connected();
}

void Node::sync_now(SyncEngine::CycleHandler done) {
    if (!engine_) {
        spdlog::warn("sync_now() called on a host node");
        return;
    }
    engine_->sync_now(std::move(done));
}

void Node::status(const std::string& text) {
    spdlog::info("{}", text);
    if (on_status_) on_status_(text);
}

} // namespace lumi
