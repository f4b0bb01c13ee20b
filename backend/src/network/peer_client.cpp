/**
 * PeerClient: Connects to a host and sends commands to it.
 *
 * Peers come from discovery or from a literal host typed by the user.
 * The heavy lifting (handshake, pending table, teardown) lives in
 * ClientSession; this class owns the current one.
 */

#include "network/peer_client.h"

#include "protocol/errors.h"

#include <spdlog/spdlog.h>

namespace lumi {

PeerClient::PeerClient(asio::io_context& io, ClientOptions options)
    : io_(io), options_(std::move(options)), shared_(std::make_shared<Shared>()) {}

PeerClient::~PeerClient() {
    std::shared_ptr<ClientSession> current;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        current = std::move(shared_->session);
        shared_->on_state = nullptr;
        shared_->on_status = nullptr;
    }
    if (current) current->disconnect();
}

void PeerClient::connect(const Peer& peer, ConnectHandler handler) {
    std::shared_ptr<ClientSession> previous;
    std::shared_ptr<ClientSession> session;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->session && shared_->session->state() == SessionState::connecting) {
            // One attempt at a time.
            asio::post(io_, [handler = std::move(handler)] { handler(make_error_code(errc::busy)); });
            return;
        }
        previous = std::move(shared_->session);
        session = std::make_shared<ClientSession>(io_, peer, options_);
        shared_->session = session;
    }

    if (previous) previous->disconnect();

    std::weak_ptr<ClientSession> weak = session;
    std::weak_ptr<Shared> weak_shared = shared_;
    session->set_on_state([weak, weak_shared](SessionState state, const std::string& reason) {
        auto self = weak.lock();
        auto shared = weak_shared.lock();
        if (!self || !shared) return;
        StateHandler cb;
        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            if (self != shared->session) return;
            cb = shared->on_state;
        }
        if (cb) cb(self->peer(), state, reason);
    });
    session->set_on_status([weak, weak_shared](const std::string& text) {
        auto self = weak.lock();
        auto shared = weak_shared.lock();
        if (!self || !shared) return;
        StatusHandler cb;
        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            if (self != shared->session) return;
            cb = shared->on_status;
        }
        if (cb) cb(text);
    });

    session->connect(std::move(handler));
}

void PeerClient::connect(const std::string& host, uint16_t port, ConnectHandler handler) {
    connect(direct_peer(host, port), std::move(handler));
}

void PeerClient::send(const std::string& type, const Parameters& parameters,
                      std::chrono::milliseconds timeout, ResponseHandler handler) {
    auto current = session();
    if (!current) {
        asio::post(io_, [handler = std::move(handler)] {
            handler(make_error_code(errc::not_connected), Response{});
        });
        return;
    }
    current->send(type, parameters, timeout, std::move(handler));
}

void PeerClient::send(const std::string& type, const Parameters& parameters,
                      ResponseHandler handler) {
    send(type, parameters, options_.command_timeout, std::move(handler));
}

void PeerClient::disconnect() {
    auto current = session();
    if (current) current->disconnect();
}

bool PeerClient::is_connected() const {
    auto current = session();
    return current && current->is_connected();
}

SessionState PeerClient::state() const {
    auto current = session();
    return current ? current->state() : SessionState::disconnected;
}

std::shared_ptr<ClientSession> PeerClient::session() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->session;
}

void PeerClient::set_on_state(StateHandler handler) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->on_state = std::move(handler);
}

void PeerClient::set_on_status(StatusHandler handler) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->on_status = std::move(handler);
}

} // namespace lumi
