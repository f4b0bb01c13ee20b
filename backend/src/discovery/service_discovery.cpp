/**
 * Service discovery over UDP multicast.
 *
 * Hosts announce themselves on a well-known group every few seconds;
 * companions listen, track who is around and forget anyone who goes quiet.
 * No command traffic ever travels over this channel.
 */

#include "discovery/service_discovery.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace lumi {

using json = nlohmann::json;

// ── Wire format ─────────────────────────────────────────────────────────────

std::string encode_announcement(const Announcement& announcement) {
    return json{
        {"service", announcement.service},
        {"instance", announcement.instance},
        {"name", announcement.name},
        {"port", announcement.port},
        {"event", announcement.goodbye ? "goodbye" : "announce"},
    }.dump();
}

std::optional<Announcement> parse_announcement(const std::string& datagram) {
    const auto doc = json::parse(datagram, nullptr, false);
    if (!doc.is_object()) return std::nullopt;

    try {
        Announcement a;
        a.service = doc.at("service").get<std::string>();
        if (a.service != kServiceType) return std::nullopt;

        a.instance = doc.at("instance").get<std::string>();
        if (a.instance.empty()) return std::nullopt;
        a.name = doc.value("name", std::string());

        const auto port = doc.value("port", 0);
        if (port <= 0 || port > 65535) return std::nullopt;
        a.port = static_cast<std::uint16_t>(port);

        a.goodbye = doc.value("event", std::string("announce")) == "goodbye";
        return a;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string pretty_service_name(const std::string& name) {
    std::string out = name;
    for (const char* suffix : {".local.", ".local"}) {
        const std::string s(suffix);
        if (out.size() > s.size() && out.compare(out.size() - s.size(), s.size(), s) == 0) {
            out.erase(out.size() - s.size());
            break;
        }
    }
    std::replace(out.begin(), out.end(), '-', ' ');
    return out;
}

// ── PeerRegistry ────────────────────────────────────────────────────────────

PeerRegistry::PeerRegistry(std::chrono::milliseconds ttl) : ttl_(ttl) {}

std::optional<PeerEvent> PeerRegistry::apply(const Announcement& announcement,
                                             const std::string& sender_host, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(announcement.instance);

    if (announcement.goodbye) {
        if (it == entries_.end()) return std::nullopt;
        PeerEvent event{PeerEventKind::removed, it->second.peer};
        entries_.erase(it);
        return event;
    }

    Peer peer;
    peer.id = announcement.instance;
    peer.service_name = announcement.instance;
    peer.name = pretty_service_name(announcement.name.empty() ? announcement.instance
                                                              : announcement.name);
    peer.host = sender_host;
    peer.port = announcement.port;
    auto state = states_.find(announcement.instance);
    if (state != states_.end()) peer.state = state->second;

    if (it == entries_.end()) {
        entries_.emplace(announcement.instance, Entry{peer, now});
        return PeerEvent{PeerEventKind::added, peer};
    }

    it->second.last_seen = now;
    const auto& known = it->second.peer;
    if (known.host == peer.host && known.port == peer.port && known.name == peer.name) {
        return std::nullopt;
    }
    it->second.peer = peer;
    return PeerEvent{PeerEventKind::updated, peer};
}

std::vector<PeerEvent> PeerRegistry::expire(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerEvent> events;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.last_seen > ttl_) {
            events.push_back({PeerEventKind::removed, it->second.peer});
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return events;
}

void PeerRegistry::set_state(const std::string& service_name, SessionState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_[service_name] = state;
    auto it = entries_.find(service_name);
    if (it != entries_.end()) it->second.peer.state = state;
}

std::vector<Peer> PeerRegistry::peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Peer> out;
    out.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) out.push_back(entry.peer);
    return out;
}

std::optional<Peer> PeerRegistry::find(const std::string& service_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(service_name);
    if (it == entries_.end()) return std::nullopt;
    return it->second.peer;
}

// ── ServiceAdvertiser ───────────────────────────────────────────────────────

ServiceAdvertiser::ServiceAdvertiser(asio::io_context& io, DiscoveryOptions options,
                                     std::string instance, std::string display_name,
                                     std::uint16_t tcp_port)
    : strand_(asio::make_strand(io)),
      socket_(strand_),
      timer_(strand_),
      options_(std::move(options)) {
    announcement_.instance = std::move(instance);
    announcement_.name = std::move(display_name);
    announcement_.port = tcp_port;
}

bool ServiceAdvertiser::start() {
    std::error_code ec;
    const auto address = asio::ip::make_address(options_.multicast_address, ec);
    if (ec) {
        spdlog::error("Bad multicast address {}: {}", options_.multicast_address, ec.message());
        return false;
    }
    group_ = asio::ip::udp::endpoint(address, options_.port);

    socket_.open(group_.protocol(), ec);
    if (!ec) socket_.set_option(asio::ip::multicast::enable_loopback(true), ec);
    if (!ec) socket_.set_option(asio::ip::multicast::hops(1), ec);
    if (ec) {
        spdlog::error("Cannot open discovery socket: {}", ec.message());
        return false;
    }

    running_ = true;
    spdlog::info("Advertising '{}' as {} on port {}", announcement_.instance, kServiceType,
                 announcement_.port);
    asio::post(strand_, [self = shared_from_this()] { self->announce(); });
    return true;
}

void ServiceAdvertiser::stop() {
    asio::post(strand_, [self = shared_from_this()] {
        if (!self->running_) return;
        self->running_ = false;
        self->timer_.cancel();

        Announcement goodbye = self->announcement_;
        goodbye.goodbye = true;
        self->send(goodbye);

        std::error_code ignored;
        self->socket_.close(ignored);
        spdlog::info("Stopped advertising '{}'", self->announcement_.instance);
    });
}

void ServiceAdvertiser::announce() {
    if (!running_) return;
    send(announcement_);

    timer_.expires_after(options_.announce_interval);
    std::weak_ptr<ServiceAdvertiser> weak = shared_from_this();
    timer_.async_wait([weak](std::error_code ec) {
        if (ec) return;
        if (auto self = weak.lock()) self->announce();
    });
}

void ServiceAdvertiser::send(const Announcement& announcement) {
    // Datagrams are tiny; a blocking send_to on the strand is fine.
    std::error_code ec;
    socket_.send_to(asio::buffer(encode_announcement(announcement)), group_, 0, ec);
    if (ec) spdlog::debug("Announcement not sent: {}", ec.message());
}

// ── ServiceBrowser ──────────────────────────────────────────────────────────

ServiceBrowser::ServiceBrowser(asio::io_context& io, DiscoveryOptions options)
    : strand_(asio::make_strand(io)),
      socket_(strand_),
      sweep_timer_(strand_),
      options_(std::move(options)),
      registry_(options_.peer_ttl) {}

bool ServiceBrowser::start() {
    std::error_code ec;
    const auto group = asio::ip::make_address(options_.multicast_address, ec);
    if (ec) {
        spdlog::error("Bad multicast address {}: {}", options_.multicast_address, ec.message());
        return false;
    }

    const asio::ip::udp::endpoint listen(asio::ip::address_v4::any(), options_.port);
    socket_.open(listen.protocol(), ec);
    if (!ec) socket_.set_option(asio::ip::udp::socket::reuse_address(true), ec);
    if (!ec) socket_.bind(listen, ec);
    if (!ec) socket_.set_option(asio::ip::multicast::join_group(group), ec);
    if (ec) {
        spdlog::error("Cannot join discovery group {}:{}: {}", options_.multicast_address,
                      options_.port, ec.message());
        std::error_code ignored;
        socket_.close(ignored);
        return false;
    }

    running_ = true;
    spdlog::info("Browsing for {} on {}:{}", kServiceType, options_.multicast_address, options_.port);
    asio::post(strand_, [self = shared_from_this()] {
        self->do_receive();
        self->arm_sweep();
    });
    return true;
}

void ServiceBrowser::stop() {
    asio::post(strand_, [self = shared_from_this()] {
        if (!self->running_) return;
        self->running_ = false;
        self->sweep_timer_.cancel();
        std::error_code ignored;
        self->socket_.close(ignored);
        spdlog::info("Stopped browsing");
    });
}

void ServiceBrowser::do_receive() {
    std::weak_ptr<ServiceBrowser> weak = shared_from_this();
    socket_.async_receive_from(
        asio::buffer(buffer_), sender_,
        [weak](std::error_code ec, std::size_t bytes) {
            auto self = weak.lock();
            if (!self || !self->running_ || ec == asio::error::operation_aborted) return;

            if (ec) {
                spdlog::warn("Discovery receive failed: {}", ec.message());
            } else if (auto announcement = parse_announcement(std::string(self->buffer_.data(), bytes))) {
                const auto host = self->sender_.address().to_string();
                if (auto event = self->registry_.apply(*announcement, host, PeerRegistry::Clock::now())) {
                    self->emit(*event);
                }
            }
            self->do_receive();
        });
}

void ServiceBrowser::arm_sweep() {
    sweep_timer_.expires_after(options_.peer_ttl / 2);
    std::weak_ptr<ServiceBrowser> weak = shared_from_this();
    sweep_timer_.async_wait([weak](std::error_code ec) {
        auto self = weak.lock();
        if (ec || !self || !self->running_) return;
        for (const auto& event : self->registry_.expire(PeerRegistry::Clock::now())) {
            self->emit(event);
        }
        self->arm_sweep();
    });
}

void ServiceBrowser::emit(const PeerEvent& event) {
    switch (event.kind) {
        case PeerEventKind::added:
            spdlog::info("Found '{}' at {}:{}", event.peer.name, event.peer.host, event.peer.port);
            break;
        case PeerEventKind::updated:
            spdlog::debug("'{}' moved to {}:{}", event.peer.name, event.peer.host, event.peer.port);
            break;
        case PeerEventKind::removed:
            spdlog::info("Lost '{}'", event.peer.name);
            break;
    }
    if (on_event_) on_event_(event);
}

} // namespace lumi
