#pragma once

#include <asio.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "discovery/peer.h"

namespace lumi {

struct DiscoveryOptions {
    std::string multicast_address = "239.255.42.85";
    std::uint16_t port = 47286;
    std::chrono::milliseconds announce_interval{2000};
    /// A peer unseen for this long is dropped.
    std::chrono::milliseconds peer_ttl{8000};
};

/// One discovery datagram:
///   {"service":"_lumiagent._tcp","instance":..,"name":..,"port":..,"event":"announce"|"goodbye"}
struct Announcement {
    std::string service = kServiceType;
    std::string instance;
    std::string name;
    std::uint16_t port = kDefaultPort;
    bool goodbye = false;
};

std::string encode_announcement(const Announcement& announcement);

/// Empty for anything that is not one of our announcements.
std::optional<Announcement> parse_announcement(const std::string& datagram);

/// "Studio-Mac.local." -> "Studio Mac"
std::string pretty_service_name(const std::string& name);

enum class PeerEventKind { added, updated, removed };

struct PeerEvent {
    PeerEventKind kind;
    Peer peer;
};

/**
 * The browser's view of who is out there. Pure bookkeeping, no I/O, so it
 * can be driven directly by tests.
 *
 * Session state set through set_state() is keyed by service name and
 * survives the peer dropping out and coming back.
 */
class PeerRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit PeerRegistry(std::chrono::milliseconds ttl);

    /// Feed one announcement. Returns the resulting change, if any.
    std::optional<PeerEvent> apply(const Announcement& announcement, const std::string& sender_host,
                                   Clock::time_point now);

    /// Drop peers not heard from within the TTL.
    std::vector<PeerEvent> expire(Clock::time_point now);

    void set_state(const std::string& service_name, SessionState state);

    [[nodiscard]] std::vector<Peer> peers() const;
    [[nodiscard]] std::optional<Peer> find(const std::string& service_name) const;

private:
    struct Entry {
        Peer peer;
        Clock::time_point last_seen;
    };

    std::chrono::milliseconds ttl_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, SessionState> states_;
};

/**
 * Host side: periodically multicasts who we are and where to connect.
 * Sends a goodbye on stop(). Create with std::make_shared.
 */
class ServiceAdvertiser : public std::enable_shared_from_this<ServiceAdvertiser> {
public:
    ServiceAdvertiser(asio::io_context& io, DiscoveryOptions options, std::string instance,
                      std::string display_name, std::uint16_t tcp_port);

    bool start();
    void stop();

    [[nodiscard]] const std::string& instance() const { return announcement_.instance; }

private:
    void announce();
    void send(const Announcement& announcement);

    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::udp::socket socket_;
    asio::steady_timer timer_;
    DiscoveryOptions options_;
    asio::ip::udp::endpoint group_;
    Announcement announcement_;
    bool running_ = false;
};

/**
 * Companion side: listens on the multicast group and keeps a PeerRegistry
 * current. Create with std::make_shared.
 */
class ServiceBrowser : public std::enable_shared_from_this<ServiceBrowser> {
public:
    using EventHandler = std::function<void(const PeerEvent&)>;

    ServiceBrowser(asio::io_context& io, DiscoveryOptions options);

    /// Set before start().
    void set_on_event(EventHandler handler) { on_event_ = std::move(handler); }

    bool start();
    void stop();

    [[nodiscard]] std::vector<Peer> peers() const { return registry_.peers(); }
    void set_state(const std::string& service_name, SessionState state) {
        registry_.set_state(service_name, state);
    }

private:
    void do_receive();
    void arm_sweep();
    void emit(const PeerEvent& event);

    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::udp::socket socket_;
    asio::steady_timer sweep_timer_;
    DiscoveryOptions options_;
    PeerRegistry registry_;

    std::array<char, 2048> buffer_{};
    asio::ip::udp::endpoint sender_;
    bool running_ = false;

    EventHandler on_event_;
};

} // namespace lumi
