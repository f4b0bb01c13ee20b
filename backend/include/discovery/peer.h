#pragma once

#include <cstdint>
#include <string>

#include "network/session_state.h"

namespace lumi {

/// Service type every host advertises.
constexpr char kServiceType[] = "_lumiagent._tcp";

/// Well-known TCP port for direct host:port dialing.
constexpr std::uint16_t kDefaultPort = 47285;

/// The other endpoint in a pairing.
struct Peer {
    std::string id;
    std::string name;          // display name
    std::string service_name;  // advertised instance name, or the host when dialed
    std::string host;
    std::uint16_t port = kDefaultPort;
    SessionState state = SessionState::discovered;
};

/// A peer for a literal host typed in by the user.
inline Peer direct_peer(const std::string& host, std::uint16_t port = kDefaultPort) {
    Peer p;
    p.id = host + ":" + std::to_string(port);
    p.name = host;
    p.service_name = host;
    p.host = host;
    p.port = port;
    return p;
}

} // namespace lumi
