#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "discovery/service_discovery.h"
#include "network/client_session.h"
#include "network/peer_server.h"
#include "sync/sync_engine.h"

namespace lumi {

enum class NodeRole {
    host,       // desktop: listens, advertises, approves, serves sync data
    companion,  // mobile: browses, dials, runs the sync engine
};

/// Everything read from config.json, with defaults filled in.
struct NodeConfig {
    NodeRole role = NodeRole::host;
    std::string device_name;
    std::filesystem::path data_dir = "./lumi-data";

    ServerOptions server;
    ClientOptions client;
    std::string direct_host;   // companion: dial this instead of browsing

    bool discovery_enabled = true;
    DiscoveryOptions discovery;

    SyncOptions sync;

    std::string log_level = "info";
};

/// Build a config from parsed JSON. Missing keys take their defaults;
/// throws nlohmann::json::exception on a key of the wrong type.
NodeConfig config_from_json(const nlohmann::json& doc);

/// Read and parse `path`. On failure returns nullopt and fills `error`.
std::optional<NodeConfig> load_config(const std::filesystem::path& path, std::string& error);

const char* to_string(NodeRole role);

} // namespace lumi
