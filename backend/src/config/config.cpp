#include "config/config.h"

#include <asio.hpp>

#include <fstream>
#include <stdexcept>

namespace lumi {

using json = nlohmann::json;

namespace {

const json& section(const json& doc, const char* name) {
    static const json empty = json::object();
    auto it = doc.find(name);
    return (it != doc.end() && it->is_object()) ? *it : empty;
}

std::chrono::milliseconds millis(const json& sec, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(sec.value(key, static_cast<long long>(fallback.count())));
}

std::string default_device_name() {
    std::error_code ec;
    auto name = asio::ip::host_name(ec);
    return (ec || name.empty()) ? std::string("Lumi device") : name;
}

} // namespace

NodeConfig config_from_json(const json& doc) {
    NodeConfig cfg;

    const auto& node = section(doc, "node");
    const auto role = node.value("role", std::string("host"));
    if (role == "host") {
        cfg.role = NodeRole::host;
    } else if (role == "companion") {
        cfg.role = NodeRole::companion;
    } else {
        throw std::invalid_argument("node.role must be \"host\" or \"companion\", got \"" + role + "\"");
    }
    cfg.device_name = node.value("device_name", default_device_name());
    cfg.data_dir = node.value("data_dir", cfg.data_dir.string());

    const auto& server = section(doc, "server");
    cfg.server.listen_port = server.value("listen_port", cfg.server.listen_port);
    cfg.server.idle_timeout = millis(server, "idle_timeout_ms", cfg.server.idle_timeout);
    cfg.server.approval_window = millis(server, "approval_window_ms", cfg.server.approval_window);

    const auto& client = section(doc, "client");
    cfg.client.device_name = cfg.device_name;
    cfg.client.connect_timeout = millis(client, "connect_timeout_ms", cfg.client.connect_timeout);
    cfg.client.approval_attempts = client.value("approval_attempts", cfg.client.approval_attempts);
    cfg.client.approval_retry = millis(client, "approval_retry_ms", cfg.client.approval_retry);
    cfg.client.probe_timeout = millis(client, "probe_timeout_ms", cfg.client.probe_timeout);
    cfg.client.command_timeout = millis(client, "command_timeout_ms", cfg.client.command_timeout);
    cfg.direct_host = client.value("direct_host", std::string());

    const auto& discovery = section(doc, "discovery");
    cfg.discovery_enabled = discovery.value("enabled", true);
    cfg.discovery.multicast_address = discovery.value("multicast_address", cfg.discovery.multicast_address);
    cfg.discovery.port = discovery.value("port", cfg.discovery.port);
    cfg.discovery.announce_interval = millis(discovery, "announce_interval_ms", cfg.discovery.announce_interval);
    cfg.discovery.peer_ttl = millis(discovery, "peer_ttl_ms", cfg.discovery.peer_ttl);

    const auto& sync = section(doc, "sync");
    cfg.sync.interval = millis(sync, "interval_ms", cfg.sync.interval);
    cfg.sync.debounce = millis(sync, "debounce_ms", cfg.sync.debounce);
    cfg.sync.metadata_timeout = millis(sync, "metadata_timeout_ms", cfg.sync.metadata_timeout);
    cfg.sync.push_timeout = millis(sync, "push_timeout_ms", cfg.sync.push_timeout);
    cfg.sync.pull_timeout = millis(sync, "pull_timeout_ms", cfg.sync.pull_timeout);

    cfg.log_level = section(doc, "log").value("level", cfg.log_level);
    return cfg;
}

std::optional<NodeConfig> load_config(const std::filesystem::path& path, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Cannot open config file: " + path.string();
        return std::nullopt;
    }
    try {
        return config_from_json(json::parse(file));
    } catch (const std::exception& e) {
        error = "Invalid config " + path.string() + ": " + e.what();
        return std::nullopt;
    }
}

const char* to_string(NodeRole role) {
    return role == NodeRole::host ? "host" : "companion";
}

} // namespace lumi
