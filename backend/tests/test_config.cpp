#include <cassert>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "config/config.h"

using namespace lumi;
using json = nlohmann::json;

static void WriteFile(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f << content;
}

int main() {
    // Everything defaulted.
    {
        const auto cfg = config_from_json(json::object());
        assert(cfg.role == NodeRole::host);
        assert(!cfg.device_name.empty());
        assert(cfg.client.device_name == cfg.device_name);
        assert(cfg.data_dir == "./lumi-data");
        assert(cfg.server.listen_port == 47285);
        assert(cfg.server.idle_timeout == std::chrono::milliseconds(300000));
        assert(cfg.server.approval_window == std::chrono::milliseconds(65000));
        assert(cfg.client.connect_timeout == std::chrono::milliseconds(8000));
        assert(cfg.client.approval_attempts == 60);
        assert(cfg.client.approval_retry == std::chrono::milliseconds(1000));
        assert(cfg.client.probe_timeout == std::chrono::milliseconds(5000));
        assert(cfg.client.command_timeout == std::chrono::milliseconds(15000));
        assert(cfg.direct_host.empty());
        assert(cfg.discovery_enabled);
        assert(cfg.discovery.multicast_address == "239.255.42.85");
        assert(cfg.discovery.port == 47286);
        assert(cfg.discovery.announce_interval == std::chrono::milliseconds(2000));
        assert(cfg.discovery.peer_ttl == std::chrono::milliseconds(8000));
        assert(cfg.sync.interval == std::chrono::milliseconds(5000));
        assert(cfg.sync.debounce == std::chrono::milliseconds(1200));
        assert(cfg.sync.metadata_timeout == std::chrono::milliseconds(10000));
        assert(cfg.sync.push_timeout == std::chrono::milliseconds(25000));
        assert(cfg.sync.pull_timeout == std::chrono::milliseconds(20000));
        assert(cfg.log_level == "info");
    }

    // A companion file overriding a few keys.
    {
        const std::string path = "tmp_lumi_config.json";
        WriteFile(path, R"({
            "node": { "role": "companion", "device_name": "Test Phone", "data_dir": "/tmp/lumi" },
            "server": { "approval_window_ms": 5000 },
            "client": { "approval_attempts": 3, "direct_host": "10.0.0.2" },
            "discovery": { "enabled": false },
            "sync": { "interval_ms": 250 },
            "log": { "level": "debug" }
        })");
        std::string err;
        auto cfg = load_config(path, err);
        assert(cfg.has_value());
        assert(err.empty());
        assert(cfg->role == NodeRole::companion);
        assert(cfg->device_name == "Test Phone");
        assert(cfg->client.device_name == "Test Phone");
        assert(cfg->data_dir == "/tmp/lumi");
        assert(cfg->client.approval_attempts == 3);
        assert(cfg->server.approval_window == std::chrono::milliseconds(5000));
        assert(cfg->client.approval_retry == std::chrono::milliseconds(1000));
        assert(cfg->direct_host == "10.0.0.2");
        assert(!cfg->discovery_enabled);
        assert(cfg->sync.interval == std::chrono::milliseconds(250));
        assert(cfg->log_level == "debug");
    }

    // Failures come back as an error string.
    {
        std::string err;
        assert(!load_config("does_not_exist.json", err));
        assert(err.find("does_not_exist.json") != std::string::npos);

        WriteFile("tmp_lumi_bad.json", "{ not json");
        err.clear();
        assert(!load_config("tmp_lumi_bad.json", err));
        assert(!err.empty());

        WriteFile("tmp_lumi_role.json", R"({"node":{"role":"toaster"}})");
        err.clear();
        assert(!load_config("tmp_lumi_role.json", err));

        WriteFile("tmp_lumi_type.json", R"({"server":{"listen_port":"eighty"}})");
        err.clear();
        assert(!load_config("tmp_lumi_type.json", err));
    }

    std::cout << "config_test passed\n";
    return 0;
}
