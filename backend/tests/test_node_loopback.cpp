#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "node/node.h"
#include "protocol/commands.h"
#include "protocol/errors.h"

using namespace lumi;
using json = nlohmann::json;
using namespace std::chrono_literals;

#define FAIL()                                                          \
    do {                                                                \
        std::cerr << "node_loopback_test failed at " << __FILE__ << ":" \
                  << __LINE__ << "\n";                                  \
        return 1;                                                       \
    } while (false)

namespace {

std::filesystem::path TempDir(const std::string& name) {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec) / name;
    if (ec) dir = std::filesystem::path{"."} / name;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    return dir;
}

/// Poll until `condition` holds or `limit` passes.
bool eventually(const std::function<bool()>& condition, std::chrono::milliseconds limit = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return condition();
}

/// Run `fn` on the event loop and wait for it.
void on_loop(asio::io_context& io, const std::function<void()>& fn) {
    std::promise<void> done;
    asio::post(io, [&] {
        fn();
        done.set_value();
    });
    done.get_future().wait();
}

NodeConfig host_config(const std::filesystem::path& dir) {
    NodeConfig cfg;
    cfg.role = NodeRole::host;
    cfg.device_name = "Loopback Mac";
    cfg.data_dir = dir;
    cfg.server.listen_port = 0;
    cfg.discovery_enabled = false;
    return cfg;
}

NodeConfig companion_config(const std::filesystem::path& dir) {
    NodeConfig cfg;
    cfg.role = NodeRole::companion;
    cfg.device_name = "Loopback Phone";
    cfg.data_dir = dir;
    cfg.discovery_enabled = false;
    cfg.client.device_name = cfg.device_name;
    cfg.client.connect_timeout = 3000ms;
    cfg.client.approval_retry = 30ms;
    cfg.client.approval_attempts = 200;
    cfg.client.command_timeout = 3000ms;
    // Only the initial cycle and debounced edits run during the test.
    cfg.sync.interval = 60000ms;
    cfg.sync.debounce = 100ms;
    return cfg;
}

std::future<std::error_code> dial(Node& node, uint16_t port) {
    auto promise = std::make_shared<std::promise<std::error_code>>();
    auto future = promise->get_future();
    node.dial("127.0.0.1", port, [promise](std::error_code ec) { promise->set_value(ec); });
    return future;
}

struct Result {
    std::error_code ec;
    Response response;
};

std::future<Result> execute(Node& node, const std::string& type, Parameters params) {
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    node.bridge().execute(type, params, 3s, [promise](std::error_code ec, Response r) {
        promise->set_value(Result{ec, std::move(r)});
    });
    return future;
}

}  // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);
    const auto root = TempDir("lumi_node_loopback_test");

    asio::io_context io;
    auto work = asio::make_work_guard(io);
    std::thread runner([&] { io.run(); });

    Node host(io, host_config(root / "host"));
    Node companion(io, companion_config(root / "companion"));
    if (!host.start()) FAIL();
    assert(companion.start());
    const auto port = host.listen_port();
    assert(port != 0);

    std::mutex mutex;
    std::vector<bool> availability;
    std::vector<std::string> request_ids;
    companion.bridge().set_on_availability([&](bool available) {
        std::lock_guard<std::mutex> lock(mutex);
        availability.push_back(available);
    });
    host.approvals()->set_on_request([&](const PendingApproval& request) {
        std::lock_guard<std::mutex> lock(mutex);
        request_ids.push_back(request.id);
    });
    auto transitions = [&] {
        std::lock_guard<std::mutex> lock(mutex);
        return availability;
    };

    // Nothing is reachable before a session exists.
    {
        auto early = execute(companion, "echo", {});
        if (early.wait_for(5s) != std::future_status::ready) FAIL();
        assert(early.get().ec == errc::not_connected);
        assert(!companion.is_syncing());
    }

    // Waiting for the operator: tools stay unavailable until approval.
    auto connected = dial(companion, port);
    {
        const bool asked = eventually([&] {
            std::lock_guard<std::mutex> lock(mutex);
            return !request_ids.empty();
        });
        if (!asked) FAIL();
        std::this_thread::sleep_for(150ms);
        assert(!companion.bridge().is_available());
        assert(!companion.is_syncing());
        assert(transitions().empty());

        std::string id;
        {
            std::lock_guard<std::mutex> lock(mutex);
            id = request_ids.front();
        }
        assert(host.approvals()->accept(id));
        if (connected.wait_for(5s) != std::future_status::ready || connected.get()) FAIL();

        if (!eventually([&] { return companion.bridge().is_available() && companion.is_syncing(); })) FAIL();
        assert(transitions() == std::vector<bool>{true});
        assert(companion.is_connected());
    }

    // The bridge reaches the host's handlers.
    {
        auto meta = execute(companion, kGetSyncMetadata, {{"file", "agents.json"}});
        if (meta.wait_for(5s) != std::future_status::ready) FAIL();
        const auto r = meta.get();
        assert(!r.ec && !r.response.success);
        assert(r.response.result == "no sync data for agents.json");
    }

    // A local edit reaches the host after the debounce.
    companion.store().mutate_collection("agents.json", [](json& items) { items.push_back({{"id", "a1"}}); });
    if (!eventually([&] { return host.store().read("agents.json") == companion.store().read("agents.json"); })) {
        FAIL();
    }

    // Session lost: bridge detached, loop and pending debounce cancelled.
    {
        companion.disconnect();
        if (!eventually([&] { return !companion.bridge().is_available() && !companion.is_syncing(); })) FAIL();
        assert(transitions() == (std::vector<bool>{true, false}));

        auto offline = execute(companion, "echo", {});
        if (offline.wait_for(5s) != std::future_status::ready) FAIL();
        assert(offline.get().ec == errc::not_connected);

        companion.store().mutate_collection("agents.json", [](json& items) { items.push_back({{"id", "a2"}}); });
        std::this_thread::sleep_for(400ms);
        assert(host.store().read("agents.json") != companion.store().read("agents.json"));
    }

    // Reconnect: the device is remembered and the first cycle catches up.
    {
        auto again = dial(companion, port);
        if (again.wait_for(5s) != std::future_status::ready || again.get()) FAIL();
        if (!eventually([&] { return companion.bridge().is_available() && companion.is_syncing(); })) FAIL();
        if (!eventually([&] { return host.store().read("agents.json") == companion.store().read("agents.json"); })) {
            FAIL();
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            assert(request_ids.size() == 1);
        }
        assert(transitions() == (std::vector<bool>{true, false, true}));
    }

    // The host going away fails the session and detaches everything.
    {
        on_loop(io, [&] { host.stop(); });
        if (!eventually([&] { return !companion.bridge().is_available() && !companion.is_syncing(); })) FAIL();
        assert(!companion.is_connected());
        assert(transitions() == (std::vector<bool>{true, false, true, false}));
    }

    on_loop(io, [&] { companion.stop(); });
    work.reset();
    io.stop();
    runner.join();

    std::cout << "node_loopback_test passed\n";
    return 0;
}
