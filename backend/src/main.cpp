/**
 * lumi-remote: Entry Point
 *
 * Loads config, brings up the node for its role (host or companion) and
 * runs the ASIO event loop on the main thread. Operator commands are read
 * from stdin on a separate thread and posted onto the loop. Only "quit"
 * or SIGINT/SIGTERM stop the node; closing stdin just ends the console.
 */

#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config/config.h"
#include "node/node.h"
#include "util/timestamp.h"
#include "util/uuid.h"

using json = nlohmann::json;
using namespace lumi;

namespace {

std::vector<std::string> split(const std::string& line) {
    std::istringstream ss(line);
    std::vector<std::string> words;
    std::string word;
    while (ss >> word) words.push_back(word);
    return words;
}

void print_help(NodeRole role) {
    if (role == NodeRole::host) {
        std::cout << "commands: pending | approve <id> | reject <id> | devices | clients | "
                     "reset-devices | quit\n";
    } else {
        std::cout << "commands: peers | connect <index> | dial <host> [port] | "
                     "send <type> [k=v ...] | sync | disconnect | touch <resource> | quit\n";
    }
}

void host_command(Node& node, const std::vector<std::string>& args) {
    auto& gate = *node.approvals();
    const auto& cmd = args[0];

    if (cmd == "pending") {
        const auto requests = gate.pending();
        if (requests.empty()) std::cout << "no pending requests\n";
        for (const auto& r : requests) {
            std::cout << r.id << "  " << r.device_name << "  " << r.address << "  "
                      << format_iso8601(r.created_at) << "\n";
        }
    } else if (cmd == "approve" && args.size() == 2) {
        if (!gate.accept(args[1])) std::cout << "no pending request " << args[1] << "\n";
    } else if (cmd == "reject" && args.size() == 2) {
        if (!gate.reject(args[1])) std::cout << "no pending request " << args[1] << "\n";
    } else if (cmd == "devices") {
        for (const auto& name : gate.approved_devices()) std::cout << name << "\n";
    } else if (cmd == "clients") {
        for (const auto& c : node.clients()) {
            std::cout << c.address << "  " << (c.device_name.empty() ? "-" : c.device_name)
                      << (c.approved ? "  approved" : "  waiting") << "\n";
        }
    } else if (cmd == "reset-devices") {
        gate.reset_paired_devices();
    } else {
        print_help(NodeRole::host);
    }
}

void companion_command(Node& node, const std::vector<std::string>& args) {
    const auto& cmd = args[0];

    if (cmd == "peers") {
        const auto peers = node.peers();
        if (peers.empty()) std::cout << "no hosts found\n";
        for (std::size_t i = 0; i < peers.size(); ++i) {
            std::cout << "[" << i << "] " << peers[i].name << "  " << peers[i].host << ":"
                      << peers[i].port << "  " << describe(peers[i].state) << "\n";
        }
    } else if (cmd == "connect" && args.size() == 2) {
        const auto peers = node.peers();
        std::size_t index = 0;
        try {
            index = std::stoul(args[1]);
        } catch (const std::exception&) {
            index = peers.size();
        }
        if (index >= peers.size()) {
            std::cout << "no peer " << args[1] << "\n";
            return;
        }
        node.connect(peers[index]);
    } else if (cmd == "dial" && (args.size() == 2 || args.size() == 3)) {
        uint16_t port = kDefaultPort;
        if (args.size() == 3) {
            try {
                port = static_cast<uint16_t>(std::stoul(args[2]));
            } catch (const std::exception&) {
                std::cout << "bad port " << args[2] << "\n";
                return;
            }
        }
        node.dial(args[1], port);
    } else if (cmd == "send" && args.size() >= 2) {
        Parameters params;
        for (std::size_t i = 2; i < args.size(); ++i) {
            const auto eq = args[i].find('=');
            if (eq == std::string::npos) continue;
            params[args[i].substr(0, eq)] = args[i].substr(eq + 1);
        }
        node.bridge().execute(args[1], params, node.config().client.command_timeout,
                              [type = args[1]](std::error_code ec, Response r) {
                                  if (ec) {
                                      spdlog::warn("{} failed: {}", type, ec.message());
                                  } else if (r.success) {
                                      spdlog::info("{} -> {}", type, r.result);
                                  } else {
                                      spdlog::warn("{} -> {} {}", type, r.error.value_or(""), r.result);
                                  }
                              });
    } else if (cmd == "sync") {
        node.sync_now([](const SyncReport& report) {
            if (report.aborted()) spdlog::warn("Sync did not run: {}", report.error.message());
        });
    } else if (cmd == "disconnect") {
        node.disconnect();
    } else if (cmd == "touch" && args.size() == 2) {
        auto& store = node.store();
        const auto* entry = store.find(args[1]);
        if (!entry) {
            std::cout << "unknown resource " << args[1] << "\n";
            return;
        }
        const auto stamp = format_iso8601(now_ms());
        if (entry->kind == ResourceKind::collection) {
            store.mutate_collection(entry->name, [&](json& items) {
                items.push_back({{"id", generate_uuid()}, {"touchedAt", stamp}});
            });
        } else {
            store.set_value(entry->name, "touchedAt", stamp);
        }
    } else {
        print_help(NodeRole::companion);
    }
}

/// The only state the console thread shares with main(). The thread blocks
/// in getline() and may outlive main(), so it never touches main's locals:
/// lines go through `deliver`, which main() clears before returning.
struct ConsoleLink {
    std::mutex mutex;
    std::function<void(std::vector<std::string>)> deliver;
};

void read_console(std::shared_ptr<ConsoleLink> link) {
    std::string line;
    while (std::getline(std::cin, line)) {
        auto args = split(line);
        if (args.empty()) continue;
        const bool quit = args[0] == "quit";

        std::lock_guard<std::mutex> lock(link->mutex);
        if (!link->deliver) return;
        link->deliver(std::move(args));
        if (quit) return;
    }

    // No more input (e.g. started with </dev/null); keep serving until a signal.
    std::lock_guard<std::mutex> lock(link->mutex);
    if (link->deliver) spdlog::info("Console input closed, stop with Ctrl+C or SIGTERM");
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::info("lumi-remote starting…");

    const std::string config_path = (argc > 1) ? argv[1] : "config.json";
    std::string error;
    auto config = load_config(config_path, error);
    if (!config) {
        spdlog::error("{}", error);
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config->log_level));
    spdlog::info("Loaded config from {}", config_path);

    asio::io_context io;
    auto work = asio::make_work_guard(io);

    Node node(io, *config);
    if (!node.start()) {
        spdlog::error("Node failed to start");
        return 1;
    }

    asio::signal_set signals(io, SIGINT, SIGTERM);
    auto shutdown = [&] {
        spdlog::info("Shutting down");
        signals.cancel();
        node.stop();
        work.reset();
        // Let goodbye datagrams and closes run, then stop whatever is left.
        asio::post(io, [&io] { io.stop(); });
    };
    signals.async_wait([&](std::error_code ec, int) {
        if (!ec) shutdown();
    });

    const auto role = node.role();
    print_help(role);

    auto link = std::make_shared<ConsoleLink>();
    link->deliver = [&io, &node, &shutdown, role](std::vector<std::string> args) {
        asio::post(io, [&node, &shutdown, role, args = std::move(args)] {
            if (args[0] == "quit") {
                shutdown();
            } else if (role == NodeRole::host) {
                host_command(node, args);
            } else {
                companion_command(node, args);
            }
        });
    };
    std::thread(read_console, link).detach();

    spdlog::info("Ready. Type 'quit' or press Ctrl+C to exit.");
    io.run();

    {
        std::lock_guard<std::mutex> lock(link->mutex);
        link->deliver = nullptr;
    }
    return 0;
}
