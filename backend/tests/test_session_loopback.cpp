#include <cassert>
#include <chrono>
#include <filesystem>
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

#include "auth/approval_gate.h"
#include "dispatch/command_dispatcher.h"
#include "network/peer_client.h"
#include "network/peer_server.h"
#include "protocol/commands.h"
#include "protocol/errors.h"
#include "protocol/frame_codec.h"
#include "sync/sync_engine.h"
#include "sync/sync_handlers.h"
#include "util/base64.h"

using namespace lumi;
using json = nlohmann::json;
using namespace std::chrono_literals;

#define FAIL()                                                              \
    do {                                                                    \
        std::cerr << "session_loopback_test failed at " << __FILE__ << ":"  \
                  << __LINE__ << "\n";                                      \
        return 1;                                                           \
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

struct Result {
    std::error_code ec;
    Response response;
};

/// Block the test thread until an async call completes (or give up).
template <typename T>
bool wait(std::future<T>& f, std::chrono::seconds limit = 10s) {
    return f.wait_for(limit) == std::future_status::ready;
}

std::future<Result> send(PeerClient& client, const std::string& type, Parameters params,
                         std::chrono::milliseconds timeout = 5s) {
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    client.send(type, params, timeout, [promise](std::error_code ec, Response r) {
        promise->set_value(Result{ec, std::move(r)});
    });
    return future;
}

std::future<std::error_code> connect(PeerClient& client, uint16_t port) {
    auto promise = std::make_shared<std::promise<std::error_code>>();
    auto future = promise->get_future();
    client.connect("127.0.0.1", port, [promise](std::error_code ec) { promise->set_value(ec); });
    return future;
}

ClientOptions fast_options(const std::string& name) {
    ClientOptions options;
    options.device_name = name;
    options.connect_timeout = 3000ms;
    options.approval_retry = 30ms;
    options.approval_attempts = 100;
    options.probe_timeout = 2000ms;
    options.command_timeout = 3000ms;
    return options;
}

}  // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);
    const auto root = TempDir("lumi_session_loopback_test");

    asio::io_context io;
    auto work = asio::make_work_guard(io);
    std::thread runner([&] { io.run(); });

    // Host side.
    ApprovalGate gate({}, 1500ms);
    CommandDispatcher dispatcher(gate);
    SyncStore host_store(root / "host");
    register_sync_handlers(dispatcher, host_store);

    dispatcher.register_handler("echo", [](const Command& c, CommandDispatcher::Reply reply) {
        reply(Response::ok(c.id, c.param("text")));
    });
    dispatcher.register_handler("delayed", [&io](const Command& c, CommandDispatcher::Reply reply) {
        auto timer = std::make_shared<asio::steady_timer>(io, 200ms);
        timer->async_wait([timer, reply, text = c.param("text")](std::error_code) {
            reply(Response::ok("", text));
        });
    });
    dispatcher.register_handler("silent", [](const Command&, CommandDispatcher::Reply) {});

    // Operator: approve the phone, turn the intruder away, ignore the rest.
    gate.set_on_request([&gate](const PendingApproval& request) {
        if (request.device_name == "Loopback Phone") gate.accept(request.id);
        if (request.device_name == "Intruder") gate.reject(request.id);
    });

    ServerOptions server_options;
    server_options.listen_port = 0;
    PeerServer server(io, dispatcher, server_options);
    if (!server.start()) FAIL();
    const auto port = server.port();
    assert(port != 0);

    {
        PeerClient client(io, fast_options("Loopback Phone"));
        std::vector<std::string> statuses;
        std::mutex status_mutex;
        client.set_on_status([&](const std::string& s) {
            std::lock_guard<std::mutex> lock(status_mutex);
            statuses.push_back(s);
        });

        // Not connected yet.
        auto early = send(client, "echo", {{"text", "x"}});
        if (!wait(early) || early.get().ec != errc::not_connected) FAIL();

        // "awaiting approval" first, then connected once the operator accepts.
        auto connected = connect(client, port);
        if (!wait(connected)) FAIL();
        const auto ec = connected.get();
        if (ec) {
            std::cerr << "connect failed: " << ec.message() << "\n";
            FAIL();
        }
        assert(client.is_connected());
        assert(client.state() == SessionState::connected);
        assert(gate.is_approved("Loopback Phone"));
        {
            std::lock_guard<std::mutex> lock(status_mutex);
            bool saw_waiting = false;
            for (const auto& s : statuses) saw_waiting |= s == kAwaitingApproval;
            assert(saw_waiting);
            assert(statuses.back() == "Connected to 127.0.0.1");
        }

        // Request/response.
        auto echo = send(client, "echo", {{"text", "hello"}});
        if (!wait(echo)) FAIL();
        auto r = echo.get();
        assert(!r.ec && r.response.success && r.response.result == "hello");

        // Out of order: the slow reply does not block the fast one.
        auto slow = send(client, "delayed", {{"text", "slow"}});
        auto fast = send(client, "echo", {{"text", "fast"}});
        if (!wait(fast)) FAIL();
        assert(slow.wait_for(0s) != std::future_status::ready);
        assert(fast.get().response.result == "fast");
        if (!wait(slow)) FAIL();
        assert(slow.get().response.result == "slow");

        // No reply: times out, the session survives.
        auto silent = send(client, "silent", {}, 150ms);
        if (!wait(silent)) FAIL();
        assert(silent.get().ec == errc::timed_out);
        assert(client.is_connected());

        // Unknown command gets an answer.
        auto unknown = send(client, "warp_drive", {});
        if (!wait(unknown)) FAIL();
        r = unknown.get();
        assert(!r.ec && !r.response.success);
        assert(r.response.error && *r.response.error == "unknown command: warp_drive");

        // Metadata for a never-created resource.
        auto meta = send(client, kGetSyncMetadata, {{"file", "agents.json"}});
        if (!wait(meta)) FAIL();
        r = meta.get();
        assert(!r.ec && !r.response.success);
        assert(r.response.result == "no sync data for agents.json");

        // A full sync cycle over the wire.
        host_store.apply_remote("conversations.json",
                                R"({"items":[{"id":"c1"}],"updatedAt":"2026-02-02T02:02:02.000Z"})", false);
        SyncStore local(root / "companion");
        local.mutate_collection("agents.json", [](json& items) { items.push_back({{"id", "a1"}}); });

        CommandExecutor executor = [&client](const std::string& type, const Parameters& params,
                                             std::chrono::milliseconds timeout, ResponseHandler handler) {
            client.send(type, params, timeout, std::move(handler));
        };
        auto engine = std::make_shared<SyncEngine>(io, local, executor);
        auto cycle = std::make_shared<std::promise<SyncReport>>();
        auto cycle_done = cycle->get_future();
        engine->sync_now([cycle](const SyncReport& report) { cycle->set_value(report); });
        if (!wait(cycle_done)) FAIL();
        const auto report = cycle_done.get();
        assert(!report.aborted());
        assert(report.pushed == 1 && report.pulled == 1);
        assert(host_store.read("agents.json") == local.read("agents.json"));
        assert(local.read("conversations.json") == host_store.read("conversations.json"));

        // Documents too big for one frame fail on their own; the session stays up.
        {
            const std::string huge(kMaxFrameSize, 'x');
            auto push = send(client, kPushSyncData, {{"file", "health_data.json"}, {"data", base64_encode(huge)}});
            if (!wait(push)) FAIL();
            r = push.get();
            if (r.ec != errc::message_too_large) FAIL();
            assert(!is_fatal(r.ec));
            assert(client.is_connected());
            assert(!host_store.read("health_data.json"));

            const auto big_doc = json{{"items", json::array({huge})}, {"updatedAt", "2026-03-03T03:03:03.000Z"}}.dump();
            assert(host_store.apply_remote("health_data.json", big_doc, false) == ApplyResult::applied);
            auto pull = send(client, kGetSyncData, {{"file", "health_data.json"}});
            if (!wait(pull)) FAIL();
            r = pull.get();
            assert(!r.ec && !r.response.success);
            assert(r.response.error && *r.response.error == kResponseTooLarge);
            assert(client.is_connected());

            auto still = send(client, "echo", {{"text", "still here"}});
            if (!wait(still)) FAIL();
            assert(still.get().response.result == "still here");
        }

        // Host sees one approved client.
        const auto clients = server.connected_clients();
        assert(clients.size() == 1);
        assert(clients[0].approved && clients[0].device_name == "Loopback Phone");

        // Disconnect fails anything still waiting.
        auto orphan = send(client, "silent", {}, 5s);
        std::this_thread::sleep_for(50ms);
        client.disconnect();
        if (!wait(orphan)) FAIL();
        assert(orphan.get().ec == errc::cancelled);
        assert(client.state() == SessionState::disconnected);

        auto after = send(client, "echo", {{"text", "x"}});
        if (!wait(after) || after.get().ec != errc::not_connected) FAIL();

        // Reconnecting builds a new session; the device is remembered.
        auto again = connect(client, port);
        if (!wait(again) || again.get()) FAIL();
        assert(client.is_connected());
        client.disconnect();
    }

    // Operator rejection is an authorization failure, no retry.
    {
        PeerClient client(io, fast_options("Intruder"));
        auto result = connect(client, port);
        if (!wait(result)) FAIL();
        const auto ec = result.get();
        if (ec != errc::approval_rejected) FAIL();
        assert(classify(ec) == ErrorClass::authorization);
        assert(client.state() == SessionState::failed);
    }

    // Nobody answers the request: bounded number of attempts.
    {
        auto options = fast_options("Ignored Tablet");
        options.approval_attempts = 3;
        PeerClient client(io, options);
        auto result = connect(client, port);
        if (!wait(result)) FAIL();
        if (result.get() != errc::approval_timeout) FAIL();
        auto left = gate.pending();
        assert(left.size() == 1 && left[0].device_name == "Ignored Tablet");

        // The abandoned request expires and can no longer be approved.
        std::this_thread::sleep_for(1700ms);
        assert(gate.pending().empty());
        assert(!gate.accept(left[0].id));
        assert(!gate.is_approved("Ignored Tablet"));
    }

    // Garbage on the wire closes only that connection.
    {
        asio::ip::tcp::socket raw(io);
        raw.connect({asio::ip::make_address("127.0.0.1"), port});
        const std::string bad = std::string("\x7f\xff\xff\xff", 4);
        asio::write(raw, asio::buffer(bad));
        char byte = 0;
        std::error_code ec;
        raw.read_some(asio::buffer(&byte, 1), ec);
        assert(ec);  // server hung up
    }

    // A companion that goes quiet is dropped by the host.
    {
        ServerOptions idle_options;
        idle_options.listen_port = 0;
        idle_options.idle_timeout = 200ms;
        PeerServer idle_server(io, dispatcher, idle_options);
        if (!idle_server.start()) FAIL();

        asio::ip::tcp::socket quiet(io);
        quiet.connect({asio::ip::make_address("127.0.0.1"), idle_server.port()});
        const auto started = std::chrono::steady_clock::now();
        char byte = 0;
        std::error_code ec;
        quiet.read_some(asio::buffer(&byte, 1), ec);
        const auto waited = std::chrono::steady_clock::now() - started;
        if (!ec) FAIL();
        assert(waited >= 150ms && waited < 10s);
        idle_server.stop();
    }

    // A host that never completes the TCP handshake hits the connect timeout.
    {
        // Backlog 0 and no accept(): once the queue holds one connection the
        // kernel drops further SYNs, so later connects hang.
        asio::ip::tcp::acceptor stalled(io);
        stalled.open(asio::ip::tcp::v4());
        stalled.bind({asio::ip::make_address("127.0.0.1"), 0});
        stalled.listen(0);
        const auto stalled_endpoint = stalled.local_endpoint();

        std::vector<std::unique_ptr<asio::ip::tcp::socket>> fillers;
        for (int i = 0; i < 8; ++i) {
            fillers.push_back(std::make_unique<asio::ip::tcp::socket>(io));
            fillers.back()->async_connect(stalled_endpoint, [](std::error_code) {});
        }
        std::this_thread::sleep_for(200ms);

        auto options = fast_options("Patient Phone");
        options.connect_timeout = 300ms;
        PeerClient client(io, options);
        const auto started = std::chrono::steady_clock::now();
        auto result = connect(client, stalled_endpoint.port());
        if (!wait(result)) FAIL();
        const auto ec = result.get();
        if (ec != errc::connect_timeout) FAIL();
        assert(classify(ec) == ErrorClass::timeout);
        assert(client.state() == SessionState::failed);
        assert(std::chrono::steady_clock::now() - started < 3s);

        std::promise<void> closed;
        asio::post(io, [&] {
            std::error_code ignored;
            for (auto& f : fillers) f->close(ignored);
            stalled.close(ignored);
            closed.set_value();
        });
        closed.get_future().wait();
    }

    server.stop();
    work.reset();
    io.stop();
    runner.join();

    std::cout << "session_loopback_test passed\n";
    return 0;
}
