#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

#include "protocol/messages.h"
#include "sync/sync_store.h"

namespace lumi {

struct SyncOptions {
    std::chrono::milliseconds interval{5000};
    std::chrono::milliseconds debounce{1200};
    std::chrono::milliseconds metadata_timeout{10000};
    std::chrono::milliseconds push_timeout{25000};
    std::chrono::milliseconds pull_timeout{20000};
};

/// Outcome of one cycle.
struct SyncReport {
    bool skipped = false;       // preflight found nothing to do
    int pushed = 0;
    int push_rejected = 0;      // refused as stale by the peer
    int pulled = 0;
    int pull_skipped = 0;       // local write in progress
    int failed = 0;             // per-resource failures the cycle survived
    std::error_code error;      // set when the cycle was aborted

    [[nodiscard]] bool aborted() const { return static_cast<bool>(error); }
};

/**
 * Companion-side reconciliation of the SyncStore with the peer.
 *
 * A cycle is: preflight (compare metadata, bail out when nothing differs),
 * push every local resource, then pull every remote resource that is newer
 * than ours. Commands go out one at a time through the CommandExecutor.
 *
 * Cycles are triggered by the periodic loop (start/stop), by a debounced
 * local-change notification, or by sync_now(). Only one runs at a time.
 * A connection-level failure aborts the cycle and stops the loop until the
 * next start().
 *
 * All state lives on a private strand; public methods can be called from
 * any thread. Create with std::make_shared.
 */
class SyncEngine : public std::enable_shared_from_this<SyncEngine> {
public:
    using ProgressHandler = std::function<void(double fraction, const std::string& detail)>;
    using DataChangedHandler = std::function<void()>;
    using CycleHandler = std::function<void(const SyncReport&)>;

    SyncEngine(asio::io_context& io, SyncStore& store, CommandExecutor executor,
               SyncOptions options = {});

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /// Observers; set before start().
    void set_on_progress(ProgressHandler handler) { on_progress_ = std::move(handler); }
    void set_on_data_changed(DataChangedHandler handler) { on_data_changed_ = std::move(handler); }
    void set_on_cycle(CycleHandler handler) { on_cycle_ = std::move(handler); }

    /// Run a cycle now, then every `interval` until stop().
    void start();

    /// Cancel the loop and any pending debounce. A cycle in flight is
    /// abandoned; what it already applied stays applied.
    void stop();

    /// Restart the debounce window; a cycle runs when it elapses.
    void notify_local_change();

    /// One-off cycle. `done` gets errc::busy if a cycle is already running.
    void sync_now(CycleHandler done = {});

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] bool in_progress() const { return in_flight_.load(); }

private:
    struct Cycle;

    void run_cycle(CycleHandler done);
    void preflight(const std::shared_ptr<Cycle>& cycle, std::size_t index);
    void push(const std::shared_ptr<Cycle>& cycle, std::size_t index);
    void pull(const std::shared_ptr<Cycle>& cycle, std::size_t index);
    void finish(const std::shared_ptr<Cycle>& cycle, std::error_code ec = {});
    void step_done(const std::shared_ptr<Cycle>& cycle, const std::string& detail);
    void schedule_next();

    /// Send through the executor and resume on our strand.
    void request(const std::string& type, Parameters parameters,
                 std::chrono::milliseconds timeout, ResponseHandler handler);

    /// True if `cycle` was overtaken by stop(); finishes it as cancelled.
    bool abandoned(const std::shared_ptr<Cycle>& cycle);

    void progress(double fraction, const std::string& detail);

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer loop_timer_;
    asio::steady_timer debounce_timer_;
    SyncStore& store_;
    CommandExecutor executor_;
    SyncOptions options_;

    std::atomic<bool> running_{false};
    std::atomic<bool> in_flight_{false};
    unsigned generation_ = 0;

    ProgressHandler on_progress_;
    DataChangedHandler on_data_changed_;
    CycleHandler on_cycle_;
};

} // namespace lumi
