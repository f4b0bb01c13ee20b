/**
 * SyncEngine: whole-document last-write-wins sync over the command channel.
 *
 * Phases run strictly one after another and each sends one command at a
 * time; every completion is posted back onto the engine's strand before it
 * touches any state.
 */

#include "sync/sync_engine.h"

#include "protocol/commands.h"
#include "protocol/errors.h"
#include "util/base64.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lumi {

struct SyncEngine::Cycle {
    unsigned generation = 0;
    std::size_t total_steps = 0;
    std::size_t completed_steps = 0;
    SyncReport report;
    CycleHandler done;
};

namespace {

/// Errors that mean the channel itself is gone, not just one request.
bool aborts_cycle(const std::error_code& ec) {
    return is_fatal(ec) || ec == errc::not_connected || ec == errc::cancelled;
}

/// Does the remote copy differ from ours, going by metadata only?
bool differs(const SyncStore& store, const ResourceSpec& entry, std::error_code ec,
             const Response& response) {
    const auto local = store.metadata(entry.name);
    if (ec) return true;
    if (!response.success) return local.has_value();  // peer has never seen it
    if (!local) return true;

    const auto remote = parse_metadata(response.result);
    if (!remote) return true;

    if (entry.kind == ResourceKind::collection && local->updated_at && remote->updated_at) {
        return *local->updated_at != *remote->updated_at;
    }
    return local->digest != remote->digest;
}

} // namespace

SyncEngine::SyncEngine(asio::io_context& io, SyncStore& store, CommandExecutor executor,
                       SyncOptions options)
    : strand_(asio::make_strand(io)),
      loop_timer_(strand_),
      debounce_timer_(strand_),
      store_(store),
      executor_(std::move(executor)),
      options_(options) {}

void SyncEngine::start() {
    asio::post(strand_, [self = shared_from_this()] {
        ++self->generation_;
        self->running_ = true;
        spdlog::info("Sync loop started (every {} ms)", self->options_.interval.count());
        self->run_cycle({});
    });
}

void SyncEngine::stop() {
    running_ = false;
    asio::post(strand_, [self = shared_from_this()] {
        ++self->generation_;
        self->loop_timer_.cancel();
        self->debounce_timer_.cancel();
        spdlog::info("Sync loop stopped");
    });
}

void SyncEngine::notify_local_change() {
    asio::post(strand_, [self = shared_from_this()] {
        if (!self->running_) return;
        self->debounce_timer_.expires_after(self->options_.debounce);
        const auto generation = self->generation_;
        std::weak_ptr<SyncEngine> weak = self;
        self->debounce_timer_.async_wait([weak, generation](std::error_code ec) {
            auto engine = weak.lock();
            if (ec || !engine || generation != engine->generation_ || !engine->running_) return;
            spdlog::debug("Local change settled, syncing");
            engine->run_cycle({});
        });
    });
}

void SyncEngine::sync_now(CycleHandler done) {
    asio::post(strand_, [self = shared_from_this(), done = std::move(done)]() mutable {
        self->run_cycle(std::move(done));
    });
}

void SyncEngine::run_cycle(CycleHandler done) {
    if (in_flight_) {
        spdlog::debug("Sync already in progress, trigger ignored");
        if (done) {
            SyncReport busy;
            busy.error = make_error_code(errc::busy);
            done(busy);
        }
        return;
    }
    in_flight_ = true;

    auto cycle = std::make_shared<Cycle>();
    cycle->generation = generation_;
    cycle->total_steps = std::max<std::size_t>(1, store_.registry().size() * 2);
    cycle->done = std::move(done);

    progress(0.0, "Checking for changes...");
    preflight(cycle, 0);
}

void SyncEngine::preflight(const std::shared_ptr<Cycle>& cycle, std::size_t index) {
    if (abandoned(cycle)) return;

    const auto& registry = store_.registry();
    if (index >= registry.size()) {
        spdlog::debug("Everything in sync, skipping cycle");
        cycle->report.skipped = true;
        finish(cycle);
        return;
    }

    const auto entry = registry[index];
    request(kGetSyncMetadata, {{"file", entry.name}}, options_.metadata_timeout,
            [this, self = shared_from_this(), cycle, entry, index](std::error_code ec, Response response) {
                if (abandoned(cycle)) return;
                if (ec && aborts_cycle(ec)) {
                    finish(cycle, ec);
                    return;
                }
                if (ec) spdlog::warn("Metadata for {} unavailable: {}", entry.name, ec.message());

                if (differs(store_, entry, ec, response)) {
                    spdlog::info("{} changed, starting sync", entry.friendly_name);
                    push(cycle, 0);
                } else {
                    preflight(cycle, index + 1);
                }
            });
}

void SyncEngine::push(const std::shared_ptr<Cycle>& cycle, std::size_t index) {
    if (abandoned(cycle)) return;

    const auto& registry = store_.registry();
    if (index >= registry.size()) {
        pull(cycle, 0);
        return;
    }

    const auto entry = registry[index];
    auto bytes = store_.read(entry.name);
    if (!bytes) {
        step_done(cycle, "Nothing to upload for " + entry.friendly_name);
        push(cycle, index + 1);
        return;
    }

    progress(static_cast<double>(cycle->completed_steps) / cycle->total_steps,
             "Uploading " + entry.friendly_name + "...");
    request(kPushSyncData, {{"file", entry.name}, {"data", base64_encode(*bytes)}}, options_.push_timeout,
            [this, self = shared_from_this(), cycle, entry, index](std::error_code ec, Response response) {
                if (abandoned(cycle)) return;
                if (ec && aborts_cycle(ec)) {
                    finish(cycle, ec);
                    return;
                }

                if (ec) {
                    spdlog::warn("Upload of {} failed: {}", entry.name, ec.message());
                    ++cycle->report.failed;
                } else if (!response.success) {
                    if (response.result.rfind("stale", 0) == 0) {
                        spdlog::info("Peer kept its newer {}", entry.name);
                        ++cycle->report.push_rejected;
                    } else {
                        spdlog::warn("Upload of {} refused: {}", entry.name,
                                     response.error.value_or(response.result));
                        ++cycle->report.failed;
                    }
                } else {
                    ++cycle->report.pushed;
                }
                step_done(cycle, "Uploaded " + entry.friendly_name);
                push(cycle, index + 1);
            });
}

void SyncEngine::pull(const std::shared_ptr<Cycle>& cycle, std::size_t index) {
    if (abandoned(cycle)) return;

    const auto& registry = store_.registry();
    if (index >= registry.size()) {
        finish(cycle);
        return;
    }

    const auto entry = registry[index];
    if (store_.write_in_progress(entry.name)) {
        spdlog::debug("{} is being written locally, not pulling", entry.name);
        ++cycle->report.pull_skipped;
        step_done(cycle, "Skipped " + entry.friendly_name);
        pull(cycle, index + 1);
        return;
    }

    progress(static_cast<double>(cycle->completed_steps) / cycle->total_steps,
             "Downloading " + entry.friendly_name + "...");
    request(kGetSyncData, {{"file", entry.name}}, options_.pull_timeout,
            [this, self = shared_from_this(), cycle, entry, index](std::error_code ec, Response response) {
                if (abandoned(cycle)) return;
                if (ec && aborts_cycle(ec)) {
                    finish(cycle, ec);
                    return;
                }

                if (ec) {
                    spdlog::warn("Download of {} failed: {}", entry.name, ec.message());
                    ++cycle->report.failed;
                } else if (!response.success) {
                    if (response.error && *response.error == kResponseTooLarge) {
                        spdlog::warn("{} is too large to download", entry.name);
                        ++cycle->report.failed;
                    } else {
                        spdlog::debug("Peer has no {}", entry.name);
                    }
                } else if (const auto* blob = response.file_blob(); !blob) {
                    spdlog::warn("Download of {} carried no data", entry.name);
                    ++cycle->report.failed;
                } else {
                    const auto result = store_.apply_if_newer(entry.name, *blob);
                    switch (result) {
                        case ApplyResult::applied:
                            spdlog::info("Pulled newer {}", entry.friendly_name);
                            ++cycle->report.pulled;
                            break;
                        case ApplyResult::unchanged:
                        case ApplyResult::stale:
                            break;
                        case ApplyResult::deferred:
                            ++cycle->report.pull_skipped;
                            break;
                        case ApplyResult::invalid:
                        case ApplyResult::unknown_resource:
                        case ApplyResult::io_error:
                            spdlog::warn("Could not apply {}: {}", entry.name, to_string(result));
                            ++cycle->report.failed;
                            break;
                    }
                }
                step_done(cycle, "Downloaded " + entry.friendly_name);
                pull(cycle, index + 1);
            });
}

void SyncEngine::step_done(const std::shared_ptr<Cycle>& cycle, const std::string& detail) {
    ++cycle->completed_steps;
    progress(static_cast<double>(cycle->completed_steps) / cycle->total_steps, detail);
}

void SyncEngine::finish(const std::shared_ptr<Cycle>& cycle, std::error_code ec) {
    auto& report = cycle->report;
    report.error = ec;
    in_flight_ = false;

    if (ec) {
        if (ec != errc::cancelled) {
            spdlog::warn("Sync aborted: {}", ec.message());
        }
        if (cycle->generation == generation_ && running_) {
            // The channel is gone; the next start() resumes the loop.
            running_ = false;
            ++generation_;
            loop_timer_.cancel();
            debounce_timer_.cancel();
        }
        progress(1.0, "Sync interrupted");
    } else if (!report.skipped) {
        spdlog::info("Sync complete: {} pushed, {} rejected, {} pulled, {} skipped, {} failed",
                     report.pushed, report.push_rejected, report.pulled, report.pull_skipped,
                     report.failed);
        progress(1.0, "Sync complete");
    } else {
        progress(1.0, "Up to date");
    }

    if (report.pulled > 0 && on_data_changed_) on_data_changed_();
    if (on_cycle_) on_cycle_(report);
    if (cycle->done) cycle->done(report);

    schedule_next();
}

void SyncEngine::schedule_next() {
    if (!running_) return;

    loop_timer_.expires_after(options_.interval);
    const auto generation = generation_;
    std::weak_ptr<SyncEngine> weak = shared_from_this();
    loop_timer_.async_wait([weak, generation](std::error_code ec) {
        auto engine = weak.lock();
        if (ec || !engine || generation != engine->generation_ || !engine->running_) return;
        engine->run_cycle({});
    });
}

void SyncEngine::request(const std::string& type, Parameters parameters,
                         std::chrono::milliseconds timeout, ResponseHandler handler) {
    if (!executor_) {
        asio::post(strand_, [handler = std::move(handler)] {
            handler(make_error_code(errc::not_connected), Response{});
        });
        return;
    }
    auto strand = strand_;
    executor_(type, parameters, timeout,
              [strand, handler = std::move(handler)](std::error_code ec, Response response) mutable {
                  asio::post(strand, [handler = std::move(handler), ec,
                                      response = std::move(response)]() mutable {
                      handler(ec, std::move(response));
                  });
              });
}

bool SyncEngine::abandoned(const std::shared_ptr<Cycle>& cycle) {
    if (cycle->generation == generation_) return false;
    spdlog::debug("Sync cycle abandoned");
    finish(cycle, make_error_code(errc::cancelled));
    return true;
}

void SyncEngine::progress(double fraction, const std::string& detail) {
    if (on_progress_) on_progress_(fraction, detail);
}

} // namespace lumi
