#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "util/timestamp.h"

namespace lumi {

/// A first-time connection waiting for the operator.
struct PendingApproval {
    std::string id;
    std::string device_name;
    std::string address;
    Timestamp created_at;
};

/// How long an unanswered request stays queued: a companion's whole probing
/// window (60 probes a second apart) with some slack.
constexpr std::chrono::milliseconds kDefaultApprovalWindow{65000};

enum class ApprovalStatus {
    approved,
    pending,   // queued (or still queued) for the operator
    rejected,  // operator said no; reported once, then forgotten
};

/**
 * Operator-approval queue for devices connecting for the first time.
 *
 * check() is called for every probe; accept()/reject() are called by
 * whatever surface the operator uses. A request nobody answers within
 * the approval window is dropped; by then the device has stopped asking.
 * All methods are thread-safe and never block on I/O other than the
 * approved-devices file.
 */
class ApprovalGate {
public:
    using RequestCallback = std::function<void(const PendingApproval&)>;

    /// `store_path` empty keeps approvals in memory only.
    explicit ApprovalGate(std::filesystem::path store_path = {},
                          std::chrono::milliseconds approval_window = kDefaultApprovalWindow);

    /// Decide for one probe; enqueues unknown devices.
    ApprovalStatus check(const std::string& device_name, const std::string& address);

    bool accept(const std::string& id);
    bool reject(const std::string& id);

    /// Requests still inside the approval window.
    [[nodiscard]] std::vector<PendingApproval> pending();
    [[nodiscard]] std::vector<std::string> approved_devices() const;
    [[nodiscard]] bool is_approved(const std::string& device_name) const;

    /// Forget every paired device; they must be approved again.
    void reset_paired_devices();

    /// Fired (outside the lock) whenever a new request is queued.
    void set_on_request(RequestCallback cb);

    bool load();

private:
    bool save_locked() const;
    void expire_locked();

    std::filesystem::path store_path_;
    std::chrono::milliseconds approval_window_;
    mutable std::mutex mutex_;
    std::set<std::string> approved_;
    std::map<std::string, PendingApproval> pending_;  // by id
    std::set<std::string> rejected_;                  // device names
    RequestCallback on_request_;
};

} // namespace lumi
