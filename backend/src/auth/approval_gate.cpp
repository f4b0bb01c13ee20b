/**
 * ApprovalGate: first-connection confirmation on the host.
 *
 * Approved device names are persisted as a JSON array so pairing survives
 * a restart:
 *
 *   { "approved": ["Alice's iPhone", ...] }
 */

#include "auth/approval_gate.h"

#include "util/uuid.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace lumi {

using json = nlohmann::json;

ApprovalGate::ApprovalGate(std::filesystem::path store_path,
                           std::chrono::milliseconds approval_window)
    : store_path_(std::move(store_path)), approval_window_(approval_window) {
    if (!store_path_.empty()) load();
}

ApprovalStatus ApprovalGate::check(const std::string& device_name, const std::string& address) {
    PendingApproval queued;
    RequestCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (approved_.count(device_name)) return ApprovalStatus::approved;

        if (rejected_.erase(device_name)) {
            spdlog::info("Refusing '{}' from {}: rejected by operator", device_name, address);
            return ApprovalStatus::rejected;
        }

        expire_locked();
        for (const auto& [id, req] : pending_) {
            if (req.device_name == device_name) return ApprovalStatus::pending;
        }

        queued.id = generate_uuid();
        queued.device_name = device_name;
        queued.address = address;
        queued.created_at = now_ms();
        pending_.emplace(queued.id, queued);
        cb = on_request_;
    }

    spdlog::info("New connection request from '{}' ({}), id {}", device_name, address, queued.id);
    if (cb) cb(queued);
    return ApprovalStatus::pending;
}

bool ApprovalGate::accept(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    expire_locked();
    auto it = pending_.find(id);
    if (it == pending_.end()) return false;

    spdlog::info("Approved '{}'", it->second.device_name);
    approved_.insert(it->second.device_name);
    rejected_.erase(it->second.device_name);
    pending_.erase(it);
    if (!save_locked()) spdlog::warn("Approval of device not persisted");
    return true;
}

bool ApprovalGate::reject(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    expire_locked();
    auto it = pending_.find(id);
    if (it == pending_.end()) return false;

    spdlog::info("Rejected '{}'", it->second.device_name);
    rejected_.insert(it->second.device_name);
    pending_.erase(it);
    return true;
}

std::vector<PendingApproval> ApprovalGate::pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    expire_locked();
    std::vector<PendingApproval> out;
    out.reserve(pending_.size());
    for (const auto& [id, req] : pending_) out.push_back(req);
    return out;
}

std::vector<std::string> ApprovalGate::approved_devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {approved_.begin(), approved_.end()};
}

bool ApprovalGate::is_approved(const std::string& device_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return approved_.count(device_name) != 0;
}

void ApprovalGate::reset_paired_devices() {
    std::lock_guard<std::mutex> lock(mutex_);
    approved_.clear();
    spdlog::info("Paired devices reset");
    if (!save_locked()) spdlog::warn("Paired device reset not persisted");
}

void ApprovalGate::set_on_request(RequestCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_request_ = std::move(cb);
}

bool ApprovalGate::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (store_path_.empty()) return false;

    std::ifstream file(store_path_);
    if (!file.is_open()) return false;

    try {
        const auto doc = json::parse(file);
        for (const auto& name : doc.at("approved")) {
            approved_.insert(name.get<std::string>());
        }
    } catch (const json::exception& e) {
        spdlog::error("Cannot read approved devices from {}: {}", store_path_.string(), e.what());
        return false;
    }
    spdlog::info("Loaded {} approved device(s)", approved_.size());
    return true;
}

void ApprovalGate::expire_locked() {
    const auto cutoff = now_ms() - approval_window_;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.created_at < cutoff) {
            spdlog::info("Connection request from '{}' expired unanswered", it->second.device_name);
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
}

bool ApprovalGate::save_locked() const {
    if (store_path_.empty()) return true;

    std::error_code ec;
    if (store_path_.has_parent_path()) {
        std::filesystem::create_directories(store_path_.parent_path(), ec);
    }

    const auto tmp = store_path_.string() + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::error("Cannot write {}", tmp);
            return false;
        }
        file << json{{"approved", approved_}}.dump(2);
        if (!file) return false;
    }
    std::filesystem::rename(tmp, store_path_, ec);
    if (ec) {
        spdlog::error("Cannot replace {}: {}", store_path_.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace lumi
