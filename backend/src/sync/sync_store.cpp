/**
 * SyncStore: file-backed replica of the synced documents.
 *
 * Collections are stored as an envelope:
 *
 *   { "items": [ ... ], "updatedAt": "2026-01-31T12:00:00.250Z" }
 *
 * Flat maps (settings, API keys) are a plain JSON object with no timestamp.
 * Every write goes to "<name>.tmp" first and is renamed over the original.
 */

#include "sync/sync_store.h"

#include <spdlog/spdlog.h>

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace lumi {

using json = nlohmann::json;

namespace {

constexpr const char* kItems = "items";
constexpr const char* kUpdatedAt = "updatedAt";

std::uint64_t fnv1a(const std::string& data) {
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

bool valid_shape(const ResourceSpec& entry, const json& doc) {
    if (!doc.is_object()) return false;
    if (entry.kind == ResourceKind::collection) {
        auto it = doc.find(kItems);
        return it != doc.end() && it->is_array();
    }
    return true;
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace

const std::vector<ResourceSpec>& default_registry() {
    static const std::vector<ResourceSpec> registry = {
        {"agents.json", ResourceKind::collection, "Agents"},
        {"conversations.json", ResourceKind::collection, "Chats"},
        {"automations.json", ResourceKind::collection, "Automations"},
        {"sync_settings.json", ResourceKind::key_value, "Settings"},
        {"sync_api_keys.json", ResourceKind::key_value, "API Keys"},
        {"health_data.json", ResourceKind::collection, "Health Data"},
    };
    return registry;
}

std::string format_metadata(const ResourceMetadata& meta) {
    std::string out;
    if (meta.updated_at) out += "updatedAt:" + format_iso8601(*meta.updated_at) + "|";
    out += "digest:" + meta.digest + "|size:" + std::to_string(meta.size);
    return out;
}

std::optional<ResourceMetadata> parse_metadata(const std::string& text) {
    ResourceMetadata meta;
    bool have_digest = false;

    std::istringstream ss(text);
    std::string field;
    while (std::getline(ss, field, '|')) {
        // Split on the first ':' only, the timestamp has more.
        const auto colon = field.find(':');
        if (colon == std::string::npos) continue;
        const auto key = field.substr(0, colon);
        const auto value = field.substr(colon + 1);

        if (key == "updatedAt") {
            meta.updated_at = parse_iso8601(value);
            if (!meta.updated_at) return std::nullopt;
        } else if (key == "digest") {
            meta.digest = value;
            have_digest = true;
        } else if (key == "size") {
            try {
                meta.size = static_cast<std::size_t>(std::stoull(value));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    }
    if (!have_digest && !meta.updated_at) return std::nullopt;
    return meta;
}

const char* to_string(ApplyResult r) {
    switch (r) {
        case ApplyResult::applied:          return "applied";
        case ApplyResult::stale:            return "stale";
        case ApplyResult::unchanged:        return "unchanged";
        case ApplyResult::deferred:         return "deferred";
        case ApplyResult::invalid:          return "invalid";
        case ApplyResult::unknown_resource: return "unknown resource";
        case ApplyResult::io_error:         return "io error";
    }
    return "unknown";
}

std::optional<Timestamp> envelope_timestamp(const std::string& bytes) {
    const auto doc = json::parse(bytes, nullptr, false);
    if (!doc.is_object()) return std::nullopt;
    auto it = doc.find(kUpdatedAt);
    if (it == doc.end()) return std::nullopt;
    return parse_timestamp(*it);
}

std::string content_digest(const std::string& bytes) {
    const auto doc = json::parse(bytes, nullptr, false);
    const auto canonical = doc.is_discarded() ? bytes : doc.dump();
    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016" PRIx64, fnv1a(canonical));
    return hex;
}

// ── WriteGuard ──────────────────────────────────────────────────────────────

SyncStore::WriteGuard::WriteGuard(SyncStore* store, std::string name)
    : store_(store), name_(std::move(name)) {}

SyncStore::WriteGuard::WriteGuard(WriteGuard&& other) noexcept
    : store_(other.store_), name_(std::move(other.name_)) {
    other.store_ = nullptr;
}

SyncStore::WriteGuard& SyncStore::WriteGuard::operator=(WriteGuard&& other) noexcept {
    if (this != &other) {
        release();
        store_ = other.store_;
        name_ = std::move(other.name_);
        other.store_ = nullptr;
    }
    return *this;
}

SyncStore::WriteGuard::~WriteGuard() {
    release();
}

void SyncStore::WriteGuard::release() {
    if (store_) {
        store_->end_write(name_);
        store_ = nullptr;
    }
}

// ── SyncStore ───────────────────────────────────────────────────────────────

SyncStore::SyncStore(std::filesystem::path directory, std::vector<ResourceSpec> registry)
    : directory_(std::move(directory)), registry_(std::move(registry)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) spdlog::error("Cannot create data directory {}: {}", directory_.string(), ec.message());

    for (const auto& entry : registry_) {
        auto bytes = read_file(directory_ / entry.name);
        if (!bytes) continue;
        if (!valid_shape(entry, json::parse(*bytes, nullptr, false))) {
            spdlog::warn("Ignoring unreadable {}", entry.name);
            continue;
        }
        documents_[entry.name] = std::move(*bytes);
    }
    spdlog::info("Sync store at {} ({} of {} resources present)",
                 directory_.string(), documents_.size(), registry_.size());
}

const ResourceSpec* SyncStore::find(const std::string& name) const {
    for (const auto& entry : registry_) {
        if (entry.name == name) return &entry;
    }
    return nullptr;
}

std::optional<std::string> SyncStore::read(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(name);
    if (it == documents_.end()) return std::nullopt;
    return it->second;
}

std::optional<ResourceMetadata> SyncStore::metadata(const std::string& name) const {
    const auto* entry = find(name);
    auto bytes = read(name);
    if (!entry || !bytes) return std::nullopt;

    ResourceMetadata meta;
    if (entry->kind == ResourceKind::collection) meta.updated_at = envelope_timestamp(*bytes);
    meta.digest = content_digest(*bytes);
    meta.size = bytes->size();
    return meta;
}

std::optional<Timestamp> SyncStore::updated_at(const std::string& name) const {
    auto bytes = read(name);
    if (!bytes) return std::nullopt;
    return envelope_timestamp(*bytes);
}

std::optional<std::string> SyncStore::digest(const std::string& name) const {
    auto bytes = read(name);
    if (!bytes) return std::nullopt;
    return content_digest(*bytes);
}

ApplyResult SyncStore::apply_remote(const std::string& name, const std::string& bytes,
                                    bool reject_stale) {
    const auto* entry = find(name);
    if (!entry) return ApplyResult::unknown_resource;

    const auto doc = json::parse(bytes, nullptr, false);
    if (!valid_shape(*entry, doc)) {
        spdlog::warn("Rejecting malformed {} ({} bytes)", name, bytes.size());
        return ApplyResult::invalid;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (reject_stale && entry->kind == ResourceKind::collection) {
        auto it = documents_.find(name);
        if (it != documents_.end()) {
            const auto ours = envelope_timestamp(it->second);
            const auto theirs = envelope_timestamp(bytes);
            if (ours && (!theirs || *theirs < *ours)) {
                spdlog::info("Refusing stale {}", name);
                return ApplyResult::stale;
            }
        }
    }

    if (!persist_locked(name, bytes)) return ApplyResult::io_error;
    spdlog::debug("Applied remote {} ({} bytes)", name, bytes.size());
    return ApplyResult::applied;
}

ApplyResult SyncStore::apply_if_newer(const std::string& name, const std::string& bytes) {
    const auto* entry = find(name);
    if (!entry) return ApplyResult::unknown_resource;

    const auto doc = json::parse(bytes, nullptr, false);
    if (!valid_shape(*entry, doc)) {
        spdlog::warn("Rejecting malformed {} ({} bytes)", name, bytes.size());
        return ApplyResult::invalid;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto writer = writers_.find(name);
    if (writer != writers_.end() && writer->second > 0) return ApplyResult::deferred;

    auto it = documents_.find(name);
    if (it != documents_.end()) {
        if (entry->kind == ResourceKind::collection) {
            const auto ours = envelope_timestamp(it->second);
            const auto theirs = envelope_timestamp(bytes);
            if (!theirs || (ours && *theirs <= *ours)) return ApplyResult::unchanged;
        } else if (content_digest(it->second) == content_digest(bytes)) {
            return ApplyResult::unchanged;
        }
    }

    if (!persist_locked(name, bytes)) return ApplyResult::io_error;
    spdlog::debug("Pulled {} ({} bytes)", name, bytes.size());
    return ApplyResult::applied;
}

bool SyncStore::mutate_collection(const std::string& name,
                                  const std::function<void(json& items)>& edit) {
    const auto* entry = find(name);
    if (!entry || entry->kind != ResourceKind::collection) return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        json doc = json::object();
        std::optional<Timestamp> previous;
        auto it = documents_.find(name);
        if (it != documents_.end()) {
            doc = json::parse(it->second, nullptr, false);
            if (!valid_shape(*entry, doc)) doc = json::object();
            previous = envelope_timestamp(it->second);
        }
        if (!doc.contains(kItems)) doc[kItems] = json::array();

        edit(doc[kItems]);

        auto stamp = now_ms();
        if (previous && stamp <= *previous) stamp = *previous + std::chrono::milliseconds(1);
        doc[kUpdatedAt] = format_iso8601(stamp);

        if (!persist_locked(name, doc.dump(2))) return false;
    }
    notify(name);
    return true;
}

bool SyncStore::set_value(const std::string& name, const std::string& key, const json& value) {
    const auto* entry = find(name);
    if (!entry || entry->kind != ResourceKind::key_value) return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        json doc = json::object();
        auto it = documents_.find(name);
        if (it != documents_.end()) {
            doc = json::parse(it->second, nullptr, false);
            if (!doc.is_object()) doc = json::object();
        }
        doc[key] = value;
        if (!persist_locked(name, doc.dump(2))) return false;
    }
    notify(name);
    return true;
}

SyncStore::WriteGuard SyncStore::begin_write(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++writers_[name];
    return WriteGuard(this, name);
}

bool SyncStore::write_in_progress(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = writers_.find(name);
    return it != writers_.end() && it->second > 0;
}

void SyncStore::add_change_listener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void SyncStore::end_write(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = writers_.find(name);
    if (it == writers_.end()) return;
    if (--it->second <= 0) writers_.erase(it);
}

void SyncStore::notify(const std::string& name) {
    std::vector<ChangeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) listener(name);
}

bool SyncStore::persist_locked(const std::string& name, const std::string& bytes) {
    const auto path = directory_ / name;
    const auto tmp = path.string() + ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            spdlog::error("Cannot write {}", tmp);
            return false;
        }
        file << bytes;
        if (!file) {
            spdlog::error("Short write to {}", tmp);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        spdlog::error("Cannot replace {}: {}", path.string(), ec.message());
        return false;
    }
    documents_[name] = bytes;
    return true;
}

} // namespace lumi
