#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "util/timestamp.h"

namespace lumi {

enum class ResourceKind {
    collection,  // { "items": [...], "updatedAt": ... }
    key_value,   // flat { key: value }, no timestamp
};

struct ResourceSpec {
    std::string name;
    ResourceKind kind = ResourceKind::collection;
    std::string friendly_name;
};

/// The fixed set of documents the companion app keeps in sync.
const std::vector<ResourceSpec>& default_registry();

struct ResourceMetadata {
    std::optional<Timestamp> updated_at;  // collections only
    std::string digest;                   // hex FNV-1a of the canonical JSON
    std::size_t size = 0;
};

/// "updatedAt:<iso>|digest:<hex>|size:<n>"; updatedAt omitted for flat maps.
std::string format_metadata(const ResourceMetadata& meta);
std::optional<ResourceMetadata> parse_metadata(const std::string& text);

enum class ApplyResult {
    applied,
    stale,             // incoming collection is older than ours
    unchanged,         // pulled copy is not newer (or identical)
    deferred,          // a local write is in progress
    invalid,           // not JSON, or not the shape the resource needs
    unknown_resource,
    io_error,
};

const char* to_string(ApplyResult r);

/**
 * Local replica of the sync registry, one JSON file per resource.
 *
 * Local edits go through mutate_collection()/set_value(): they bump the
 * collection's updatedAt (strictly increasing) and notify change
 * listeners. Data arriving from the peer goes through apply_remote() and
 * never notifies, so a pull cannot trigger another push.
 *
 * Thread-safe.
 */
class SyncStore {
public:
    using ChangeListener = std::function<void(const std::string& resource)>;

    /// Marks a resource as being written locally (e.g. a reply still
    /// streaming into a conversation). Pulls skip it while any guard lives.
    class WriteGuard {
    public:
        WriteGuard() = default;
        WriteGuard(SyncStore* store, std::string name);
        WriteGuard(WriteGuard&& other) noexcept;
        WriteGuard& operator=(WriteGuard&& other) noexcept;
        WriteGuard(const WriteGuard&) = delete;
        WriteGuard& operator=(const WriteGuard&) = delete;
        ~WriteGuard();

        void release();

    private:
        SyncStore* store_ = nullptr;
        std::string name_;
    };

    explicit SyncStore(std::filesystem::path directory,
                       std::vector<ResourceSpec> registry = default_registry());

    [[nodiscard]] const std::vector<ResourceSpec>& registry() const { return registry_; }
    [[nodiscard]] const ResourceSpec* find(const std::string& name) const;
    [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }

    /// Raw document bytes, empty if the resource was never created.
    [[nodiscard]] std::optional<std::string> read(const std::string& name) const;
    [[nodiscard]] std::optional<ResourceMetadata> metadata(const std::string& name) const;
    [[nodiscard]] std::optional<Timestamp> updated_at(const std::string& name) const;
    [[nodiscard]] std::optional<std::string> digest(const std::string& name) const;

    /// Replace a resource with a document received from the peer.
    /// With `reject_stale`, an older collection is refused.
    ApplyResult apply_remote(const std::string& name, const std::string& bytes, bool reject_stale);

    /// Take a pulled document only if it beats ours: a newer updatedAt for
    /// collections, different content for flat maps. Decided and written
    /// under one lock, so a local edit can never be overwritten by an
    /// older copy that was compared before the edit landed.
    ApplyResult apply_if_newer(const std::string& name, const std::string& bytes);

    /// Local edit of a collection's items. Creates the envelope if missing.
    bool mutate_collection(const std::string& name,
                           const std::function<void(nlohmann::json& items)>& edit);

    /// Local edit of one key in a flat map.
    bool set_value(const std::string& name, const std::string& key, const nlohmann::json& value);

    [[nodiscard]] WriteGuard begin_write(const std::string& name);
    [[nodiscard]] bool write_in_progress(const std::string& name) const;

    void add_change_listener(ChangeListener listener);

private:
    bool persist_locked(const std::string& name, const std::string& bytes);
    void notify(const std::string& name);
    void end_write(const std::string& name);

    std::filesystem::path directory_;
    std::vector<ResourceSpec> registry_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> documents_;
    std::map<std::string, int> writers_;
    std::vector<ChangeListener> listeners_;
};

/// Envelope timestamp of a collection document, if it has one.
std::optional<Timestamp> envelope_timestamp(const std::string& bytes);

/// Hex FNV-1a 64 of the document's canonical form (sorted keys, compact).
std::string content_digest(const std::string& bytes);

} // namespace lumi
