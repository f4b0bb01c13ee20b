#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sync/sync_store.h"

using namespace lumi;
using json = nlohmann::json;

#define FAIL()                                                       \
    do {                                                             \
        std::cerr << "sync_store_test failed at " << __FILE__ << ":" \
                  << __LINE__ << "\n";                               \
        return 1;                                                    \
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

std::string envelope(const std::string& updated_at, const json& items) {
    return json{{"items", items}, {"updatedAt", updated_at}}.dump();
}

}  // namespace

int main() {
    const auto dir = TempDir("lumi_sync_store_test");

    {
        SyncStore store(dir);
        assert(store.registry().size() == 6);
        assert(store.find("agents.json") && store.find("agents.json")->friendly_name == "Agents");
        assert(store.find("sync_api_keys.json")->kind == ResourceKind::key_value);
        assert(!store.find("passwords.txt"));

        // Never created.
        assert(!store.read("agents.json"));
        assert(!store.metadata("agents.json"));

        std::vector<std::string> changed;
        store.add_change_listener([&](const std::string& name) { changed.push_back(name); });

        // Local edit: envelope created, listener told, file on disk.
        if (!store.mutate_collection("agents.json", [](json& items) {
                items.push_back({{"id", "a1"}, {"name", "Researcher"}});
            })) {
            FAIL();
        }
        assert(changed.size() == 1 && changed[0] == "agents.json");
        assert(std::filesystem::exists(dir / "agents.json"));
        assert(!std::filesystem::exists(dir / "agents.json.tmp"));
        const auto first = store.updated_at("agents.json");
        assert(first.has_value());

        // updatedAt strictly increases, even within one millisecond.
        store.mutate_collection("agents.json", [](json& items) { items.push_back({{"id", "a2"}}); });
        store.mutate_collection("agents.json", [](json& items) { items.push_back({{"id", "a3"}}); });
        const auto third = store.updated_at("agents.json");
        assert(third && *third >= *first + std::chrono::milliseconds(2));
        assert(json::parse(*store.read("agents.json")).at("items").size() == 3);

        // Flat maps have no timestamp.
        assert(store.set_value("sync_settings.json", "theme", "dark"));
        assert(!store.updated_at("sync_settings.json"));
        auto meta = store.metadata("sync_settings.json");
        assert(meta && !meta->updated_at && !meta->digest.empty());
        assert(!store.set_value("agents.json", "k", 1));
        assert(!store.mutate_collection("sync_settings.json", [](json&) {}));
        assert(changed.size() == 4);

        // Remote data never notifies.
        const auto newer = envelope("2099-01-01T00:00:00.000Z", json::array({{{"id", "r1"}}}));
        assert(store.apply_remote("agents.json", newer, true) == ApplyResult::applied);
        assert(changed.size() == 4);
        assert(*store.read("agents.json") == newer);

        // Older incoming copy is refused when asked to.
        const auto older = envelope("2000-01-01T00:00:00.000Z", json::array());
        assert(store.apply_remote("agents.json", older, true) == ApplyResult::stale);
        assert(*store.read("agents.json") == newer);
        assert(store.apply_remote("agents.json", older, false) == ApplyResult::applied);

        // Shape checks.
        assert(store.apply_remote("agents.json", "not json", false) == ApplyResult::invalid);
        assert(store.apply_remote("agents.json", "{\"items\":5}", false) == ApplyResult::invalid);
        assert(store.apply_remote("sync_api_keys.json", "[1,2]", false) == ApplyResult::invalid);
        assert(store.apply_remote("nope.json", "{}", false) == ApplyResult::unknown_resource);

        // Write guards nest.
        assert(!store.write_in_progress("conversations.json"));
        {
            auto g1 = store.begin_write("conversations.json");
            {
                auto g2 = store.begin_write("conversations.json");
                assert(store.write_in_progress("conversations.json"));
            }
            assert(store.write_in_progress("conversations.json"));
            auto moved = std::move(g1);
            assert(store.write_in_progress("conversations.json"));
        }
        assert(!store.write_in_progress("conversations.json"));
    }

    // Reload from disk.
    {
        SyncStore store(dir);
        assert(store.read("agents.json").has_value());
        assert(json::parse(*store.read("sync_settings.json")).at("theme") == "dark");
    }

    // Numeric updatedAt from older documents.
    {
        std::ofstream(dir / "health_data.json") << R"({"items":[],"updatedAt":0})";
        SyncStore store(dir);
        auto ts = store.updated_at("health_data.json");
        assert(ts && format_iso8601(*ts) == "2001-01-01T00:00:00.000Z");
    }

    // Pulled copies only replace ours when they are newer.
    {
        SyncStore store(dir / "pulled");
        const auto remote = envelope("2026-01-02T00:00:00.000Z", json::array({{{"id", "remote"}}}));

        // Nothing local yet: taken as is.
        assert(store.apply_if_newer("agents.json", remote) == ApplyResult::applied);
        assert(*store.read("agents.json") == remote);
        assert(store.apply_if_newer("agents.json", remote) == ApplyResult::unchanged);

        // A local edit made after the remote copy was fetched survives it.
        assert(store.mutate_collection("agents.json", [](json& items) { items.push_back({{"id", "local"}}); }));
        const auto edited = *store.read("agents.json");
        if (store.apply_if_newer("agents.json", remote) != ApplyResult::unchanged) FAIL();
        assert(*store.read("agents.json") == edited);
        assert(*store.updated_at("agents.json") > *envelope_timestamp(remote));

        // An undated copy never replaces a dated one.
        assert(store.apply_if_newer("agents.json", R"({"items":[]})") == ApplyResult::unchanged);

        const auto later = envelope("2099-01-01T00:00:00.000Z", json::array());
        assert(store.apply_if_newer("agents.json", later) == ApplyResult::applied);

        // Flat maps compare by content.
        assert(store.set_value("sync_api_keys.json", "openai", "sk-1"));
        const auto same = *store.read("sync_api_keys.json");
        assert(store.apply_if_newer("sync_api_keys.json", same) == ApplyResult::unchanged);
        assert(store.apply_if_newer("sync_api_keys.json", R"({"openai":"sk-2"})") == ApplyResult::applied);

        // Busy resources are left alone, bad input is refused.
        {
            auto guard = store.begin_write("conversations.json");
            assert(store.apply_if_newer("conversations.json", remote) == ApplyResult::deferred);
            assert(!store.read("conversations.json"));
        }
        assert(store.apply_if_newer("conversations.json", "{") == ApplyResult::invalid);
        assert(store.apply_if_newer("nope.json", "{}") == ApplyResult::unknown_resource);
    }

    // Metadata text and digests.
    {
        ResourceMetadata meta;
        meta.updated_at = parse_iso8601("2026-03-01T10:20:30.400Z");
        meta.digest = "00ff00ff00ff00ff";
        meta.size = 1234;
        const auto text = format_metadata(meta);
        assert(text == "updatedAt:2026-03-01T10:20:30.400Z|digest:00ff00ff00ff00ff|size:1234");
        auto back = parse_metadata(text);
        if (!back) FAIL();
        assert(back->updated_at == meta.updated_at && back->digest == meta.digest && back->size == 1234);

        meta.updated_at.reset();
        assert(format_metadata(meta) == "digest:00ff00ff00ff00ff|size:1234");
        assert(!parse_metadata("garbage"));

        // Key order and whitespace do not change the digest.
        assert(content_digest(R"({"a":1,"b":2})") == content_digest("{ \"b\": 2,\n \"a\": 1 }"));
        assert(content_digest(R"({"a":1})") != content_digest(R"({"a":2})"));
        assert(content_digest("x").size() == 16);
    }

    std::cout << "sync_store_test passed\n";
    return 0;
}
