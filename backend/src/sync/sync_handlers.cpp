#include "sync/sync_handlers.h"

#include "protocol/commands.h"
#include "util/base64.h"

#include <spdlog/spdlog.h>

namespace lumi {

namespace {

/// Validate the "file" parameter; replies and returns false when unusable.
bool resolve_file(const SyncStore& store, const Command& command,
                  const CommandDispatcher::Reply& reply, std::string& file) {
    file = command.param("file");
    if (file.empty()) {
        reply(Response::failure(command.id, "missing parameter: file"));
        return false;
    }
    if (!store.find(file)) {
        reply(Response::failure(command.id, "unknown resource: " + file));
        return false;
    }
    return true;
}

void handle_metadata(SyncStore& store, const Command& command, CommandDispatcher::Reply reply) {
    std::string file;
    if (!resolve_file(store, command, reply, file)) return;

    auto meta = store.metadata(file);
    if (!meta) {
        reply(Response::failure(command.id, "not found", "no sync data for " + file));
        return;
    }
    reply(Response::ok(command.id, format_metadata(*meta)));
}

void handle_data(SyncStore& store, const Command& command, CommandDispatcher::Reply reply) {
    std::string file;
    if (!resolve_file(store, command, reply, file)) return;

    auto bytes = store.read(file);
    auto meta = store.metadata(file);
    if (!bytes || !meta) {
        reply(Response::failure(command.id, "not found", "no sync data for " + file));
        return;
    }

    spdlog::debug("Serving {} ({} bytes)", file, bytes->size());
    auto response = Response::ok(command.id, format_metadata(*meta));
    response.payload = FileBlobPayload{std::move(*bytes)};
    reply(std::move(response));
}

void handle_push(SyncStore& store, const Command& command, CommandDispatcher::Reply reply) {
    std::string file;
    if (!resolve_file(store, command, reply, file)) return;

    auto bytes = base64_decode(command.param("data"));
    if (!bytes) {
        reply(Response::failure(command.id, "invalid data", "data is not valid base64"));
        return;
    }

    switch (store.apply_remote(file, *bytes, /*reject_stale=*/true)) {
        case ApplyResult::applied:
            spdlog::info("Received {} ({} bytes)", file, bytes->size());
            reply(Response::ok(command.id, "saved " + file));
            break;
        case ApplyResult::stale:
            reply(Response::failure(command.id, "stale data",
                                    "stale data for " + file + ", host copy is newer"));
            break;
        case ApplyResult::invalid:
            reply(Response::failure(command.id, "invalid data", "malformed document for " + file));
            break;
        case ApplyResult::unknown_resource:
            reply(Response::failure(command.id, "unknown resource: " + file));
            break;
        case ApplyResult::io_error:
        case ApplyResult::unchanged:
        case ApplyResult::deferred:
            reply(Response::failure(command.id, "write failed", "could not save " + file));
            break;
    }
}

} // namespace

void register_sync_handlers(CommandDispatcher& dispatcher, SyncStore& store) {
    dispatcher.register_handler(kGetSyncMetadata, [&store](const Command& c, CommandDispatcher::Reply r) {
        handle_metadata(store, c, std::move(r));
    });
    dispatcher.register_handler(kGetSyncData, [&store](const Command& c, CommandDispatcher::Reply r) {
        handle_data(store, c, std::move(r));
    });
    dispatcher.register_handler(kPushSyncData, [&store](const Command& c, CommandDispatcher::Reply r) {
        handle_push(store, c, std::move(r));
    });
}

} // namespace lumi
