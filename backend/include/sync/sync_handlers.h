#pragma once

#include "dispatch/command_dispatcher.h"
#include "sync/sync_store.h"

namespace lumi {

/**
 * Host-side answers to the sync commands, backed by `store`:
 *
 *   get_sync_metadata {file}        -> "updatedAt:..|digest:..|size:.."
 *   get_sync_data {file}            -> same, plus a fileBlob payload
 *   push_sync_data {file, data}     -> applied unless older than ours
 *
 * `store` must outlive the dispatcher.
 */
void register_sync_handlers(CommandDispatcher& dispatcher, SyncStore& store);

} // namespace lumi
