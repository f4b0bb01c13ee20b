#pragma once

namespace lumi {

// Command types the protocol layer itself understands. Everything else is
// opaque and goes to whoever registered a handler for it.

/// Approval probe; parameter "device_name".
constexpr char kProbeCommand[] = "ping";

/// Parameter "file"; replies "updatedAt:<iso>|digest:<hex>|size:<n>".
constexpr char kGetSyncMetadata[] = "get_sync_metadata";

/// Parameter "file"; same result plus a fileBlob payload.
constexpr char kGetSyncData[] = "get_sync_data";

/// Parameters "file" and "data" (base64 document).
constexpr char kPushSyncData[] = "push_sync_data";

/// Error text a host uses while the operator has not decided yet.
constexpr char kAwaitingApproval[] = "awaiting approval";

constexpr char kRejectedByHost[] = "connection rejected by host";

/// Error text sent in place of a reply that would not fit in one frame.
constexpr char kResponseTooLarge[] = "response too large";

} // namespace lumi
