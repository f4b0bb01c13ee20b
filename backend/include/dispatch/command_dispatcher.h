#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "auth/approval_gate.h"
#include "protocol/messages.h"

namespace lumi {

/// What the dispatcher knows about the connection a command came in on.
struct SessionContext {
    std::string address;
    std::string device_name;
    bool approved = false;
};

/**
 * Server-side routing of decoded commands to handlers.
 *
 * Every command gets exactly one Response with its id: handlers reply
 * through a callback that ignores second calls, unknown types get a
 * failure, and a handler that throws produces a failure too.
 * Before the session is approved only the "ping" probe is serviced.
 * Approval is re-checked on every command, so resetting the paired
 * devices locks out sessions that are already open.
 */
class CommandDispatcher {
public:
    using Reply = std::function<void(Response)>;
    using Handler = std::function<void(const Command&, Reply)>;

    explicit CommandDispatcher(ApprovalGate& gate);

    /// Register (or replace) the handler for one command type.
    void register_handler(const std::string& type, Handler handler);

    /// Handler for every type without its own; unset means "unknown command".
    void set_fallback(Handler handler);

    [[nodiscard]] bool has_handler(const std::string& type) const;

    /// `context` is owned by the calling session and updated on approval.
    void dispatch(SessionContext& context, const Command& command, Reply reply);

private:
    void handle_probe(SessionContext& context, const Command& command, const Reply& reply);

    ApprovalGate& gate_;
    mutable std::mutex mutex_;
    std::map<std::string, Handler> handlers_;
    Handler fallback_;
};

} // namespace lumi
