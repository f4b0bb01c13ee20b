#include "dispatch/command_dispatcher.h"

#include "protocol/commands.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <exception>
#include <memory>

namespace lumi {

namespace {

/// Wrap `reply` so only the first call goes through.
CommandDispatcher::Reply once(CommandDispatcher::Reply reply, std::string id) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    return [reply = std::move(reply), done, id = std::move(id)](Response response) {
        if (done->exchange(true)) {
            spdlog::warn("Handler replied twice to {}, dropping the second reply", id);
            return;
        }
        response.id = id;
        reply(std::move(response));
    };
}

} // namespace

CommandDispatcher::CommandDispatcher(ApprovalGate& gate) : gate_(gate) {}

void CommandDispatcher::register_handler(const std::string& type, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[type] = std::move(handler);
}

void CommandDispatcher::set_fallback(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    fallback_ = std::move(handler);
}

bool CommandDispatcher::has_handler(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(type) != 0;
}

void CommandDispatcher::dispatch(SessionContext& context, const Command& command, Reply reply) {
    auto respond = once(std::move(reply), command.id);

    if (command.type == kProbeCommand) {
        handle_probe(context, command, respond);
        return;
    }

    if (context.approved && !gate_.is_approved(context.device_name)) {
        spdlog::info("'{}' is no longer paired, revoking its session", context.device_name);
        context.approved = false;
    }

    if (!context.approved) {
        spdlog::warn("Refusing '{}' from unapproved {}", command.type, context.address);
        respond(Response::failure(command.id, "unauthorized: device not approved"));
        return;
    }

    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(command.type);
        if (it != handlers_.end()) {
            handler = it->second;
        } else {
            handler = fallback_;
        }
    }

    if (!handler) {
        spdlog::warn("Unknown command '{}' from {}", command.type, context.device_name);
        respond(Response::failure(command.id, "unknown command: " + command.type));
        return;
    }

    try {
        handler(command, respond);
    } catch (const std::exception& e) {
        spdlog::error("Handler for '{}' threw: {}", command.type, e.what());
        respond(Response::failure(command.id, std::string("internal error: ") + e.what()));
    }
}

void CommandDispatcher::handle_probe(SessionContext& context, const Command& command,
                                     const Reply& reply) {
    auto name = command.param("device_name");
    if (name.empty()) name = "Unknown device";

    switch (gate_.check(name, context.address)) {
        case ApprovalStatus::approved:
            if (!context.approved) {
                spdlog::info("Session from {} approved as '{}'", context.address, name);
            }
            context.approved = true;
            context.device_name = name;
            reply(Response::ok(command.id, "pong"));
            break;
        case ApprovalStatus::pending:
            reply(Response::failure(command.id, kAwaitingApproval));
            break;
        case ApprovalStatus::rejected:
            reply(Response::failure(command.id, kRejectedByHost));
            break;
    }
}

} // namespace lumi
