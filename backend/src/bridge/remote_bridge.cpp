#include "bridge/remote_bridge.h"

#include "protocol/errors.h"

#include <spdlog/spdlog.h>

namespace lumi {

RemoteBridge::RemoteBridge() : state_(std::make_shared<State>()) {}

void RemoteBridge::attach(CommandExecutor executor) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->executor = std::move(executor);
    }
    if (!available_.exchange(true)) {
        spdlog::info("Remote tools available");
        publish(true);
    }
}

void RemoteBridge::detach() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->executor = nullptr;
    }
    if (available_.exchange(false)) {
        spdlog::info("Remote tools unavailable");
        publish(false);
    }
}

void RemoteBridge::execute(const std::string& type, const Parameters& parameters,
                           std::chrono::milliseconds timeout, ResponseHandler handler) const {
    CommandExecutor executor;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        executor = state_->executor;
    }
    if (!executor) {
        handler(make_error_code(errc::not_connected), Response{});
        return;
    }
    executor(type, parameters, timeout, std::move(handler));
}

CommandExecutor RemoteBridge::executor() const {
    std::weak_ptr<State> weak = state_;
    return [weak](const std::string& type, const Parameters& parameters,
                  std::chrono::milliseconds timeout, ResponseHandler handler) {
        CommandExecutor executor;
        if (auto state = weak.lock()) {
            std::lock_guard<std::mutex> lock(state->mutex);
            executor = state->executor;
        }
        if (!executor) {
            handler(make_error_code(errc::not_connected), Response{});
            return;
        }
        executor(type, parameters, timeout, std::move(handler));
    };
}

void RemoteBridge::set_on_availability(AvailabilityHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_availability_ = std::move(handler);
}

void RemoteBridge::publish(bool available) {
    AvailabilityHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = on_availability_;
    }
    if (handler) handler(available);
}

} // namespace lumi
