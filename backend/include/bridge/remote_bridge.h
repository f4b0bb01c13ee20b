#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "protocol/messages.h"

namespace lumi {

/**
 * Hands an authorized session to the agent runtime as a plain
 * "run this command remotely" function. Knows nothing about what the
 * commands mean.
 *
 * attach() is called once the approval handshake has succeeded, detach()
 * as soon as the session is lost. While detached every call completes
 * with errc::not_connected.
 */
class RemoteBridge {
public:
    using AvailabilityHandler = std::function<void(bool available)>;

    RemoteBridge();

    void attach(CommandExecutor executor);
    void detach();

    [[nodiscard]] bool is_available() const { return available_.load(); }

    void execute(const std::string& type, const Parameters& parameters,
                 std::chrono::milliseconds timeout, ResponseHandler handler) const;

    /// A CommandExecutor that routes through this bridge; safe to keep
    /// across attach/detach.
    [[nodiscard]] CommandExecutor executor() const;

    void set_on_availability(AvailabilityHandler handler);

private:
    struct State {
        std::mutex mutex;
        CommandExecutor executor;
    };

    void publish(bool available);

    std::shared_ptr<State> state_;
    std::atomic<bool> available_{false};

    std::mutex handler_mutex_;
    AvailabilityHandler on_availability_;
};

} // namespace lumi
