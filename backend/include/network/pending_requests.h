#pragma once

#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <system_error>
#include <unordered_map>

#include "protocol/messages.h"

namespace lumi {

/**
 * Waiters for in-flight commands, keyed by command id.
 *
 * Strand-confined: every call must happen on the executor passed to the
 * constructor, which is also where timers fire. Each waiter completes
 * exactly once, with the matching Response, a timeout or a connection
 * failure, whichever comes first.
 */
class PendingRequests {
public:
    explicit PendingRequests(asio::any_io_executor executor);
    ~PendingRequests();

    PendingRequests(const PendingRequests&) = delete;
    PendingRequests& operator=(const PendingRequests&) = delete;

    /// Register a waiter and arm its timer.
    void add(const std::string& id, std::chrono::milliseconds timeout, ResponseHandler handler);

    /// Complete the waiter for `response.id`. Returns false when nobody is
    /// waiting any more (late or unknown id); such responses are dropped.
    bool resolve(Response response);

    /// Complete one waiter with an error, e.g. after a failed write.
    bool fail(const std::string& id, std::error_code ec);

    /// Complete every waiter with `ec` and clear the table.
    void fail_all(std::error_code ec);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool contains(const std::string& id) const;

private:
    struct Entry {
        ResponseHandler handler;
        std::unique_ptr<asio::steady_timer> timer;
    };
    using Table = std::unordered_map<std::string, Entry>;

    static void expire(const std::shared_ptr<Table>& table, const std::string& id);

    asio::any_io_executor executor_;
    std::shared_ptr<Table> table_;
};

} // namespace lumi
