#include "network/pending_requests.h"

#include "protocol/errors.h"

#include <spdlog/spdlog.h>

#include <vector>

namespace lumi {

PendingRequests::PendingRequests(asio::any_io_executor executor)
    : executor_(std::move(executor)), table_(std::make_shared<Table>()) {}

PendingRequests::~PendingRequests() {
    fail_all(make_error_code(errc::cancelled));
}

void PendingRequests::add(const std::string& id, std::chrono::milliseconds timeout,
                          ResponseHandler handler) {
    auto timer = std::make_unique<asio::steady_timer>(executor_);
    timer->expires_after(timeout);

    std::weak_ptr<Table> weak = table_;
    timer->async_wait([weak, id](std::error_code ec) {
        if (ec == asio::error::operation_aborted) return;
        if (auto table = weak.lock()) expire(table, id);
    });

    auto& entry = (*table_)[id];
    if (entry.handler) {
        // Id reuse would orphan the first caller.
        spdlog::error("Duplicate pending request id {}", id);
    }
    entry.handler = std::move(handler);
    entry.timer = std::move(timer);
}

bool PendingRequests::resolve(Response response) {
    auto it = table_->find(response.id);
    if (it == table_->end()) {
        spdlog::debug("Discarding response for unknown or expired request {}", response.id);
        return false;
    }
    auto handler = std::move(it->second.handler);
    it->second.timer->cancel();
    table_->erase(it);

    handler({}, std::move(response));
    return true;
}

bool PendingRequests::fail(const std::string& id, std::error_code ec) {
    auto it = table_->find(id);
    if (it == table_->end()) return false;
    auto handler = std::move(it->second.handler);
    it->second.timer->cancel();
    table_->erase(it);

    handler(ec, Response{});
    return true;
}

void PendingRequests::fail_all(std::error_code ec) {
    if (table_->empty()) return;

    // Handlers may issue new requests; complete a detached snapshot.
    std::vector<ResponseHandler> handlers;
    handlers.reserve(table_->size());
    for (auto& [id, entry] : *table_) {
        entry.timer->cancel();
        handlers.push_back(std::move(entry.handler));
    }
    table_->clear();

    for (auto& handler : handlers) {
        Response empty;
        handler(ec, std::move(empty));
    }
}

std::size_t PendingRequests::size() const {
    return table_->size();
}

bool PendingRequests::contains(const std::string& id) const {
    return table_->count(id) != 0;
}

void PendingRequests::expire(const std::shared_ptr<Table>& table, const std::string& id) {
    auto it = table->find(id);
    if (it == table->end()) return;
    auto handler = std::move(it->second.handler);
    table->erase(it);

    spdlog::debug("Request {} timed out", id);
    handler(make_error_code(errc::timed_out), Response{});
}

} // namespace lumi
