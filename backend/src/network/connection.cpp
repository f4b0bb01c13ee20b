/**
 * FramedConnection: read loop, write queue and teardown for one stream.
 */

#include "network/connection.h"

#include "protocol/errors.h"

#include <spdlog/spdlog.h>

namespace lumi {

FramedConnection::FramedConnection(asio::ip::tcp::socket socket)
    : socket_(std::move(socket)) {
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if (!ec) remote_address_ = ep.address().to_string();
}

void FramedConnection::start(FrameHandler on_frame, CloseHandler on_close) {
    on_frame_ = std::move(on_frame);
    on_close_ = std::move(on_close);
    asio::post(socket_.get_executor(), [self = shared_from_this()] { self->do_read(); });
}

void FramedConnection::write(std::string frame) {
    asio::post(socket_.get_executor(),
               [self = shared_from_this(), frame = std::move(frame)]() mutable {
                   if (self->closed_) return;
                   self->write_queue_.push_back(std::move(frame));
                   if (self->write_queue_.size() == 1) self->do_write();
               });
}

void FramedConnection::close(std::error_code reason) {
    asio::post(socket_.get_executor(),
               [self = shared_from_this(), reason] { self->shutdown(reason); });
}

void FramedConnection::do_read() {
    if (closed_) return;

    socket_.async_read_some(
        asio::buffer(read_buf_),
        [self = shared_from_this()](std::error_code ec, std::size_t n) {
            if (self->closed_) return;
            if (ec) {
                if (ec == asio::error::eof) ec = make_error_code(errc::connection_closed);
                self->shutdown(ec);
                return;
            }

            std::vector<std::string> frames;
            auto decode_ec = self->decoder_.feed(self->read_buf_.data(), n, frames);

            for (auto& frame : frames) {
                if (self->closed_) return;
                self->on_frame_(std::move(frame));
            }

            if (decode_ec) {
                spdlog::error("Protocol error from {}: {}", self->remote_address_, decode_ec.message());
                self->shutdown(decode_ec);
                return;
            }
            self->do_read();
        });
}

void FramedConnection::do_write() {
    asio::async_write(
        socket_, asio::buffer(write_queue_.front()),
        [self = shared_from_this()](std::error_code ec, std::size_t) {
            if (self->closed_) return;
            if (ec) {
                spdlog::warn("Write to {} failed: {}", self->remote_address_, ec.message());
                self->shutdown(ec);
                return;
            }
            self->write_queue_.pop_front();
            if (!self->write_queue_.empty()) self->do_write();
        });
}

void FramedConnection::shutdown(std::error_code reason) {
    if (closed_) return;
    closed_ = true;

    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    decoder_.reset();
    write_queue_.clear();

    auto handler = std::move(on_close_);
    on_close_ = nullptr;
    on_frame_ = nullptr;
    if (handler) handler(reason);
}

} // namespace lumi
