#pragma once

#include <asio.hpp>
#include <array>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

#include "protocol/frame_codec.h"

namespace lumi {

/**
 * One TCP stream carrying length-prefixed frames.
 *
 * The socket must live on a strand; every handler below runs on it, so the
 * receive buffer and the write queue are never touched concurrently.
 * write() and close() may be called from any thread.
 */
class FramedConnection : public std::enable_shared_from_this<FramedConnection> {
public:
    using FrameHandler = std::function<void(std::string payload)>;
    using CloseHandler = std::function<void(std::error_code reason)>;

    explicit FramedConnection(asio::ip::tcp::socket socket);

    /// Begin the read loop. `on_close` fires exactly once.
    void start(FrameHandler on_frame, CloseHandler on_close);

    /// Queue an already-encoded frame.
    void write(std::string frame);

    void close(std::error_code reason);

    [[nodiscard]] asio::any_io_executor executor() { return socket_.get_executor(); }
    [[nodiscard]] const std::string& remote_address() const { return remote_address_; }
    [[nodiscard]] bool is_open() const { return !closed_; }

private:
    void do_read();
    void do_write();
    void shutdown(std::error_code reason);

    asio::ip::tcp::socket socket_;
    std::string remote_address_;
    std::array<char, 65536> read_buf_{};
    FrameDecoder decoder_;
    std::deque<std::string> write_queue_;
    FrameHandler on_frame_;
    CloseHandler on_close_;
    bool closed_ = false;
};

} // namespace lumi
