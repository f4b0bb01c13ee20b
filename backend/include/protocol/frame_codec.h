#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace lumi {

/// Declared payload lengths above this are treated as stream corruption.
constexpr std::size_t kMaxFrameSize = 8 * 1024 * 1024;

/// Upper bound on bytes held while waiting for a frame to complete.
constexpr std::size_t kMaxReceiveBuffer = 16 * 1024 * 1024;

constexpr std::size_t kFrameHeaderSize = 4;

/// Prefix `payload` with its 4-byte big-endian length.
std::string encode_frame(const std::string& payload);

/**
 * Incremental decoder for length-prefixed frames.
 *
 * Owned by exactly one read path. Bytes are appended as they arrive and
 * every complete frame is drained before the caller asks for more.
 * A frame header above the frame cap, or a buffer above the buffer cap,
 * puts the decoder into a failed state: the buffer is cleared and all
 * further input is refused.
 */
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t max_frame_size = kMaxFrameSize,
                          std::size_t max_buffer_size = kMaxReceiveBuffer);

    /// Append `size` bytes and push every complete payload onto `frames`.
    /// Frames completed before a corrupt header are still delivered.
    std::error_code feed(const char* data, std::size_t size,
                         std::vector<std::string>& frames);

    std::error_code feed(const std::string& bytes, std::vector<std::string>& frames) {
        return feed(bytes.data(), bytes.size(), frames);
    }

    /// Bytes held back waiting for the rest of a frame.
    [[nodiscard]] std::size_t buffered() const { return buffer_.size(); }
    [[nodiscard]] bool failed() const { return failed_; }

    void reset();

private:
    std::error_code fail(std::error_code ec);

    std::string buffer_;
    std::size_t max_frame_size_;
    std::size_t max_buffer_size_;
    bool failed_ = false;
};

} // namespace lumi
