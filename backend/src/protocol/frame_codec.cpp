/**
 * Frame codec: 4-byte big-endian length + UTF-8 JSON payload.
 *
 * The same framing is used in both directions.
 */

#include "protocol/frame_codec.h"

#include "protocol/errors.h"

#include <limits>
#include <stdexcept>

namespace lumi {

std::string encode_frame(const std::string& payload) {
    if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("frame payload exceeds 32-bit length");
    }
    const auto len = static_cast<std::uint32_t>(payload.size());

    std::string frame;
    frame.reserve(kFrameHeaderSize + payload.size());
    frame.push_back(static_cast<char>((len >> 24) & 0xFF));
    frame.push_back(static_cast<char>((len >> 16) & 0xFF));
    frame.push_back(static_cast<char>((len >> 8) & 0xFF));
    frame.push_back(static_cast<char>(len & 0xFF));
    frame.append(payload);
    return frame;
}

FrameDecoder::FrameDecoder(std::size_t max_frame_size, std::size_t max_buffer_size)
    : max_frame_size_(max_frame_size), max_buffer_size_(max_buffer_size) {}

std::error_code FrameDecoder::feed(const char* data, std::size_t size,
                                   std::vector<std::string>& frames) {
    if (failed_) return make_error_code(errc::malformed_message);

    buffer_.append(data, size);
    if (buffer_.size() > max_buffer_size_) {
        return fail(make_error_code(errc::buffer_overflow));
    }

    std::size_t offset = 0;
    while (buffer_.size() - offset >= kFrameHeaderSize) {
        const auto* header = reinterpret_cast<const unsigned char*>(buffer_.data() + offset);
        const std::uint32_t len = (static_cast<std::uint32_t>(header[0]) << 24) |
                                  (static_cast<std::uint32_t>(header[1]) << 16) |
                                  (static_cast<std::uint32_t>(header[2]) << 8) |
                                  static_cast<std::uint32_t>(header[3]);

        if (len > max_frame_size_) {
            return fail(make_error_code(errc::frame_too_large));
        }

        const std::size_t total = kFrameHeaderSize + len;
        if (buffer_.size() - offset < total) break;

        frames.emplace_back(buffer_, offset + kFrameHeaderSize, len);
        offset += total;
    }

    buffer_.erase(0, offset);
    return {};
}

void FrameDecoder::reset() {
    buffer_.clear();
    buffer_.shrink_to_fit();
    failed_ = false;
}

std::error_code FrameDecoder::fail(std::error_code ec) {
    buffer_.clear();
    buffer_.shrink_to_fit();
    failed_ = true;
    return ec;
}

} // namespace lumi
