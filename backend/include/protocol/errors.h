#pragma once

#include <string>
#include <system_error>

namespace lumi {

/**
 * Error codes reported through completion handlers.
 *
 * Everything asynchronous in this project reports failures as
 * std::error_code, the same way asio does. Raw asio socket errors are
 * passed through untouched and classified as transport failures.
 */
enum class errc {
    // Transport
    transport_failed = 1,
    connection_closed,

    // Protocol
    frame_too_large,
    buffer_overflow,
    malformed_message,

    // Timeout
    timed_out,
    connect_timeout,
    approval_timeout,

    // Authorization
    unauthorized,
    approval_rejected,

    // Local
    not_connected,
    cancelled,
    busy,
    message_too_large,  // refused before sending; the session is unaffected
};

/// Coarse classes used to decide how far a failure propagates.
enum class ErrorClass {
    none,
    transport,
    protocol,
    timeout,
    authorization,
    local,
};

const std::error_category& error_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

/// Map any error code (ours or asio's) onto the taxonomy.
ErrorClass classify(const std::error_code& ec) noexcept;

/// True for failures that must tear the whole session down.
inline bool is_fatal(const std::error_code& ec) noexcept {
    const auto cls = classify(ec);
    return cls == ErrorClass::transport || cls == ErrorClass::protocol;
}

const char* to_string(ErrorClass cls) noexcept;

} // namespace lumi

namespace std {
template <>
struct is_error_code_enum<lumi::errc> : true_type {};
} // namespace std
