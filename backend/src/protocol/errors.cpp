/**
 * Error category for the remote-control protocol.
 */

#include "protocol/errors.h"

#include <asio/error.hpp>

namespace lumi {

namespace {

class LumiErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "lumi"; }

    std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
            case errc::transport_failed:  return "transport failure";
            case errc::connection_closed: return "connection closed";
            case errc::frame_too_large:   return "invalid frame length";
            case errc::buffer_overflow:   return "receive buffer overflow";
            case errc::malformed_message: return "malformed message";
            case errc::timed_out:         return "command timed out";
            case errc::connect_timeout:   return "connection timed out";
            case errc::approval_timeout:  return "approval timed out, accept the request on the host and try again";
            case errc::unauthorized:      return "not authorized";
            case errc::approval_rejected: return "connection rejected by host";
            case errc::not_connected:     return "not connected";
            case errc::cancelled:         return "cancelled";
            case errc::busy:              return "connection attempt already in progress";
            case errc::message_too_large: return "message exceeds the frame size limit";
        }
        return "unknown error";
    }
};

} // namespace

const std::error_category& error_category() noexcept {
    static const LumiErrorCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

ErrorClass classify(const std::error_code& ec) noexcept {
    if (!ec) return ErrorClass::none;

    if (ec.category() != error_category()) {
        if (ec == asio::error::operation_aborted) return ErrorClass::local;
        return ErrorClass::transport;
    }

    switch (static_cast<errc>(ec.value())) {
        case errc::transport_failed:
        case errc::connection_closed:
            return ErrorClass::transport;
        case errc::frame_too_large:
        case errc::buffer_overflow:
        case errc::malformed_message:
            return ErrorClass::protocol;
        case errc::timed_out:
        case errc::connect_timeout:
        case errc::approval_timeout:
            return ErrorClass::timeout;
        case errc::unauthorized:
        case errc::approval_rejected:
            return ErrorClass::authorization;
        case errc::not_connected:
        case errc::cancelled:
        case errc::busy:
        case errc::message_too_large:
            return ErrorClass::local;
    }
    return ErrorClass::transport;
}

const char* to_string(ErrorClass cls) noexcept {
    switch (cls) {
        case ErrorClass::none:          return "none";
        case ErrorClass::transport:     return "transport";
        case ErrorClass::protocol:      return "protocol";
        case ErrorClass::timeout:       return "timeout";
        case ErrorClass::authorization: return "authorization";
        case ErrorClass::local:         return "local";
    }
    return "unknown";
}

} // namespace lumi
