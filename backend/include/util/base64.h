#pragma once

#include <optional>
#include <string>

namespace lumi {

/// Standard alphabet, padded.
std::string base64_encode(const std::string& bytes);

/// Returns nullopt on characters outside the alphabet or bad padding.
std::optional<std::string> base64_decode(const std::string& text);

} // namespace lumi
