#pragma once

#include <string>

namespace lumi {

/// Random RFC 4122 version-4 UUID, upper-case hex like the peers emit.
std::string generate_uuid();

} // namespace lumi
