#include "util/uuid.h"

#include <array>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>

namespace lumi {

std::string generate_uuid() {
    static std::mutex mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    std::array<std::uint8_t, 16> b{};
    {
        std::lock_guard<std::mutex> lock(mutex);
        const std::uint64_t hi = rng();
        const std::uint64_t lo = rng();
        for (int i = 0; i < 8; ++i) {
            b[i] = static_cast<std::uint8_t>(hi >> (56 - 8 * i));
            b[8 + i] = static_cast<std::uint8_t>(lo >> (56 - 8 * i));
        }
    }
    b[6] = static_cast<std::uint8_t>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<std::uint8_t>((b[8] & 0x3F) | 0x80);

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02X%02X%02X%02X-%02X%02X-%02X%02X-%02X%02X-%02X%02X%02X%02X%02X%02X",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return buf;
}

} // namespace lumi
