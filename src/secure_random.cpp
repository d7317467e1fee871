#include "secure_random.hpp"

#include "hex.hpp"
#include "secure_memory.hpp"

#include <limits>
#include <stdexcept>

#include <sodium.h>

namespace hc {

namespace {

void ensureSodiumReady() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
}

} // namespace

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<std::uint8_t> buffer(numBytes);
    if (numBytes == 0) {
        return buffer;
    }

    ensureSodiumReady();
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

std::string secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    std::string hex = bytesToHex(bytes.data(), bytes.size());
    secureZero(bytes.data(), bytes.size());
    return hex;
}

std::uint64_t secureRandomBelow(std::uint64_t bound) {
    if (bound == 0) {
        throw std::invalid_argument("secureRandomBelow bound must be non-zero");
    }

    // Largest multiple of bound representable in 64 bits; draws at or above it
    // are rejected.
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t limit = max - (max % bound);

    for (;;) {
        auto bytes = secureRandomBytes(sizeof(std::uint64_t));
        std::uint64_t value = 0;
        for (auto byte : bytes) {
            value = (value << 8) | byte;
        }
        secureZero(bytes.data(), bytes.size());
        if (value < limit) {
            return value % bound;
        }
    }
}

} // namespace hc
