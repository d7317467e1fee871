#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hc {

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);
std::string secureRandomHex(std::size_t numBytes);

// Uniform value in [0, bound) without modulo bias. bound must be non-zero.
std::uint64_t secureRandomBelow(std::uint64_t bound);

} // namespace hc
