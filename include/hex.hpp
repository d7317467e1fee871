#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hc {

std::string bytesToHex(const std::uint8_t* data, std::size_t len);

template <typename Container>
std::string toHex(const Container& bytes) {
    return bytesToHex(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
}

// "0x"-prefixed lowercase rendering used on the wire.
template <typename Container>
std::string toPrefixedHex(const Container& bytes) {
    return "0x" + toHex(bytes);
}

// Accepts an optional "0x"/"0X" prefix. Throws std::invalid_argument on odd
// length or non-hex characters.
std::vector<std::uint8_t> hexToBytes(const std::string& hex);

bool isHexString(const std::string& value);

} // namespace hc
