#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace hc {

using Hash32 = std::array<std::uint8_t, 32>;
using Address = std::array<std::uint8_t, 20>;
using Wei = boost::multiprecision::uint256_t;

// 32 zero bytes: audit chain genesis and Merkle padding leaf.
extern const Hash32 kZeroHash;

Hash32 sha256(const std::uint8_t* data, std::size_t len);
Hash32 sha256(const std::string& data);
Hash32 hashPair(const Hash32& left, const Hash32& right);

// Decimal wei text. Throws GameError(ValidationError) on empty, non-digit or
// out-of-range input.
Wei parseWei(const std::string& decimal);
std::string formatWei(const Wei& value);

// "0x" + 40 hex digits; throws GameError(ValidationError) otherwise.
Address parseAddress(const std::string& text);
std::string formatAddress(const Address& address);

// 32-byte hex (with or without "0x"); throws GameError(ValidationError).
Hash32 parseHash32(const std::string& text);

// Packed field encoding shared by commitments, signed messages and audit
// entries. No padding and no length prefixes:
//   text    -> raw bytes
//   bytes32 -> 32 bytes
//   address -> 20 bytes
//   uint8   -> 1 byte
//   uint    -> 32-byte big-endian
class PackedEncoder {
public:
    PackedEncoder& text(const std::string& value);
    PackedEncoder& bytes32(const Hash32& value);
    PackedEncoder& address(const Address& value);
    PackedEncoder& uint8(std::uint8_t value);
    PackedEncoder& uint256(std::uint64_t value);
    PackedEncoder& uint256(const Wei& value);

    const std::vector<std::uint8_t>& bytes() const { return buffer_; }
    Hash32 digest() const;

private:
    std::vector<std::uint8_t> buffer_;
};

} // namespace hc
