#include "packed_encoding.hpp"

#include "errors.hpp"
#include "hex.hpp"

#include "picosha2.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace hc {

const Hash32 kZeroHash{};

Hash32 sha256(const std::uint8_t* data, std::size_t len) {
    Hash32 out{};
    picosha2::hash256(data, data + len, out.begin(), out.end());
    return out;
}

Hash32 sha256(const std::string& data) {
    Hash32 out{};
    picosha2::hash256(data.begin(), data.end(), out.begin(), out.end());
    return out;
}

Hash32 hashPair(const Hash32& left, const Hash32& right) {
    std::array<std::uint8_t, 64> joined{};
    std::copy(left.begin(), left.end(), joined.begin());
    std::copy(right.begin(), right.end(), joined.begin() + 32);
    return sha256(joined.data(), joined.size());
}

Wei parseWei(const std::string& decimal) {
    if (decimal.empty() || decimal.size() > 78) {
        throw GameError(ErrorKind::ValidationError, "amount must be 1-78 decimal digits");
    }
    Wei value = 0;
    for (unsigned char ch : decimal) {
        if (std::isdigit(ch) == 0) {
            throw GameError(ErrorKind::ValidationError, "amount must be a decimal wei string");
        }
        Wei next = value * 10 + (ch - '0');
        if (next / 10 != value) {
            throw GameError(ErrorKind::ValidationError, "amount exceeds uint256");
        }
        value = next;
    }
    return value;
}

std::string formatWei(const Wei& value) {
    return value.str();
}

Address parseAddress(const std::string& text) {
    if (text.size() != 42 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X') ||
        !isHexString(text.substr(2))) {
        throw GameError(ErrorKind::ValidationError,
                        "player must be a 0x-prefixed 20-byte hex address");
    }
    auto bytes = hexToBytes(text);
    Address out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

std::string formatAddress(const Address& address) {
    return toPrefixedHex(address);
}

Hash32 parseHash32(const std::string& text) {
    std::vector<std::uint8_t> bytes;
    try {
        bytes = hexToBytes(text);
    } catch (const std::invalid_argument& ex) {
        throw GameError(ErrorKind::ValidationError, ex.what());
    }
    if (bytes.size() != 32) {
        throw GameError(ErrorKind::ValidationError, "expected 32 bytes of hex");
    }
    Hash32 out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

PackedEncoder& PackedEncoder::text(const std::string& value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
    return *this;
}

PackedEncoder& PackedEncoder::bytes32(const Hash32& value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
    return *this;
}

PackedEncoder& PackedEncoder::address(const Address& value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
    return *this;
}

PackedEncoder& PackedEncoder::uint8(std::uint8_t value) {
    buffer_.push_back(value);
    return *this;
}

PackedEncoder& PackedEncoder::uint256(std::uint64_t value) {
    return uint256(Wei(value));
}

PackedEncoder& PackedEncoder::uint256(const Wei& value) {
    std::array<std::uint8_t, 32> word{};
    Wei rest = value;
    for (std::size_t i = 0; i < word.size(); ++i) {
        Wei low = rest & 0xff;
        word[word.size() - 1 - i] = static_cast<std::uint8_t>(low.convert_to<unsigned>());
        rest >>= 8;
    }
    buffer_.insert(buffer_.end(), word.begin(), word.end());
    return *this;
}

Hash32 PackedEncoder::digest() const {
    return sha256(buffer_.data(), buffer_.size());
}

} // namespace hc
