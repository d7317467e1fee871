#include "target.hpp"

#include "secure_memory.hpp"
#include "secure_random.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace hc {

std::uint64_t SecureTargetSource::drawValue(std::uint64_t bound) {
    return secureRandomBelow(bound);
}

Salt SecureTargetSource::drawSalt() {
    auto bytes = secureRandomBytes(Salt{}.size());
    Salt salt{};
    std::copy(bytes.begin(), bytes.end(), salt.begin());
    secureZero(bytes.data(), bytes.size());
    return salt;
}

RoundSecret::RoundSecret(RoundSecret&& other) noexcept
    : secret(std::move(other.secret))
    , salt(other.salt)
    , commitment(other.commitment) {
    secureZero(other.secret.data(), other.secret.size());
    other.secret.clear();
    secureZero(other.salt);
}

RoundSecret& RoundSecret::operator=(RoundSecret&& other) noexcept {
    if (this != &other) {
        secureZero(secret.data(), secret.size());
        secret = std::move(other.secret);
        salt = other.salt;
        commitment = other.commitment;
        secureZero(other.secret.data(), other.secret.size());
        other.secret.clear();
        secureZero(other.salt);
    }
    return *this;
}

RoundSecret::~RoundSecret() {
    secureZero(secret.data(), secret.size());
    secureZero(salt);
}

std::string formatTarget(std::uint64_t value) {
    if (value >= kTargetSpace) {
        throw std::out_of_range("target value must be below 10^12");
    }
    std::ostringstream oss;
    oss << std::setw(static_cast<int>(kTargetDigits)) << std::setfill('0') << value;
    return oss.str();
}

Hash32 computeCommitment(const std::string& secret, const std::string& roundId, const Salt& salt) {
    Hash32 saltWord{};
    std::copy(salt.begin(), salt.end(), saltWord.begin());

    PackedEncoder enc;
    enc.text(kCommitmentDomainTag).text(secret).text(roundId).bytes32(saltWord);
    return enc.digest();
}

RoundSecret newRoundSecret(TargetSource& source, const std::string& roundId) {
    RoundSecret out;
    out.secret = formatTarget(source.drawValue(kTargetSpace));
    out.salt = source.drawSalt();
    out.commitment = computeCommitment(out.secret, roundId, out.salt);
    return out;
}

} // namespace hc
