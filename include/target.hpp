#pragma once

#include "packed_encoding.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace hc {

constexpr std::size_t kTargetDigits = 12;
constexpr std::uint64_t kTargetSpace = 1'000'000'000'000ULL; // 10^12
constexpr char kCommitmentDomainTag[] = "hotcold:commit:v1";

using Salt = std::array<std::uint8_t, 32>;

class TargetSource {
public:
    virtual ~TargetSource() = default;
    // Uniform value in [0, bound).
    virtual std::uint64_t drawValue(std::uint64_t bound) = 0;
    virtual Salt drawSalt() = 0;
};

// libsodium-backed source used in production.
class SecureTargetSource : public TargetSource {
public:
    std::uint64_t drawValue(std::uint64_t bound) override;
    Salt drawSalt() override;
};

// Secret, salt and commitment for one round. Secret and salt are wiped on
// destruction.
struct RoundSecret {
    std::string secret;
    Salt salt{};
    Hash32 commitment{};

    RoundSecret() = default;
    RoundSecret(const RoundSecret&) = delete;
    RoundSecret& operator=(const RoundSecret&) = delete;
    RoundSecret(RoundSecret&& other) noexcept;
    RoundSecret& operator=(RoundSecret&& other) noexcept;
    ~RoundSecret();
};

// Fixed-width, zero-padded decimal rendering of a value below 10^12.
std::string formatTarget(std::uint64_t value);

// H(text domainTag | text secret | text roundId | bytes32 salt).
Hash32 computeCommitment(const std::string& secret, const std::string& roundId, const Salt& salt);

RoundSecret newRoundSecret(TargetSource& source, const std::string& roundId);

} // namespace hc
