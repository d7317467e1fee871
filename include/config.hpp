#pragma once

#include "packed_encoding.hpp"
#include "pricing.hpp"
#include "signer.hpp"

#include <cstdint>
#include <string>

namespace hc {

struct EngineConfig {
    // Hex Ed25519 seed. Empty when no signer is configured.
    std::string signingSeedHex;
    SignerMode signerMode = SignerMode::Simulation;
    std::uint64_t nonceFloor = 0;
    std::uint64_t firstRoundId = 1;
    Wei defaultBaseBuyIn = Wei(10'000'000'000'000'000ULL); // 0.01 ETH
    PricingConfig pricing = defaultPricingConfig();

    EngineConfig() = default;
    EngineConfig(const EngineConfig&) = default;
    EngineConfig& operator=(const EngineConfig&) = default;
    ~EngineConfig();
};

// Reads HC_ENCLAVE_SEED (tee mode) or HC_DEV_SIGNING_SEED (simulation mode),
// HC_NONCE_FLOOR, HC_FIRST_ROUND_ID and HC_DEFAULT_BASE_BUY_IN. Malformed
// values throw GameError(ValidationError).
EngineConfig loadEngineConfig();

// Throws GameError(SignerUnavailable) when no seed is configured.
SignerPtr makeSigner(const EngineConfig& cfg);

} // namespace hc
