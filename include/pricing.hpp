#pragma once

#include "packed_encoding.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hc {

enum class PriceTier { Base, Warm, Hot, Scorching };

const char* priceTierName(PriceTier tier);

struct TierSpec {
    PriceTier tier;
    std::uint64_t maxDistance; // inclusive
    std::uint32_t multiplier;
};

struct PricingConfig {
    std::vector<TierSpec> tiers;
    // Loosest first. Severity is taken from this order only, never from
    // maxDistance.
    std::vector<PriceTier> severityOrder;
};

// Base <= 999999999999 x1, Warm <= 1000 x2, Hot <= 100 x5, Scorching <= 10 x10.
PricingConfig defaultPricingConfig();

class PricingEngine {
public:
    // Throws GameError(ValidationError) when the config does not describe a
    // well-formed tier ladder.
    explicit PricingEngine(PricingConfig config);

    PriceTier tierFor(std::uint64_t distance) const;
    std::uint32_t multiplier(PriceTier tier) const;
    Wei buyInFor(const Wei& baseBuyIn, std::uint64_t distance) const;
    Wei buyInForTier(const Wei& baseBuyIn, PriceTier tier) const;
    bool shouldEscalate(PriceTier currentTier, std::uint64_t newDistance) const;

    std::size_t severity(PriceTier tier) const;
    PriceTier loosestTier() const { return config_.severityOrder.front(); }
    const PricingConfig& config() const { return config_; }

private:
    PricingConfig config_;
    std::vector<TierSpec> byDistance_; // ascending maxDistance
};

} // namespace hc
