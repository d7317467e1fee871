#include "pricing.hpp"

#include "errors.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace hc {

namespace {

const TierSpec* findSpec(const std::vector<TierSpec>& tiers, PriceTier tier) {
    for (const auto& spec : tiers) {
        if (spec.tier == tier) {
            return &spec;
        }
    }
    return nullptr;
}

void validate(const PricingConfig& cfg) {
    if (cfg.tiers.empty()) {
        throw GameError(ErrorKind::ValidationError, "pricing config must define at least one tier");
    }
    if (cfg.severityOrder.size() != cfg.tiers.size()) {
        throw GameError(ErrorKind::ValidationError,
                        "severity order must rank every configured tier exactly once");
    }

    const TierSpec* previous = nullptr;
    for (std::size_t i = 0; i < cfg.severityOrder.size(); ++i) {
        PriceTier tier = cfg.severityOrder[i];
        if (std::count(cfg.severityOrder.begin(), cfg.severityOrder.end(), tier) != 1) {
            throw GameError(ErrorKind::ValidationError, "severity order repeats a tier");
        }
        const TierSpec* spec = findSpec(cfg.tiers, tier);
        if (spec == nullptr) {
            std::ostringstream oss;
            oss << "severity order names unconfigured tier " << priceTierName(tier);
            throw GameError(ErrorKind::ValidationError, oss.str());
        }
        if (spec->multiplier == 0) {
            throw GameError(ErrorKind::ValidationError, "tier multiplier must be positive");
        }
        if (previous != nullptr && spec->maxDistance >= previous->maxDistance) {
            std::ostringstream oss;
            oss << "tier " << priceTierName(tier)
                << " must have a smaller maxDistance than " << priceTierName(previous->tier);
            throw GameError(ErrorKind::ValidationError, oss.str());
        }
        if (previous != nullptr && spec->multiplier < previous->multiplier) {
            std::ostringstream oss;
            oss << "tier " << priceTierName(tier) << " multiplier x" << spec->multiplier
                << " is below the x" << previous->multiplier << " of " << priceTierName(previous->tier);
            throw GameError(ErrorKind::ValidationError, oss.str());
        }
        previous = spec;
    }
}

} // namespace

const char* priceTierName(PriceTier tier) {
    switch (tier) {
    case PriceTier::Base:
        return "base";
    case PriceTier::Warm:
        return "warm";
    case PriceTier::Hot:
        return "hot";
    case PriceTier::Scorching:
        return "scorching";
    }
    return "unknown";
}

PricingConfig defaultPricingConfig() {
    PricingConfig cfg;
    cfg.tiers = {
        { PriceTier::Base, 999'999'999'999ULL, 1 },
        { PriceTier::Warm, 1'000, 2 },
        { PriceTier::Hot, 100, 5 },
        { PriceTier::Scorching, 10, 10 },
    };
    cfg.severityOrder = { PriceTier::Base, PriceTier::Warm, PriceTier::Hot, PriceTier::Scorching };
    return cfg;
}

PricingEngine::PricingEngine(PricingConfig config)
    : config_(std::move(config)) {
    validate(config_);
    byDistance_ = config_.tiers;
    std::stable_sort(byDistance_.begin(), byDistance_.end(), [](const TierSpec& a, const TierSpec& b) {
        return a.maxDistance < b.maxDistance;
    });
}

PriceTier PricingEngine::tierFor(std::uint64_t distance) const {
    for (const auto& spec : byDistance_) {
        if (distance <= spec.maxDistance) {
            return spec.tier;
        }
    }
    return loosestTier();
}

std::uint32_t PricingEngine::multiplier(PriceTier tier) const {
    const TierSpec* spec = findSpec(config_.tiers, tier);
    if (spec == nullptr) {
        throw GameError(ErrorKind::ValidationError,
                        std::string("tier not configured: ") + priceTierName(tier));
    }
    return spec->multiplier;
}

Wei PricingEngine::buyInFor(const Wei& baseBuyIn, std::uint64_t distance) const {
    return buyInForTier(baseBuyIn, tierFor(distance));
}

Wei PricingEngine::buyInForTier(const Wei& baseBuyIn, PriceTier tier) const {
    return baseBuyIn * multiplier(tier);
}

bool PricingEngine::shouldEscalate(PriceTier currentTier, std::uint64_t newDistance) const {
    return severity(tierFor(newDistance)) > severity(currentTier);
}

std::size_t PricingEngine::severity(PriceTier tier) const {
    auto it = std::find(config_.severityOrder.begin(), config_.severityOrder.end(), tier);
    if (it == config_.severityOrder.end()) {
        throw GameError(ErrorKind::ValidationError,
                        std::string("tier has no severity rank: ") + priceTierName(tier));
    }
    return static_cast<std::size_t>(it - config_.severityOrder.begin());
}

} // namespace hc
