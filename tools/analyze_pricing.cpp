#include "errors.hpp"
#include "pricing.hpp"

#include <iomanip>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    hc::Wei baseBuyIn = hc::Wei(10'000'000'000'000'000ULL);
    if (argc > 1) {
        try {
            baseBuyIn = hc::parseWei(argv[1]);
        } catch (const hc::GameError& ex) {
            std::cerr << ex.what() << '\n';
            return 1;
        }
    }

    hc::PricingEngine pricing(hc::defaultPricingConfig());

    std::cout << "=== PRICE LADDER (base buy-in " << hc::formatWei(baseBuyIn) << " wei) ===\n";
    for (hc::PriceTier tier : pricing.config().severityOrder) {
        std::uint64_t maxDistance = 0;
        for (const auto& spec : pricing.config().tiers) {
            if (spec.tier == tier) {
                maxDistance = spec.maxDistance;
            }
        }
        std::cout << "  " << std::setw(10) << std::left << hc::priceTierName(tier) << " distance <= "
                  << std::setw(13) << maxDistance << " x" << std::setw(3) << pricing.multiplier(tier)
                  << " buy-in " << hc::formatWei(pricing.buyInForTier(baseBuyIn, tier)) << '\n';
    }

    std::cout << "\n=== ODDS OF A RANDOM GUESS LANDING IN EACH TIER ===\n";
    const double space = 1e12;
    for (const auto& spec : pricing.config().tiers) {
        // Values within maxDistance on both sides of the target.
        double window = 2.0 * static_cast<double>(spec.maxDistance) + 1.0;
        double p = window >= space ? 1.0 : window / space;
        std::cout << "  " << std::setw(10) << std::left << hc::priceTierName(spec.tier) << " ~ "
                  << std::scientific << std::setprecision(3) << p << std::defaultfloat << '\n';
    }

    return 0;
}
