#pragma once

#include "pricing.hpp"

#include <cstdint>
#include <string>

namespace hc {

struct Hint {
    std::uint8_t digitsInPlace = 0; // bulls
    std::uint8_t digitsCorrect = 0; // cows
    std::uint64_t numericDistance = 0;
    bool isExactMatch = false;
    PriceTier priceTier = PriceTier::Base;
};

// True when value is exactly kTargetDigits decimal digits.
bool isValidGuess(const std::string& value);

// Throws GameError(ValidationError) unless both operands are 12-digit
// decimal strings.
Hint score(const std::string& secret, const std::string& guess, const PricingEngine& pricing);

// |a - b| of two 12-digit decimal strings.
std::uint64_t numericDistance(const std::string& a, const std::string& b);

} // namespace hc
