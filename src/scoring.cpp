#include "scoring.hpp"

#include "errors.hpp"
#include "target.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace hc {

namespace {

void requireDigits(const std::string& value, const char* what) {
    if (!isValidGuess(value)) {
        throw GameError(ErrorKind::ValidationError,
                        std::string("InvalidGuessFormat: ") + what + " must be exactly 12 decimal digits");
    }
}

std::uint64_t parseFixedWidth(const std::string& digits) {
    std::uint64_t value = 0;
    for (char ch : digits) {
        value = value * 10 + static_cast<std::uint64_t>(ch - '0');
    }
    return value;
}

} // namespace

bool isValidGuess(const std::string& value) {
    return value.size() == kTargetDigits &&
           std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

std::uint64_t numericDistance(const std::string& a, const std::string& b) {
    requireDigits(a, "left operand");
    requireDigits(b, "right operand");
    std::uint64_t x = parseFixedWidth(a);
    std::uint64_t y = parseFixedWidth(b);
    return x > y ? x - y : y - x;
}

Hint score(const std::string& secret, const std::string& guess, const PricingEngine& pricing) {
    requireDigits(secret, "secret");
    requireDigits(guess, "guess");

    std::array<bool, kTargetDigits> secretUsed{};
    std::array<bool, kTargetDigits> guessUsed{};

    Hint hint;
    for (std::size_t i = 0; i < kTargetDigits; ++i) {
        if (secret[i] == guess[i]) {
            ++hint.digitsInPlace;
            secretUsed[i] = true;
            guessUsed[i] = true;
        }
    }

    // Each remaining guess digit, left to right, consumes the first unused
    // equal digit of the secret.
    for (std::size_t i = 0; i < kTargetDigits; ++i) {
        if (guessUsed[i]) {
            continue;
        }
        for (std::size_t j = 0; j < kTargetDigits; ++j) {
            if (!secretUsed[j] && secret[j] == guess[i]) {
                ++hint.digitsCorrect;
                secretUsed[j] = true;
                break;
            }
        }
    }

    hint.numericDistance = numericDistance(secret, guess);
    hint.isExactMatch = hint.digitsInPlace == kTargetDigits;
    hint.priceTier = pricing.tierFor(hint.numericDistance);
    return hint;
}

} // namespace hc
