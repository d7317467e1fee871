#include "errors.hpp"
#include "hex.hpp"
#include "scoring.hpp"
#include "target.hpp"

#include <algorithm>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: verify_commitment <target 12 digits> <roundId> <saltHex> <commitmentHex>\n";
        return 2;
    }

    std::string target = argv[1];
    std::string roundId = argv[2];
    if (!hc::isValidGuess(target)) {
        std::cerr << "Target must be exactly 12 decimal digits\n";
        return 2;
    }

    hc::Salt salt{};
    hc::Hash32 expected{};
    try {
        hc::Hash32 saltWord = hc::parseHash32(argv[3]);
        std::copy(saltWord.begin(), saltWord.end(), salt.begin());
        expected = hc::parseHash32(argv[4]);
    } catch (const hc::GameError& ex) {
        std::cerr << "Hex parse error: " << ex.what() << '\n';
        return 2;
    }

    hc::Hash32 recomputed = hc::computeCommitment(target, roundId, salt);
    bool ok = recomputed == expected;
    std::cout << "Recomputed commitment: " << hc::toPrefixedHex(recomputed) << '\n';
    std::cout << "Commitment verification: " << (ok ? "valid" : "INVALID") << '\n';
    return ok ? 0 : 1;
}
