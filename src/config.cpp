#include "config.hpp"

#include "errors.hpp"
#include "secure_memory.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace hc {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::string readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return "";
    }
    return trim(env);
}

std::uint64_t parseUnsigned(const char* name, const std::string& value) {
    if (value.empty() || value.size() > 20) {
        throw GameError(ErrorKind::ValidationError, std::string(name) + " must be an unsigned integer");
    }
    for (unsigned char ch : value) {
        if (std::isdigit(ch) == 0) {
            throw GameError(ErrorKind::ValidationError, std::string(name) + " must be an unsigned integer");
        }
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw GameError(ErrorKind::ValidationError, std::string(name) + " exceeds 64 bits");
    }
}

} // namespace

EngineConfig::~EngineConfig() {
    secureZero(signingSeedHex.data(), signingSeedHex.size());
}

EngineConfig loadEngineConfig() {
    EngineConfig cfg;

    std::string teeSeed = readEnv("HC_ENCLAVE_SEED");
    std::string devSeed = readEnv("HC_DEV_SIGNING_SEED");
    if (!teeSeed.empty()) {
        cfg.signingSeedHex = teeSeed;
        cfg.signerMode = SignerMode::Tee;
    } else if (!devSeed.empty()) {
        cfg.signingSeedHex = devSeed;
        cfg.signerMode = SignerMode::Simulation;
    }
    secureZero(teeSeed.data(), teeSeed.size());
    secureZero(devSeed.data(), devSeed.size());

    std::string nonceFloor = readEnv("HC_NONCE_FLOOR");
    if (!nonceFloor.empty()) {
        cfg.nonceFloor = parseUnsigned("HC_NONCE_FLOOR", nonceFloor);
    }

    std::string firstRoundId = readEnv("HC_FIRST_ROUND_ID");
    if (!firstRoundId.empty()) {
        cfg.firstRoundId = parseUnsigned("HC_FIRST_ROUND_ID", firstRoundId);
    }

    std::string baseBuyIn = readEnv("HC_DEFAULT_BASE_BUY_IN");
    if (!baseBuyIn.empty()) {
        cfg.defaultBaseBuyIn = parseWei(baseBuyIn);
        if (cfg.defaultBaseBuyIn == 0) {
            throw GameError(ErrorKind::ValidationError, "HC_DEFAULT_BASE_BUY_IN must be positive");
        }
    }

    return cfg;
}

SignerPtr makeSigner(const EngineConfig& cfg) {
    if (cfg.signingSeedHex.empty()) {
        throw GameError(ErrorKind::SignerUnavailable,
                        "No signer configured. Set HC_ENCLAVE_SEED (tee) or HC_DEV_SIGNING_SEED (simulation)");
    }
    return Ed25519Signer::fromSeedHex(cfg.signingSeedHex, cfg.signerMode);
}

} // namespace hc
