#include "signer.hpp"

#include "errors.hpp"
#include "hex.hpp"
#include "secure_random.hpp"

#include <algorithm>
#include <stdexcept>

#include <sodium.h>

namespace hc {

namespace {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

} // namespace

const char* signerModeName(SignerMode mode) {
    switch (mode) {
    case SignerMode::Tee:
        return "tee";
    case SignerMode::Simulation:
        return "simulation";
    }
    return "unknown";
}

Address deriveAddress(const std::vector<std::uint8_t>& publicKey) {
    Hash32 digest = sha256(publicKey.data(), publicKey.size());
    Address out{};
    std::copy(digest.end() - out.size(), digest.end(), out.begin());
    return out;
}

std::shared_ptr<Ed25519Signer> Ed25519Signer::fromSeedHex(std::string seedHex, SignerMode mode) {
    std::vector<std::uint8_t> seed;
    try {
        seed = hexToBytes(seedHex);
    } catch (const std::invalid_argument& ex) {
        secureZero(seedHex.data(), seedHex.size());
        throw GameError(ErrorKind::ValidationError, std::string("signing seed: ") + ex.what());
    }
    secureZero(seedHex.data(), seedHex.size());

    if (seed.size() != crypto_sign_SEEDBYTES) {
        secureZero(seed.data(), seed.size());
        throw GameError(ErrorKind::ValidationError, "signing seed must decode to 32 bytes");
    }
    std::shared_ptr<Ed25519Signer> signer(new Ed25519Signer(seed, mode));
    secureZero(seed.data(), seed.size());
    return signer;
}

std::shared_ptr<Ed25519Signer> Ed25519Signer::generate(SignerMode mode) {
    auto seed = secureRandomBytes(crypto_sign_SEEDBYTES);
    std::shared_ptr<Ed25519Signer> signer(new Ed25519Signer(seed, mode));
    secureZero(seed.data(), seed.size());
    return signer;
}

Ed25519Signer::Ed25519Signer(const std::vector<std::uint8_t>& seed, SignerMode mode)
    : secretKey_(crypto_sign_SECRETKEYBYTES)
    , publicKey_(crypto_sign_PUBLICKEYBYTES)
    , mode_(mode) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    if (crypto_sign_seed_keypair(publicKey_.data(), secretKey_.data(), seed.data()) != 0) {
        throw std::runtime_error("Failed to derive Ed25519 keypair from seed");
    }
    address_ = deriveAddress(publicKey_);
}

std::vector<std::uint8_t> Ed25519Signer::sign(const std::vector<std::uint8_t>& payload) const {
    std::vector<std::uint8_t> signature(crypto_sign_BYTES);
    unsigned long long sigLen = 0;
    if (crypto_sign_detached(signature.data(), &sigLen, payload.data(), payload.size(), secretKey_.data()) != 0) {
        throw std::runtime_error("Ed25519 signing failed");
    }
    signature.resize(static_cast<std::size_t>(sigLen));
    return signature;
}

bool Ed25519Signer::verify(const std::vector<std::uint8_t>& publicKey,
                           const std::vector<std::uint8_t>& payload,
                           const std::vector<std::uint8_t>& signature) {
    if (!ensureSodiumReady()) {
        return false;
    }
    if (publicKey.size() != crypto_sign_PUBLICKEYBYTES || signature.size() != crypto_sign_BYTES) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), payload.data(), payload.size(), publicKey.data()) == 0;
}

} // namespace hc
