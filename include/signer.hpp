#pragma once

#include "packed_encoding.hpp"
#include "secure_memory.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hc {

enum class SignerMode { Tee, Simulation };

const char* signerModeName(SignerMode mode);

// Opaque signing capability: signs a byte payload under a stable identity.
class Signer {
public:
    virtual ~Signer() = default;
    virtual std::vector<std::uint8_t> sign(const std::vector<std::uint8_t>& payload) const = 0;
    virtual const std::vector<std::uint8_t>& publicKey() const = 0;
    virtual const Address& address() const = 0;
    virtual SignerMode mode() const = 0;
};

using SignerPtr = std::shared_ptr<const Signer>;

// Last 20 bytes of H(publicKey).
Address deriveAddress(const std::vector<std::uint8_t>& publicKey);

class Ed25519Signer : public Signer {
public:
    // seedHex must decode to crypto_sign_SEEDBYTES bytes. Throws
    // GameError(ValidationError) otherwise.
    static std::shared_ptr<Ed25519Signer> fromSeedHex(std::string seedHex, SignerMode mode);
    static std::shared_ptr<Ed25519Signer> generate(SignerMode mode);

    std::vector<std::uint8_t> sign(const std::vector<std::uint8_t>& payload) const override;
    const std::vector<std::uint8_t>& publicKey() const override { return publicKey_; }
    const Address& address() const override { return address_; }
    SignerMode mode() const override { return mode_; }

    static bool verify(const std::vector<std::uint8_t>& publicKey,
                       const std::vector<std::uint8_t>& payload,
                       const std::vector<std::uint8_t>& signature);

private:
    Ed25519Signer(const std::vector<std::uint8_t>& seed, SignerMode mode);

    SecureBytes secretKey_;
    std::vector<std::uint8_t> publicKey_;
    Address address_{};
    SignerMode mode_;
};

} // namespace hc
