#include "attestation.hpp"

#include "errors.hpp"
#include "hex.hpp"

#include <stdexcept>
#include <utility>

namespace hc {

AttestationService::AttestationService(SignerPtr signer, std::shared_ptr<NonceCounter> nonces)
    : signer_(std::move(signer))
    , nonces_(std::move(nonces)) {
    if (!signer_) {
        throw GameError(ErrorKind::SignerUnavailable, "no signing capability configured");
    }
    if (!nonces_) {
        throw std::invalid_argument("AttestationService requires a nonce counter");
    }
}

// Signing runs inside the nonce transaction, so a rejected field or a failed
// signature hands the nonce back.
template <typename Message>
Message AttestationService::attest(Message msg) {
    return nonces_->transact([&](NonceCounter::Cursor& cursor) { return attest(std::move(msg), cursor); });
}

template <typename Message>
Message AttestationService::attest(Message msg, NonceCounter::Cursor& cursor) {
    msg.attestation.nonce = cursor.take();
    msg.attestation.digest = encode(msg).digest();
    msg.attestation.signature = signer_->sign(
        std::vector<std::uint8_t>(msg.attestation.digest.begin(), msg.attestation.digest.end()));
    return msg;
}

SignedRoundStart AttestationService::signRoundStart(const std::string& roundId,
                                                    const Hash32& commitmentHash,
                                                    const Wei& baseBuyIn) {
    SignedRoundStart msg;
    msg.roundId = roundId;
    msg.commitmentHash = commitmentHash;
    msg.baseBuyIn = baseBuyIn;
    return attest(std::move(msg));
}

SignedHint AttestationService::signHint(const std::string& roundId,
                                        const std::string& player,
                                        std::uint8_t digitsCorrect,
                                        std::uint8_t digitsInPlace,
                                        std::uint64_t numericDistance) {
    SignedHint msg;
    msg.roundId = roundId;
    msg.player = player;
    msg.digitsCorrect = digitsCorrect;
    msg.digitsInPlace = digitsInPlace;
    msg.numericDistance = numericDistance;
    return attest(std::move(msg));
}

SignedPriceUpdate AttestationService::signPriceUpdate(const std::string& roundId, const Wei& newBuyIn) {
    SignedPriceUpdate msg;
    msg.roundId = roundId;
    msg.newBuyIn = newBuyIn;
    return attest(std::move(msg));
}

SignedWinnerDeclaration AttestationService::signWinner(const std::string& roundId,
                                                       const std::string& winner) {
    SignedWinnerDeclaration msg;
    msg.roundId = roundId;
    msg.winner = winner;
    return attest(std::move(msg));
}

SignedAuditRoot AttestationService::signAuditRoot(const std::string& roundId,
                                                  const Hash32& merkleRoot,
                                                  std::uint64_t entryCount) {
    SignedAuditRoot msg;
    msg.roundId = roundId;
    msg.merkleRoot = merkleRoot;
    msg.entryCount = entryCount;
    return attest(std::move(msg));
}

GuessAttestations AttestationService::signGuessOutcome(const std::string& roundId,
                                                       const std::string& player,
                                                       std::uint8_t digitsCorrect,
                                                       std::uint8_t digitsInPlace,
                                                       std::uint64_t numericDistance,
                                                       const std::optional<Wei>& newBuyIn,
                                                       bool declareWinner) {
    return nonces_->transact([&](NonceCounter::Cursor& cursor) {
        GuessAttestations out;

        SignedHint hint;
        hint.roundId = roundId;
        hint.player = player;
        hint.digitsCorrect = digitsCorrect;
        hint.digitsInPlace = digitsInPlace;
        hint.numericDistance = numericDistance;
        out.hint = attest(std::move(hint), cursor);

        if (newBuyIn) {
            SignedPriceUpdate price;
            price.roundId = roundId;
            price.newBuyIn = *newBuyIn;
            out.priceUpdate = attest(std::move(price), cursor);
        }
        if (declareWinner) {
            SignedWinnerDeclaration winner;
            winner.roundId = roundId;
            winner.winner = player;
            out.winner = attest(std::move(winner), cursor);
        }
        return out;
    });
}

AttestationIdentity AttestationService::identity() const {
    return AttestationIdentity{
        formatAddress(signer_->address()),
        toPrefixedHex(signer_->publicKey()),
        signerModeName(signer_->mode()),
    };
}

PackedEncoder AttestationService::encode(const SignedRoundStart& msg) {
    PackedEncoder enc;
    enc.text(msg.roundId).bytes32(msg.commitmentHash).uint256(msg.baseBuyIn).uint256(msg.attestation.nonce);
    return enc;
}

PackedEncoder AttestationService::encode(const SignedHint& msg) {
    PackedEncoder enc;
    enc.text(msg.roundId)
        .address(parseAddress(msg.player))
        .uint8(msg.digitsCorrect)
        .uint8(msg.digitsInPlace)
        .uint256(msg.numericDistance)
        .uint256(msg.attestation.nonce);
    return enc;
}

PackedEncoder AttestationService::encode(const SignedPriceUpdate& msg) {
    PackedEncoder enc;
    enc.text(msg.roundId).uint256(msg.newBuyIn).uint256(msg.attestation.nonce);
    return enc;
}

PackedEncoder AttestationService::encode(const SignedWinnerDeclaration& msg) {
    PackedEncoder enc;
    enc.text(msg.roundId).address(parseAddress(msg.winner)).uint256(msg.attestation.nonce);
    return enc;
}

PackedEncoder AttestationService::encode(const SignedAuditRoot& msg) {
    PackedEncoder enc;
    enc.text(msg.roundId).bytes32(msg.merkleRoot).uint256(msg.entryCount).uint256(msg.attestation.nonce);
    return enc;
}

} // namespace hc
