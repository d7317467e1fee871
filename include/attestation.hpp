#pragma once

#include "errors.hpp"
#include "packed_encoding.hpp"
#include "signer.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hc {

// Process-wide nonce source shared by every round and message kind. Issued
// values are strictly increasing, never repeat and leave no gaps. Recreating
// the counter restarts from its floor, so a restarted engine must be given a
// floor above every nonce an external verifier has already consumed.
class NonceCounter {
public:
    // Hands out consecutive nonces inside one transaction.
    class Cursor {
    public:
        std::uint64_t take() { return next_++; }

    private:
        friend class NonceCounter;
        explicit Cursor(std::uint64_t start) : next_(start) {}
        std::uint64_t next_;
    };

    explicit NonceCounter(std::uint64_t floor = 0) : next_(floor) {}

    NonceCounter(const NonceCounter&) = delete;
    NonceCounter& operator=(const NonceCounter&) = delete;

    // Runs fn(cursor) under the counter lock. Nonces taken from the cursor
    // are consumed only if fn returns normally; if it throws, the next
    // caller is handed the same values.
    template <typename Fn>
    auto transact(Fn&& fn) -> decltype(fn(std::declval<Cursor&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        Cursor cursor(next_);
        auto result = fn(cursor);
        next_ = cursor.next_;
        return result;
    }

    std::uint64_t next() {
        return transact([](Cursor& cursor) { return cursor.take(); });
    }

    std::uint64_t peek() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return next_;
    }

private:
    mutable std::mutex mutex_;
    std::uint64_t next_;
};

struct Attestation {
    std::uint64_t nonce = 0;
    Hash32 digest{};
    std::vector<std::uint8_t> signature;
};

struct SignedRoundStart {
    std::string roundId;
    Hash32 commitmentHash{};
    Wei baseBuyIn;
    Attestation attestation;
};

struct SignedHint {
    std::string roundId;
    std::string player;
    std::uint8_t digitsCorrect = 0;
    std::uint8_t digitsInPlace = 0;
    std::uint64_t numericDistance = 0;
    Attestation attestation;
};

struct SignedPriceUpdate {
    std::string roundId;
    Wei newBuyIn;
    Attestation attestation;
};

struct SignedWinnerDeclaration {
    std::string roundId;
    std::string winner;
    Attestation attestation;
};

struct SignedAuditRoot {
    std::string roundId;
    Hash32 merkleRoot{};
    std::uint64_t entryCount = 0;
    Attestation attestation;
};

// Every message one accepted guess produces, signed under consecutive nonces.
struct GuessAttestations {
    SignedHint hint;
    std::optional<SignedPriceUpdate> priceUpdate;
    std::optional<SignedWinnerDeclaration> winner;
};

struct AttestationIdentity {
    std::string address;
    std::string publicKey;
    std::string mode;
};

class AttestationService {
public:
    // Throws GameError(SignerUnavailable) when signer is null.
    AttestationService(SignerPtr signer, std::shared_ptr<NonceCounter> nonces);

    SignedRoundStart signRoundStart(const std::string& roundId,
                                    const Hash32& commitmentHash,
                                    const Wei& baseBuyIn);
    SignedHint signHint(const std::string& roundId,
                        const std::string& player,
                        std::uint8_t digitsCorrect,
                        std::uint8_t digitsInPlace,
                        std::uint64_t numericDistance);
    SignedPriceUpdate signPriceUpdate(const std::string& roundId, const Wei& newBuyIn);
    SignedWinnerDeclaration signWinner(const std::string& roundId, const std::string& winner);
    SignedAuditRoot signAuditRoot(const std::string& roundId,
                                  const Hash32& merkleRoot,
                                  std::uint64_t entryCount);

    // Hint, then price update when newBuyIn is set, then winner declaration
    // when declareWinner is true. Either all of them are signed or none is
    // and no nonce is consumed.
    GuessAttestations signGuessOutcome(const std::string& roundId,
                                       const std::string& player,
                                       std::uint8_t digitsCorrect,
                                       std::uint8_t digitsInPlace,
                                       std::uint64_t numericDistance,
                                       const std::optional<Wei>& newBuyIn,
                                       bool declareWinner);

    AttestationIdentity identity() const;
    const Signer& signer() const { return *signer_; }
    std::uint64_t peekNonce() const { return nonces_->peek(); }

    // Canonical packed encodings; an external verifier recomputes the same bytes.
    static PackedEncoder encode(const SignedRoundStart& msg);
    static PackedEncoder encode(const SignedHint& msg);
    static PackedEncoder encode(const SignedPriceUpdate& msg);
    static PackedEncoder encode(const SignedWinnerDeclaration& msg);
    static PackedEncoder encode(const SignedAuditRoot& msg);

    // Recomputes the digest from the record's fields and checks the signature.
    template <typename Message>
    static bool verify(const Message& msg, const std::vector<std::uint8_t>& publicKey) {
        Hash32 digest{};
        try {
            digest = encode(msg).digest();
        } catch (const GameError&) {
            return false;
        }
        if (digest != msg.attestation.digest) {
            return false;
        }
        return Ed25519Signer::verify(
            publicKey, std::vector<std::uint8_t>(digest.begin(), digest.end()), msg.attestation.signature);
    }

private:
    template <typename Message>
    Message attest(Message msg);
    template <typename Message>
    Message attest(Message msg, NonceCounter::Cursor& cursor);

    SignerPtr signer_;
    std::shared_ptr<NonceCounter> nonces_;
};

} // namespace hc
