#pragma once

#include "attestation.hpp"
#include "audit_log.hpp"
#include "pricing.hpp"
#include "round.hpp"
#include "scoring.hpp"
#include "target.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hc {

struct RoundSnapshot {
    std::string roundId;
    RoundStatus status = RoundStatus::Active;
    Wei baseBuyIn;
    Wei currentBuyIn;
    Wei pool;
    std::size_t guessCount = 0;
    PriceTier priceTier = PriceTier::Base;
    Hash32 commitmentHash{};
    std::optional<std::string> winner;
    std::uint64_t startTime = 0;
    std::optional<std::uint64_t> endTime;
};

struct StartRoundResult {
    RoundSnapshot round;
    SignedRoundStart signedStart;
};

struct GuessOutcome {
    Hint hint;
    SignedHint signedHint;
    std::optional<SignedPriceUpdate> priceUpdate;
    std::optional<SignedWinnerDeclaration> winner;
};

struct AuditReport {
    std::string roundId;
    std::vector<AuditEntry> entries;
    Hash32 merkleRoot{};
    bool chainValid = true;
    std::optional<SignedAuditRoot> signedRoot;
};

struct RevealedTarget {
    std::string roundId;
    std::string secret;
    Salt salt{};
    Hash32 commitmentHash{};
};

struct GuessEvent {
    std::string player;
    Hint hint;
    RoundSnapshot round;
    bool priceEscalated = false;
};

using GuessObserver = std::function<void(const GuessEvent& event)>;

// Owns every round's state machine. Each round is mutated only under its own
// mutex; guesses against different rounds run in parallel.
class RoundLifecycleManager {
public:
    RoundLifecycleManager(PricingConfig pricing,
                          std::shared_ptr<AttestationService> attestation,
                          std::unique_ptr<TargetSource> targets,
                          std::unique_ptr<RoundRepository> rounds,
                          std::unique_ptr<AuditStore> auditStore,
                          std::uint64_t firstRoundId = 1);

    RoundLifecycleManager(const RoundLifecycleManager&) = delete;
    RoundLifecycleManager& operator=(const RoundLifecycleManager&) = delete;

    StartRoundResult startRound(const Wei& baseBuyIn);

    // Errors, in the order they are checked: NotFound, InvalidState,
    // InsufficientPayment, ValidationError (guess or player malformed).
    GuessOutcome submitGuess(const std::string& roundId,
                             const std::string& player,
                             const std::string& guess,
                             const Wei& buyInPaid);

    RoundSnapshot roundStatus(const std::string& roundId) const;
    AuditReport auditReport(const std::string& roundId);
    SignedAuditRoot anchorAuditRoot(const std::string& roundId);
    bool verifyAudit(const std::string& roundId) const;
    RevealedTarget reveal(const std::string& roundId) const;
    AttestationIdentity identity() const { return attestation_->identity(); }
    std::vector<std::string> roundIds() const { return rounds_->roundIds(); }

    const PricingEngine& pricing() const { return pricing_; }
    void setGuessObserver(GuessObserver observer) { observer_ = std::move(observer); }

private:
    RoundSlotPtr requireSlot(const std::string& roundId) const;
    static RoundSnapshot snapshot(const Round& round);

    PricingEngine pricing_;
    std::shared_ptr<AttestationService> attestation_;
    std::unique_ptr<TargetSource> targets_;
    std::mutex targetsMutex_;
    std::unique_ptr<RoundRepository> rounds_;
    std::unique_ptr<AuditStore> auditStore_;
    AuditLedger ledger_;
    std::atomic<std::uint64_t> nextRoundId_;
    GuessObserver observer_;
};

// In-memory engine with a libsodium target source.
std::unique_ptr<RoundLifecycleManager> makeInMemoryEngine(SignerPtr signer,
                                                          PricingConfig pricing,
                                                          std::uint64_t nonceFloor = 0,
                                                          std::uint64_t firstRoundId = 1);

} // namespace hc
