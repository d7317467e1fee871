#include "round_manager.hpp"

#include "clock.hpp"
#include "errors.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace hc {

RoundLifecycleManager::RoundLifecycleManager(PricingConfig pricing,
                                             std::shared_ptr<AttestationService> attestation,
                                             std::unique_ptr<TargetSource> targets,
                                             std::unique_ptr<RoundRepository> rounds,
                                             std::unique_ptr<AuditStore> auditStore,
                                             std::uint64_t firstRoundId)
    : pricing_(std::move(pricing))
    , attestation_(std::move(attestation))
    , targets_(std::move(targets))
    , rounds_(std::move(rounds))
    , auditStore_(auditStore ? std::move(auditStore) : std::make_unique<InMemoryAuditStore>())
    , ledger_(*auditStore_)
    , nextRoundId_(firstRoundId) {
    if (!attestation_) {
        throw GameError(ErrorKind::SignerUnavailable, "round manager requires an attestation service");
    }
    if (!targets_ || !rounds_) {
        throw std::invalid_argument("round manager requires a target source and a round repository");
    }
}

StartRoundResult RoundLifecycleManager::startRound(const Wei& baseBuyIn) {
    if (baseBuyIn == 0) {
        throw GameError(ErrorKind::ValidationError, "baseBuyIn must be positive");
    }

    auto slot = std::make_shared<RoundSlot>();
    std::lock_guard<std::mutex> roundLock(slot->mutex);

    Round& round = slot->round;
    round.id = std::to_string(nextRoundId_.fetch_add(1));
    if (ledger_.entryCount(round.id) != 0) {
        throw GameError(ErrorKind::InvalidState, "audit trail already exists for round " + round.id);
    }
    // Claim the id before signing or logging anything for it. The slot stays
    // locked, so nobody observes the round until it is fully built.
    if (!rounds_->insert(slot)) {
        throw GameError(ErrorKind::InvalidState, "round id already in use: " + round.id);
    }

    SignedRoundStart signedStart;
    try {
        {
            std::lock_guard<std::mutex> targetsLock(targetsMutex_);
            round.secret = newRoundSecret(*targets_, round.id);
        }
        round.baseBuyIn = baseBuyIn;
        round.currentBuyIn = pricing_.buyInForTier(baseBuyIn, pricing_.loosestTier());
        round.currentTier = pricing_.loosestTier();
        round.pool = 0;
        round.startTime = unixMillis();

        signedStart = attestation_->signRoundStart(round.id, round.secret.commitment, round.baseBuyIn);
    } catch (const std::exception&) {
        round.status = RoundStatus::Aborted;
        rounds_->erase(round.id);
        throw;
    }

    ledger_.append(round.id, RoundStartPayload{ round.secret.commitment, round.baseBuyIn }, round.startTime);

    return StartRoundResult{ snapshot(round), std::move(signedStart) };
}

GuessOutcome RoundLifecycleManager::submitGuess(const std::string& roundId,
                                                const std::string& player,
                                                const std::string& guess,
                                                const Wei& buyInPaid) {
    RoundSlotPtr slot = requireSlot(roundId);
    GuessEvent event;
    GuessOutcome outcome;
    {
        std::lock_guard<std::mutex> roundLock(slot->mutex);
        Round& round = slot->round;

        if (round.status != RoundStatus::Active) {
            throw GameError(ErrorKind::InvalidState, "round " + roundId + " is not active");
        }
        if (buyInPaid < round.currentBuyIn) {
            std::ostringstream oss;
            oss << "buy-in " << formatWei(buyInPaid) << " is below the current price "
                << formatWei(round.currentBuyIn);
            throw GameError(ErrorKind::InsufficientPayment, oss.str());
        }
        if (!isValidGuess(guess)) {
            throw GameError(ErrorKind::ValidationError,
                            "InvalidGuessFormat: guess must be exactly 12 decimal digits");
        }
        const std::string playerId = formatAddress(parseAddress(player));

        outcome.hint = score(round.secret.secret, guess, pricing_);
        const Hint& hint = outcome.hint;
        const bool escalate = pricing_.shouldEscalate(round.currentTier, hint.numericDistance);
        std::optional<Wei> newBuyIn;
        if (escalate) {
            newBuyIn = pricing_.buyInForTier(round.baseBuyIn, hint.priceTier);
        }

        // All or nothing: a failing signer leaves the round and the nonce
        // counter untouched.
        GuessAttestations signedOutcome = attestation_->signGuessOutcome(roundId,
                                                                         playerId,
                                                                         hint.digitsCorrect,
                                                                         hint.digitsInPlace,
                                                                         hint.numericDistance,
                                                                         newBuyIn,
                                                                         hint.isExactMatch);
        outcome.signedHint = std::move(signedOutcome.hint);
        outcome.priceUpdate = std::move(signedOutcome.priceUpdate);
        outcome.winner = std::move(signedOutcome.winner);

        const std::uint64_t now = unixMillis();
        round.guesses.push_back(GuessRecord{ playerId, guess, hint, buyInPaid, now });
        round.pool += buyInPaid;

        ledger_.append(roundId, GuessPayload{ playerId, sha256(guess), buyInPaid }, now);
        ledger_.append(roundId,
                       HintPayload{ playerId, hint.digitsInPlace, hint.digitsCorrect, hint.numericDistance },
                       now);

        if (escalate) {
            round.currentTier = hint.priceTier;
            round.currentBuyIn = *newBuyIn;
            ledger_.append(roundId, PriceChangePayload{ hint.priceTier, *newBuyIn }, now);
        }

        if (hint.isExactMatch) {
            round.status = RoundStatus::Completed;
            round.winner = playerId;
            round.endTime = now;
            ledger_.append(roundId, WinnerPayload{ playerId }, now);
        }

        event.player = playerId;
        event.hint = hint;
        event.round = snapshot(round);
        event.priceEscalated = escalate;
    }

    if (observer_) {
        observer_(event);
    }
    return outcome;
}

RoundSnapshot RoundLifecycleManager::roundStatus(const std::string& roundId) const {
    RoundSlotPtr slot = requireSlot(roundId);
    std::lock_guard<std::mutex> roundLock(slot->mutex);
    return snapshot(slot->round);
}

AuditReport RoundLifecycleManager::auditReport(const std::string& roundId) {
    RoundSlotPtr slot = requireSlot(roundId);
    std::lock_guard<std::mutex> roundLock(slot->mutex);

    AuditReport report;
    report.roundId = roundId;
    report.entries = ledger_.trail(roundId);
    report.chainValid = AuditLedger::verifyEntries(report.entries);
    report.merkleRoot = ledger_.merkleRoot(roundId);
    if (!report.entries.empty() && report.chainValid) {
        report.signedRoot = attestation_->signAuditRoot(roundId, report.merkleRoot, report.entries.size());
    }
    return report;
}

SignedAuditRoot RoundLifecycleManager::anchorAuditRoot(const std::string& roundId) {
    RoundSlotPtr slot = requireSlot(roundId);
    std::lock_guard<std::mutex> roundLock(slot->mutex);
    if (!ledger_.verifyChain(roundId)) {
        throw GameError(ErrorKind::IntegrityViolation,
                        "audit chain for round " + roundId + " failed verification; refusing to anchor");
    }
    return attestation_->signAuditRoot(roundId, ledger_.merkleRoot(roundId), ledger_.entryCount(roundId));
}

bool RoundLifecycleManager::verifyAudit(const std::string& roundId) const {
    RoundSlotPtr slot = requireSlot(roundId);
    std::lock_guard<std::mutex> roundLock(slot->mutex);
    return ledger_.verifyChain(roundId);
}

RevealedTarget RoundLifecycleManager::reveal(const std::string& roundId) const {
    RoundSlotPtr slot = requireSlot(roundId);
    std::lock_guard<std::mutex> roundLock(slot->mutex);
    const Round& round = slot->round;
    if (round.status != RoundStatus::Completed) {
        throw GameError(ErrorKind::InvalidState, "round " + roundId + " is still active; secret stays sealed");
    }
    return RevealedTarget{ round.id, round.secret.secret, round.secret.salt, round.secret.commitment };
}

RoundSlotPtr RoundLifecycleManager::requireSlot(const std::string& roundId) const {
    RoundSlotPtr slot = rounds_->find(roundId);
    if (!slot) {
        throw GameError(ErrorKind::NotFound, "round not found: " + roundId);
    }
    return slot;
}

RoundSnapshot RoundLifecycleManager::snapshot(const Round& round) {
    RoundSnapshot out;
    out.roundId = round.id;
    out.status = round.status;
    out.baseBuyIn = round.baseBuyIn;
    out.currentBuyIn = round.currentBuyIn;
    out.pool = round.pool;
    out.guessCount = round.guesses.size();
    out.priceTier = round.currentTier;
    out.commitmentHash = round.secret.commitment;
    out.winner = round.winner;
    out.startTime = round.startTime;
    out.endTime = round.endTime;
    return out;
}

std::unique_ptr<RoundLifecycleManager> makeInMemoryEngine(SignerPtr signer,
                                                          PricingConfig pricing,
                                                          std::uint64_t nonceFloor,
                                                          std::uint64_t firstRoundId) {
    auto attestation =
        std::make_shared<AttestationService>(std::move(signer), std::make_shared<NonceCounter>(nonceFloor));
    return std::make_unique<RoundLifecycleManager>(std::move(pricing),
                                                   std::move(attestation),
                                                   std::make_unique<SecureTargetSource>(),
                                                   std::make_unique<InMemoryRoundRepository>(),
                                                   std::make_unique<InMemoryAuditStore>(),
                                                   firstRoundId);
}

} // namespace hc
