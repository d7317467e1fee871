#include "round_manager.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void fail(const std::string& msg) {
    hctest::fail("round_lifecycle_test", msg);
}

const std::string kAlice = "0x00000000000000000000000000000000000000a1";
const std::string kBob = "0x00000000000000000000000000000000000000b0";
const std::string kSecret = "123456789012";

std::unique_ptr<hc::RoundLifecycleManager> makeManager(std::deque<std::uint64_t> targets,
                                                       hc::SignerPtr signer,
                                                       std::uint64_t firstRoundId = 1,
                                                       std::shared_ptr<hc::NonceCounter> nonces = nullptr,
                                                       std::unique_ptr<hc::RoundRepository> rounds = nullptr,
                                                       std::unique_ptr<hc::AuditStore> auditStore = nullptr) {
    if (!nonces) {
        nonces = std::make_shared<hc::NonceCounter>();
    }
    if (!rounds) {
        rounds = std::make_unique<hc::InMemoryRoundRepository>();
    }
    auto attestation = std::make_shared<hc::AttestationService>(std::move(signer), std::move(nonces));
    return std::make_unique<hc::RoundLifecycleManager>(
        hc::defaultPricingConfig(),
        std::move(attestation),
        std::make_unique<hctest::ScriptedTargetSource>(std::move(targets)),
        std::move(rounds),
        std::move(auditStore),
        firstRoundId);
}

std::vector<std::string> entryTypes(const hc::AuditReport& report) {
    std::vector<std::string> types;
    for (const auto& entry : report.entries) {
        types.push_back(entry.type);
    }
    return types;
}

} // namespace

int main() {
    using namespace hc;

    auto signer = hctest::testSigner();
    const auto& publicKey = signer->publicKey();

    // Full round: escalation, a colder guess that keeps the price, then a win.
    {
        auto manager = makeManager({ 123'456'789'012ULL }, signer);
        std::size_t observed = 0;
        manager->setGuessObserver([&](const GuessEvent&) { ++observed; });

        const Wei base(1000);
        StartRoundResult started = manager->startRound(base);
        const RoundSnapshot& round = started.round;
        if (round.roundId != "1" || round.status != RoundStatus::Active || round.currentBuyIn != base ||
            round.priceTier != PriceTier::Base || round.pool != 0 || round.guessCount != 0 || round.winner) {
            fail("fresh round has the wrong initial state");
        }
        if (round.commitmentHash != computeCommitment(kSecret, "1", hctest::ScriptedTargetSource::saltForDraw(1))) {
            fail("published commitment does not bind the drawn secret");
        }
        if (started.signedStart.attestation.nonce != 0 ||
            !AttestationService::verify(started.signedStart, publicKey)) {
            fail("round start attestation invalid");
        }
        if (!hctest::throwsKind(ErrorKind::InvalidState, [&] { manager->reveal("1"); })) {
            fail("secret must stay sealed while the round is active");
        }

        GuessOutcome cold = manager->submitGuess("1", kAlice, "999999999999", base);
        if (cold.priceUpdate || cold.winner || cold.hint.priceTier != PriceTier::Base) {
            fail("distant guess must not escalate");
        }
        if (cold.signedHint.player != kAlice || !AttestationService::verify(cold.signedHint, publicKey)) {
            fail("hint attestation invalid");
        }

        if (!hctest::throwsKind(ErrorKind::InsufficientPayment,
                                [&] { manager->submitGuess("1", kBob, "123456788512", Wei(999)); })) {
            fail("underpayment must be rejected");
        }

        GuessOutcome warm = manager->submitGuess("1", kBob, "123456788512", base);
        if (warm.hint.numericDistance != 500 || !warm.priceUpdate || warm.priceUpdate->newBuyIn != Wei(2000)) {
            fail("distance 500 must escalate to the warm price");
        }
        if (manager->roundStatus("1").priceTier != PriceTier::Warm) {
            fail("round tier not updated to warm");
        }

        if (!hctest::throwsKind(ErrorKind::InsufficientPayment,
                                [&] { manager->submitGuess("1", kAlice, "123456788962", Wei(1999)); })) {
            fail("old price must no longer be accepted");
        }
        GuessOutcome hot = manager->submitGuess("1", kAlice, "123456788962", Wei(2000));
        if (hot.hint.numericDistance != 50 || !hot.priceUpdate || hot.priceUpdate->newBuyIn != Wei(5000)) {
            fail("distance 50 must escalate to the hot price");
        }
        if (hot.priceUpdate->attestation.nonce <= hot.signedHint.attestation.nonce ||
            !AttestationService::verify(*hot.priceUpdate, publicKey)) {
            fail("price update must be signed after its hint");
        }

        GuessOutcome colder = manager->submitGuess("1", kBob, "999999999999", Wei(5000));
        RoundSnapshot afterCold = manager->roundStatus("1");
        if (colder.priceUpdate || afterCold.priceTier != PriceTier::Hot || afterCold.currentBuyIn != Wei(5000)) {
            fail("price must never go back down");
        }

        GuessOutcome win = manager->submitGuess("1", kBob, kSecret, Wei(5000));
        if (!win.hint.isExactMatch || win.hint.digitsInPlace != 12 || !win.winner || win.winner->winner != kBob) {
            fail("exact guess must win");
        }
        if (!win.priceUpdate ||
            !(win.signedHint.attestation.nonce < win.priceUpdate->attestation.nonce &&
              win.priceUpdate->attestation.nonce < win.winner->attestation.nonce)) {
            fail("winning guess must sign hint, price, then winner");
        }
        if (!AttestationService::verify(*win.winner, publicKey)) {
            fail("winner declaration invalid");
        }

        RoundSnapshot done = manager->roundStatus("1");
        if (done.status != RoundStatus::Completed || !done.winner || *done.winner != kBob || !done.endTime ||
            done.guessCount != 5 || done.pool != Wei(1000 + 1000 + 2000 + 5000 + 5000)) {
            fail("completed round snapshot is wrong");
        }
        if (!hctest::throwsKind(ErrorKind::InvalidState,
                                [&] { manager->submitGuess("1", kAlice, kSecret, Wei(1'000'000)); })) {
            fail("completed round must reject guesses");
        }
        if (observed != 5) {
            fail("observer should see every accepted guess");
        }

        AuditReport report = manager->auditReport("1");
        std::vector<std::string> expected{ "ROUND_START", "GUESS", "HINT",  "GUESS", "HINT",
                                           "PRICE_CHANGE", "GUESS", "HINT", "PRICE_CHANGE", "GUESS",
                                           "HINT",  "GUESS", "HINT", "PRICE_CHANGE", "WINNER" };
        if (entryTypes(report) != expected) {
            fail("audit trail has the wrong event sequence");
        }
        if (!report.chainValid || !manager->verifyAudit("1")) {
            fail("audit chain must verify");
        }
        if (report.entries[1].data.find(kSecret) != std::string::npos ||
            report.entries[1].data.find("999999999999") != std::string::npos) {
            fail("guess entries must not carry the raw guess");
        }
        if (!report.signedRoot || report.signedRoot->merkleRoot != report.merkleRoot ||
            report.signedRoot->entryCount != report.entries.size() ||
            !AttestationService::verify(*report.signedRoot, publicKey)) {
            fail("audit report root attestation invalid");
        }
        if (report.merkleRoot != AuditLedger::merkleRootOf([&] {
                std::vector<Hash32> leaves;
                for (const auto& entry : report.entries) {
                    leaves.push_back(entry.hash);
                }
                return leaves;
            }())) {
            fail("report root does not match its entries");
        }

        SignedAuditRoot anchored = manager->anchorAuditRoot("1");
        if (anchored.entryCount != expected.size() || anchored.merkleRoot != report.merkleRoot ||
            anchored.attestation.nonce <= report.signedRoot->attestation.nonce) {
            fail("anchor must sign the current root with a fresh nonce");
        }

        RevealedTarget revealed = manager->reveal("1");
        if (revealed.secret != kSecret ||
            computeCommitment(revealed.secret, revealed.roundId, revealed.salt) != round.commitmentHash) {
            fail("revealed secret must open the published commitment");
        }
    }

    // Input validation precedes lookup; lookup precedes state checks.
    {
        auto manager = makeManager({ 1ULL }, signer, 40);
        StartRoundResult started = manager->startRound(Wei(10));
        if (started.round.roundId != "40") {
            fail("round ids must start at the configured first id");
        }
        if (!hctest::throwsKind(ErrorKind::ValidationError, [&] { manager->startRound(Wei(0)); })) {
            fail("zero base buy-in must be rejected");
        }
        if (!hctest::throwsKind(ErrorKind::ValidationError,
                                [&] { manager->submitGuess("40", kAlice, "12345", Wei(10)); })) {
            fail("short guess must be rejected");
        }
        if (!hctest::throwsKind(ErrorKind::ValidationError,
                                [&] { manager->submitGuess("40", kAlice, "12345678901a", Wei(10)); })) {
            fail("non-digit guess must be rejected");
        }
        if (!hctest::throwsKind(ErrorKind::ValidationError,
                                [&] { manager->submitGuess("40", "0x12", "123456789012", Wei(10)); })) {
            fail("malformed player must be rejected");
        }
        if (!hctest::throwsKind(ErrorKind::NotFound,
                                [&] { manager->submitGuess("nope", kAlice, "bad", Wei(10)); })) {
            fail("round lookup must run before guess validation");
        }
        if (!hctest::throwsKind(ErrorKind::InsufficientPayment,
                                [&] { manager->submitGuess("40", "0x12", "bad", Wei(9)); })) {
            fail("payment must be checked before guess validation");
        }
        if (!hctest::throwsKind(ErrorKind::NotFound,
                                [&] { manager->submitGuess("nope", kAlice, "123456789012", Wei(10)); })) {
            fail("unknown round must be NotFound");
        }
        if (!hctest::throwsKind(ErrorKind::NotFound, [&] { manager->roundStatus("41"); }) ||
            !hctest::throwsKind(ErrorKind::NotFound, [&] { manager->auditReport("41"); }) ||
            !hctest::throwsKind(ErrorKind::NotFound, [&] { manager->reveal("41"); })) {
            fail("queries on unknown rounds must be NotFound");
        }
        GuessOutcome leading = manager->submitGuess("40", kAlice, "000000000001", Wei(10));
        if (!leading.winner) {
            fail("secret with leading zeros must be guessable");
        }
        if (!hctest::throwsKind(ErrorKind::InvalidState,
                                [&] { manager->submitGuess("40", kAlice, "bad", Wei(10)); })) {
            fail("closed round must report InvalidState before guess validation");
        }
        auto ids = manager->roundIds();
        if (ids.size() != 1 || ids.front() != "40") {
            fail("roundIds should list the single round");
        }
    }

    // Many players on one round: every guess lands and the chain stays intact.
    {
        auto manager = makeManager({ 555'555'555'555ULL }, signer);
        const std::string roundId = manager->startRound(Wei(3)).round.roundId;
        constexpr int kThreads = 8;
        constexpr int kPerThread = 10;
        std::atomic<int> errors{ 0 };
        std::vector<std::thread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&] {
                for (int i = 0; i < kPerThread; ++i) {
                    try {
                        manager->submitGuess(roundId, kAlice, "999999999999", Wei(3));
                    } catch (const GameError&) {
                        ++errors;
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        RoundSnapshot snap = manager->roundStatus(roundId);
        if (errors.load() != 0 || snap.guessCount != kThreads * kPerThread ||
            snap.pool != Wei(3 * kThreads * kPerThread)) {
            fail("concurrent guesses lost updates");
        }
        AuditReport report = manager->auditReport(roundId);
        if (!report.chainValid || report.entries.size() != 1 + 2 * kThreads * kPerThread) {
            fail("concurrent guesses corrupted the audit chain");
        }
    }

    // Racing exact guesses: one winner, everyone else sees a closed round.
    {
        auto manager = makeManager({ 777'777'777'777ULL }, signer);
        const std::string roundId = manager->startRound(Wei(1)).round.roundId;
        constexpr int kThreads = 8;
        std::atomic<int> winners{ 0 };
        std::atomic<int> closed{ 0 };
        std::atomic<int> unexpected{ 0 };
        std::vector<std::thread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&] {
                try {
                    GuessOutcome outcome = manager->submitGuess(roundId, kBob, "777777777777", Wei(100));
                    if (outcome.winner) {
                        ++winners;
                    }
                } catch (const GameError& ex) {
                    if (ex.kind() == ErrorKind::InvalidState) {
                        ++closed;
                    } else {
                        ++unexpected;
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        if (winners.load() != 1 || closed.load() != kThreads - 1 || unexpected.load() != 0) {
            fail("exactly one racing exact guess must win");
        }
        AuditReport report = manager->auditReport(roundId);
        auto winnerEntries = std::count_if(report.entries.begin(), report.entries.end(), [](const AuditEntry& entry) {
            return entry.type == "WINNER";
        });
        if (winnerEntries != 1 || report.entries.back().type != "WINNER") {
            fail("winner entry must close the trail");
        }
    }

    // A signer failure mid-guess leaves the round and the nonce counter untouched.
    {
        auto flaky = std::make_shared<hctest::SwitchableSigner>(signer);
        auto nonces = std::make_shared<NonceCounter>();
        auto manager = makeManager({ 42ULL }, flaky, 1, nonces);
        const std::string roundId = manager->startRound(Wei(5)).round.roundId;
        const std::uint64_t before = nonces->peek();

        // The hint and price update sign, the winner declaration does not.
        flaky->failAfter(2);
        bool threw = false;
        try {
            manager->submitGuess(roundId, kAlice, "000000000042", Wei(5));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        if (!threw || nonces->peek() != before) {
            fail("a partly signed guess must not consume nonces");
        }
        flaky->restore();
        RoundSnapshot snap = manager->roundStatus(roundId);
        if (snap.guessCount != 0 || snap.pool != 0 || snap.status != RoundStatus::Active ||
            manager->auditReport(roundId).entries.size() != 1) {
            fail("failed signature must not change round state");
        }

        // The report above signed its root, so the retry starts one later.
        const std::uint64_t resume = nonces->peek();
        GuessOutcome retry = manager->submitGuess(roundId, kAlice, "000000000042", Wei(5));
        if (resume != before + 1 || retry.signedHint.attestation.nonce != resume || !retry.priceUpdate ||
            retry.priceUpdate->attestation.nonce != resume + 1 || !retry.winner ||
            retry.winner->attestation.nonce != resume + 2) {
            fail("retried guess must be signed under consecutive nonces");
        }
    }

    // A start that cannot be attested leaves nothing behind.
    {
        auto flaky = std::make_shared<hctest::SwitchableSigner>(signer);
        auto nonces = std::make_shared<NonceCounter>();
        auto manager = makeManager({ 7ULL, 8ULL }, flaky, 1, nonces);
        flaky->breakSigning();
        bool threw = false;
        try {
            manager->startRound(Wei(5));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        if (!threw || !manager->roundIds().empty() || nonces->peek() != 0) {
            fail("unattested start must not leave a round behind");
        }
        flaky->restore();
        StartRoundResult next = manager->startRound(Wei(5));
        if (next.round.roundId != "2" || next.signedStart.attestation.nonce != 0) {
            fail("next start must get a fresh id and the unused nonce");
        }
    }

    // An id that already exists is refused without touching its round or trail.
    {
        auto rounds = std::make_unique<InMemoryRoundRepository>();
        auto existing = std::make_shared<RoundSlot>();
        existing->round.id = "1";
        existing->round.status = RoundStatus::Completed;
        rounds->insert(existing);

        auto nonces = std::make_shared<NonceCounter>();
        auto manager = makeManager({ 5ULL, 6ULL }, signer, 1, nonces, std::move(rounds));
        if (!hctest::throwsKind(ErrorKind::InvalidState, [&] { manager->startRound(Wei(5)); })) {
            fail("colliding round id must be refused");
        }
        if (nonces->peek() != 0 || !manager->auditReport("1").entries.empty() ||
            manager->roundStatus("1").status != RoundStatus::Completed) {
            fail("refused start must not sign or log anything for the existing round");
        }
        if (manager->startRound(Wei(5)).round.roundId != "2") {
            fail("manager must move past the colliding id");
        }

        auto store = std::make_unique<InMemoryAuditStore>();
        InMemoryAuditStore* storeView = store.get();
        AuditLedger(*store).append("1", WinnerPayload{ kAlice }, 1);
        auto fresh = makeManager({ 5ULL }, signer, 1, nullptr, nullptr, std::move(store));
        if (!hctest::throwsKind(ErrorKind::InvalidState, [&] { fresh->startRound(Wei(5)); })) {
            fail("id with an existing audit trail must be refused");
        }
        if (storeView->find("1")->entries.size() != 1 || !fresh->roundIds().empty()) {
            fail("existing trail must be left as it was");
        }
    }

    // Production wiring with the libsodium target source.
    {
        auto engine = makeInMemoryEngine(signer, defaultPricingConfig(), 500, 9);
        StartRoundResult started = engine->startRound(Wei(1));
        if (started.round.roundId != "9" || started.signedStart.attestation.nonce != 500) {
            fail("engine factory ignored its floor or first id");
        }
        if (engine->identity().address != formatAddress(signer->address())) {
            fail("engine identity must come from its signer");
        }
    }

    std::cout << "round_lifecycle_test passed" << std::endl;
    return 0;
}
