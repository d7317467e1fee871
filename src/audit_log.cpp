#include "audit_log.hpp"

#include "clock.hpp"
#include "hex.hpp"

#include <sstream>
#include <type_traits>

namespace hc {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::vector<Hash32> paddedLeaves(const std::vector<Hash32>& leaves) {
    std::vector<Hash32> layer = leaves;
    std::size_t width = 1;
    while (width < layer.size()) {
        width <<= 1;
    }
    layer.resize(width, kZeroHash);
    return layer;
}

std::vector<Hash32> leafHashes(const AuditTrail& trail) {
    std::vector<Hash32> leaves;
    leaves.reserve(trail.entries.size());
    for (const auto& entry : trail.entries) {
        leaves.push_back(entry.hash);
    }
    return leaves;
}

} // namespace

const char* auditEntryTypeTag(AuditEntryType type) {
    switch (type) {
    case AuditEntryType::RoundStart:
        return "ROUND_START";
    case AuditEntryType::Guess:
        return "GUESS";
    case AuditEntryType::Hint:
        return "HINT";
    case AuditEntryType::PriceChange:
        return "PRICE_CHANGE";
    case AuditEntryType::Winner:
        return "WINNER";
    }
    return "UNKNOWN";
}

AuditEntryType payloadType(const AuditPayload& payload) {
    return std::visit(Overloaded{
                          [](const RoundStartPayload&) { return AuditEntryType::RoundStart; },
                          [](const GuessPayload&) { return AuditEntryType::Guess; },
                          [](const HintPayload&) { return AuditEntryType::Hint; },
                          [](const PriceChangePayload&) { return AuditEntryType::PriceChange; },
                          [](const WinnerPayload&) { return AuditEntryType::Winner; },
                      },
                      payload);
}

std::string serializePayload(const AuditPayload& payload) {
    std::ostringstream json;
    std::visit(Overloaded{
                   [&](const RoundStartPayload& p) {
                       json << "{\"commitmentHash\":\"" << toPrefixedHex(p.commitmentHash)
                            << "\",\"baseBuyIn\":\"" << formatWei(p.baseBuyIn) << "\"}";
                   },
                   [&](const GuessPayload& p) {
                       json << "{\"player\":\"" << p.player << "\",\"guessHash\":\""
                            << toPrefixedHex(p.guessHash) << "\",\"buyInPaid\":\""
                            << formatWei(p.buyInPaid) << "\"}";
                   },
                   [&](const HintPayload& p) {
                       json << "{\"player\":\"" << p.player
                            << "\",\"digitsInPlace\":" << static_cast<unsigned>(p.digitsInPlace)
                            << ",\"digitsCorrect\":" << static_cast<unsigned>(p.digitsCorrect)
                            << ",\"numericDistance\":\"" << p.numericDistance << "\"}";
                   },
                   [&](const PriceChangePayload& p) {
                       json << "{\"newTier\":\"" << priceTierName(p.newTier) << "\",\"newBuyIn\":\""
                            << formatWei(p.newBuyIn) << "\"}";
                   },
                   [&](const WinnerPayload& p) { json << "{\"winner\":\"" << p.winner << "\"}"; },
               },
               payload);
    return json.str();
}

Hash32 computeEntryHash(std::uint64_t index,
                        const std::string& type,
                        const std::string& roundId,
                        const std::string& data,
                        std::uint64_t timestamp,
                        const Hash32& previousHash) {
    PackedEncoder enc;
    enc.uint256(index).text(type).text(roundId).text(data).uint256(timestamp).bytes32(previousHash);
    return enc.digest();
}

AuditTrail& InMemoryAuditStore::open(const std::string& roundId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = trails_[roundId];
    if (!slot) {
        slot = std::make_unique<AuditTrail>();
        slot->roundId = roundId;
    }
    return *slot;
}

const AuditTrail* InMemoryAuditStore::find(const std::string& roundId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trails_.find(roundId);
    if (it == trails_.end()) {
        return nullptr;
    }
    return it->second.get();
}

AuditLedger::AuditLedger(AuditStore& store)
    : store_(store) {}

const AuditEntry& AuditLedger::append(const std::string& roundId, const AuditPayload& payload) {
    return append(roundId, payload, unixMillis());
}

const AuditEntry& AuditLedger::append(const std::string& roundId,
                                      const AuditPayload& payload,
                                      std::uint64_t timestampMs) {
    AuditTrail& trail = store_.open(roundId);

    AuditEntry entry;
    entry.index = trail.entries.size();
    entry.type = auditEntryTypeTag(payloadType(payload));
    entry.roundId = roundId;
    entry.data = serializePayload(payload);
    entry.timestamp = timestampMs;
    entry.previousHash = trail.entries.empty() ? kZeroHash : trail.entries.back().hash;
    entry.hash = computeEntryHash(
        entry.index, entry.type, entry.roundId, entry.data, entry.timestamp, entry.previousHash);

    trail.entries.push_back(std::move(entry));
    trail.cachedRoot.reset();
    return trail.entries.back();
}

Hash32 AuditLedger::merkleRoot(const std::string& roundId) {
    const AuditTrail* existing = store_.find(roundId);
    if (existing == nullptr || existing->entries.empty()) {
        return kZeroHash;
    }

    AuditTrail& trail = store_.open(roundId);
    if (!trail.cachedRoot) {
        trail.cachedRoot = merkleRootOf(leafHashes(trail));
    }
    return *trail.cachedRoot;
}

Hash32 AuditLedger::merkleRootOf(const std::vector<Hash32>& leaves) {
    if (leaves.empty()) {
        return kZeroHash;
    }

    std::vector<Hash32> layer = paddedLeaves(leaves);
    while (layer.size() > 1) {
        std::vector<Hash32> next;
        next.reserve(layer.size() / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            next.push_back(hashPair(layer[i], layer[i + 1]));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<MerkleProofStep> AuditLedger::merkleProof(const std::string& roundId,
                                                      std::size_t index) const {
    std::vector<MerkleProofStep> proof;
    const AuditTrail* trail = store_.find(roundId);
    if (trail == nullptr || index >= trail->entries.size()) {
        return proof;
    }

    std::vector<Hash32> layer = paddedLeaves(leafHashes(*trail));
    while (layer.size() > 1) {
        std::size_t siblingIdx = index ^ 1U;
        proof.push_back({ layer[siblingIdx], (index & 1U) != 0 });

        std::vector<Hash32> next;
        next.reserve(layer.size() / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            next.push_back(hashPair(layer[i], layer[i + 1]));
        }
        layer = std::move(next);
        index >>= 1;
    }
    return proof;
}

bool AuditLedger::verifyMerkleProof(const Hash32& leaf,
                                    std::size_t index,
                                    const std::vector<MerkleProofStep>& proof,
                                    const Hash32& root) {
    Hash32 node = leaf;
    for (const auto& step : proof) {
        if (step.siblingIsLeft != ((index & 1U) != 0)) {
            return false;
        }
        node = step.siblingIsLeft ? hashPair(step.sibling, node) : hashPair(node, step.sibling);
        index >>= 1;
    }
    return index == 0 && node == root;
}

bool AuditLedger::verifyChain(const std::string& roundId) const {
    const AuditTrail* trail = store_.find(roundId);
    if (trail == nullptr) {
        return true;
    }
    return verifyEntries(trail->entries);
}

bool AuditLedger::verifyEntries(const std::vector<AuditEntry>& entries) {
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (entry.index != i) {
            return false;
        }
        const Hash32& expectedPrev = i > 0 ? entries[i - 1].hash : kZeroHash;
        if (entry.previousHash != expectedPrev) {
            return false;
        }
        Hash32 expected = computeEntryHash(
            entry.index, entry.type, entry.roundId, entry.data, entry.timestamp, entry.previousHash);
        if (entry.hash != expected) {
            return false;
        }
    }
    return true;
}

std::vector<AuditEntry> AuditLedger::trail(const std::string& roundId) const {
    const AuditTrail* trail = store_.find(roundId);
    if (trail == nullptr) {
        return {};
    }
    return trail->entries;
}

std::size_t AuditLedger::entryCount(const std::string& roundId) const {
    const AuditTrail* trail = store_.find(roundId);
    return trail == nullptr ? 0 : trail->entries.size();
}

} // namespace hc
