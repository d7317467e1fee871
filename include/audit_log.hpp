#pragma once

#include "packed_encoding.hpp"
#include "pricing.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hc {

enum class AuditEntryType { RoundStart, Guess, Hint, PriceChange, Winner };

const char* auditEntryTypeTag(AuditEntryType type);

struct RoundStartPayload {
    Hash32 commitmentHash{};
    Wei baseBuyIn;
};

struct GuessPayload {
    std::string player;
    Hash32 guessHash{};
    Wei buyInPaid;
};

struct HintPayload {
    std::string player;
    std::uint8_t digitsInPlace = 0;
    std::uint8_t digitsCorrect = 0;
    std::uint64_t numericDistance = 0;
};

struct PriceChangePayload {
    PriceTier newTier = PriceTier::Base;
    Wei newBuyIn;
};

struct WinnerPayload {
    std::string winner;
};

using AuditPayload =
    std::variant<RoundStartPayload, GuessPayload, HintPayload, PriceChangePayload, WinnerPayload>;

AuditEntryType payloadType(const AuditPayload& payload);

// Compact JSON with a fixed key order; this text is what gets hashed.
std::string serializePayload(const AuditPayload& payload);

struct AuditEntry {
    std::uint64_t index = 0;
    std::string type;
    std::string roundId;
    std::string data;
    std::uint64_t timestamp = 0; // unix milliseconds
    Hash32 previousHash{};
    Hash32 hash{};
};

// H(uint index | text type | text roundId | text data | uint timestamp |
//   bytes32 previousHash)
Hash32 computeEntryHash(std::uint64_t index,
                        const std::string& type,
                        const std::string& roundId,
                        const std::string& data,
                        std::uint64_t timestamp,
                        const Hash32& previousHash);

struct AuditTrail {
    std::string roundId;
    std::vector<AuditEntry> entries;
    std::optional<Hash32> cachedRoot; // empty means stale
};

struct MerkleProofStep {
    Hash32 sibling{};
    bool siblingIsLeft = false;
};

class AuditStore {
public:
    virtual ~AuditStore() = default;
    // Returns the trail for roundId, creating an empty one if needed. The
    // reference stays valid for the lifetime of the store.
    virtual AuditTrail& open(const std::string& roundId) = 0;
    virtual const AuditTrail* find(const std::string& roundId) const = 0;
};

class InMemoryAuditStore : public AuditStore {
public:
    AuditTrail& open(const std::string& roundId) override;
    const AuditTrail* find(const std::string& roundId) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<AuditTrail>> trails_;
};

// Hash-chained, Merkle-rootable event log, one trail per round. Callers
// serialize access per round; the ledger takes no per-trail lock.
class AuditLedger {
public:
    explicit AuditLedger(AuditStore& store);

    const AuditEntry& append(const std::string& roundId, const AuditPayload& payload);
    const AuditEntry& append(const std::string& roundId,
                             const AuditPayload& payload,
                             std::uint64_t timestampMs);

    Hash32 merkleRoot(const std::string& roundId);
    std::vector<MerkleProofStep> merkleProof(const std::string& roundId, std::size_t index) const;
    bool verifyChain(const std::string& roundId) const;

    std::vector<AuditEntry> trail(const std::string& roundId) const;
    std::size_t entryCount(const std::string& roundId) const;

    static Hash32 merkleRootOf(const std::vector<Hash32>& leaves);
    static bool verifyEntries(const std::vector<AuditEntry>& entries);
    static bool verifyMerkleProof(const Hash32& leaf,
                                  std::size_t index,
                                  const std::vector<MerkleProofStep>& proof,
                                  const Hash32& root);

private:
    AuditStore& store_;
};

} // namespace hc
