#pragma once

#include "packed_encoding.hpp"
#include "pricing.hpp"
#include "scoring.hpp"
#include "target.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hc {

// Aborted marks a round whose start could not be attested; it never accepts
// guesses.
enum class RoundStatus { Active, Completed, Aborted };

const char* roundStatusName(RoundStatus status);

struct GuessRecord {
    std::string player;
    std::string guess;
    Hint hint;
    Wei buyInPaid;
    std::uint64_t timestamp = 0;
};

struct Round {
    std::string id;
    RoundSecret secret;
    Wei baseBuyIn;
    Wei currentBuyIn;
    PriceTier currentTier = PriceTier::Base;
    Wei pool;
    std::vector<GuessRecord> guesses;
    RoundStatus status = RoundStatus::Active;
    std::optional<std::string> winner;
    std::uint64_t startTime = 0;
    std::optional<std::uint64_t> endTime;
};

// A round plus the mutex that serializes every mutation of it and of its
// audit trail.
struct RoundSlot {
    std::mutex mutex;
    Round round;
};

using RoundSlotPtr = std::shared_ptr<RoundSlot>;

class RoundRepository {
public:
    virtual ~RoundRepository() = default;
    // Returns false if a round with the same id already exists.
    virtual bool insert(RoundSlotPtr slot) = 0;
    virtual RoundSlotPtr find(const std::string& roundId) const = 0;
    virtual void erase(const std::string& roundId) = 0;
    virtual std::vector<std::string> roundIds() const = 0;
};

class InMemoryRoundRepository : public RoundRepository {
public:
    bool insert(RoundSlotPtr slot) override;
    RoundSlotPtr find(const std::string& roundId) const override;
    void erase(const std::string& roundId) override;
    std::vector<std::string> roundIds() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, RoundSlotPtr> rounds_;
};

} // namespace hc
