#include "round.hpp"

#include <utility>

namespace hc {

const char* roundStatusName(RoundStatus status) {
    switch (status) {
    case RoundStatus::Active:
        return "active";
    case RoundStatus::Completed:
        return "completed";
    case RoundStatus::Aborted:
        return "aborted";
    }
    return "unknown";
}

bool InMemoryRoundRepository::insert(RoundSlotPtr slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = slot->round.id;
    return rounds_.emplace(std::move(id), std::move(slot)).second;
}

RoundSlotPtr InMemoryRoundRepository::find(const std::string& roundId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rounds_.find(roundId);
    if (it == rounds_.end()) {
        return nullptr;
    }
    return it->second;
}

void InMemoryRoundRepository::erase(const std::string& roundId) {
    std::lock_guard<std::mutex> lock(mutex_);
    rounds_.erase(roundId);
}

std::vector<std::string> InMemoryRoundRepository::roundIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(rounds_.size());
    for (const auto& entry : rounds_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace hc
