#include "PartnershipStatistics.h"

#include <stdexcept>
#include <string>
#include <utility>

using namespace wicketsim;

// PartnershipStatistics
PartnershipStatistics::PartnershipStatistics(DiscreteDistribution overs_, DiscreteDistribution runs_)
    : overs(std::move(overs_)), runs(std::move(runs_)) {
    if (overs.size() != MAX_PARTNERSHIP_OVERS + 1)
        throw std::invalid_argument("PartnershipStatistics: expected " + std::to_string(MAX_PARTNERSHIP_OVERS + 1) +
                                    " overs buckets, got " + std::to_string(overs.size()));
    if (runs.size() != MAX_PARTNERSHIP_RUNS + 1)
        throw std::invalid_argument("PartnershipStatistics: expected " + std::to_string(MAX_PARTNERSHIP_RUNS + 1) +
                                    " runs buckets, got " + std::to_string(runs.size()));
}

PartnershipStatistics PartnershipStatistics::uniform() {
    return PartnershipStatistics(DiscreteDistribution::uniform(MAX_PARTNERSHIP_OVERS + 1),
                                 DiscreteDistribution::uniform(MAX_PARTNERSHIP_RUNS + 1));
}


// PartnershipStore
void PartnershipStore::set(const int wicket, PartnershipStatistics stats) {
    if (wicket < 1 || wicket > WICKETS_PER_INNINGS)
        throw std::out_of_range("PartnershipStore: wicket index " + std::to_string(wicket) + " outside 1.." +
                                std::to_string(WICKETS_PER_INNINGS));
    slots_[wicket - 1].emplace(std::move(stats));
}

const PartnershipStatistics* PartnershipStore::find(const int wicket) const noexcept {
    if (wicket < 1 || wicket > WICKETS_PER_INNINGS) return nullptr;
    const auto& slot = slots_[wicket - 1];
    return slot ? &*slot : nullptr;
}

size_t PartnershipStore::size() const noexcept {
    size_t n = 0;
    for (const auto& slot : slots_)
        if (slot) ++n;
    return n;
}
