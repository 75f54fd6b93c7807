#include "Collector.h"
#include <algorithm>
#include <cassert>
#include <stdexcept>

using namespace wicketsim;

// OutcomeCounter
void OutcomeCounter::save(const TrialResult& result) {
    switch (result.outcome) {
    case MatchOutcome::WIN:
        ++wins_;
        break;
    case MatchOutcome::DRAW:
        ++draws_;
        break;
    case MatchOutcome::LOSS:
        ++losses_;
        break;
    }
}

void OutcomeCounter::merge(const TrialCollector& other) {
    const auto& o = dynamic_cast<const OutcomeCounter&>(other);
    wins_ += o.wins_;
    draws_ += o.draws_;
    losses_ += o.losses_;
}

OutcomeProbabilities OutcomeCounter::probabilities() const noexcept {
    const long n = total();
    if (n == 0) return {};
    const auto d = static_cast<double>(n);
    // the last non-empty outcome takes the remainder, so win + draw + loss == 1.0 exactly
    OutcomeProbabilities p{wins_ / d, draws_ / d, losses_ / d};
    if (losses_ > 0) p.loss = 1.0 - (p.win + p.draw);
    else if (draws_ > 0) p.draw = 1.0 - p.win;
    else p.win = 1.0;
    return p;
}


// LeadHistogram
LeadHistogram::LeadHistogram(const int lo, const int hi, const int binWidth) : lo_(lo), hi_(hi), binWidth_(binWidth) {
    if (lo >= hi) throw std::invalid_argument("LeadHistogram: lo must be < hi");
    if (binWidth <= 0) throw std::invalid_argument("LeadHistogram: binWidth must be positive");
    hist_.assign((hi - lo + binWidth - 1) / binWidth, 0);
}

void LeadHistogram::save(const TrialResult& result) {
    const int last = static_cast<int>(hist_.size()) - 1;
    const int bin = result.finalLead < lo_ ? 0 : std::min((result.finalLead - lo_) / binWidth_, last);
    hist_[bin] += 1;
}

void LeadHistogram::merge(const TrialCollector& other) {
    const auto& o = dynamic_cast<const LeadHistogram&>(other);
    assert(o.hist_.size() == hist_.size());
    for (size_t i = 0; i < hist_.size(); ++i)
        hist_[i] += o.hist_[i];
}


// CollectorGroup
CollectorGroup::CollectorGroup(const std::vector<std::shared_ptr<TrialCollector>>& collectors) {
    collectors_.reserve(collectors.size());
    for (const auto& collector : collectors)
        collectors_.emplace_back(collector->clone());
}

CollectorGroup::CollectorGroup(const CollectorGroup& other) {
    collectors_.reserve(other.collectors_.size());
    for (const auto& collector : other.collectors_)
        collectors_.emplace_back(collector->clone());
}

void CollectorGroup::merge(const TrialCollector& other) {
    const auto& o = dynamic_cast<const CollectorGroup&>(other);
    assert(o.collectors_.size() == collectors_.size());
    for (size_t i = 0; i < collectors_.size(); ++i)
        collectors_[i]->merge(*o.collectors_[i]);
}
