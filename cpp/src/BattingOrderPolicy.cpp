#include "BattingOrderPolicy.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace wicketsim;

Team wicketsim::likelyNextToBat(const MatchState& state) noexcept {
    return state.firstWicketsRemaining > state.secondWicketsRemaining ? Team::FIRST : Team::SECOND;
}

// HalfSplitPolicy
InningsPlan HalfSplitPolicy::plan(const MatchState& state) const {
    return InningsPlan{likelyNextToBat(state), state.oversLeft / 2.0};
}

// ExpressionSplitPolicy
ExpressionSplitPolicy::ExpressionSplitPolicy(const std::string& expr) : expression_(expr) {}

InningsPlan ExpressionSplitPolicy::plan(const MatchState& state) const {
    const double budget = expression_.eval(state);
    if (!std::isfinite(budget))
        throw std::runtime_error("ExpressionSplitPolicy: '" + expression_.expr() + "' gave a non-finite budget");
    return InningsPlan{likelyNextToBat(state), std::clamp(budget, 0.0, std::max(0.0, state.oversLeft))};
}

std::unique_ptr<BattingOrderPolicy> ExpressionSplitPolicy::clone() const {
    return std::make_unique<ExpressionSplitPolicy>(expression_.expr());
}
