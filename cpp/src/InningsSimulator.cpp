#include "InningsSimulator.h"

#include <algorithm>

using namespace wicketsim;

Partnership wicketsim::clipPartnership(const Partnership& drawn, const double oversRemaining) noexcept {
    if (drawn.overs <= oversRemaining) return drawn;
    const double clipped = std::max(0.0, oversRemaining);
    return Partnership{clipped, drawn.runs * (clipped / drawn.overs)};
}

Partnership InningsSimulator::drawPartnership(const int wicket, RngEngine& rng) const {
    if (const auto* stats = store_.find(wicket)) {
        const int overs = stats->overs.sample(rng);
        const int runs = stats->runs.sample(rng);
        return Partnership{static_cast<double>(overs), static_cast<double>(runs)};
    }
    const double overs = rng.exponential(FALLBACK_MEAN_OVERS);
    const int runs = rng.poisson(FALLBACK_MEAN_RUNS);
    return Partnership{overs, static_cast<double>(runs)};
}

InningsResult InningsSimulator::simulate(const int wicketsAvailable, const double oversBudget, RngEngine& rng) const {
    InningsResult result;
    if (wicketsAvailable <= 0 || oversBudget <= 0.0) return result;

    for (int wicket = 1; wicket <= wicketsAvailable; ++wicket) {
        const Partnership played = clipPartnership(drawPartnership(wicket, rng), oversBudget - result.overs);
        result.runs += static_cast<int>(played.runs);
        result.overs += played.overs;
        if (result.overs >= oversBudget) break;
    }
    // accumulated float error must not push us past the budget
    result.overs = std::min(result.overs, oversBudget);
    return result;
}
