#pragma once
/**
 * @file MatchOutcome.h
 * @brief Possible outcomes of a simulated match, from the first team's perspective.
 */

namespace wicketsim {
    /**
     * @brief Codes returned by MatchSimulator::simulateTrial.
     */
    enum class MatchOutcome : int { WIN, DRAW, LOSS };

    /** @brief Positive lead wins, negative loses, level is a draw. */
    constexpr MatchOutcome classifyLead(const int lead) noexcept {
        return lead > 0 ? MatchOutcome::WIN : lead < 0 ? MatchOutcome::LOSS : MatchOutcome::DRAW;
    }

    /**
     * @brief Outcome of one trial.
     */
    struct TrialResult {
        MatchOutcome outcome;
        int finalLead;
        double oversUsed;
    };

    struct OutcomeProbabilities {
        double win = 0.0;
        double draw = 0.0;
        double loss = 0.0;
    };
}
