#pragma once
/**
 * @file MatchState.h
 * @brief Snapshot of an unfinished match.
 */

namespace wicketsim {
    /**
     * @brief The part of a match state the simulator needs.
     *
     * Wickets are cumulative over a team's two innings, so each lies in 0…20.
     */
    struct MatchState {
        double oversLeft = 0.0;          /**< overs remaining in the whole match */
        int firstWicketsRemaining = 0;   /**< first team (bats innings 1 and 3) */
        int secondWicketsRemaining = 0;  /**< second team (bats innings 2 and 4) */
        int lead = 0;                    /**< first team's runs minus second team's */

        /** @brief Neither side can bat again, so the lead is final. */
        bool isTerminal() const noexcept { return firstWicketsRemaining == 0 && secondWicketsRemaining == 0; }
    };
}
