#pragma once
/**
 * @file InningsSimulator.h
 * @brief Plays out one innings as a sequence of sampled partnerships.
 */
#include "PartnershipStatistics.h"
#include "RngEngine.h"

namespace wicketsim {
    /**
     * @brief One partnership: how long it lasted and what it scored.
     */
    struct Partnership {
        double overs;
        double runs;
    };

    /**
     * @brief Cut a partnership short when it outlasts the overs that remain.
     *
     * Overs are capped at oversRemaining and runs are scaled by the fraction of the
     * partnership that was actually played. A partnership that fits is returned as is.
     * @param drawn           sampled partnership
     * @param oversRemaining  budget left in the innings, >= 0
     */
    Partnership clipPartnership(const Partnership& drawn, double oversRemaining) noexcept;

    struct InningsResult {
        int runs = 0;
        double overs = 0.0; /**< never more than the budget */
    };

    /**
     * @brief Samples partnerships from a store, falling back to parametric draws for
     *        wicket indices the store does not cover.
     *
     * Stateless apart from the borrowed store, so one instance is shared by all workers.
     */
    class InningsSimulator {
    public:
        static constexpr double FALLBACK_MEAN_OVERS = 10.0;
        static constexpr double FALLBACK_MEAN_RUNS = 30.0;

        /** @param store  must outlive the simulator */
        explicit InningsSimulator(const PartnershipStore& store) : store_(store) {}

        /**
         * @brief Simulate one innings.
         * @param wicketsAvailable  partnerships the side can still form (0…20)
         * @param oversBudget       overs this innings may use
         * @param rng               random stream
         * @return                  runs (each partnership truncated to whole runs) and overs used
         */
        InningsResult simulate(int wicketsAvailable, double oversBudget, RngEngine& rng) const;

        /** @brief Draw one unclipped partnership for a wicket index. */
        Partnership drawPartnership(int wicket, RngEngine& rng) const;

    private:
        const PartnershipStore& store_;
    };
}
