#pragma once
#include "BattingOrderPolicy.h"
#include "Collector.h"
#include "InningsSimulator.h"
#include "MatchOutcome.h"
#include "MatchState.h"
#include "PartnershipStatistics.h"

#include <cstdint>
#include <memory>
#include <optional>

namespace wicketsim {
    struct SimulationConfig {
        int numWorkers = 1;             /**< worker threads per call */
        int chunkSize = 256;            /**< trials per work item, each with its own RNG stream */
        std::optional<uint64_t> seed;   /**< fixed seed for reproducible calls; fresh per call if empty */
    };

    /**
     * @brief Monte Carlo win/draw/loss estimator over an owned partnership store.
     *
     * Trials are grouped into chunks handed out to worker threads. Chunk i always draws from
     * RNG stream i of the call's seed, so a seeded call gives the same answer for any worker count.
     */
    class MatchSimulator {
    public:
        /**
         * @param store   learned or loaded distributions; never modified afterwards
         * @param config  threading and seeding
         * @param policy  batting-order heuristic (HalfSplitPolicy when null)
         * @throws std::invalid_argument if numWorkers or chunkSize is below 1
         */
        explicit MatchSimulator(PartnershipStore store,
                                SimulationConfig config = {},
                                std::unique_ptr<BattingOrderPolicy> policy = nullptr);

        /**
         * @brief Outcome probabilities for the first team.
         *
         * A state where neither side has wickets left is decided by the sign of the lead
         * without running any trials.
         * @throws std::invalid_argument if nSimulations < 1
         */
        OutcomeProbabilities simulateMatch(const MatchState& state, int nSimulations) const;

        OutcomeProbabilities simulateMatch(double oversLeft, int firstWicketsRemaining, int secondWicketsRemaining,
                                           int lead, int nSimulations) const {
            return simulateMatch(MatchState{oversLeft, firstWicketsRemaining, secondWicketsRemaining, lead},
                                 nSimulations);
        }

        /**
         * @brief Run nSimulations trials and merge every trial into `collectors`.
         * @throws std::invalid_argument if nSimulations < 1
         */
        void run(const MatchState& state, int nSimulations, CollectorGroup& collectors) const;

        /** @brief One innings against this simulator's store. */
        InningsResult simulateInnings(int wicketsAvailable, double oversBudget, RngEngine& rng) const;

        /**
         * @brief Play out the rest of one match.
         * @param state   starting state
         * @param rng     random stream
         * @param policy  batting order for this trial
         */
        TrialResult simulateTrial(const MatchState& state, RngEngine& rng, const BattingOrderPolicy& policy) const;

        const PartnershipStore& store() const noexcept { return store_; }
        const SimulationConfig& config() const noexcept { return config_; }
        const BattingOrderPolicy& policy() const noexcept { return *policy_; }

    private:
        const PartnershipStore store_;
        const SimulationConfig config_;
        std::unique_ptr<const BattingOrderPolicy> policy_;

        void processChunk(int64_t chunkIndex, int64_t nTrials, uint64_t seed, const MatchState& state,
                          const BattingOrderPolicy& policy, CollectorGroup& collectors) const;
    };
}
