#pragma once
/**
 * @file PartnershipLearner.h
 * @brief Builds per-wicket partnership histograms from historical innings.
 */
#include <array>
#include <vector>

#include "InningsRecord.h"
#include "PartnershipStatistics.h"

namespace wicketsim {
    struct LearnerConfig {
        double smoothing = 1e-4; /**< added to every normalized bucket before renormalizing */
    };

    /**
     * @brief Accumulates partnership (runs, overs) bucket counts for each wicket-fall index.
     *
     * Counts are plain integers, so learners fed disjoint parts of a corpus can be merged in
     * any order and build() gives the same store as a single learner fed everything.
     */
    class PartnershipLearner {
    public:
        explicit PartnershipLearner(LearnerConfig config = {});

        /**
         * @brief Walk one innings and record a sample at every wicket fall up to the tenth.
         * @param innings  chronological deliveries
         */
        void addInnings(const InningsRecord& innings);

        /**
         * @brief Record one partnership directly.
         * @param wicket  wicket-fall index; samples outside 1…10 are ignored
         * @param runs    runs added during the partnership
         * @param overs   balls faced during the partnership / 6
         */
        void addSample(int wicket, double runs, double overs);

        /** @brief Absorb another learner's counts. */
        void merge(const PartnershipLearner& other);

        /** @brief Number of samples recorded for a wicket index (0 outside 1…10). */
        long sampleCount(int wicket) const noexcept;

        /** @brief Number of innings walked by addInnings. */
        long inningsCount() const noexcept { return innings_; }

        /**
         * @brief Normalize, smooth and package the histograms.
         *
         * Every wicket 1…10 is populated; an index without samples gets a uniform distribution.
         */
        PartnershipStore build() const;

    private:
        struct Histogram {
            std::vector<long> overs = std::vector<long>(MAX_PARTNERSHIP_OVERS + 1, 0);
            std::vector<long> runs = std::vector<long>(MAX_PARTNERSHIP_RUNS + 1, 0);
            long samples = 0;
        };

        LearnerConfig config_;
        std::array<Histogram, WICKETS_PER_INNINGS> histograms_;
        long innings_ = 0;

        DiscreteDistribution smoothed(const std::vector<long>& counts, long total) const;
    };

    /**
     * @brief Learn a full store from a corpus.
     * @param corpus      historical innings
     * @param numWorkers  threads sharing the corpus, each with its own learner
     * @param config      smoothing configuration
     */
    PartnershipStore learn(const std::vector<InningsRecord>& corpus, int numWorkers = 1, LearnerConfig config = {});
}
