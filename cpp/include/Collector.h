#pragma once
/**
 * @file Collector.h
 * @brief Interfaces and implementations for collecting trial results.
 */
#include <memory>
#include <vector>

#include "MatchOutcome.h"

namespace wicketsim {
    /**
     * @brief Base interface for per-trial data collection.
     */
    class TrialCollector {
    public:
        virtual ~TrialCollector() = default;

        /**
         * @brief commit one trial into long-term storage
         * @param result  trial outcome
         */
        virtual void save(const TrialResult& result) = 0;

        /**
         * @brief merge another collector's results into this one
         * @param other  same type collector to absorb
         */
        virtual void merge(const TrialCollector& other) = 0;

        /** @brief clone a fresh, empty instance of this collector type */
        virtual std::unique_ptr<TrialCollector> clone() const = 0;
    };

    /**
     * @brief Win / draw / loss tallies.
     */
    class OutcomeCounter final : public TrialCollector {
    public:
        OutcomeCounter() = default;

        std::unique_ptr<TrialCollector> clone() const override { return std::make_unique<OutcomeCounter>(); }

        void save(const TrialResult& result) override;
        void merge(const TrialCollector& other) override;

        long wins() const noexcept { return wins_; }
        long draws() const noexcept { return draws_; }
        long losses() const noexcept { return losses_; }
        long total() const noexcept { return wins_ + draws_ + losses_; }

        /**
         * @brief Counts divided by total(), summing to exactly 1; all zero when nothing was saved.
         */
        OutcomeProbabilities probabilities() const noexcept;

    private:
        long wins_ = 0, draws_ = 0, losses_ = 0;
    };

    /**
     * @brief Histogram of the final lead, one bin per `binWidth` runs over [lo, hi).
     *
     * Leads outside the range land in the first or last bin.
     */
    class LeadHistogram final : public TrialCollector {
    public:
        /**
         * @param lo        lowest lead covered
         * @param hi        one past the highest lead covered
         * @param binWidth  runs per bin
         * @throws std::invalid_argument unless lo < hi and binWidth > 0
         */
        LeadHistogram(int lo, int hi, int binWidth);

        std::unique_ptr<TrialCollector> clone() const override {
            return std::make_unique<LeadHistogram>(lo_, hi_, binWidth_);
        }

        void save(const TrialResult& result) override;
        void merge(const TrialCollector& other) override;

        /**
         * @brief Retrieve the accumulated histogram counts.
         * @return vector of length ceil((hi - lo) / binWidth)
         */
        const std::vector<long>& histogram() const noexcept { return hist_; }

        /** @brief Lowest lead falling in bin i. */
        int binStart(const size_t i) const noexcept { return lo_ + static_cast<int>(i) * binWidth_; }

    private:
        int lo_, hi_, binWidth_;
        std::vector<long> hist_;
    };

    /**
     * @brief Thread-local grouping of multiple TrialCollector instances.
     *
     * Internally owns unique_ptr<TrialCollector> clones.
     */
    class CollectorGroup final : public TrialCollector {
    public:
        CollectorGroup() = default;

        /**
         * @brief Construct by cloning each supplied collector.
         * @param collectors  original collectors to clone
         */
        explicit CollectorGroup(const std::vector<std::shared_ptr<TrialCollector>>& collectors);

        /**
         * @brief Copy constructor, yields empty clones.
         * @param other the other CollectorGroup to copy
         */
        CollectorGroup(const CollectorGroup& other);

        std::unique_ptr<TrialCollector> clone() const override { return std::make_unique<CollectorGroup>(*this); }

        void save(const TrialResult& result) override {
            for (const auto& c : collectors_) c->save(result);
        }

        void merge(const TrialCollector& other) override;

        /** @brief Number of collectors in this group. */
        size_t size() const { return collectors_.size(); }

        /**
         * @brief Access a specific collector.
         * @param i  index [0...size())
         */
        const std::unique_ptr<TrialCollector>& at(const size_t i) const { return collectors_.at(i); }

    private:
        std::vector<std::unique_ptr<TrialCollector>> collectors_;
    };
}
