#pragma once
/**
 * @file PartnershipStatistics.h
 * @brief Per-wicket partnership distributions and the store that holds them.
 */
#include <array>
#include <optional>

#include "Distribution.h"

namespace wicketsim {
    constexpr int MAX_PARTNERSHIP_OVERS = 100;  /**< overs bucket saturation */
    constexpr int MAX_PARTNERSHIP_RUNS = 300;   /**< runs bucket saturation */
    constexpr int WICKETS_PER_INNINGS = 10;

    /**
     * @brief How long the partnership for one wicket-fall index lasts and what it scores.
     */
    struct PartnershipStatistics {
        DiscreteDistribution overs; /**< 101 buckets, index = whole overs */
        DiscreteDistribution runs;  /**< 301 buckets, index = runs */

        /**
         * @throws std::invalid_argument unless overs has 101 buckets and runs 301
         */
        PartnershipStatistics(DiscreteDistribution overs_, DiscreteDistribution runs_);

        /** @brief Uniform over the full range of both buckets. */
        static PartnershipStatistics uniform();

        double meanOvers() const { return overs.mean(); }
        double meanRuns() const { return runs.mean(); }

        bool operator==(const PartnershipStatistics& other) const {
            return overs == other.overs && runs == other.runs;
        }
        bool operator!=(const PartnershipStatistics& other) const { return !(*this == other); }
    };

    /**
     * @brief Wicket index (1…10) → PartnershipStatistics.
     *
     * Indices outside 1…10 are valid to query and simply have no statistics.
     */
    class PartnershipStore {
    public:
        PartnershipStore() = default;

        /**
         * @brief Install statistics for one wicket.
         * @param wicket  1…10
         * @throws std::out_of_range for any other wicket
         */
        void set(int wicket, PartnershipStatistics stats);

        /**
         * @brief Statistics for a wicket, or nullptr if none are held.
         * @param wicket  any integer
         */
        const PartnershipStatistics* find(int wicket) const noexcept;

        bool contains(const int wicket) const noexcept { return find(wicket) != nullptr; }

        /** @brief Number of wicket indices holding statistics. */
        size_t size() const noexcept;

        bool empty() const noexcept { return size() == 0; }

        bool operator==(const PartnershipStore& other) const { return slots_ == other.slots_; }
        bool operator!=(const PartnershipStore& other) const { return !(*this == other); }

    private:
        std::array<std::optional<PartnershipStatistics>, WICKETS_PER_INNINGS> slots_{};
    };
}
