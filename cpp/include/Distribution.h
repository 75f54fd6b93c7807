#pragma once
/**
 * @file Distribution.h
 * @brief Immutable discrete probability mass function over 0…n-1.
 */
#include <cstddef>
#include <vector>

#include "RngEngine.h"

namespace wicketsim {
    /**
     * @brief Discrete distribution sampled by binary search on its cumulative weights.
     *
     * The weights are stored exactly as given (they are not renormalized), so a
     * distribution read back from disk compares equal to the one that was written.
     * Sampling divides by the total weight, so weights need not sum to exactly one.
     */
    class DiscreteDistribution {
    public:
        /**
         * @param weights  non-negative, finite, with a positive sum
         * @throws std::invalid_argument on empty, negative, non-finite or all-zero weights
         */
        explicit DiscreteDistribution(std::vector<double> weights);

        /**
         * @brief Uniform distribution over 0…n-1.
         * @param n  number of outcomes, must be > 0
         */
        static DiscreteDistribution uniform(size_t n);

        /**
         * @brief Draw one outcome index.
         * @param rng  random stream
         * @return     value in [0, size())
         */
        int sample(RngEngine& rng) const;

        /** @brief Expected outcome index. */
        double mean() const;

        /** @brief Number of outcomes. */
        size_t size() const noexcept { return weights_.size(); }

        /** @brief Weight of outcome i as stored. */
        double operator[](const size_t i) const { return weights_[i]; }

        /** @brief The stored weights. */
        const std::vector<double>& probabilities() const noexcept { return weights_; }

        bool operator==(const DiscreteDistribution& other) const { return weights_ == other.weights_; }
        bool operator!=(const DiscreteDistribution& other) const { return !(*this == other); }

    private:
        std::vector<double> weights_;
        std::vector<double> cumulative_;
    };
}
