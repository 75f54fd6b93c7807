#include "Distribution.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

using namespace wicketsim;

DiscreteDistribution::DiscreteDistribution(std::vector<double> weights) : weights_(std::move(weights)) {
    if (weights_.empty())
        throw std::invalid_argument("DiscreteDistribution: no outcomes");

    cumulative_.reserve(weights_.size());
    double total = 0.0;
    for (size_t i = 0; i < weights_.size(); ++i) {
        const double w = weights_[i];
        if (!std::isfinite(w) || w < 0.0)
            throw std::invalid_argument("DiscreteDistribution: invalid weight at index " + std::to_string(i));
        total += w;
        cumulative_.push_back(total);
    }
    if (total <= 0.0)
        throw std::invalid_argument("DiscreteDistribution: weights sum to zero");
}

DiscreteDistribution DiscreteDistribution::uniform(const size_t n) {
    if (n == 0) throw std::invalid_argument("DiscreteDistribution::uniform: n must be positive");
    return DiscreteDistribution(std::vector<double>(n, 1.0 / static_cast<double>(n)));
}

int DiscreteDistribution::sample(RngEngine& rng) const {
    const double target = rng.uniform() * cumulative_.back();
    // first bucket whose cumulative weight exceeds the target; zero-weight buckets are never hit
    const auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), target);
    if (it == cumulative_.end()) {
        // rounding at the very top: fall back to the last bucket carrying weight
        const auto last = std::find_if(weights_.rbegin(), weights_.rend(), [](const double w) { return w > 0.0; });
        return static_cast<int>(weights_.rend() - last) - 1;
    }
    return static_cast<int>(it - cumulative_.begin());
}

double DiscreteDistribution::mean() const {
    double m = 0.0;
    for (size_t i = 0; i < weights_.size(); ++i)
        m += static_cast<double>(i) * weights_[i];
    return m / cumulative_.back();
}
