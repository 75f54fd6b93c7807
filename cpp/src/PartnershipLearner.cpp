#include "PartnershipLearner.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

using namespace wicketsim;

namespace {
    // halves go to the even bucket
    int bucket(const double value, const int maxBucket) {
        const auto rounded = static_cast<long>(std::nearbyint(value));
        return static_cast<int>(std::clamp<long>(rounded, 0, maxBucket));
    }
}

PartnershipLearner::PartnershipLearner(const LearnerConfig config) : config_(config) {
    if (!(config_.smoothing > 0.0))
        throw std::invalid_argument("PartnershipLearner: smoothing must be positive");
}

void PartnershipLearner::addInnings(const InningsRecord& innings) {
    int wicketsDown = 0;
    long runs = 0, balls = 0;
    long prevRuns = 0, prevBalls = 0;

    for (const auto& delivery : innings.deliveries) {
        ++balls;
        runs += delivery.runs;
        if (delivery.wickets <= 0) continue;

        wicketsDown += delivery.wickets;
        addSample(wicketsDown, static_cast<double>(runs - prevRuns), static_cast<double>(balls - prevBalls) / 6.0);
        prevRuns = runs;
        prevBalls = balls;

        if (wicketsDown >= WICKETS_PER_INNINGS) break;
    }
    ++innings_;
}

void PartnershipLearner::addSample(const int wicket, const double runs, const double overs) {
    if (wicket < 1 || wicket > WICKETS_PER_INNINGS) return;
    auto& h = histograms_[wicket - 1];
    h.overs[bucket(overs, MAX_PARTNERSHIP_OVERS)] += 1;
    h.runs[bucket(runs, MAX_PARTNERSHIP_RUNS)] += 1;
    h.samples += 1;
}

void PartnershipLearner::merge(const PartnershipLearner& other) {
    for (size_t w = 0; w < histograms_.size(); ++w) {
        auto& mine = histograms_[w];
        const auto& theirs = other.histograms_[w];
        for (size_t i = 0; i < mine.overs.size(); ++i) mine.overs[i] += theirs.overs[i];
        for (size_t i = 0; i < mine.runs.size(); ++i) mine.runs[i] += theirs.runs[i];
        mine.samples += theirs.samples;
    }
    innings_ += other.innings_;
}

long PartnershipLearner::sampleCount(const int wicket) const noexcept {
    if (wicket < 1 || wicket > WICKETS_PER_INNINGS) return 0;
    return histograms_[wicket - 1].samples;
}

DiscreteDistribution PartnershipLearner::smoothed(const std::vector<long>& counts, const long total) const {
    std::vector<double> p(counts.size());
    double sum = 0.0;
    for (size_t i = 0; i < counts.size(); ++i) {
        p[i] = static_cast<double>(counts[i]) / static_cast<double>(total) + config_.smoothing;
        sum += p[i];
    }
    for (auto& x : p) x /= sum;
    return DiscreteDistribution(std::move(p));
}

PartnershipStore PartnershipLearner::build() const {
    PartnershipStore store;
    for (int wicket = 1; wicket <= WICKETS_PER_INNINGS; ++wicket) {
        const auto& h = histograms_[wicket - 1];
        if (h.samples == 0) {
            spdlog::info("Wicket {}: no data, using uniform distribution", wicket);
            store.set(wicket, PartnershipStatistics::uniform());
            continue;
        }
        PartnershipStatistics stats(smoothed(h.overs, h.samples), smoothed(h.runs, h.samples));
        spdlog::info("Wicket {}: avg {:.1f} runs in {:.1f} overs ({} samples)", wicket, stats.meanRuns(),
                     stats.meanOvers(), h.samples);
        store.set(wicket, std::move(stats));
    }
    return store;
}


PartnershipStore wicketsim::learn(const std::vector<InningsRecord>& corpus, const int numWorkers,
                                  const LearnerConfig config) {
    if (numWorkers < 1) throw std::invalid_argument("learn: numWorkers must be at least 1");

    spdlog::info("Learning partnership distributions from {} innings", corpus.size());

    const size_t total = corpus.size();
    const auto workers = static_cast<size_t>(numWorkers);
    std::vector<PartnershipLearner> learners(workers, PartnershipLearner(config));
    std::vector<std::thread> threads;
    threads.reserve(workers);

    for (size_t i = 0; i < workers; ++i) {
        const size_t begin = total * i / workers;
        const size_t end = total * (i + 1) / workers;
        threads.emplace_back([&corpus, &learner = learners[i], begin, end] {
            for (size_t j = begin; j < end; ++j)
                learner.addInnings(corpus[j]);
        });
    }
    for (auto& t : threads) t.join();

    for (size_t i = 1; i < workers; ++i) learners[0].merge(learners[i]);
    return learners[0].build();
}
