#include "MatchSimulator.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

using namespace wicketsim;

MatchSimulator::MatchSimulator(PartnershipStore store,
                               const SimulationConfig config,
                               std::unique_ptr<BattingOrderPolicy> policy)
    : store_(std::move(store)),
      config_(config),
      policy_(policy ? std::move(policy)
                     : std::unique_ptr<BattingOrderPolicy>(std::make_unique<HalfSplitPolicy>())) {
    if (config_.numWorkers < 1) throw std::invalid_argument("MatchSimulator: numWorkers must be at least 1");
    if (config_.chunkSize < 1) throw std::invalid_argument("MatchSimulator: chunkSize must be at least 1");
}


OutcomeProbabilities MatchSimulator::simulateMatch(const MatchState& state, const int nSimulations) const {
    if (nSimulations < 1) throw std::invalid_argument("simulateMatch: nSimulations must be at least 1");

    if (state.isTerminal()) {
        switch (classifyLead(state.lead)) {
        case MatchOutcome::WIN: return {1.0, 0.0, 0.0};
        case MatchOutcome::LOSS: return {0.0, 0.0, 1.0};
        case MatchOutcome::DRAW: return {0.0, 1.0, 0.0};
        }
    }

    const std::vector<std::shared_ptr<TrialCollector>> prototypes{std::make_shared<OutcomeCounter>()};
    CollectorGroup collectors(prototypes);
    run(state, nSimulations, collectors);
    return dynamic_cast<const OutcomeCounter&>(*collectors.at(0)).probabilities();
}


void MatchSimulator::run(const MatchState& state, const int nSimulations, CollectorGroup& collectors) const {
    if (nSimulations < 1) throw std::invalid_argument("run: nSimulations must be at least 1");

    const uint64_t seed = config_.seed ? *config_.seed : RngEngine::defaultSeed();
    const int64_t nTrials = nSimulations;
    const int64_t nChunks = (nTrials + config_.chunkSize - 1) / config_.chunkSize;
    const int nWorkers = static_cast<int>(std::min<int64_t>(config_.numWorkers, nChunks));

    spdlog::debug("Simulating {} trials in {} chunks on {} workers (overs_left={}, wickets={}/{}, lead={})",
                  nTrials, nChunks, nWorkers, state.oversLeft, state.firstWicketsRemaining,
                  state.secondWicketsRemaining, state.lead);

    if (nWorkers == 1) {
        // per-call copy; a compiled expression must not be shared across threads
        const auto policy = policy_->clone();
        for (int64_t chunkIdx = 0; chunkIdx < nChunks; ++chunkIdx)
            processChunk(chunkIdx, nTrials, seed, state, *policy, collectors);
        return;
    }

    std::atomic<int64_t> nextChunk{0};

    struct WorkerCtx {
        std::unique_ptr<BattingOrderPolicy> policy;
        CollectorGroup collectors;
        std::exception_ptr error;
        std::thread thread;
    };
    std::vector<WorkerCtx> workers;
    workers.reserve(nWorkers);

    for (int i = 0; i < nWorkers; ++i) {
        workers.push_back({policy_->clone(), collectors, nullptr, {}});
        auto& wk = workers.back();
        wk.thread = std::thread([&wk, &nextChunk, nChunks, nTrials, seed, &state, this] {
            try {
                while (true) {
                    const int64_t chunkIdx = nextChunk.fetch_add(1, std::memory_order_relaxed);
                    if (chunkIdx >= nChunks) break;
                    processChunk(chunkIdx, nTrials, seed, state, *wk.policy, wk.collectors);
                }
            }
            catch (...) {
                wk.error = std::current_exception();
                nextChunk.store(nChunks, std::memory_order_relaxed);
            }
        });
    }

    for (auto& wk : workers) wk.thread.join();
    for (auto& wk : workers)
        if (wk.error) std::rethrow_exception(wk.error);
    for (auto& wk : workers) collectors.merge(wk.collectors);
}


void MatchSimulator::processChunk(const int64_t chunkIndex, const int64_t nTrials, const uint64_t seed,
                                  const MatchState& state, const BattingOrderPolicy& policy,
                                  CollectorGroup& collectors) const {
    const int64_t remain = nTrials - chunkIndex * static_cast<int64_t>(config_.chunkSize);
    const int64_t blockSz = std::min(static_cast<int64_t>(config_.chunkSize), remain);

    RngEngine rng(seed, static_cast<uint64_t>(chunkIndex));
    for (int64_t i = 0; i < blockSz; ++i)
        collectors.save(simulateTrial(state, rng, policy));
}


InningsResult MatchSimulator::simulateInnings(const int wicketsAvailable, const double oversBudget,
                                              RngEngine& rng) const {
    return InningsSimulator(store_).simulate(wicketsAvailable, oversBudget, rng);
}


TrialResult MatchSimulator::simulateTrial(const MatchState& state, RngEngine& rng,
                                          const BattingOrderPolicy& policy) const {
    const InningsSimulator innings(store_);
    const InningsPlan plan = policy.plan(state);

    const bool firstTeamOpens = plan.battingFirst == Team::FIRST;
    const int openerWickets = firstTeamOpens ? state.firstWicketsRemaining : state.secondWicketsRemaining;
    const int closerWickets = firstTeamOpens ? state.secondWicketsRemaining : state.firstWicketsRemaining;
    // runs for the side batting first move the lead this way
    const int sign = firstTeamOpens ? 1 : -1;

    int lead = state.lead;
    double oversLeft = state.oversLeft;

    const InningsResult opener = innings.simulate(openerWickets, plan.firstBudget, rng);
    lead += sign * opener.runs;
    oversLeft -= opener.overs;
    double oversUsed = opener.overs;

    if (oversLeft > 0.0 && closerWickets > 0) {
        const InningsResult closer = innings.simulate(closerWickets, oversLeft, rng);
        lead -= sign * closer.runs;
        oversUsed += closer.overs;
    }

    return TrialResult{classifyLead(lead), lead, oversUsed};
}
