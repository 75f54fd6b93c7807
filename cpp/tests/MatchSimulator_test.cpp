#include "gtest/gtest.h"
#include "MatchSimulator.h"
#include "PartnershipLearner.h"

#include <memory>
#include <vector>

using namespace wicketsim;

namespace {
    DiscreteDistribution pointMass(const size_t buckets, const int at) {
        std::vector<double> w(buckets, 0.0);
        w[at] = 1.0;
        return DiscreteDistribution(std::move(w));
    }

    // every partnership lasts 10 overs and scores 20 runs
    PartnershipStore fixedStore() {
        PartnershipStore store;
        for (int wicket = 1; wicket <= WICKETS_PER_INNINGS; ++wicket)
            store.set(wicket, PartnershipStatistics(pointMass(MAX_PARTNERSHIP_OVERS + 1, 10),
                                                    pointMass(MAX_PARTNERSHIP_RUNS + 1, 20)));
        return store;
    }

    PartnershipStore learnedStore() {
        std::vector<InningsRecord> corpus(400);
        for (size_t i = 0; i < corpus.size(); ++i) {
            int wickets = 0;
            for (int b = 0; wickets < 10 && b < 700; ++b) {
                Delivery d;
                d.runs = static_cast<int>((b * 7 + i * 3) % 6 == 0 ? 4 : (b + i) % 3 == 0 ? 1 : 0);
                d.wickets = (b * 13 + i * 5) % 41 == 0 ? 1 : 0;
                wickets += d.wickets;
                corpus[i].deliveries.push_back(d);
            }
        }
        return learn(corpus);
    }

    SimulationConfig seeded(const uint64_t seed, const int workers = 1, const int chunk = 256) {
        SimulationConfig config;
        config.seed = seed;
        config.numWorkers = workers;
        config.chunkSize = chunk;
        return config;
    }
}

TEST(MatchSimulator, TerminalStateIsDecidedByLead) {
    const MatchSimulator sim(PartnershipStore{});
    for (int n : {1, 7, 1000}) {
        const auto win = sim.simulateMatch(123.0, 0, 0, 50, n);
        EXPECT_EQ(win.win, 1.0);
        EXPECT_EQ(win.draw, 0.0);
        EXPECT_EQ(win.loss, 0.0);

        const auto loss = sim.simulateMatch(123.0, 0, 0, -50, n);
        EXPECT_EQ(loss.win, 0.0);
        EXPECT_EQ(loss.draw, 0.0);
        EXPECT_EQ(loss.loss, 1.0);

        const auto draw = sim.simulateMatch(0.0, 0, 0, 0, n);
        EXPECT_EQ(draw.win, 0.0);
        EXPECT_EQ(draw.draw, 1.0);
        EXPECT_EQ(draw.loss, 0.0);
    }
}

TEST(MatchSimulator, RejectsBadArguments) {
    EXPECT_THROW(MatchSimulator(PartnershipStore{}, seeded(1, 0)), std::invalid_argument);
    EXPECT_THROW(MatchSimulator(PartnershipStore{}, seeded(1, 1, 0)), std::invalid_argument);

    const MatchSimulator sim(PartnershipStore{});
    EXPECT_THROW(sim.simulateMatch(100.0, 5, 5, 0, 0), std::invalid_argument);
    EXPECT_THROW(sim.simulateMatch(0.0, 0, 0, 10, -3), std::invalid_argument);
}

TEST(MatchSimulator, SideWithMoreWicketsBatsFirstWithHalfTheOvers) {
    const MatchSimulator sim(fixedStore());
    const HalfSplitPolicy policy;
    RngEngine rng(1);

    // second team: 3 x (10 overs, 20 runs) inside its 50 overs; first team then 2 x 20
    auto t = sim.simulateTrial(MatchState{100.0, 2, 3, 0}, rng, policy);
    EXPECT_EQ(t.finalLead, -20);
    EXPECT_EQ(t.outcome, MatchOutcome::LOSS);
    EXPECT_DOUBLE_EQ(t.oversUsed, 50.0);

    t = sim.simulateTrial(MatchState{100.0, 3, 2, 0}, rng, policy);
    EXPECT_EQ(t.finalLead, 20);
    EXPECT_EQ(t.outcome, MatchOutcome::WIN);

    // ties send the second team in first; equal resources leave the lead unchanged
    t = sim.simulateTrial(MatchState{100.0, 2, 2, 5}, rng, policy);
    EXPECT_EQ(t.finalLead, 5);
    EXPECT_EQ(t.outcome, MatchOutcome::WIN);

    t = sim.simulateTrial(MatchState{100.0, 2, 2, 0}, rng, policy);
    EXPECT_EQ(t.outcome, MatchOutcome::DRAW);
}

TEST(MatchSimulator, FirstInningsIsClippedToItsShare) {
    const MatchSimulator sim(fixedStore());
    const HalfSplitPolicy policy;
    RngEngine rng(1);

    // first team gets 15 overs: 20 + 10 runs; second team then bats 10 of the remaining 15
    const auto t = sim.simulateTrial(MatchState{30.0, 5, 1, 0}, rng, policy);
    EXPECT_EQ(t.finalLead, 10);
    EXPECT_DOUBLE_EQ(t.oversUsed, 25.0);
}

TEST(MatchSimulator, NoTimeForTheSecondInnings) {
    const MatchSimulator sim(fixedStore());
    RngEngine rng(1);

    // the side batting first takes every over that is left
    const ExpressionSplitPolicy allOvers("overs_left");
    const auto t = sim.simulateTrial(MatchState{40.0, 6, 3, -70}, rng, allOvers);
    EXPECT_EQ(t.finalLead, 10);
    EXPECT_DOUBLE_EQ(t.oversUsed, 40.0);
}

TEST(MatchSimulator, DeterministicStoreGivesCertainOutcome) {
    const MatchSimulator sim(fixedStore(), seeded(5));
    const auto p = sim.simulateMatch(100.0, 2, 3, 0, 250);
    EXPECT_EQ(p.win, 0.0);
    EXPECT_EQ(p.draw, 0.0);
    EXPECT_EQ(p.loss, 1.0);
}

TEST(MatchSimulator, CustomPolicyChangesTheSplit) {
    SimulationConfig config = seeded(5);
    const MatchSimulator sim(fixedStore(), config, std::make_unique<ExpressionSplitPolicy>("10"));
    EXPECT_EQ(sim.policy().describe(), "expression: 10");

    // first team bats 10 overs (one partnership, 20 runs); second team then scores 40
    const auto p = sim.simulateMatch(100.0, 3, 2, 0, 50);
    EXPECT_EQ(p.loss, 1.0);
}

TEST(MatchSimulator, ProbabilitiesSumToOne) {
    const MatchSimulator sim(learnedStore(), seeded(17));
    for (const MatchState& s : {MatchState{300.0, 20, 20, 0}, MatchState{90.0, 4, 10, 150},
                                MatchState{12.5, 1, 0, -3}, MatchState{200.0, 10, 10, 0}}) {
        for (int n : {1, 3, 100, 999}) {
            const auto p = sim.simulateMatch(s, n);
            EXPECT_EQ(p.win + p.draw + p.loss, 1.0);
            EXPECT_GE(p.win, 0.0);
            EXPECT_GE(p.draw, 0.0);
            EXPECT_GE(p.loss, 0.0);
        }
    }
}

TEST(MatchSimulator, SeededRunsReplay) {
    const PartnershipStore store = learnedStore();
    const MatchState state{180.0, 9, 12, 40};

    const MatchSimulator a(store, seeded(99));
    const MatchSimulator b(store, seeded(99));
    const auto pa = a.simulateMatch(state, 2000);
    const auto pb = b.simulateMatch(state, 2000);
    EXPECT_EQ(pa.win, pb.win);
    EXPECT_EQ(pa.draw, pb.draw);
    EXPECT_EQ(pa.loss, pb.loss);
}

TEST(MatchSimulator, WorkerCountDoesNotChangeSeededResult) {
    const PartnershipStore store = learnedStore();
    const MatchState state{150.0, 12, 8, -25};

    const MatchSimulator single(store, seeded(4242, 1, 64));
    const MatchSimulator parallel(store, seeded(4242, 4, 64));

    const std::vector<std::shared_ptr<TrialCollector>> prototypes{
        std::make_shared<OutcomeCounter>(), std::make_shared<LeadHistogram>(-400, 400, 20)};
    CollectorGroup one(prototypes), many(prototypes);
    single.run(state, 3000, one);
    parallel.run(state, 3000, many);

    const auto& c1 = dynamic_cast<const OutcomeCounter&>(*one.at(0));
    const auto& c4 = dynamic_cast<const OutcomeCounter&>(*many.at(0));
    EXPECT_EQ(c1.total(), 3000);
    EXPECT_EQ(c1.wins(), c4.wins());
    EXPECT_EQ(c1.draws(), c4.draws());
    EXPECT_EQ(c1.losses(), c4.losses());

    const auto& h1 = dynamic_cast<const LeadHistogram&>(*one.at(1));
    const auto& h4 = dynamic_cast<const LeadHistogram&>(*many.at(1));
    EXPECT_EQ(h1.histogram(), h4.histogram());
}

TEST(MatchSimulator, MoreWicketsDoNotHurt) {
    const MatchSimulator sim(learnedStore(), seeded(7, 2));
    const int n = 20'000;

    // second team always bats first here
    double previous = -1.0;
    for (int first : {1, 3, 5, 7, 9}) {
        const double pWin = sim.simulateMatch(200.0, first, 10, 0, n).win;
        EXPECT_GE(pWin, previous - 0.02) << "first_wickets=" << first;
        previous = pWin;
    }

    // first team always bats first here
    previous = -1.0;
    for (int first : {6, 10, 14, 18}) {
        const double pWin = sim.simulateMatch(200.0, first, 5, 0, n).win;
        EXPECT_GE(pWin, previous - 0.02) << "first_wickets=" << first;
        previous = pWin;
    }

    EXPECT_GT(sim.simulateMatch(200.0, 9, 10, 0, n).win, sim.simulateMatch(200.0, 1, 10, 0, n).win);
}

TEST(MatchSimulator, PolicyErrorsReachTheCaller) {
    const MatchSimulator sim(fixedStore(), seeded(1, 4, 10), std::make_unique<ExpressionSplitPolicy>("0/0"));
    EXPECT_THROW(sim.simulateMatch(100.0, 3, 2, 0, 1000), std::runtime_error);
}

TEST(MatchSimulator, RunFeedsEveryTrialToCollectors) {
    const MatchSimulator sim(learnedStore(), seeded(3, 3, 50));
    const std::vector<std::shared_ptr<TrialCollector>> prototypes{std::make_shared<LeadHistogram>(-300, 300, 25)};
    CollectorGroup group(prototypes);
    sim.run(MatchState{120.0, 6, 6, 10}, 1234, group);

    const auto& h = dynamic_cast<const LeadHistogram&>(*group.at(0));
    long total = 0;
    for (long c : h.histogram()) total += c;
    EXPECT_EQ(total, 1234);
}

TEST(MatchSimulator, SimulateInningsUsesOwnStore) {
    const MatchSimulator sim(fixedStore());
    RngEngine rng(8);
    const auto r = sim.simulateInnings(4, 35.0, rng);
    EXPECT_EQ(r.runs, 70);
    EXPECT_DOUBLE_EQ(r.overs, 35.0);

    const auto none = sim.simulateInnings(5, 0.0, rng);
    EXPECT_EQ(none.runs, 0);
    EXPECT_DOUBLE_EQ(none.overs, 0.0);
}
