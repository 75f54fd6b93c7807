#include "gtest/gtest.h"
#include "Collector.h"

#include <memory>
#include <vector>

using namespace wicketsim;

namespace {
    TrialResult trial(const int lead) {
        return TrialResult{classifyLead(lead), lead, 10.0};
    }
}

TEST(MatchOutcome, ClassifyLead) {
    EXPECT_EQ(classifyLead(1), MatchOutcome::WIN);
    EXPECT_EQ(classifyLead(0), MatchOutcome::DRAW);
    EXPECT_EQ(classifyLead(-1), MatchOutcome::LOSS);
}

TEST(OutcomeCounter, CountsAndProbabilities) {
    OutcomeCounter counter;
    const auto none = counter.probabilities();
    EXPECT_EQ(none.win + none.draw + none.loss, 0.0);

    for (int lead : {12, 3, 0, -7, 40, 0, -1, 5})
        counter.save(trial(lead));
    EXPECT_EQ(counter.wins(), 4);
    EXPECT_EQ(counter.draws(), 2);
    EXPECT_EQ(counter.losses(), 2);
    EXPECT_EQ(counter.total(), 8);

    const auto p = counter.probabilities();
    EXPECT_DOUBLE_EQ(p.win, 0.5);
    EXPECT_DOUBLE_EQ(p.draw, 0.25);
    EXPECT_DOUBLE_EQ(p.loss, 0.25);
}

TEST(OutcomeCounter, ProbabilitiesSumToOne) {
    for (int wins = 0; wins < 12; ++wins)
        for (int draws = 0; draws < 12; ++draws)
            for (int losses = 0; losses < 12; ++losses) {
                if (wins + draws + losses == 0) continue;
                OutcomeCounter counter;
                for (int i = 0; i < wins; ++i) counter.save(trial(3));
                for (int i = 0; i < draws; ++i) counter.save(trial(0));
                for (int i = 0; i < losses; ++i) counter.save(trial(-3));

                const auto p = counter.probabilities();
                ASSERT_EQ(p.win + p.draw + p.loss, 1.0) << wins << "/" << draws << "/" << losses;
                EXPECT_NEAR(p.loss, losses / double(counter.total()), 1e-15);
                EXPECT_EQ(p.loss == 0.0, losses == 0);
                EXPECT_EQ(p.draw == 0.0, draws == 0);
            }
}

TEST(OutcomeCounter, MergeAndClone) {
    OutcomeCounter a, b;
    a.save(trial(1));
    b.save(trial(-1));
    b.save(trial(0));
    a.merge(b);
    EXPECT_EQ(a.total(), 3);
    EXPECT_EQ(a.losses(), 1);

    const auto fresh = a.clone();
    EXPECT_EQ(dynamic_cast<const OutcomeCounter&>(*fresh).total(), 0);
}

TEST(LeadHistogram, Bins) {
    LeadHistogram h(-100, 100, 50);
    ASSERT_EQ(h.histogram().size(), 4u);
    EXPECT_EQ(h.binStart(0), -100);
    EXPECT_EQ(h.binStart(3), 50);

    for (int lead : {-500, -100, -51, -50, 0, 49, 99, 100, 700})
        h.save(trial(lead));
    EXPECT_EQ(h.histogram(), (std::vector<long>{3, 1, 2, 3}));
}

TEST(LeadHistogram, PartialLastBin) {
    LeadHistogram h(0, 10, 3);
    ASSERT_EQ(h.histogram().size(), 4u);
    h.save(trial(9));
    h.save(trial(8));
    EXPECT_EQ(h.histogram(), (std::vector<long>{0, 0, 1, 1}));
}

TEST(LeadHistogram, RejectsBadRange) {
    EXPECT_THROW(LeadHistogram(10, 10, 1), std::invalid_argument);
    EXPECT_THROW(LeadHistogram(20, 10, 1), std::invalid_argument);
    EXPECT_THROW(LeadHistogram(0, 10, 0), std::invalid_argument);
    EXPECT_THROW(LeadHistogram(0, 10, -2), std::invalid_argument);
}

TEST(CollectorGroup, FansOutAndMerges) {
    const std::vector<std::shared_ptr<TrialCollector>> prototypes{
        std::make_shared<OutcomeCounter>(), std::make_shared<LeadHistogram>(-20, 20, 10)};
    CollectorGroup group(prototypes);
    ASSERT_EQ(group.size(), 2u);

    group.save(trial(15));
    group.save(trial(-3));

    CollectorGroup other(group);
    EXPECT_EQ(dynamic_cast<const OutcomeCounter&>(*other.at(0)).total(), 0);
    other.save(trial(0));

    group.merge(other);
    const auto& counter = dynamic_cast<const OutcomeCounter&>(*group.at(0));
    EXPECT_EQ(counter.wins(), 1);
    EXPECT_EQ(counter.draws(), 1);
    EXPECT_EQ(counter.losses(), 1);
    EXPECT_EQ(dynamic_cast<const LeadHistogram&>(*group.at(1)).histogram(), (std::vector<long>{0, 1, 1, 1}));

    // prototypes are cloned, never written to
    EXPECT_EQ(dynamic_cast<const OutcomeCounter&>(*prototypes[0]).total(), 0);
}
