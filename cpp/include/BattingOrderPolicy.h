#pragma once
/**
 * @file BattingOrderPolicy.h
 * @brief Who bats next in a simulated trial, and for how long.
 */
#include <memory>
#include <string>

#include "CompiledExpression.h"
#include "MatchState.h"

namespace wicketsim {
    enum class Team : int { FIRST, SECOND };

    /**
     * @brief Innings order for the unfinished part of a match.
     */
    struct InningsPlan {
        Team battingFirst;  /**< side that bats first in the trial */
        double firstBudget; /**< overs granted to that side; the other side gets whatever is left */
    };

    /**
     * @brief Base interface for batting-order heuristics.
     *
     * The simulator clones one instance per worker thread.
     */
    class BattingOrderPolicy {
    public:
        virtual ~BattingOrderPolicy() = default;

        /**
         * @brief Decide the innings order for a non-terminal state.
         * @param state  match state at the start of the trial
         */
        virtual InningsPlan plan(const MatchState& state) const = 0;

        /** @brief Short human-readable description. */
        virtual std::string describe() const = 0;

        /** @brief clone for per-worker isolation */
        virtual std::unique_ptr<BattingOrderPolicy> clone() const = 0;
    };

    /**
     * @brief The side with more wickets in hand is still due to bat (ties go to the second team).
     */
    Team likelyNextToBat(const MatchState& state) noexcept;

    /**
     * @brief likelyNextToBat() order, first side gets half of the overs left.
     */
    class HalfSplitPolicy final : public BattingOrderPolicy {
    public:
        InningsPlan plan(const MatchState& state) const override;
        std::string describe() const override { return "half-split"; }
        std::unique_ptr<BattingOrderPolicy> clone() const override { return std::make_unique<HalfSplitPolicy>(*this); }
    };

    /**
     * @brief likelyNextToBat() order, first side's overs given by an expression.
     *
     * The expression sees overs_left, first_wickets, second_wickets and lead; its value is
     * clamped to [0, overs_left].
     */
    class ExpressionSplitPolicy final : public BattingOrderPolicy {
    public:
        /**
         * @param expr  e.g. "overs_left * first_wickets / (first_wickets + second_wickets)"
         * @throws std::invalid_argument if the expression does not compile
         */
        explicit ExpressionSplitPolicy(const std::string& expr);

        /** @throws std::runtime_error if the expression evaluates to NaN or infinity */
        InningsPlan plan(const MatchState& state) const override;
        std::string describe() const override { return "expression: " + expression_.expr(); }

        /** @brief recompiles, so the clone can run on another thread */
        std::unique_ptr<BattingOrderPolicy> clone() const override;

    private:
        CompiledExpression expression_;
    };
}
