#pragma once
/**
 * @file CompiledExpression.h
 * @brief An arithmetic expression evaluator over a match state.
 */
#include <memory>
#include <string>

#include "MatchState.h"

namespace wicketsim {
    /**
     * @brief Holds a compiled expression for fast repeated evaluation.
     *
     * Copies share the compiled form, so a copy must not be evaluated concurrently
     * with the original. Compile a fresh instance from expr() for each thread.
     */
    class CompiledExpression {
    public:
        /**
         * @brief Compile a new expression from source.
         * @param expr  arithmetic (and/or boolean) expression over
         *              overs_left, first_wickets, second_wickets, lead
         * @throws std::invalid_argument if the expression does not compile
         */
        explicit CompiledExpression(const std::string& expr);

        /**
         * @brief Evaluate on one state.
         * @param s  the match state
         * @return   the result as double
         */
        double eval(const MatchState& s) const;

        /** @brief Get the original source string. */
        const std::string& expr() const { return expr_; }

    private:
        std::string expr_;
        struct Impl;
        std::shared_ptr<Impl> impl_;
    };
}
