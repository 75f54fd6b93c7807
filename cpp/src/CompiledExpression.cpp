#include "CompiledExpression.h"
#include <exprtk.hpp>
#include <stdexcept>

using namespace wicketsim;


struct CompiledExpression::Impl {
    exprtk::symbol_table<double> symbols;
    exprtk::expression<double> expression;
    exprtk::parser<double> parser;

    double oversLeft = 0.0, firstWickets = 0.0, secondWickets = 0.0, lead = 0.0;

    explicit Impl(const std::string& expr) {
        symbols.add_variable("overs_left", oversLeft);
        symbols.add_variable("first_wickets", firstWickets);
        symbols.add_variable("second_wickets", secondWickets);
        symbols.add_variable("lead", lead);
        symbols.add_constants();
        expression.register_symbol_table(symbols);

        if (!parser.compile(expr, expression))
            throw std::invalid_argument("ExprTk compile error in '" + expr + "': " + parser.error());
    }
};

CompiledExpression::CompiledExpression(const std::string& expr):
    expr_(expr), impl_(std::make_shared<Impl>(expr)) {}


double CompiledExpression::eval(const MatchState& s) const {
    auto& impl = *impl_;
    impl.oversLeft = s.oversLeft;
    impl.firstWickets = s.firstWicketsRemaining;
    impl.secondWickets = s.secondWicketsRemaining;
    impl.lead = s.lead;

    return impl.expression.value();
}
