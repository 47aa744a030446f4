#pragma once

#include "tools/tool_interfaces.hpp"

#include <map>
#include <string>
#include <string_view>

namespace norma::tools::calculator {

// Evaluates an arithmetic expression with named variables.
//
// Grammar: + - * / ^ (right-associative), parentheses, unary minus, numeric
// literals, constants `pi` and `e`, and the functions sqrt floor ceil abs
// round log log10 exp sin cos tan (one argument) and min max pow (two).
// Unknown identifiers, division by zero, non-finite results and syntax errors
// are reported through `error`.
bool EvaluateExpression(std::string_view expression, const std::map<std::string, double>& variables,
                        double& value, std::string& error);

// Built-in calculation tool used by `norma run`.
class ExpressionCalculator final : public ICalculationTool {
public:
  bool Calculate(const CalculationRequest& request, CalculationResult& result,
                 std::string& error) override;
};

} // namespace norma::tools::calculator
