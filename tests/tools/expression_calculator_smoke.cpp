#include "../common/assertions.hpp"
#include "tools/calculator/expression_calculator.hpp"

#include <cmath>
#include <map>
#include <string>
#include <string_view>

namespace {

using norma::tests::common::AssertContains;
using norma::tests::common::Fail;

double Eval(std::string_view expression, const std::map<std::string, double>& variables = {}) {
  double value = 0.0;
  std::string error;
  if (!norma::tools::calculator::EvaluateExpression(expression, variables, value, error)) {
    Fail("expression '" + std::string(expression) + "' failed: " + error);
  }
  return value;
}

void ExpectError(std::string_view expression, std::string_view needle) {
  double value = 0.0;
  std::string error;
  if (norma::tools::calculator::EvaluateExpression(expression, {}, value, error)) {
    Fail("expression '" + std::string(expression) + "' should have failed");
  }
  AssertContains(error, needle);
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

} // namespace

int main() {
  if (Eval("1 + 2 * 3") != 7.0 || Eval("(1 + 2) * 3") != 9.0 || Eval("10 - 4 - 3") != 3.0) {
    Fail("operator precedence or associativity is wrong");
  }
  if (Eval("2 ^ 3 ^ 2") != 512.0 || Eval("-2 ^ 2") != -4.0) {
    Fail("power must be right-associative and bind tighter than unary minus");
  }
  if (Eval("sqrt(16) + max(2, 5) + min(2, 5) + abs(-1.5)") != 12.5) {
    Fail("built-in functions produced a wrong value");
  }
  if (!Near(Eval("2 * pi"), 6.283185307179586) || !Near(Eval("log(e)"), 1.0)) {
    Fail("constants are wrong");
  }
  if (Eval("cover + d / 2", {{"cover", 20.0}, {"d", 12.0}}) != 26.0) {
    Fail("variables must be substituted");
  }
  if (Eval("pi", {{"pi", 3.0}}) != 3.0) {
    Fail("variables shadow constants");
  }

  ExpectError("   ", "expression cannot be empty");
  ExpectError("1 / 0", "division by zero");
  ExpectError("width * 2", "unknown identifier 'width'");
  ExpectError("(1 + 2", "expected ')'");
  ExpectError("1 + 2)", "unexpected character ')' at position 6");
  ExpectError("sqrt(-1)", "sqrt of a negative number");
  ExpectError("max(1)", "function 'max' expects 2 arguments");
  ExpectError("foo(1)", "unknown function 'foo'");
  ExpectError("10 ^ 400", "not a finite number");

  {
    norma::tools::calculator::ExpressionCalculator calculator;
    norma::tools::CalculationRequest request;
    request.expression = "a * b";
    request.variables = {{"a", 1.5}, {"b", 4.0}};
    request.output_variable = "area_m2";
    norma::tools::CalculationResult result;
    std::string error;
    if (!calculator.Calculate(request, result, error) || result.value != 6.0 ||
        result.output_variable != "area_m2") {
      Fail("calculator tool must evaluate with request variables: " + error);
    }

    request.output_variable.clear();
    if (!calculator.Calculate(request, result, error) || result.output_variable != "result") {
      Fail("empty output variable must default to 'result'");
    }

    request.expression = "a / (b - 4)";
    if (calculator.Calculate(request, result, error)) {
      Fail("division by zero must fail the tool call");
    }
    AssertContains(error, "calculation failed: division by zero");
  }

  return 0;
}
