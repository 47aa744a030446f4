#include "tools/calculator/expression_calculator.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace norma::tools::calculator {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kE = 2.71828182845904523536;

class ExpressionParser {
public:
  ExpressionParser(std::string_view input, const std::map<std::string, double>& variables)
      : input_(input), variables_(variables) {}

  bool Evaluate(double& value, std::string& error) {
    if (!ParseSum(value, error)) {
      return false;
    }
    SkipWhitespace();
    if (pos_ != input_.size()) {
      return Fail("unexpected character '" + std::string(1, input_[pos_]) + "'", error);
    }
    return true;
  }

private:
  bool ParseSum(double& value, std::string& error) {
    if (!ParseProduct(value, error)) {
      return false;
    }
    while (true) {
      SkipWhitespace();
      if (Match('+')) {
        double rhs = 0.0;
        if (!ParseProduct(rhs, error)) {
          return false;
        }
        value += rhs;
      } else if (Match('-')) {
        double rhs = 0.0;
        if (!ParseProduct(rhs, error)) {
          return false;
        }
        value -= rhs;
      } else {
        return true;
      }
    }
  }

  bool ParseProduct(double& value, std::string& error) {
    if (!ParseUnary(value, error)) {
      return false;
    }
    while (true) {
      SkipWhitespace();
      if (Match('*')) {
        double rhs = 0.0;
        if (!ParseUnary(rhs, error)) {
          return false;
        }
        value *= rhs;
      } else if (Match('/')) {
        double rhs = 0.0;
        if (!ParseUnary(rhs, error)) {
          return false;
        }
        if (rhs == 0.0) {
          return Fail("division by zero", error);
        }
        value /= rhs;
      } else {
        return true;
      }
    }
  }

  bool ParseUnary(double& value, std::string& error) {
    SkipWhitespace();
    if (Match('-')) {
      if (!ParseUnary(value, error)) {
        return false;
      }
      value = -value;
      return true;
    }
    if (Match('+')) {
      return ParseUnary(value, error);
    }
    return ParsePower(value, error);
  }

  // `^` binds tighter than unary minus on its left and is right-associative:
  // -2^2 == -4, 2^3^2 == 512.
  bool ParsePower(double& value, std::string& error) {
    if (!ParsePrimary(value, error)) {
      return false;
    }
    SkipWhitespace();
    if (Match('^')) {
      double exponent = 0.0;
      if (!ParseUnary(exponent, error)) {
        return false;
      }
      value = std::pow(value, exponent);
    }
    return true;
  }

  bool ParsePrimary(double& value, std::string& error) {
    SkipWhitespace();
    if (pos_ >= input_.size()) {
      return Fail("unexpected end of expression", error);
    }

    const char c = input_[pos_];
    if (c == '(') {
      ++pos_;
      if (!ParseSum(value, error)) {
        return false;
      }
      SkipWhitespace();
      if (!Match(')')) {
        return Fail("expected ')'", error);
      }
      return true;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.') {
      return ParseNumber(value, error);
    }
    if (std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_') {
      return ParseIdentifier(value, error);
    }
    return Fail("unexpected character '" + std::string(1, c) + "'", error);
  }

  bool ParseNumber(double& value, std::string& error) {
    const std::string tail(input_.substr(pos_));
    char* end = nullptr;
    value = std::strtod(tail.c_str(), &end);
    if (end == tail.c_str()) {
      return Fail("invalid number", error);
    }
    pos_ += static_cast<std::size_t>(end - tail.c_str());
    return true;
  }

  bool ParseIdentifier(double& value, std::string& error) {
    const std::size_t start = pos_;
    while (pos_ < input_.size() &&
           (std::isalnum(static_cast<unsigned char>(input_[pos_])) != 0 || input_[pos_] == '_')) {
      ++pos_;
    }
    const std::string name(input_.substr(start, pos_ - start));

    SkipWhitespace();
    if (Match('(')) {
      std::vector<double> args;
      if (!ParseArguments(args, error)) {
        return false;
      }
      return ApplyFunction(name, args, value, error);
    }

    const auto it = variables_.find(name);
    if (it != variables_.end()) {
      value = it->second;
      return true;
    }
    if (name == "pi") {
      value = kPi;
      return true;
    }
    if (name == "e") {
      value = kE;
      return true;
    }
    return Fail("unknown identifier '" + name + "'", error);
  }

  bool ParseArguments(std::vector<double>& args, std::string& error) {
    SkipWhitespace();
    if (Match(')')) {
      return true;
    }
    while (true) {
      double arg = 0.0;
      if (!ParseSum(arg, error)) {
        return false;
      }
      args.push_back(arg);
      SkipWhitespace();
      if (Match(')')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' or ')' in argument list", error);
      }
    }
  }

  bool ApplyFunction(const std::string& name, const std::vector<double>& args, double& value,
                     std::string& error) {
    using UnaryFn = double (*)(double);
    static const std::map<std::string, UnaryFn> kUnary = {
        {"sqrt", [](double x) { return std::sqrt(x); }},
        {"floor", [](double x) { return std::floor(x); }},
        {"ceil", [](double x) { return std::ceil(x); }},
        {"abs", [](double x) { return std::fabs(x); }},
        {"round", [](double x) { return std::round(x); }},
        {"log", [](double x) { return std::log(x); }},
        {"log10", [](double x) { return std::log10(x); }},
        {"exp", [](double x) { return std::exp(x); }},
        {"sin", [](double x) { return std::sin(x); }},
        {"cos", [](double x) { return std::cos(x); }},
        {"tan", [](double x) { return std::tan(x); }},
    };

    if (const auto it = kUnary.find(name); it != kUnary.end()) {
      if (args.size() != 1U) {
        return Fail("function '" + name + "' expects 1 argument", error);
      }
      if (name == "sqrt" && args[0] < 0.0) {
        return Fail("sqrt of a negative number", error);
      }
      if ((name == "log" || name == "log10") && args[0] <= 0.0) {
        return Fail("log of a non-positive number", error);
      }
      value = it->second(args[0]);
      return true;
    }

    if (name == "min" || name == "max" || name == "pow") {
      if (args.size() != 2U) {
        return Fail("function '" + name + "' expects 2 arguments", error);
      }
      if (name == "min") {
        value = std::fmin(args[0], args[1]);
      } else if (name == "max") {
        value = std::fmax(args[0], args[1]);
      } else {
        value = std::pow(args[0], args[1]);
      }
      return true;
    }

    return Fail("unknown function '" + name + "'", error);
  }

  void SkipWhitespace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool Match(char expected) {
    if (pos_ < input_.size() && input_[pos_] == expected) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool Fail(const std::string& message, std::string& error) const {
    error = message + " at position " + std::to_string(pos_ + 1U);
    return false;
  }

  std::string_view input_;
  const std::map<std::string, double>& variables_;
  std::size_t pos_ = 0;
};

} // namespace

bool EvaluateExpression(std::string_view expression, const std::map<std::string, double>& variables,
                        double& value, std::string& error) {
  error.clear();
  if (expression.find_first_not_of(" \t\r\n") == std::string_view::npos) {
    error = "expression cannot be empty";
    return false;
  }

  ExpressionParser parser(expression, variables);
  double result = 0.0;
  if (!parser.Evaluate(result, error)) {
    return false;
  }
  if (!std::isfinite(result)) {
    error = "expression result is not a finite number";
    return false;
  }
  value = result;
  return true;
}

bool ExpressionCalculator::Calculate(const CalculationRequest& request, CalculationResult& result,
                                     std::string& error) {
  double value = 0.0;
  if (!EvaluateExpression(request.expression, request.variables, value, error)) {
    error = "calculation failed: " + error;
    return false;
  }
  result.output_variable = request.output_variable.empty() ? "result" : request.output_variable;
  result.value = value;
  return true;
}

} // namespace norma::tools::calculator
