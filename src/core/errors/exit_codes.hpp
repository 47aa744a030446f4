#pragma once

namespace norma::core::errors {

// Process-exit contract for the `norma` CLI.
//
// 0/1/2 keep their conventional meanings. The session outcomes get their own
// codes so wrappers can tell "answered" from "needs an engineer" without
// parsing stdout.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kInputInvalid = 10,
  kHumanReview = 40,
  kSessionError = 50,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace norma::core::errors
