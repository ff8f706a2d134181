#pragma once

#include <cstdio>
#include <stdexcept>
#include <string>

namespace fomin {

/**
 * @brief Base of the numerical failures a first-order minimizer recovers from.
 * @details Anything not derived from this class is treated as a programming error
 *          and leaves the iteration loop untouched.
 */
class FirstOrderException : public std::runtime_error {
public:
  explicit FirstOrderException(const std::string &msg = "") : std::runtime_error(msg) {}
};

/// @brief The gradient went non-finite after an update.
class NaNHistory : public FirstOrderException {
public:
  NaNHistory() : FirstOrderException("NaN or infinite gradient") {}
};

/// @brief The step-size search shrank the step below a usable magnitude.
class StepSizeUnderflow : public FirstOrderException {
public:
  StepSizeUnderflow() : FirstOrderException("Step size underflow") {}
};

/// @brief A bounded line search ran out of trials.
class LineSearchFailed : public FirstOrderException {
public:
  LineSearchFailed(double grad_norm, double dir_norm)
      : FirstOrderException(format(grad_norm, dir_norm)), grad_norm_(grad_norm), dir_norm_(dir_norm) {}

  double gradNorm() const noexcept { return grad_norm_; }
  double dirNorm() const noexcept { return dir_norm_; }

private:
  static std::string format(double grad_norm, double dir_norm) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "Grad norm: %.4f Dir Norm: %.4f", grad_norm, dir_norm);
    return buf;
  }

  double grad_norm_;
  double dir_norm_;
};

} // namespace fomin
