#pragma once

#include "exceptions.hpp"
#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>
#include <utility>

namespace fomin {

/**
 * @brief Bisection/expansion line search on the Wolfe conditions.
 * @details Works on the one-dimensional restriction phi(alpha) = f(x + alpha p), given
 *          as a callable returning (phi(alpha), phi'(alpha)). Failures are reported as
 *          FirstOrderException so the iteration core can recover from them.
 */
class WolfeLineSearch {
public:
  /// @brief (value, directional derivative) at a trial step.
  using Phi = std::function<std::pair<double, double>(double)>;

  explicit WolfeLineSearch(int max_line_iters = 50, double c1 = 1e-4, double c2 = 0.9, double rho = 0.5)
      : _max_line_iters(max_line_iters), c1(c1), c2(c2), rho(rho) {
    if (max_line_iters <= 0) throw std::invalid_argument("line search needs at least one trial");
    if (!(0.0 < c1 && c1 < c2 && c2 < 1.0)) throw std::invalid_argument("Wolfe constants need 0 < c1 < c2 < 1");
    if (!(0.0 < rho && rho < 1.0)) throw std::invalid_argument("rho must lie in (0, 1)");
  }

  /// @brief With false only the sufficient-decrease (Armijo) condition is enforced.
  void setCurvatureCondition(bool enable) noexcept { _curvature = enable; }

  void setMinStep(double min_step) noexcept { _min_step = min_step; }

  /**
   * @brief Find a step satisfying the Wolfe conditions.
   * @param phi Restriction of the objective to the search line.
   * @param f_old phi(0).
   * @param grad_f_old phi'(0); must be negative.
   * @param alpha Initial trial step.
   * @param grad_norm Gradient norm, for diagnostics.
   * @param dir_norm Direction norm, for diagnostics.
   * @throws LineSearchFailed when the trials run out or the direction is not a descent direction.
   * @throws StepSizeUnderflow when the trial step shrinks below the minimum.
   */
  double minimize(const Phi &phi, double f_old, double grad_f_old, double alpha, double grad_norm,
      double dir_norm) const {
    if (!(grad_f_old < 0.0)) throw LineSearchFailed(grad_norm, dir_norm);

    const double inf = std::numeric_limits<double>::infinity();
    double alpha_min = 0.0;
    double alpha_max = inf;

    for (int i = 0; i < _max_line_iters; ++i) {
      if (alpha < _min_step) throw StepSizeUnderflow();
      auto [f_new, grad_f_new_dot_p] = phi(alpha);

      if (!std::isfinite(f_new) || f_new > f_old + c1 * alpha * grad_f_old) {
        alpha_max = alpha;
        alpha = rho * (alpha_min + alpha_max);
        continue;
      }

      if (_curvature && grad_f_new_dot_p < c2 * grad_f_old) {
        alpha_min = alpha;
        if (alpha_max == inf)
          alpha *= 2;
        else
          alpha = rho * (alpha_min + alpha_max);
        continue;
      }
      return alpha;
    }
    throw LineSearchFailed(grad_norm, dir_norm);
  }

private:
  int _max_line_iters;
  double c1;
  double c2;
  double rho;
  double _min_step = 1e-12;
  bool _curvature = true;
};

} // namespace fomin
