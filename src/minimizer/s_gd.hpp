#pragma once

#include "exceptions.hpp"
#include "first_order_minimizer.hpp"
#include <cmath>
#include <stdexcept>

namespace fomin {

/// @brief History of methods that need none.
struct NoHistory {};

/**
 * @brief Stochastic Gradient Descent with a decaying step.
 * @details Step at iteration k is `defaultStepSize / (k + 1)^(2/3)` along the negative
 *          adjusted gradient.
 */
template <typename V> class StochasticGradientDescent : public FirstOrderMinimizer<V, NoHistory> {
  using Base = FirstOrderMinimizer<V, NoHistory>;

public:
  using typename Base::Objective;
  using typename Base::State;

  explicit StochasticGradientDescent(double default_step_size = 1.0,
      int max_iters = 100,
      double tolerance = 1e-5,
      double improvement_tol = 1e-4,
      int min_improvement_window = 50)
      : Base(max_iters, tolerance, improvement_tol, min_improvement_window) {
    setStepSize(default_step_size);
  }

  /**
   * @brief Sets the base step size (learning rate).
   * @param s Step size.
   */
  void setStepSize(double s) {
    if (!(s > 0.0)) throw std::invalid_argument("step size must be positive");
    step_size = s;
  }

  double stepSize() const noexcept { return step_size; }

protected:
  NoHistory initialHistory(Objective & /*f*/, const V & /*init*/) override { return {}; }

  V chooseDescentDirection(const State &state) override { return -state.adjustedGradient; }

  double determineStepSize(const State &state, Objective & /*f*/, const V & /*direction*/) override {
    return step_size / std::pow(state.iter + 1.0, 2.0 / 3.0);
  }

  V takeStep(const State &state, const V &dir, double stepSize) override { return state.x + stepSize * dir; }

  NoHistory updateHistory(const V & /*newX*/, const V &newGrad, double newVal, const State & /*oldState*/) override {
    if (!std::isfinite(newVal) || !VectorSpace<V>::allFinite(newGrad)) throw NaNHistory();
    return {};
  }

  double step_size = 1.0;
};

} // namespace fomin
