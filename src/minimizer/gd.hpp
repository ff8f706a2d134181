#pragma once

#include "s_gd.hpp"

namespace fomin {

/**
 * @brief Gradient Descent with a constant step.
 */
template <typename V> class GradientDescent : public StochasticGradientDescent<V> {
  using Base = StochasticGradientDescent<V>;

public:
  using typename Base::Objective;
  using typename Base::State;

  explicit GradientDescent(double step_size = 1e-2, int max_iters = -1, double tolerance = 1e-5)
      : Base(step_size, max_iters, tolerance, 1e-3, 10) {}

protected:
  double determineStepSize(const State & /*state*/, Objective & /*f*/, const V & /*direction*/) override {
    return this->step_size;
  }
};

} // namespace fomin
