#pragma once

#include "lbfgs.hpp"
#include <cmath>
#include <stdexcept>

namespace fomin {

/**
 * @brief Orthant-wise L-BFGS for objectives with an added `l1 * |x|_1` term.
 * @details The adjusted gradient is the L1 pseudo-gradient, directions are restricted to
 *          the orthant of steepest descent and every trial point is projected back onto
 *          the orthant of the current point. Only sufficient decrease is enforced.
 */
template <typename V> class OWLQN : public LBFGS<V> {
  using Base = LBFGS<V>;
  using VS = VectorSpace<V>;

public:
  using typename Base::History;
  using typename Base::Objective;
  using typename Base::State;

  OWLQN(int max_iters = -1, int m = 10, double l1_weight = 1.0, double tolerance = 1e-8) : Base(max_iters, m, tolerance) {
    setL1Weight(l1_weight);
    this->line_search.setCurvatureCondition(false);
  }

  void setL1Weight(double weight) {
    if (weight < 0.0) throw std::invalid_argument("L1 weight must be non-negative");
    l1_weight = weight;
  }

  double l1Weight() const noexcept { return l1_weight; }

protected:
  ValueAndGrad<V> adjust(const V &newX, const V &newGrad, double newVal) override {
    const double l1 = l1_weight;
    V pseudo = VS::zipWith(newX, newGrad, [l1](double xi, double gi) {
      if (xi > 0.0) return gi + l1;
      if (xi < 0.0) return gi - l1;
      if (gi + l1 < 0.0) return gi + l1;
      if (gi - l1 > 0.0) return gi - l1;
      return 0.0;
    });
    return ValueAndGrad<V>(newVal + l1 * VS::l1Norm(newX), pseudo);
  }

  V chooseDescentDirection(const State &state) override {
    V dir = Base::chooseDescentDirection(state);
    // Drop components that disagree with steepest descent on the pseudo-gradient.
    return VS::zipWith(dir, state.adjustedGradient, [](double di, double gi) { return di * gi < 0.0 ? di : 0.0; });
  }

  V takeStep(const State &state, const V &dir, double stepSize) override {
    V orthant = VS::zipWith(state.x, state.adjustedGradient, [](double xi, double gi) {
      if (xi != 0.0) return xi > 0.0 ? 1.0 : -1.0;
      if (gi != 0.0) return gi > 0.0 ? -1.0 : 1.0;
      return 0.0;
    });
    V candidate = state.x + stepSize * dir;
    return VS::zipWith(candidate, orthant, [](double ci, double oi) { return ci * oi > 0.0 ? ci : 0.0; });
  }

private:
  double l1_weight = 1.0;
};

} // namespace fomin
