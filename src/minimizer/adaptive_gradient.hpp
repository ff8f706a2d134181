#pragma once

#include "exceptions.hpp"
#include "first_order_minimizer.hpp"
#include <cmath>
#include <stdexcept>

namespace fomin {

/// @brief Running sum of squared adjusted gradients, one entry per coordinate.
template <typename V> struct AdaGradHistory {
  V sumOfSquaredGradients;
};

/**
 * @brief Adaptive-gradient (AdaGrad) descent.
 * @details Coordinate i moves by `eta * d_i / (delta + sqrt(s_i))`, with s the running sum
 *          of squared adjusted gradients. The history is primed with the gradient at the
 *          start point and, by default, one depth-charge step, since the first steps of
 *          an empty accumulator are erratic. Subclasses choose the regularisation.
 */
template <typename V> class AdaptiveGradientDescent : public FirstOrderMinimizer<V, AdaGradHistory<V>> {
  using Base = FirstOrderMinimizer<V, AdaGradHistory<V>>;

protected:
  using VS = VectorSpace<V>;

public:
  using typename Base::Objective;
  using typename Base::State;
  using History = AdaGradHistory<V>;

  AdaptiveGradientDescent(double lambda,
      double eta = 4.0,
      int max_iters = 100,
      double tolerance = 1e-5,
      double improvement_tol = 1e-4,
      int min_improvement_window = 50)
      : Base(max_iters, tolerance, improvement_tol, min_improvement_window) {
    if (lambda < 0.0) throw std::invalid_argument("regularization must be non-negative");
    if (!(eta > 0.0)) throw std::invalid_argument("eta must be positive");
    this->lambda = lambda;
    this->eta = eta;
    this->setDepthChargeSteps(1);
  }

  double regularization() const noexcept { return lambda; }
  double learningRate() const noexcept { return eta; }

  /// @brief Offset keeping the per-coordinate step finite.
  void setDelta(double d) {
    if (!(d > 0.0)) throw std::invalid_argument("delta must be positive");
    delta = d;
  }

protected:
  History initialHistory(Objective &f, const V &init) override {
    auto [value, grad] = f.calculate(init);
    auto [adj_value, adj_grad] = this->adjust(init, grad, value);
    if (!std::isfinite(adj_value) || !VS::allFinite(adj_grad)) throw NaNHistory();
    return History{VS::zipWith(adj_grad, adj_grad, [](double a, double b) { return a * b; })};
  }

  V chooseDescentDirection(const State &state) override { return -state.adjustedGradient; }

  double determineStepSize(const State & /*state*/, Objective & /*f*/, const V & /*direction*/) override {
    return eta;
  }

  /// @brief Per-coordinate scaled step `x + stepSize * d / (delta + sqrt(s))`.
  V takeStep(const State &state, const V &dir, double stepSize) override {
    const double d = delta;
    return VS::zipWith(state.x, dir, state.history.sumOfSquaredGradients,
        [stepSize, d](double xi, double di, double si) { return xi + stepSize * di / (d + std::sqrt(si)); });
  }

  History updateHistory(const V &newX, const V &newGrad, double newVal, const State &oldState) override {
    auto [adj_value, adj_grad] = this->adjust(newX, newGrad, newVal);
    if (!std::isfinite(adj_value) || !VS::allFinite(adj_grad)) throw NaNHistory();
    return History{VS::zipWith(oldState.history.sumOfSquaredGradients, adj_grad,
        [](double si, double gi) { return si + gi * gi; })};
  }

  double lambda = 0.0;
  double eta = 4.0;
  double delta = 1e-4;
};

/**
 * @brief AdaGrad with `lambda / 2 * |x|^2` folded into the adjusted value and gradient.
 */
template <typename V> class AdaGradL2 : public AdaptiveGradientDescent<V> {
  using Base = AdaptiveGradientDescent<V>;
  using VS = VectorSpace<V>;

public:
  using Base::Base;

protected:
  ValueAndGrad<V> adjust(const V &newX, const V &newGrad, double newVal) override {
    return ValueAndGrad<V>(newVal + 0.5 * this->lambda * VS::dot(newX, newX), newGrad + this->lambda * newX);
  }
};

/**
 * @brief AdaGrad with `lambda * |x|_1`, using the subgradient and truncating coordinates
 *        that would cross zero.
 */
template <typename V> class AdaGradL1 : public AdaptiveGradientDescent<V> {
  using Base = AdaptiveGradientDescent<V>;
  using VS = VectorSpace<V>;

public:
  using Base::Base;
  using typename Base::State;

protected:
  ValueAndGrad<V> adjust(const V &newX, const V &newGrad, double newVal) override {
    const double l = this->lambda;
    V subgrad = VS::zipWith(newX, newGrad, [l](double xi, double gi) {
      if (xi > 0.0) return gi + l;
      if (xi < 0.0) return gi - l;
      return gi;
    });
    return ValueAndGrad<V>(newVal + l * VS::l1Norm(newX), subgrad);
  }

  V takeStep(const State &state, const V &dir, double stepSize) override {
    V candidate = Base::takeStep(state, dir, stepSize);
    return VS::zipWith(state.x, candidate, [](double xi, double ci) { return xi * ci < 0.0 ? 0.0 : ci; });
  }
};

} // namespace fomin
