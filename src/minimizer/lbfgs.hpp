#pragma once

#include "exceptions.hpp"
#include "first_order_minimizer.hpp"
#include "line_search.hpp"
#include "ring_buffer.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace fomin {

/// @brief Curvature pairs (s, y, 1 / y.s) kept by L-BFGS, oldest first.
template <typename V> struct LBFGSHistory {
  RingBuffer<V> s_list;
  RingBuffer<V> y_list;
  RingBuffer<double> rho_list;
};

/**
 * @brief Limited-memory BFGS (L-BFGS) minimizer.
 * @details Approximates the inverse Hessian using a history of size m. Expects a
 *          deterministic objective, since steps are chosen by a Wolfe line search.
 */
template <typename V> class LBFGS : public FirstOrderMinimizer<V, LBFGSHistory<V>> {
  using Base = FirstOrderMinimizer<V, LBFGSHistory<V>>;

protected:
  using VS = VectorSpace<V>;

public:
  using typename Base::Objective;
  using typename Base::State;
  using History = LBFGSHistory<V>;

  explicit LBFGS(int max_iters = -1, int m = 10, double tolerance = 1e-9) : Base(max_iters, tolerance) {
    setHistorySize(m);
  }

  /**
   * @brief Set history size for L-BFGS.
   * @param history_size Number of curvature pairs to store (m).
   */
  void setHistorySize(int history_size) {
    if (history_size <= 0) throw std::invalid_argument("L-BFGS history size must be positive");
    m = static_cast<size_t>(history_size);
  }

  size_t historySize() const noexcept { return m; }

  /// @brief Line search used from the second step on.
  WolfeLineSearch &lineSearch() noexcept { return line_search; }

  /**
   * @brief Two-loop recursion: approximate inverse Hessian applied to @p grad.
   * @return The search direction `-H grad`.
   */
  static V compute_direction(const V &grad, const History &history) {
    const auto &s_list = history.s_list;
    const auto &y_list = history.y_list;
    const auto &rho_list = history.rho_list;

    if (s_list.empty()) {
      return -grad;
    }

    V q = grad;
    std::vector<double> alpha_list(s_list.size());

    // Backward pass
    for (int i = static_cast<int>(s_list.size()) - 1; i >= 0; --i) {
      alpha_list[i] = rho_list[i] * VS::dot(s_list[i], q);
      q = q - alpha_list[i] * y_list[i];
    }

    // Scaling
    double gamma = VS::dot(s_list.back(), y_list.back()) / VS::dot(y_list.back(), y_list.back());

    V z = gamma * q;

    // Forward pass
    for (size_t i = 0; i < s_list.size(); ++i) {
      double beta = rho_list[i] * VS::dot(y_list[i], z);
      z = z + s_list[i] * (alpha_list[i] - beta);
    }

    return -z;
  }

protected:
  History initialHistory(Objective & /*f*/, const V & /*init*/) override {
    return History{RingBuffer<V>(m), RingBuffer<V>(m), RingBuffer<double>(m)};
  }

  V chooseDescentDirection(const State &state) override {
    return compute_direction(state.adjustedGradient, state.history);
  }

  /// @brief First step after a (re)start is `min(1, 1/|g|)`; otherwise a line search from 1.
  double determineStepSize(const State &state, Objective &f, const V &direction) override {
    const double grad_norm = VS::norm(state.adjustedGradient);
    const double dir_norm = VS::norm(direction);
    if (state.history.s_list.empty()) {
      double alpha = std::min(1.0, 1.0 / grad_norm);
      if (!(alpha > 0.0) || !std::isfinite(alpha)) throw StepSizeUnderflow();
      return alpha;
    }

    WolfeLineSearch::Phi phi = [&](double alpha) {
      V x_new = this->takeStep(state, direction, alpha);
      auto [value, grad] = f.calculate(x_new);
      auto [adj_value, adj_grad] = this->adjust(x_new, grad, value);
      return std::make_pair(adj_value, VS::dot(adj_grad, direction));
    };
    const double slope = VS::dot(state.adjustedGradient, direction);
    return line_search.minimize(phi, state.adjustedValue, slope, 1.0, grad_norm, dir_norm);
  }

  V takeStep(const State &state, const V &dir, double stepSize) override { return state.x + stepSize * dir; }

  /// @brief Push (x_new - x, g_new - g) when the pair has positive curvature.
  History updateHistory(const V &newX, const V &newGrad, double newVal, const State &oldState) override {
    if (!std::isfinite(newVal) || !VS::allFinite(newGrad)) throw NaNHistory();

    History history = oldState.history;
    V s = newX - oldState.x;
    V y = newGrad - oldState.grad;
    double ys = VS::dot(y, s);
    if (ys > 1e-10) {
      history.s_list.push_back(s);
      history.y_list.push_back(y);
      history.rho_list.push_back(1.0 / ys);
    }
    return history;
  }

  WolfeLineSearch line_search;

private:
  size_t m = 10;
};

} // namespace fomin
