#pragma once

#include "../common.hpp"
#include "../iteration_recorder.hpp"
#include "exceptions.hpp"
#include "minimizer.hpp"
#include "objective.hpp"
#include "ring_buffer.hpp"
#include "vector_space.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace fomin {

/**
 * @brief Iteration core shared by every first-order method.
 * @details Runs the choose-direction / step-size / step / evaluate / adjust / update-history
 *          loop, tracks stagnation over a window of adjusted values, recovers once from
 *          a FirstOrderException by resetting the history, and stops on the first state
 *          that satisfies the termination predicate.
 *
 *          Concrete methods implement the protected hooks; the loop itself never looks
 *          inside History.
 *
 * @tparam V Point type, with a VectorSpace<V> specialisation.
 * @tparam H History type owned by the concrete method.
 */
template <typename V, typename H> class FirstOrderMinimizer : public Minimizer<V> {
protected:
  using VS = VectorSpace<V>;

public:
  using History = H;
  using Objective = StochasticDiffFunction<V>;

  /**
   * @brief Snapshot of the optimisation progress after one iteration.
   * @details Produced states are never modified; each transition builds a new one.
   */
  struct State {
    V x;
    double value;
    V grad;
    double adjustedValue;
    V adjustedGradient;
    int iter;
    double initialAdjVal;
    H history;
    RingBuffer<double> fVals;
    int numImprovementFailures = 0;
    bool searchFailed = false;
  };

  class IterationSequence;

  /**
   * @param max_iters Iteration limit; negative means unbounded.
   * @param tolerance Relative tolerance on the adjusted gradient norm.
   * @param improvement_tol Minimum relative improvement over the window.
   * @param min_improvement_window Number of adjusted values tracked for stagnation.
   * @param number_of_improvement_failures Stagnation episodes tolerated before stopping.
   */
  explicit FirstOrderMinimizer(int max_iters = -1,
      double tolerance = 1e-5,
      double improvement_tol = 1e-3,
      int min_improvement_window = 10,
      int number_of_improvement_failures = 1) {
    setMaxIterations(max_iters);
    setTolerance(tolerance);
    setImprovementTolerance(improvement_tol);
    setMinImprovementWindow(min_improvement_window);
    setNumberOfImprovementFailures(number_of_improvement_failures);
  }

  void setMaxIterations(int max_iters) noexcept { _max_iters = max_iters; }

  void setTolerance(double tol) {
    if (!(tol >= 0.0)) throw std::invalid_argument("tolerance must be non-negative");
    _tol = tol;
  }

  void setImprovementTolerance(double tol) {
    if (!(tol >= 0.0)) throw std::invalid_argument("improvement tolerance must be non-negative");
    _improvement_tol = tol;
  }

  void setMinImprovementWindow(int window) {
    if (window < 0) throw std::invalid_argument("improvement window must be non-negative");
    _min_improvement_window = window;
  }

  void setNumberOfImprovementFailures(int n) {
    if (n < 0) throw std::invalid_argument("number of improvement failures must be non-negative");
    _number_of_improvement_failures = n;
  }

  /**
   * @brief Throwaway warm-up steps taken before the first real iteration.
   * @details Only the history they accumulate is kept.
   */
  void setDepthChargeSteps(int steps) {
    if (steps < 0) throw std::invalid_argument("depth charge steps must be non-negative");
    _depth_charge_steps = steps;
  }

  int maxIterations() const noexcept { return _max_iters; }
  double tolerance() const noexcept { return _tol; }
  double improvementTolerance() const noexcept { return _improvement_tol; }
  int minImprovementWindow() const noexcept { return _min_improvement_window; }
  int numberOfImprovementFailures() const noexcept { return _number_of_improvement_failures; }

  /**
   * @brief Lazy sequence of states starting at @p init.
   * @details Nothing is evaluated until the first `next()`. The sequence keeps references
   *          to this minimizer and to @p f; both must outlive it.
   */
  IterationSequence iterations(Objective &f, const V &init) { return IterationSequence(*this, f, init); }

  V minimize(Objective &f, const V &init) override { return iterations(f, init).last().x; }

  MinimizationResult<V> run(Objective &f, const V &init) override {
    State s = iterations(f, init).last();
    MinimizationResult<V> result{s.x, s.value, s.adjustedValue, VS::norm(s.adjustedGradient), s.iter,
        s.searchFailed, stopReason(s)};
    return result;
  }

  /// @brief Which stopping condition @p s meets, or None.
  ConvergenceReason stopReason(const State &s) const {
    if (s.searchFailed) return ConvergenceReason::SearchFailed;
    if (_max_iters >= 0 && s.iter >= _max_iters) return ConvergenceReason::MaxIterations;
    if (VS::norm(s.adjustedGradient) <= std::max(_tol * std::abs(s.initialAdjVal), 1e-8))
      return ConvergenceReason::GradientConverged;
    if (s.numImprovementFailures >= _number_of_improvement_failures) return ConvergenceReason::ImprovementFailures;
    return ConvergenceReason::None;
  }

  bool isTerminal(const State &s) const { return stopReason(s) != ConvergenceReason::None; }

protected:
  virtual H initialHistory(Objective &f, const V &init) = 0;

  /// @brief Correction folded into value and gradient before convergence tests.
  virtual ValueAndGrad<V> adjust(const V & /*newX*/, const V &newGrad, double newVal) {
    return ValueAndGrad<V>(newVal, newGrad);
  }

  virtual V chooseDescentDirection(const State &state) = 0;
  virtual double determineStepSize(const State &state, Objective &f, const V &direction) = 0;
  virtual V takeStep(const State &state, const V &dir, double stepSize) = 0;
  virtual H updateHistory(const V &newX, const V &newGrad, double newVal, const State &oldState) = 0;

  virtual int numDepthChargeSteps() const { return _depth_charge_steps; }

  RingBuffer<double> updateFValWindow(const State &oldState, double newAdjVal) const {
    RingBuffer<double> window = oldState.fVals;
    window.push_back(newAdjVal);
    return window;
  }

  State initialState(Objective &f, const V &init) {
    auto [value, grad] = f.calculate(init);
    auto [adj_value, adj_grad] = adjust(init, grad, value);
    H history = initialHistory(f, init);
    return State{init, value, grad, adj_value, adj_grad, 0, adj_value, std::move(history),
        RingBuffer<double>(static_cast<size_t>(_min_improvement_window))};
  }

  /**
   * @brief One full iteration from @p state; recognised failures propagate.
   */
  State step(Objective &f, const State &state) {
    V dir = chooseDescentDirection(state);
    double step_size = determineStepSize(state, f, dir);
    if (this->_verbose) std::cout << "Step Size:" << step_size << std::endl;
    V x = takeStep(state, dir, step_size);
    auto [value, grad] = f.calculate(x);
    if (this->_verbose) std::cout << "Val and Grad Norm:" << value << " " << VS::norm(grad) << std::endl;
    auto [adj_value, adj_grad] = adjust(x, grad, value);
    if (this->_verbose) std::cout << "Adj Val and Grad Norm:" << adj_value << " " << VS::norm(adj_grad) << std::endl;
    H history = updateHistory(x, grad, value, state);

    RingBuffer<double> window = updateFValWindow(state, adj_value);
    int improvement_failures = 0;
    const bool stalled = window.size() >= static_cast<size_t>(_min_improvement_window) && !window.empty() &&
                         window.back() > window.front() * (1.0 - _improvement_tol);
    if (stalled) {
      window.clear();
      improvement_failures = state.numImprovementFailures + 1;
    }

    return State{std::move(x), value, std::move(grad), adj_value, std::move(adj_grad), state.iter + 1,
        state.initialAdjVal, std::move(history), std::move(window), improvement_failures, false};
  }

  /**
   * @brief Initial state, with the history warmed up by the depth-charge steps.
   * @details The start point is evaluated once; warm-up steps only contribute their
   *          history. A recognised failure during warm-up abandons it and keeps the
   *          start state with its fresh history.
   */
  State doDepthCharge(Objective &f, const V &init) {
    State start = initialState(f, init);
    const int steps = numDepthChargeSteps();
    if (steps <= 0) return start;

    State state = start;
    try {
      for (int i = 0; i < steps; ++i) {
        V dir = chooseDescentDirection(state);
        double step_size = determineStepSize(state, f, dir);
        V x = takeStep(state, dir, step_size);
        auto [value, grad] = f.calculate(x);
        auto [adj_value, adj_grad] = adjust(x, grad, value);
        H history = updateHistory(x, grad, value, state);
        if (this->_verbose)
          std::cout << "False Step " << i << ": v=" << adj_value << " g=" << VS::norm(adj_grad) << std::endl;
        state = State{std::move(x), value, std::move(grad), adj_value, std::move(adj_grad), 0, state.initialAdjVal,
            std::move(history), RingBuffer<double>(static_cast<size_t>(_min_improvement_window))};
      }
    } catch (const FirstOrderException &e) {
      std::cerr << "Failure during warm-up, keeping a fresh history: " << e.what() << std::endl;
      return start;
    }

    start.history = std::move(state.history);
    return start;
  }

  int _max_iters = -1;
  double _tol = 1e-5;
  double _improvement_tol = 1e-3;
  int _min_improvement_window = 10;
  int _number_of_improvement_failures = 1;
  int _depth_charge_steps = 0;
};

/**
 * @brief Single-pass generator over the states of one minimisation run.
 * @details Each `next()` computes exactly one state. The sequence ends right after the
 *          first state satisfying the termination predicate; it cannot be rewound.
 */
template <typename V, typename H> class FirstOrderMinimizer<V, H>::IterationSequence {
public:
  IterationSequence(FirstOrderMinimizer &owner, Objective &f, const V &init) : _owner(owner), _f(f), _init(init) {}

  /// @brief True while another state can be produced.
  bool hasNext() const noexcept { return !_done; }

  /**
   * @brief Produce the next state.
   * @throws std::out_of_range once the sequence has ended.
   */
  const State &next() {
    if (_done) throw std::out_of_range("IterationSequence exhausted");
    if (!_current) {
      _start_time = std::chrono::steady_clock::now();
      _current.emplace(_owner.doDepthCharge(_f, _init));
    } else {
      State advanced = advance(*_current);
      _current.emplace(std::move(advanced));
    }
    _done = _owner.isTerminal(*_current);
    record(*_current);
    return *_current;
  }

  /// @brief Drain the sequence and return its final state.
  State last() {
    while (hasNext())
      next();
    return *_current;
  }

  /// @brief Most recently produced state, if any.
  const std::optional<State> &current() const noexcept { return _current; }

private:
  State advance(const State &state) {
    try {
      State stepped = _owner.step(_f, state);
      _failed_once = false;
      return stepped;
    } catch (const FirstOrderException &e) {
      if (!_failed_once) {
        _failed_once = true;
        std::cerr << "Failure! Resetting history: " << e.what() << std::endl;
        State recovered = state;
        try {
          recovered.history = _owner.initialHistory(_f, state.x);
        } catch (const FirstOrderException &reset_error) {
          // the reset itself is the second consecutive failure
          return giveUp(state, reset_error);
        }
        return advance(recovered);
      }
      return giveUp(state, e);
    }
  }

  State giveUp(const State &state, const FirstOrderException &e) const {
    std::cerr << "Failure again! Giving up and returning. Maybe the objective is just poorly behaved? (" << e.what()
              << ")" << std::endl;
    State failed = state;
    failed.searchFailed = true;
    return failed;
  }

  void record(const State &s) {
    if (!_owner._recorder) return;
    auto now = std::chrono::steady_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(now - _start_time).count();
    _owner._recorder->record(s.iter, s.adjustedValue, VectorSpace<V>::norm(s.adjustedGradient), elapsed_ms);
  }

  FirstOrderMinimizer &_owner;
  Objective &_f;
  V _init;
  std::optional<State> _current;
  bool _done = false;
  bool _failed_once = false;
  std::chrono::steady_clock::time_point _start_time;
};

} // namespace fomin
