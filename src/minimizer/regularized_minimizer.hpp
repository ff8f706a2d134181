#pragma once

#include "minimizer.hpp"
#include "objective.hpp"
#include <memory>
#include <stdexcept>

namespace fomin {

/**
 * @brief Runs an inner minimizer on `f + weight / 2 * |x|^2`.
 * @details Reported values include the penalty.
 */
template <typename V> class L2RegularizedMinimizer : public Minimizer<V> {
public:
  L2RegularizedMinimizer(std::unique_ptr<Minimizer<V>> inner, double weight) : _inner(std::move(inner)), _weight(weight) {
    if (!_inner) throw std::invalid_argument("L2RegularizedMinimizer: null inner minimizer");
    if (weight < 0.0) throw std::invalid_argument("L2 regularization weight must be non-negative");
  }

  V minimize(StochasticDiffFunction<V> &f, const V &init) override {
    L2Regularized<V> regularized(f, _weight);
    return _inner->minimize(regularized, init);
  }

  MinimizationResult<V> run(StochasticDiffFunction<V> &f, const V &init) override {
    L2Regularized<V> regularized(f, _weight);
    return _inner->run(regularized, init);
  }

  void setRecorder(IterationRecorder *recorder) override { _inner->setRecorder(recorder); }

  void setVerbose(bool verbose) override { _inner->setVerbose(verbose); }

  Minimizer<V> &inner() noexcept { return *_inner; }

  double weight() const noexcept { return _weight; }

private:
  std::unique_ptr<Minimizer<V>> _inner;
  double _weight;
};

} // namespace fomin
