#pragma once

#include "../common.hpp"
#include "../seed.hpp"
#include "vector_space.hpp"
#include <cstddef>
#include <functional>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fomin {

/**
 * @brief Differentiable objective whose value and gradient may change between calls.
 * @details Mini-batch objectives sample a different batch on every call; minimizers
 *          make no determinism assumption about this interface.
 */
template <typename V> class StochasticDiffFunction {
public:
  virtual ~StochasticDiffFunction() = default;

  /**
   * @brief Evaluates the objective.
   * @param x Point of evaluation.
   * @return Pair (value, gradient) at @p x.
   */
  virtual ValueAndGrad<V> calculate(const V &x) = 0;

  double valueAt(const V &x) { return calculate(x).first; }

  V gradientAt(const V &x) { return calculate(x).second; }
};

/**
 * @brief Deterministic differentiable objective.
 * @details Same interface as the stochastic one; deriving from it promises that
 *          repeated calls at the same point agree, which line searches rely on.
 */
template <typename V> class DiffFunction : public StochasticDiffFunction<V> {};

/**
 * @brief DiffFunction built from callables.
 */
template <typename V> class LambdaDiffFunction : public DiffFunction<V> {
public:
  using Fused = std::function<ValueAndGrad<V>(const V &)>;

  /// @brief Separate value and gradient callables.
  LambdaDiffFunction(VecFun<V, double> f, GradFun<V> gradient)
      : _fused([f = std::move(f), gradient = std::move(gradient)](const V &x) {
          return ValueAndGrad<V>(f(x), gradient(x));
        }) {}

  /// @brief A single callable returning value and gradient together.
  explicit LambdaDiffFunction(Fused fused) : _fused(std::move(fused)) {
    if (!_fused) throw std::invalid_argument("LambdaDiffFunction: empty callable");
  }

  ValueAndGrad<V> calculate(const V &x) override { return _fused(x); }

private:
  Fused _fused;
};

/**
 * @brief Adds `weight / 2 * |x|^2` to an objective.
 * @details Holds a reference; the wrapped objective must outlive this object.
 *          Deterministic objectives stay deterministic.
 */
template <typename V> class L2Regularized : public StochasticDiffFunction<V> {
  using VS = VectorSpace<V>;

public:
  L2Regularized(StochasticDiffFunction<V> &f, double weight) : _f(f), _weight(weight) {
    if (weight < 0.0) throw std::invalid_argument("L2 regularization weight must be non-negative");
  }

  ValueAndGrad<V> calculate(const V &x) override {
    auto [value, grad] = _f.calculate(x);
    const double sq = VS::dot(x, x);
    return ValueAndGrad<V>(value + 0.5 * _weight * sq, grad + _weight * x);
  }

  double weight() const noexcept { return _weight; }

private:
  StochasticDiffFunction<V> &_f;
  double _weight;
};

template <typename V> L2Regularized<V> withL2Regularization(StochasticDiffFunction<V> &f, double weight) {
  return L2Regularized<V>(f, weight);
}

template <typename V> class RandomBatchFunction;

/**
 * @brief Objective defined as a reduction over indexed examples.
 * @details `calculate(x)` evaluates the full batch; `calculateBatch` evaluates any subset.
 */
template <typename V> class BatchDiffFunction : public DiffFunction<V> {
public:
  /**
   * @brief Evaluates the objective on a subset of examples.
   * @param x Point of evaluation.
   * @param batch Example indices, each in [0, fullRange()).
   */
  virtual ValueAndGrad<V> calculateBatch(const V &x, const std::vector<size_t> &batch) = 0;

  /// @brief Number of examples.
  virtual size_t fullRange() const = 0;

  ValueAndGrad<V> calculate(const V &x) override { return calculateBatch(x, fullIndices()); }

  std::vector<size_t> fullIndices() const {
    std::vector<size_t> idx(fullRange());
    std::iota(idx.begin(), idx.end(), 0);
    return idx;
  }

  /**
   * @brief Stochastic view sampling a fresh batch of @p batch_size examples per call.
   * @details The returned object references this one.
   */
  RandomBatchFunction<V> withRandomBatches(size_t batch_size, unsigned int seed = kDefaultSeed) {
    return RandomBatchFunction<V>(*this, batch_size, seed);
  }
};

/**
 * @brief Sample @p batch_size distinct indices out of [0, N) with a partial Fisher-Yates shuffle.
 * @details Returns every index when @p batch_size >= N and nothing when either is zero.
 */
inline std::vector<size_t> sample_minibatch_indices(const size_t N, size_t batch_size, std::mt19937 &rng) {
  if (N == 0 || batch_size == 0) return {};
  std::vector<size_t> idx(N);
  std::iota(idx.begin(), idx.end(), 0);
  if (batch_size >= N) return idx;

  for (size_t i = 0; i < batch_size; ++i) {
    std::uniform_int_distribution<size_t> dist(i, N - 1);
    size_t j = dist(rng);
    std::swap(idx[i], idx[j]);
  }
  idx.resize(batch_size);
  return idx;
}

/**
 * @brief Stochastic objective evaluating a random mini-batch of a BatchDiffFunction per call.
 */
template <typename V> class RandomBatchFunction : public StochasticDiffFunction<V> {
public:
  RandomBatchFunction(BatchDiffFunction<V> &f, size_t batch_size, unsigned int seed = kDefaultSeed)
      : _f(f), _batch_size(batch_size), _rng(seed) {
    if (batch_size == 0) throw std::invalid_argument("RandomBatchFunction: batch size must be positive");
  }

  ValueAndGrad<V> calculate(const V &x) override {
    auto batch = sample_minibatch_indices(_f.fullRange(), _batch_size, _rng);
    return _f.calculateBatch(x, batch);
  }

  size_t batchSize() const noexcept { return _batch_size; }

private:
  BatchDiffFunction<V> &_f;
  size_t _batch_size;
  std::mt19937 _rng;
};

/**
 * @brief BatchDiffFunction whose value is the mean of per-example terms.
 * @details Terms are summed in parallel when OpenMP is enabled; a term callable must
 *          therefore be thread-safe and must not throw.
 */
template <typename V> class MeanOfTermsFunction : public BatchDiffFunction<V> {
  using VS = VectorSpace<V>;

public:
  using Term = std::function<ValueAndGrad<V>(const V &, size_t)>;

  MeanOfTermsFunction(size_t num_terms, Term term) : _num_terms(num_terms), _term(std::move(term)) {
    if (!_term) throw std::invalid_argument("MeanOfTermsFunction: empty term callable");
  }

  ValueAndGrad<V> calculateBatch(const V &x, const std::vector<size_t> &batch) override {
    double value = 0.0;
    V grad = VS::zerosLike(x);
    const long n = static_cast<long>(batch.size());
    if (n == 0) return ValueAndGrad<V>(value, grad);

#pragma omp parallel
    {
      double local_value = 0.0;
      V local_grad = VS::zerosLike(x);
#pragma omp for nowait
      for (long k = 0; k < n; ++k) {
        ValueAndGrad<V> vg = _term(x, batch[static_cast<size_t>(k)]);
        local_value += vg.first;
        local_grad = local_grad + vg.second;
      }
#pragma omp critical
      {
        value += local_value;
        grad = grad + local_grad;
      }
    }

    const double inv = 1.0 / static_cast<double>(n);
    return ValueAndGrad<V>(value * inv, grad * inv);
  }

  size_t fullRange() const override { return _num_terms; }

private:
  size_t _num_terms;
  Term _term;
};

} // namespace fomin
