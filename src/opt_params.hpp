#pragma once

#include "minimizer/adaptive_gradient.hpp"
#include "minimizer/lbfgs.hpp"
#include "minimizer/minimizer.hpp"
#include "minimizer/objective.hpp"
#include "minimizer/owlqn.hpp"
#include "minimizer/regularized_minimizer.hpp"
#include "simple_config.hpp"
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace fomin {

/**
 * @struct OptParams
 * @brief Selects an optimization routine from a small configuration record.
 *
 * Configurations:
 *  - useStochastic=false, useL1=false: L-BFGS on the L2-regularized objective
 *  - useStochastic=false, useL1=true:  OWL-QN with L1 regularization
 *  - useStochastic=true,  useL1=false: AdaGrad with L2 regularization
 *  - useStochastic=true,  useL1=true:  AdaGrad with L1 regularization
 */
struct OptParams {
  int batchSize = 512;         ///< Mini-batch size when useStochastic.
  double regularization = 1.0; ///< Regularization constant.
  double alpha = 0.5;          ///< Learning rate, stochastic methods only.
  int maxIterations = 1000;
  bool useL1 = false;
  double tolerance = 1e-3;
  bool useStochastic = false;

  /// @brief History size of the quasi-Newton methods.
  static constexpr int kQuasiNewtonHistory = 5;

  /**
   * @brief Read parameters from a configuration, keeping defaults for missing keys.
   * @details Keys: batch_size, regularization, alpha, max_iterations, use_l1, tolerance,
   *          use_stochastic.
   */
  static OptParams fromConfig(const SimpleConfig &cfg) {
    OptParams p;
    p.batchSize = cfg.getInt("batch_size", p.batchSize);
    p.regularization = cfg.getDouble("regularization", p.regularization);
    p.alpha = cfg.getDouble("alpha", p.alpha);
    p.maxIterations = cfg.getInt("max_iterations", p.maxIterations);
    p.useL1 = cfg.getBool("use_l1", p.useL1);
    p.tolerance = cfg.getDouble("tolerance", p.tolerance);
    p.useStochastic = cfg.getBool("use_stochastic", p.useStochastic);
    p.validate();
    return p;
  }

  void validate() const {
    if (batchSize <= 0) throw std::invalid_argument("batch_size must be positive");
    if (regularization < 0.0) throw std::invalid_argument("regularization must be non-negative");
    if (!(alpha > 0.0)) throw std::invalid_argument("alpha must be positive");
    if (!(tolerance >= 0.0)) throw std::invalid_argument("tolerance must be non-negative");
  }

  /// @brief The minimizer this configuration stands for.
  template <typename V> std::unique_ptr<Minimizer<V>> minimizer() const {
    validate();
    if (useStochastic) {
      if (useL1) return std::make_unique<AdaGradL1<V>>(regularization, alpha, maxIterations);
      return std::make_unique<AdaGradL2<V>>(regularization, alpha, maxIterations);
    }
    if (useL1) return std::make_unique<OWLQN<V>>(maxIterations, kQuasiNewtonHistory, regularization, tolerance);
    return std::make_unique<L2RegularizedMinimizer<V>>(
        std::make_unique<LBFGS<V>>(maxIterations, kQuasiNewtonHistory, tolerance), regularization);
  }

  /**
   * @brief Minimise @p f; stochastic configurations sample batches of batchSize.
   * @param recorder Optional iteration recorder.
   * @param verbose Print per-step diagnostics.
   */
  template <typename V>
  MinimizationResult<V> run(
      BatchDiffFunction<V> &f, const V &init, IterationRecorder *recorder = nullptr, bool verbose = false) const {
    auto m = minimizer<V>();
    m->setRecorder(recorder);
    m->setVerbose(verbose);
    if (useStochastic) {
      auto batched = f.withRandomBatches(static_cast<size_t>(batchSize));
      return m->run(batched, init);
    }
    return m->run(f, init);
  }

  template <typename V> V minimize(BatchDiffFunction<V> &f, const V &init) const { return run(f, init).x; }

  std::string describe() const {
    std::string method = useStochastic ? "AdaGrad" : (useL1 ? "OWL-QN" : "L-BFGS");
    return method + (useL1 ? " + L1" : " + L2");
  }
};

inline std::ostream &operator<<(std::ostream &os, const OptParams &p) {
  return os << "OptParams(batchSize=" << p.batchSize << ", regularization=" << p.regularization << ", alpha=" << p.alpha
            << ", maxIterations=" << p.maxIterations << ", useL1=" << std::boolalpha << p.useL1
            << ", tolerance=" << p.tolerance << ", useStochastic=" << p.useStochastic << std::noboolalpha << ")";
}

} // namespace fomin
