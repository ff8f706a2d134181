#pragma once

#include "../iteration_recorder.hpp"
#include "objective.hpp"

namespace fomin {

/// @brief Why a minimisation run stopped.
enum class ConvergenceReason {
  None,
  MaxIterations,
  GradientConverged,
  ImprovementFailures,
  SearchFailed,
};

inline const char *to_string(ConvergenceReason reason) {
  switch (reason) {
  case ConvergenceReason::None:
    return "none";
  case ConvergenceReason::MaxIterations:
    return "max iterations";
  case ConvergenceReason::GradientConverged:
    return "gradient converged";
  case ConvergenceReason::ImprovementFailures:
    return "insufficient improvement";
  case ConvergenceReason::SearchFailed:
    return "search failed";
  }
  return "unknown";
}

/**
 * @brief Summary of the terminal state of a run.
 * @details A run that stopped on SearchFailed returns the last point reached, which is
 *          generally not a minimum.
 */
template <typename V> struct MinimizationResult {
  V x;
  double value;
  double adjustedValue;
  double gradNorm; ///< Norm of the adjusted gradient.
  int iterations;
  bool searchFailed;
  ConvergenceReason reason;

  bool converged() const {
    return reason == ConvergenceReason::GradientConverged || reason == ConvergenceReason::ImprovementFailures;
  }
};

/**
 * @brief Common interface of everything that minimises a StochasticDiffFunction.
 */
template <typename V> class Minimizer {
public:
  virtual ~Minimizer() = default;

  /**
   * @brief Minimise @p f starting from @p init.
   * @return The point of the final state.
   */
  virtual V minimize(StochasticDiffFunction<V> &f, const V &init) = 0;

  /// @brief Like minimize(), but also reports how the run ended.
  virtual MinimizationResult<V> run(StochasticDiffFunction<V> &f, const V &init) = 0;

  /**
   * @brief Attach a recorder for adjusted value / gradient norm history.
   * @param recorder Recorder instance (may be null).
   */
  virtual void setRecorder(IterationRecorder *recorder) { _recorder = recorder; }

  /// @brief Print per-step diagnostics on std::cout.
  virtual void setVerbose(bool verbose) { _verbose = verbose; }

protected:
  IterationRecorder *_recorder = nullptr; ///< Optional recorder for diagnostics
  bool _verbose = false;
};

} // namespace fomin
