#pragma once

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

namespace fomin {

/**
 * @brief Stores per-iteration adjusted value, gradient norm and wall time.
 * @details Entries are indexed by iteration number; indices outside the allocated
 *          capacity are ignored.
 */
class IterationRecorder {
public:
  /// @brief Allocate buffers for up to @p capacity iterations.
  void init(int capacity) {
    if (capacity <= 0) return;
    capacity_ = capacity;
    loss_.assign(static_cast<size_t>(capacity), 0.0);
    grad_norm_.assign(static_cast<size_t>(capacity), 0.0);
    time_ms_.assign(static_cast<size_t>(capacity), 0.0);
    size_ = 0;
  }

  /// @brief Reset recorded size without releasing memory.
  void reset() { size_ = 0; }

  /**
   * @brief Record a loss/grad/time entry at iteration index.
   * @param idx Iteration index.
   * @param loss Adjusted objective value.
   * @param grad_norm Adjusted gradient norm.
   * @param time_ms Cumulative time in ms.
   */
  void record(int idx, double loss, double grad_norm, double time_ms = 0.0) {
    if (idx < 0 || idx >= capacity_) return;
    size_t i = static_cast<size_t>(idx);
    loss_[i] = loss;
    grad_norm_[i] = grad_norm;
    time_ms_[i] = time_ms;
    size_ = std::max(size_, idx + 1);
  }

  /// @brief Copy recorded loss, gradient norm, and time to output vectors.
  void copy_to_host(
      std::vector<double> &loss_out, std::vector<double> &grad_norm_out, std::vector<double> &time_ms_out) const {
    loss_out.assign(loss_.begin(), loss_.begin() + size_);
    grad_norm_out.assign(grad_norm_.begin(), grad_norm_.begin() + size_);
    time_ms_out.assign(time_ms_.begin(), time_ms_.begin() + size_);
  }

  /// @brief Current number of recorded entries.
  int size() const { return size_; }

  double loss(int idx) const { return loss_[static_cast<size_t>(idx)]; }
  double gradNorm(int idx) const { return grad_norm_[static_cast<size_t>(idx)]; }

private:
  std::vector<double> loss_;      ///< Adjusted values per iteration.
  std::vector<double> grad_norm_; ///< Adjusted gradient norms per iteration.
  std::vector<double> time_ms_;   ///< Cumulative time in ms.
  int capacity_ = 0;              ///< Allocated capacity.
  int size_ = 0;                  ///< Current number of entries.
};

/// Rows kept for runs without an iteration limit.
inline constexpr int kUnboundedHistoryCapacity = 10000;

/**
 * @brief Recorder capacity for a run capped at @p max_iterations.
 * @details One row per iteration plus the start state; a negative limit means an
 *          unbounded run, which keeps its first @p unbounded_capacity rows.
 */
inline int history_capacity(int max_iterations, int unbounded_capacity = kUnboundedHistoryCapacity) {
  return max_iterations >= 0 ? max_iterations + 1 : unbounded_capacity;
}

/**
 * @brief Dump a recorder as CSV, keeping every @p log_interval-th row.
 * @return false if nothing was written.
 */
inline bool write_history_csv(const std::string &filename, const IterationRecorder &recorder, int log_interval) {
  if (log_interval <= 0) return false;
  std::vector<double> loss_hist;
  std::vector<double> grad_hist;
  std::vector<double> time_hist;
  recorder.copy_to_host(loss_hist, grad_hist, time_hist);
  if (loss_hist.empty()) return false;

  std::ofstream log_file(filename);
  if (!log_file.is_open()) return false;
  log_file << "Iteration,Loss,GradNorm,TimeMs\n";
  size_t stride = static_cast<size_t>(log_interval);
  for (size_t i = 0; i < loss_hist.size(); i += stride) {
    log_file << i << "," << loss_hist[i] << "," << grad_hist[i] << "," << time_hist[i] << "\n";
  }
  return true;
}

} // namespace fomin
