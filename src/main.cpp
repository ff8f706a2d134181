#include "common.hpp"
#include "iteration_recorder.hpp"
#include "opt_params.hpp"
#include "seed.hpp"
#include "simple_config.hpp"
#include <Eigen/Dense>
#include <exception>
#include <iostream>
#include <random>
#include <string>

using Vec = Eigen::VectorXd;
using Mat = Eigen::MatrixXd;

// Synthetic linear regression: targets = X^T w_true + noise, samples as columns.
int main(int argc, char **argv) {
  const std::string config_path = (argc > 1) ? argv[1] : "fomin.cfg";
  fomin::SimpleConfig cfg = fomin::SimpleConfig::load(config_path);
  if (!cfg.loaded()) {
    std::cout << "Config " << config_path << " not found, using defaults." << std::endl;
  }
  if (cfg.getBool("check_parallelism", false)) checkParallelism();

  try {
    const int n_samples = cfg.getInt("samples", 1000);
    const int dim = cfg.getInt("dim", 10);
    const double noise = cfg.getDouble("noise", 0.01);
    if (n_samples <= 0 || dim <= 0) {
      std::cerr << "samples and dim must be positive" << std::endl;
      return 1;
    }

    std::mt19937 rng(static_cast<unsigned int>(cfg.getInt("seed", static_cast<int>(fomin::kDefaultSeed))));
    std::normal_distribution<double> normal(0.0, 1.0);

    Mat inputs(dim, n_samples);
    Vec w_true(dim);
    for (int j = 0; j < dim; ++j)
      w_true(j) = normal(rng);
    for (int i = 0; i < n_samples; ++i)
      for (int j = 0; j < dim; ++j)
        inputs(j, i) = normal(rng);
    Vec targets = inputs.transpose() * w_true;
    for (int i = 0; i < n_samples; ++i)
      targets(i) += noise * normal(rng);

    fomin::MeanOfTermsFunction<Vec> loss(static_cast<size_t>(n_samples), [&](const Vec &w, size_t i) {
      const auto col = inputs.col(static_cast<Eigen::Index>(i));
      const double r = col.dot(w) - targets(static_cast<Eigen::Index>(i));
      return fomin::ValueAndGrad<Vec>(0.5 * r * r, r * col);
    });

    fomin::OptParams params = fomin::OptParams::fromConfig(cfg);
    std::cout << params << std::endl;
    std::cout << "Method: " << params.describe() << std::endl;

    fomin::IterationRecorder recorder;
    recorder.init(fomin::history_capacity(
        params.maxIterations, cfg.getInt("history_capacity", fomin::kUnboundedHistoryCapacity)));
    const bool verbose = cfg.getBool("verbose", false);
    fomin::MinimizationResult<Vec> result = params.run(loss, Vec(Vec::Zero(dim)), &recorder, verbose);

    std::cout << "Stopped after " << result.iterations << " iterations (" << fomin::to_string(result.reason) << ")"
              << std::endl;
    std::cout << "  objective:      " << result.adjustedValue << std::endl;
    std::cout << "  gradient norm:  " << result.gradNorm << std::endl;
    std::cout << "  |w - w_true|:   " << (result.x - w_true).norm() << std::endl;

    const std::string name = cfg.getString("name", "fomin");
    const std::string csv = name + "_history.csv";
    if (fomin::write_history_csv(csv, recorder, cfg.getInt("log_interval", 1))) {
      std::cout << "History written to " << csv << std::endl;
    }
    return result.searchFailed ? 2 : 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
