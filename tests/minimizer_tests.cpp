#include "test.hpp"

#include "../src/iteration_recorder.hpp"
#include "../src/minimizer/adaptive_gradient.hpp"
#include "../src/minimizer/gd.hpp"
#include "../src/minimizer/lbfgs.hpp"
#include "../src/minimizer/line_search.hpp"
#include "../src/minimizer/owlqn.hpp"
#include "../src/minimizer/regularized_minimizer.hpp"
#include "../src/minimizer/ring_buffer.hpp"
#include "../src/opt_params.hpp"
#include "../src/seed.hpp"
#include "../src/simple_config.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <vector>

using Vec = Eigen::VectorXd;
using Mat = Eigen::MatrixXd;
using namespace fomin;

namespace {

using Suite = Tests::TestSuite<Vec>;
using MinimizerPtr = std::shared_ptr<Minimizer<Vec>>;

Vec vec(std::initializer_list<double> values) {
  Vec v(static_cast<Eigen::Index>(values.size()));
  Eigen::Index i = 0;
  for (double x : values)
    v(i++) = x;
  return v;
}

/// 0.5 (x - c)^T diag(scale) (x - c)
class Bowl : public DiffFunction<Vec> {
public:
  Bowl(Vec center, Vec scale) : center(std::move(center)), scale(std::move(scale)) {}

  ValueAndGrad<Vec> calculate(const Vec &x) override {
    Vec d = x - center;
    Vec g = scale.cwiseProduct(d);
    return {0.5 * d.dot(g), g};
  }

  Vec center;
  Vec scale;
};

/// |x|^2 whose gradient is NaN on the listed (1-based) evaluations.
class FlakySquare : public DiffFunction<Vec> {
public:
  explicit FlakySquare(std::set<int> nan_calls) : nan_calls(std::move(nan_calls)) {}

  ValueAndGrad<Vec> calculate(const Vec &x) override {
    ++calls;
    Vec g = 2.0 * x;
    if (nan_calls.count(calls) > 0) g.setConstant(std::numeric_limits<double>::quiet_NaN());
    return {x.squaredNorm(), g};
  }

  std::set<int> nan_calls;
  int calls = 0;
};

class Rosenbrock : public DiffFunction<Vec> {
public:
  ValueAndGrad<Vec> calculate(const Vec &x) override {
    const double a = 1.0 - x(0);
    const double b = x(1) - x(0) * x(0);
    Vec g(2);
    g(0) = -2.0 * a - 400.0 * x(0) * b;
    g(1) = 200.0 * b;
    return {a * a + 100.0 * b * b, g};
  }
};

/// Noise-free least squares, samples as columns; the term of sample i is 0.5 (x_i.w - y_i)^2.
struct LeastSquares {
  LeastSquares(int n, int dim, unsigned int seed) : inputs(dim, n), w_true(dim), targets(n) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    for (int j = 0; j < dim; ++j)
      w_true(j) = normal(rng);
    for (int i = 0; i < n; ++i)
      for (int j = 0; j < dim; ++j)
        inputs(j, i) = normal(rng);
    targets = inputs.transpose() * w_true;
  }

  MeanOfTermsFunction<Vec> objective() {
    return MeanOfTermsFunction<Vec>(static_cast<size_t>(targets.size()), [this](const Vec &w, size_t i) {
      const auto col = inputs.col(static_cast<Eigen::Index>(i));
      const double r = col.dot(w) - targets(static_cast<Eigen::Index>(i));
      return ValueAndGrad<Vec>(0.5 * r * r, r * col);
    });
  }

  Mat inputs;
  Vec w_true;
  Vec targets;
};

// ---------------------------------------------------------------------------------------------
// Tests run on every registered implementation

void test_bowl(MinimizerPtr &m) {
  const Vec c = vec({1.0, -2.0, 3.0, -4.0});
  Bowl f(c, vec({1.0, 2.0, 3.0, 4.0}));
  const Vec x0 = Vec::Zero(4);

  auto [f0, g0] = f.calculate(x0);
  MinimizationResult<Vec> result = m->run(f, x0);
  auto [f1, g1] = f.calculate(result.x);
  const double dist = (result.x - c).norm();

  Suite::printStatus(f0, f1, g0.norm(), g1.norm(), dist, {1e-6, 1e-4, 1e-4});
  std::cout << "\t iterations=" << result.iterations << " reason=" << to_string(result.reason) << std::endl;
  TEST_EXPECT(dist < 1e-4);
  TEST_EXPECT(f1 < 1e-6);
  TEST_EXPECT(!result.searchFailed);
}

void test_minimize_matches_run(MinimizerPtr &m) {
  Bowl f(vec({0.5, 1.5}), vec({2.0, 1.0}));
  const Vec x0 = vec({-1.0, 2.0});
  Vec a = m->minimize(f, x0);
  MinimizationResult<Vec> r = m->run(f, x0);
  TEST_EXPECT((a - r.x).norm() == 0.0);
}

// ---------------------------------------------------------------------------------------------
// Concrete methods

void test_rosenbrock_lbfgs() {
  Rosenbrock f;
  LBFGS<Vec> lbfgs(1000, 5, 1e-10);
  lbfgs.setNumberOfImprovementFailures(2);
  const Vec x0 = vec({-1.2, 1.0});
  auto [f0, g0] = f.calculate(x0);
  MinimizationResult<Vec> result = lbfgs.run(f, x0);
  auto [f1, g1] = f.calculate(result.x);
  const double dist = (result.x - vec({1.0, 1.0})).norm();
  Suite::printStatus(f0, f1, g0.norm(), g1.norm(), dist, {1e-8, 1e-4, 1e-3});
  TEST_EXPECT(dist < 1e-3);
  TEST_EXPECT(result.iterations < 1000);
}

void test_gradient_descent_step_rules() {
  Bowl f(vec({1.0}), vec({1.0}));
  GradientDescent<Vec> gd(0.5, 1);
  Vec x = gd.minimize(f, vec({0.0}));
  TEST_EXPECT_NEAR(x(0), 0.5, 1e-15);

  // decaying step: 1 / (0 + 1)^(2/3) = 1, exact Newton step on a unit bowl
  StochasticGradientDescent<Vec> sgd(1.0, 1);
  Vec y = sgd.minimize(f, vec({0.0}));
  TEST_EXPECT_NEAR(y(0), 1.0, 1e-15);

  TEST_EXPECT_THROWS(gd.setStepSize(0.0), std::invalid_argument);
}

void test_two_loop_direction() {
  using History = LBFGS<Vec>::History;
  History empty{RingBuffer<Vec>(3), RingBuffer<Vec>(3), RingBuffer<double>(3)};
  const Vec g = vec({4.0, -2.0});
  Vec d0 = LBFGS<Vec>::compute_direction(g, empty);
  TEST_EXPECT((d0 + g).norm() == 0.0);

  // one pair from the Hessian 2I gives the exact Newton direction
  History h = empty;
  h.s_list.push_back(vec({1.0, 1.0}));
  h.y_list.push_back(vec({2.0, 2.0}));
  h.rho_list.push_back(0.25);
  Vec d1 = LBFGS<Vec>::compute_direction(g, h);
  TEST_EXPECT_NEAR(d1(0), -2.0, 1e-12);
  TEST_EXPECT_NEAR(d1(1), 1.0, 1e-12);

  LBFGS<Vec> lbfgs;
  TEST_EXPECT_THROWS(lbfgs.setHistorySize(0), std::invalid_argument);
  lbfgs.setHistorySize(7);
  TEST_EXPECT(lbfgs.historySize() == 7);
}

void test_lbfgs_line_search_settings() {
  Bowl f(vec({1.0, -2.0, 0.5}), vec({1.0, 10.0, 100.0}));
  LBFGS<Vec> lbfgs(200, 5, 1e-9);
  lbfgs.lineSearch().setCurvatureCondition(false);
  MinimizationResult<Vec> result = lbfgs.run(f, Vec::Zero(3));
  TEST_EXPECT(!result.searchFailed);
  TEST_EXPECT((result.x - f.center).norm() < 1e-4);
}

void test_line_search() {
  WolfeLineSearch ls;
  WolfeLineSearch::Phi parabola = [](double a) { return std::make_pair((a - 1.0) * (a - 1.0), 2.0 * (a - 1.0)); };
  TEST_EXPECT(ls.minimize(parabola, 1.0, -2.0, 1.0, 1.0, 1.0) == 1.0);

  // curvature condition forces an expansion from 1 to 2
  WolfeLineSearch strict(50, 1e-4, 0.5);
  WolfeLineSearch::Phi far = [](double a) { return std::make_pair((a - 4.0) * (a - 4.0), 2.0 * (a - 4.0)); };
  TEST_EXPECT(strict.minimize(far, 16.0, -8.0, 1.0, 1.0, 1.0) == 2.0);
  strict.setCurvatureCondition(false);
  TEST_EXPECT(strict.minimize(far, 16.0, -8.0, 1.0, 1.0, 1.0) == 1.0);

  TEST_EXPECT_THROWS(ls.minimize(parabola, 1.0, 2.0, 1.0, 1.0, 1.0), LineSearchFailed);

  WolfeLineSearch::Phi blowup = [](double) {
    return std::make_pair(std::numeric_limits<double>::quiet_NaN(), 0.0);
  };
  TEST_EXPECT_THROWS(ls.minimize(blowup, 1.0, -1.0, 1.0, 1.0, 1.0), StepSizeUnderflow);
  WolfeLineSearch short_search(5);
  TEST_EXPECT_THROWS(short_search.minimize(blowup, 1.0, -1.0, 1.0, 1.0, 1.0), LineSearchFailed);
  // 1, 0.5, 0.25, 0.125 are tried; the fifth trial 0.0625 is below the floor
  short_search.setMinStep(0.1);
  TEST_EXPECT_THROWS(short_search.minimize(blowup, 1.0, -1.0, 1.0, 1.0, 1.0), StepSizeUnderflow);

  TEST_EXPECT_THROWS(WolfeLineSearch(0), std::invalid_argument);
  TEST_EXPECT_THROWS(WolfeLineSearch(10, 0.9, 0.1), std::invalid_argument);
}

void test_owlqn_soft_threshold() {
  Bowl f(vec({3.0, 0.5, -2.0, -0.2}), Vec::Ones(4));
  OWLQN<Vec> owlqn(200, 5, 1.0, 1e-9);
  MinimizationResult<Vec> result = owlqn.run(f, Vec::Zero(4));
  std::cout << "\t x=" << result.x.transpose() << std::endl;
  TEST_EXPECT_NEAR(result.x(0), 2.0, 1e-6);
  TEST_EXPECT(result.x(1) == 0.0);
  TEST_EXPECT_NEAR(result.x(2), -1.0, 1e-6);
  TEST_EXPECT(result.x(3) == 0.0);
  // adjusted value includes the L1 term
  TEST_EXPECT_NEAR(result.adjustedValue, result.value + result.x.lpNorm<1>(), 1e-12);
  TEST_EXPECT_THROWS(owlqn.setL1Weight(-1.0), std::invalid_argument);
}

void test_adagrad_l1_sparsity() {
  Bowl f(vec({3.0, 0.5, -2.0, -0.2}), Vec::Ones(4));
  AdaGradL1<Vec> adagrad(1.0, 1.0, 4000);
  // zero coordinates keep a nonzero subgradient; let the run go the full length
  adagrad.setNumberOfImprovementFailures(100000);
  MinimizationResult<Vec> result = adagrad.run(f, Vec::Zero(4));
  std::cout << "\t x=" << result.x.transpose() << std::endl;
  TEST_EXPECT(result.reason == ConvergenceReason::MaxIterations);
  TEST_EXPECT_NEAR(result.x(0), 2.0, 0.1);
  TEST_EXPECT_NEAR(result.x(1), 0.0, 0.1);
  TEST_EXPECT_NEAR(result.x(2), -1.0, 0.1);
  TEST_EXPECT_NEAR(result.x(3), 0.0, 0.1);
}

void test_adagrad_l2_shrinks() {
  const Vec c = vec({2.0, -4.0});
  Bowl f(c, Vec::Ones(2));
  AdaGradL2<Vec> adagrad(1.0, 1.0, 2000, 1e-8);
  MinimizationResult<Vec> result = adagrad.run(f, Vec::Zero(2));
  TEST_EXPECT((result.x - 0.5 * c).norm() < 1e-4);
  TEST_EXPECT_THROWS(AdaGradL2<Vec>(-1.0), std::invalid_argument);
  TEST_EXPECT_THROWS(adagrad.setDelta(0.0), std::invalid_argument);
}

void test_adagrad_failed_reset_terminates() {
  // evaluations: 1 start point, 2 initial history, 3 warm-up step, 4.. real steps
  FlakySquare f({6, 7}); // step to iteration 3, then the history reset
  AdaGradL2<Vec> adagrad(0.0, 0.5, 20);
  bool escaped = false;
  try {
    MinimizationResult<Vec> result = adagrad.run(f, vec({3.0, 3.0}));
    TEST_EXPECT(result.searchFailed);
    TEST_EXPECT(result.reason == ConvergenceReason::SearchFailed);
    TEST_EXPECT(result.iterations == 2);
    TEST_EXPECT(result.x.allFinite());
  } catch (const FirstOrderException &e) {
    std::cerr << "\t escaped: " << e.what() << std::endl;
    escaped = true;
  }
  TEST_EXPECT(!escaped);
  TEST_EXPECT(f.calls == 7);
}

void test_adagrad_warm_up_failure() {
  FlakySquare f({3});
  AdaGradL2<Vec> adagrad(0.0, 0.5, 20);
  auto seq = adagrad.iterations(f, vec({3.0, 3.0}));
  bool escaped = false;
  try {
    const auto first = seq.next();
    TEST_EXPECT(f.calls == 3);
    TEST_EXPECT(first.x == vec({3.0, 3.0}));
    // the start history survives: sum of squared gradients at the start point
    TEST_EXPECT(first.history.sumOfSquaredGradients == vec({36.0, 36.0}));
    const auto last = seq.last();
    TEST_EXPECT(!last.searchFailed);
    TEST_EXPECT(last.value < first.value);
  } catch (const FirstOrderException &e) {
    std::cerr << "\t escaped: " << e.what() << std::endl;
    escaped = true;
  }
  TEST_EXPECT(!escaped);
}

void test_regularized_minimizer() {
  const Vec c = vec({2.0, -4.0});
  Bowl f(c, Vec::Ones(2));
  L2RegularizedMinimizer<Vec> ridge(std::make_unique<LBFGS<Vec>>(100, 5, 1e-10), 3.0);
  MinimizationResult<Vec> result = ridge.run(f, Vec::Zero(2));
  TEST_EXPECT((result.x - 0.25 * c).norm() < 1e-6);
  TEST_EXPECT_NEAR(result.value, 0.5 * (result.x - c).squaredNorm() + 1.5 * result.x.squaredNorm(), 1e-12);
  TEST_EXPECT(ridge.weight() == 3.0);
  TEST_EXPECT_THROWS(L2RegularizedMinimizer<Vec>(nullptr, 1.0), std::invalid_argument);
}

// ---------------------------------------------------------------------------------------------
// Selection

void test_opt_params_from_config() {
  SimpleConfig cfg = SimpleConfig::parse("# solver\n"
                                         "batch_size: 64\n"
                                         "regularization: 0.25\n"
                                         "alpha: \"0.1\"\n"
                                         "max_iterations: 77\n"
                                         "use_l1: yes\n"
                                         "tolerance: 1e-6\n"
                                         "use_stochastic: off\n");
  OptParams p = OptParams::fromConfig(cfg);
  TEST_EXPECT(p.batchSize == 64);
  TEST_EXPECT(p.regularization == 0.25);
  TEST_EXPECT(p.alpha == 0.1);
  TEST_EXPECT(p.maxIterations == 77);
  TEST_EXPECT(p.useL1);
  TEST_EXPECT(p.tolerance == 1e-6);
  TEST_EXPECT(!p.useStochastic);

  OptParams defaults = OptParams::fromConfig(SimpleConfig());
  TEST_EXPECT(defaults.batchSize == 512);
  TEST_EXPECT(defaults.regularization == 1.0);
  TEST_EXPECT(defaults.alpha == 0.5);
  TEST_EXPECT(defaults.maxIterations == 1000);
  TEST_EXPECT(!defaults.useL1);
  TEST_EXPECT(defaults.tolerance == 1e-3);
  TEST_EXPECT(!defaults.useStochastic);

  TEST_EXPECT_THROWS(OptParams::fromConfig(SimpleConfig::parse("batch_size: 0")), std::invalid_argument);
  TEST_EXPECT_THROWS(OptParams::fromConfig(SimpleConfig::parse("regularization: -1")), std::invalid_argument);
}

void test_opt_params_dispatch() {
  OptParams p;
  auto lbfgs = p.minimizer<Vec>();
  auto *ridge = dynamic_cast<L2RegularizedMinimizer<Vec> *>(lbfgs.get());
  TEST_EXPECT(ridge != nullptr);
  if (ridge) {
    TEST_EXPECT(ridge->weight() == 1.0);
    auto *inner = dynamic_cast<LBFGS<Vec> *>(&ridge->inner());
    TEST_EXPECT(inner != nullptr);
    TEST_EXPECT(dynamic_cast<OWLQN<Vec> *>(&ridge->inner()) == nullptr);
    if (inner) {
      TEST_EXPECT(inner->historySize() == 5);
      TEST_EXPECT(inner->maxIterations() == 1000);
      TEST_EXPECT(inner->tolerance() == 1e-3);
    }
  }
  TEST_EXPECT(p.describe() == "L-BFGS + L2");

  p.useL1 = true;
  auto owlqn = p.minimizer<Vec>();
  auto *o = dynamic_cast<OWLQN<Vec> *>(owlqn.get());
  TEST_EXPECT(o != nullptr);
  if (o) TEST_EXPECT(o->l1Weight() == 1.0 && o->historySize() == 5);
  TEST_EXPECT(p.describe() == "OWL-QN + L1");

  p.useStochastic = true;
  auto l1 = p.minimizer<Vec>();
  auto *a1 = dynamic_cast<AdaGradL1<Vec> *>(l1.get());
  TEST_EXPECT(a1 != nullptr);
  if (a1) TEST_EXPECT(a1->regularization() == 1.0 && a1->learningRate() == 0.5 && a1->maxIterations() == 1000);
  TEST_EXPECT(p.describe() == "AdaGrad + L1");

  p.useL1 = false;
  auto l2 = p.minimizer<Vec>();
  TEST_EXPECT(dynamic_cast<AdaGradL2<Vec> *>(l2.get()) != nullptr);
  TEST_EXPECT(p.describe() == "AdaGrad + L2");

  p.alpha = 0.0;
  TEST_EXPECT_THROWS(p.minimizer<Vec>(), std::invalid_argument);
}

void test_opt_params_deterministic_l2() {
  LeastSquares data(200, 3, kDefaultSeed);
  auto loss = data.objective();

  OptParams p;
  p.regularization = 0.5;
  p.tolerance = 1e-10;
  p.maxIterations = 500;
  IterationRecorder recorder;
  recorder.init(p.maxIterations + 1);
  MinimizationResult<Vec> result = p.run(loss, Vec(Vec::Zero(3)), &recorder);

  // (X X^T / n + lambda I) w = X y / n
  const double n = static_cast<double>(data.targets.size());
  Mat a = data.inputs * data.inputs.transpose() / n + 0.5 * Mat::Identity(3, 3);
  Vec b = data.inputs * data.targets / n;
  Vec expected = a.ldlt().solve(b);
  TEST_EXPECT((result.x - expected).norm() < 1e-4);

  TEST_EXPECT(recorder.size() >= 1);
  TEST_EXPECT_NEAR(recorder.loss(0), loss.valueAt(Vec::Zero(3)), 1e-12);
}

void test_opt_params_deterministic_l1() {
  LeastSquares data(200, 3, kDefaultSeed + 1);
  auto loss = data.objective();
  OptParams p;
  p.useL1 = true;
  p.regularization = 1e-3;
  p.tolerance = 1e-8;
  Vec w = p.minimize(loss, Vec(Vec::Zero(3)));
  TEST_EXPECT((w - data.w_true).norm() < 0.05);
}

void test_opt_params_stochastic() {
  LeastSquares data(1000, 3, kDefaultSeed + 2);
  auto loss = data.objective();
  const double initial = loss.valueAt(Vec::Zero(3));

  OptParams p;
  p.useStochastic = true;
  p.batchSize = 32;
  p.regularization = 0.0;
  p.maxIterations = 300;
  MinimizationResult<Vec> result = p.run(loss, Vec(Vec::Zero(3)));
  const double final_loss = loss.valueAt(result.x);
  std::cout << "\t full-batch loss " << initial << " -> " << final_loss << " after " << result.iterations
            << " iterations" << std::endl;
  TEST_EXPECT(result.x.allFinite());
  TEST_EXPECT(result.iterations >= 1);
  TEST_EXPECT(final_loss < 0.1 * initial);
}

// ---------------------------------------------------------------------------------------------
// Objectives and utilities

void test_mean_of_terms() {
  MeanOfTermsFunction<double> f(4, [](const double &x, size_t i) {
    const double d = x - static_cast<double>(i);
    return ValueAndGrad<double>(0.5 * d * d, d);
  });
  TEST_EXPECT(f.fullRange() == 4);
  auto [v, g] = f.calculate(0.0);
  TEST_EXPECT_NEAR(v, 1.75, 1e-15);
  TEST_EXPECT_NEAR(g, -1.5, 1e-15);

  auto [vb, gb] = f.calculateBatch(0.0, {1, 3});
  TEST_EXPECT_NEAR(vb, 2.5, 1e-15);
  TEST_EXPECT_NEAR(gb, -2.0, 1e-15);

  auto [ve, ge] = f.calculateBatch(0.0, {});
  TEST_EXPECT(ve == 0.0 && ge == 0.0);

  auto all = f.withRandomBatches(10);
  TEST_EXPECT_NEAR(all.valueAt(0.0), 1.75, 1e-15);

  auto pairs = f.withRandomBatches(2);
  const std::set<double> pair_values{0.25, 1.0, 2.25, 1.25, 2.5, 3.25};
  for (int k = 0; k < 20; ++k) {
    const double value = pairs.valueAt(0.0);
    bool known = false;
    for (double pv : pair_values)
      known = known || std::abs(pv - value) < 1e-12;
    TEST_EXPECT(known);
  }

  TEST_EXPECT_THROWS(f.withRandomBatches(0), std::invalid_argument);
  TEST_EXPECT_THROWS(MeanOfTermsFunction<double>(3, nullptr), std::invalid_argument);
}

void test_minibatch_sampling() {
  std::mt19937 rng(kDefaultSeed);
  auto idx = sample_minibatch_indices(10, 4, rng);
  TEST_EXPECT(idx.size() == 4);
  std::set<size_t> distinct(idx.begin(), idx.end());
  TEST_EXPECT(distinct.size() == 4);
  for (size_t i : idx)
    TEST_EXPECT(i < 10);

  auto all = sample_minibatch_indices(5, 9, rng);
  TEST_EXPECT((all == std::vector<size_t>{0, 1, 2, 3, 4}));
  TEST_EXPECT(sample_minibatch_indices(5, 0, rng).empty());
  TEST_EXPECT(sample_minibatch_indices(0, 3, rng).empty());
}

void test_l2_regularized_objective() {
  LambdaDiffFunction<Vec> zero([](const Vec &x) { return ValueAndGrad<Vec>(0.0, Vec::Zero(x.size())); });
  L2Regularized<Vec> reg = withL2Regularization<Vec>(zero, 2.0);
  auto [v, g] = reg.calculate(vec({1.0, 2.0}));
  TEST_EXPECT_NEAR(v, 5.0, 1e-15);
  TEST_EXPECT((g - vec({2.0, 4.0})).norm() == 0.0);
  TEST_EXPECT_THROWS(L2Regularized<Vec>(zero, -1.0), std::invalid_argument);
  TEST_EXPECT_THROWS(LambdaDiffFunction<Vec>{LambdaDiffFunction<Vec>::Fused{}}, std::invalid_argument);
}

void test_vector_space() {
  using VS = VectorSpace<Vec>;
  const Vec v = vec({3.0, -4.0});
  TEST_EXPECT(VS::norm(v) == 5.0);
  TEST_EXPECT(VS::l1Norm(v) == 7.0);
  TEST_EXPECT(VS::dot(v, v) == 25.0);
  TEST_EXPECT(VS::zerosLike(v).size() == 2 && VS::zerosLike(v).isZero());
  TEST_EXPECT(VS::allFinite(v));
  TEST_EXPECT(!VS::allFinite(vec({1.0, std::numeric_limits<double>::infinity()})));
  Vec s = VS::zipWith(v, vec({1.0, 1.0}), [](double a, double b) { return a + b; });
  TEST_EXPECT((s - vec({4.0, -3.0})).norm() == 0.0);

  TEST_EXPECT(VectorSpace<double>::norm(-2.0) == 2.0);
  TEST_EXPECT(!VectorSpace<double>::allFinite(std::numeric_limits<double>::quiet_NaN()));
}

void test_ring_buffer() {
  RingBuffer<int> buffer(3);
  TEST_EXPECT(buffer.empty() && buffer.capacity() == 3);
  for (int i = 1; i <= 5; ++i)
    buffer.push_back(i);
  TEST_EXPECT(buffer.size() == 3 && buffer.full());
  TEST_EXPECT(buffer.front() == 3 && buffer[1] == 4 && buffer.back() == 5);

  RingBuffer<int> copy = buffer;
  buffer.push_back(6);
  TEST_EXPECT(copy.front() == 3 && buffer.front() == 4);

  buffer.clear();
  TEST_EXPECT(buffer.empty() && buffer.capacity() == 3);

  RingBuffer<int> none(0);
  none.push_back(1);
  TEST_EXPECT(none.empty());
}

void test_simple_config() {
  SimpleConfig cfg = SimpleConfig::parse("  name : 'run a'  \n"
                                         "# comment: ignored\n"
                                         "no separator here\n"
                                         "count: 12\n"
                                         "ratio: abc\n"
                                         "flag: ON\n");
  TEST_EXPECT(cfg.loaded());
  TEST_EXPECT(cfg.getString("name", "") == "run a");
  TEST_EXPECT(!cfg.has("comment") && !cfg.has("# comment"));
  TEST_EXPECT(cfg.getInt("count", 0) == 12);
  TEST_EXPECT(cfg.getDouble("ratio", 0.5) == 0.5);
  TEST_EXPECT(cfg.getBool("flag", false));
  TEST_EXPECT(cfg.getInt("missing", -3) == -3);

  SimpleConfig missing = SimpleConfig::load("/nonexistent/fomin.cfg");
  TEST_EXPECT(!missing.loaded());
  missing.set("alpha", "2");
  TEST_EXPECT(missing.getDouble("alpha", 0.0) == 2.0);
}

void test_history_csv() {
  IterationRecorder recorder;
  recorder.init(4);
  recorder.record(0, 10.0, 1.0, 0.5);
  recorder.record(1, 5.0, 0.5, 1.0);
  recorder.record(2, 2.5, 0.25, 1.5);
  recorder.record(7, 1.0, 0.1, 2.0); // beyond capacity
  TEST_EXPECT(recorder.size() == 3);

  const std::string path = (std::filesystem::temp_directory_path() / "fomin_history_test.csv").string();
  TEST_EXPECT(write_history_csv(path, recorder, 2));
  std::ifstream in(path);
  std::string header, row0, row2, extra;
  std::getline(in, header);
  std::getline(in, row0);
  std::getline(in, row2);
  TEST_EXPECT(header == "Iteration,Loss,GradNorm,TimeMs");
  TEST_EXPECT(row0 == "0,10,1,0.5");
  TEST_EXPECT(row2 == "2,2.5,0.25,1.5");
  TEST_EXPECT(!std::getline(in, extra));
  in.close();
  std::remove(path.c_str());

  TEST_EXPECT(!write_history_csv(path, recorder, 0));
  IterationRecorder empty;
  TEST_EXPECT(!write_history_csv(path, empty, 1));

  // a reset recorder is empty but keeps its capacity
  recorder.reset();
  TEST_EXPECT(recorder.size() == 0);
  TEST_EXPECT(!write_history_csv(path, recorder, 1));
  recorder.record(3, 4.0, 0.4, 0.1);
  TEST_EXPECT(recorder.size() == 4);
  TEST_EXPECT(recorder.loss(3) == 4.0);
}

void test_history_capacity() {
  TEST_EXPECT(history_capacity(0) == 1);
  TEST_EXPECT(history_capacity(1000) == 1001);
  // unbounded runs still record
  TEST_EXPECT(history_capacity(-1) == kUnboundedHistoryCapacity);
  TEST_EXPECT(history_capacity(-1, 50) == 50);

  IterationRecorder recorder;
  recorder.init(history_capacity(-1));
  recorder.record(0, 1.0, 1.0);
  TEST_EXPECT(recorder.size() == 1);
}

} // namespace

int main() {
  Suite suite;

  suite.addImplementation(std::make_shared<GradientDescent<Vec>>(0.1, 5000, 1e-8), "GradientDescent");
  suite.addImplementation(std::make_shared<LBFGS<Vec>>(200, 5, 1e-9), "LBFGS");
  suite.addImplementation(std::make_shared<OWLQN<Vec>>(200, 5, 0.0, 1e-9), "OWLQN");
  suite.addImplementation(std::make_shared<AdaGradL2<Vec>>(0.0, 1.0, 2000, 1e-8), "AdaGradL2");
  suite.addTest("quadratic bowl", test_bowl);
  suite.addTest("minimize matches run", test_minimize_matches_run);

  suite.addCase("rosenbrock lbfgs", test_rosenbrock_lbfgs);
  suite.addCase("gradient descent step rules", test_gradient_descent_step_rules);
  suite.addCase("two loop direction", test_two_loop_direction);
  suite.addCase("lbfgs line search settings", test_lbfgs_line_search_settings);
  suite.addCase("line search", test_line_search);
  suite.addCase("owlqn soft threshold", test_owlqn_soft_threshold);
  suite.addCase("adagrad l1 sparsity", test_adagrad_l1_sparsity);
  suite.addCase("adagrad l2 shrinks", test_adagrad_l2_shrinks);
  suite.addCase("adagrad failed reset terminates", test_adagrad_failed_reset_terminates);
  suite.addCase("adagrad warm-up failure", test_adagrad_warm_up_failure);
  suite.addCase("regularized minimizer", test_regularized_minimizer);
  suite.addCase("opt params from config", test_opt_params_from_config);
  suite.addCase("opt params dispatch", test_opt_params_dispatch);
  suite.addCase("opt params deterministic l2", test_opt_params_deterministic_l2);
  suite.addCase("opt params deterministic l1", test_opt_params_deterministic_l1);
  suite.addCase("opt params stochastic", test_opt_params_stochastic);
  suite.addCase("mean of terms", test_mean_of_terms);
  suite.addCase("minibatch sampling", test_minibatch_sampling);
  suite.addCase("l2 regularized objective", test_l2_regularized_objective);
  suite.addCase("vector space", test_vector_space);
  suite.addCase("ring buffer", test_ring_buffer);
  suite.addCase("simple config", test_simple_config);
  suite.addCase("history csv", test_history_csv);
  suite.addCase("history capacity", test_history_capacity);

  return suite.runTests() == 0 ? 0 : 1;
}
