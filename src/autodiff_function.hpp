#pragma once

#include "common.hpp"
#include "minimizer/objective.hpp"
#include <Eigen/Eigen>
#include <autodiff/reverse/var.hpp>
#include <autodiff/reverse/var/eigen.hpp>
#include <stdexcept>
#include <utility>

namespace fomin {

/**
 * @brief DiffFunction over Eigen::VectorXd whose gradient comes from autodiff reverse mode.
 * @details The objective is written once on autodiff::var; every call records a fresh
 *          expression tree.
 */
class AutodiffFunction : public DiffFunction<Eigen::VectorXd> {
public:
  using Vec = Eigen::VectorXd;
  using Objective = VecFun<autodiff::VectorXvar, autodiff::var>;

  explicit AutodiffFunction(Objective f_ad) : _f_ad(std::move(f_ad)) {
    if (!_f_ad) throw std::invalid_argument("AutodiffFunction: empty objective");
  }

  ValueAndGrad<Vec> calculate(const Vec &x) override {
    autodiff::VectorXvar x_var = x.cast<autodiff::var>();
    autodiff::var y = _f_ad(x_var);
    Vec grad = autodiff::gradient(y, x_var);
    return ValueAndGrad<Vec>(autodiff::val(y), std::move(grad));
  }

private:
  Objective _f_ad;
};

} // namespace fomin
