#pragma once

#include <Eigen/Core>
#include <cmath>
#include <type_traits>

namespace fomin {

/**
 * @brief Compile-time capability set for the point type of a minimizer.
 * @details The iteration core only calls `norm`. Concrete strategies also use `dot`, `l1Norm`,
 *          `zerosLike`, `allFinite` and the coordinate-wise `zipWith` helpers,
 *          plus the usual `+`, `-` and scalar `*` operators of the point type.
 *          Specialise this template to plug in a new vector representation.
 */
template <typename V> struct VectorSpace;

/// @brief Eigen dense column vectors (VectorXd, Vector3d, VectorXf, ...).
template <typename Scalar, int Rows, int Options, int MaxRows>
struct VectorSpace<Eigen::Matrix<Scalar, Rows, 1, Options, MaxRows, 1>> {
  using Vector = Eigen::Matrix<Scalar, Rows, 1, Options, MaxRows, 1>;

  static double norm(const Vector &v) { return static_cast<double>(v.norm()); }

  static double dot(const Vector &a, const Vector &b) { return static_cast<double>(a.dot(b)); }

  static double l1Norm(const Vector &v) { return static_cast<double>(v.template lpNorm<1>()); }

  static Vector zerosLike(const Vector &v) { return Vector::Zero(v.size()); }

  static bool allFinite(const Vector &v) { return v.allFinite(); }

  template <typename F> static Vector zipWith(const Vector &a, const Vector &b, F &&f) {
    Vector out(a.size());
    for (Eigen::Index i = 0; i < a.size(); ++i)
      out(i) = static_cast<Scalar>(f(static_cast<double>(a(i)), static_cast<double>(b(i))));
    return out;
  }

  template <typename F> static Vector zipWith(const Vector &a, const Vector &b, const Vector &c, F &&f) {
    Vector out(a.size());
    for (Eigen::Index i = 0; i < a.size(); ++i)
      out(i) = static_cast<Scalar>(
          f(static_cast<double>(a(i)), static_cast<double>(b(i)), static_cast<double>(c(i))));
    return out;
  }
};

/// @brief One-dimensional problems over plain doubles.
template <> struct VectorSpace<double> {
  using Vector = double;

  static double norm(double v) { return std::abs(v); }

  static double dot(double a, double b) { return a * b; }

  static double l1Norm(double v) { return std::abs(v); }

  static double zerosLike(double) { return 0.0; }

  static bool allFinite(double v) { return std::isfinite(v); }

  template <typename F> static double zipWith(double a, double b, F &&f) { return f(a, b); }

  template <typename F> static double zipWith(double a, double b, double c, F &&f) { return f(a, b, c); }
};

} // namespace fomin
