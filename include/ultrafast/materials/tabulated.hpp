#pragma once

#include <vector>

#include <Eigen/Core>

#include "ultrafast/materials/formula.hpp"

namespace ultrafast {
namespace materials {

/// Natural cubic spline through (x_i, y_i) with strictly increasing x.
/// Outside [x_0, x_{N-1}] the end segments are continued.
class NaturalCubicSpline {
public:
  NaturalCubicSpline() = default;

  /// @throws ConfigurationError if fewer than two knots are given, sizes
  ///         differ, or x is not strictly increasing
  NaturalCubicSpline(const Eigen::VectorXd &x, const Eigen::VectorXd &y);

  double operator()(double x) const;
  double derivative(double x) const;
  double second_derivative(double x) const;

  const Eigen::VectorXd &knots() const { return x_; }
  const Eigen::VectorXd &values() const { return y_; }

private:
  Eigen::Index segment(double x) const;

  Eigen::VectorXd x_;
  Eigen::VectorXd y_;
  Eigen::VectorXd m_; ///< Second derivatives at the knots
};

/// Tabulated dispersion ("tabulated n" and "tabulated nk").
///
/// Coefficients are the table rows flattened: (lambda, n) pairs or
/// (lambda, n, k) triples, lambda in um and strictly increasing. The index is
/// interpolated with a natural cubic spline, so dn/dlambda and
/// d^2n/dlambda^2 are those of the spline.
class TabulatedFormula : public DispersionFormula {
public:
  /// @param columns 2 for "tabulated n", 3 for "tabulated nk"
  /// @param range Valid range, or an empty range to use the table span
  /// @throws ConfigurationError if the rows are ragged, fewer than two,
  ///         unordered, or the range exceeds the table span
  TabulatedFormula(const std::vector<double> &rows, const ValidRange &range,
                   int columns);

  double n(double lambda) const override;
  double dn_dlambda(double lambda) const override;
  double d2n_dlambda2(double lambda) const override;
  bool has_analytic_derivatives() const override { return true; }

  bool has_extinction() const { return columns_ == 3; }

  /// Extinction coefficient k(lambda); zero for "tabulated n".
  double extinction(double lambda) const;

  int columns() const { return columns_; }
  Eigen::Index num_rows() const { return index_.knots().size(); }

private:
  int columns_;
  NaturalCubicSpline index_;
  NaturalCubicSpline extinction_;
};

} // namespace materials
} // namespace ultrafast
