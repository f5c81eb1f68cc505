#include "ultrafast/materials/tabulated.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

#include <Eigen/Sparse>
#include <Eigen/SparseCholesky>

#include "ultrafast/errors.hpp"

namespace ultrafast {
namespace materials {

NaturalCubicSpline::NaturalCubicSpline(const Eigen::VectorXd &x,
                                       const Eigen::VectorXd &y)
    : x_(x), y_(y), m_(Eigen::VectorXd::Zero(x.size())) {
  const Eigen::Index N = x.size();
  if (N < 2 || y.size() != N) {
    throw ConfigurationError("Cubic spline needs at least two (x, y) knots");
  }
  for (Eigen::Index i = 0; i + 1 < N; ++i) {
    if (!(x[i + 1] > x[i])) {
      std::ostringstream ss;
      ss << "Spline abscissae must be strictly increasing (x[" << i
         << "] = " << x[i] << ", x[" << i + 1 << "] = " << x[i + 1] << ")";
      throw ConfigurationError(ss.str());
    }
  }
  if (N == 2)
    return; // Linear segment, M = 0

  // Interior second derivatives M_1..M_{N-2}; M_0 = M_{N-1} = 0.
  // The system is symmetric, tridiagonal and diagonally dominant.
  const Eigen::Index n = N - 2;
  std::vector<Eigen::Triplet<double>> trips;
  trips.reserve(static_cast<size_t>(3 * n));
  Eigen::VectorXd rhs(n);
  for (Eigen::Index k = 0; k < n; ++k) {
    const Eigen::Index i = k + 1;
    const double h0 = x[i] - x[i - 1];
    const double h1 = x[i + 1] - x[i];
    trips.emplace_back(k, k, 2.0 * (h0 + h1));
    if (k > 0)
      trips.emplace_back(k, k - 1, h0);
    if (k + 1 < n)
      trips.emplace_back(k, k + 1, h1);
    rhs[k] = 6.0 * ((y[i + 1] - y[i]) / h1 - (y[i] - y[i - 1]) / h0);
  }
  Eigen::SparseMatrix<double> A(n, n);
  A.setFromTriplets(trips.begin(), trips.end());

  Eigen::SimplicialLDLT<Eigen::SparseMatrix<double>> solver;
  solver.compute(A);
  if (solver.info() != Eigen::Success) {
    throw ConfigurationError("Cubic spline system factorization failed");
  }
  Eigen::VectorXd interior = solver.solve(rhs);
  m_.segment(1, n) = interior;
}

Eigen::Index NaturalCubicSpline::segment(double x) const {
  const Eigen::Index N = x_.size();
  if (x <= x_[0])
    return 0;
  if (x >= x_[N - 1])
    return N - 2;
  const double *begin = x_.data();
  const double *it = std::upper_bound(begin, begin + N, x);
  return static_cast<Eigen::Index>(it - begin) - 1;
}

double NaturalCubicSpline::operator()(double x) const {
  const Eigen::Index i = segment(x);
  const double h = x_[i + 1] - x_[i];
  const double a = x_[i + 1] - x;
  const double b = x - x_[i];
  return m_[i] * a * a * a / (6.0 * h) + m_[i + 1] * b * b * b / (6.0 * h) +
         (y_[i] / h - m_[i] * h / 6.0) * a +
         (y_[i + 1] / h - m_[i + 1] * h / 6.0) * b;
}

double NaturalCubicSpline::derivative(double x) const {
  const Eigen::Index i = segment(x);
  const double h = x_[i + 1] - x_[i];
  const double a = x_[i + 1] - x;
  const double b = x - x_[i];
  return -m_[i] * a * a / (2.0 * h) + m_[i + 1] * b * b / (2.0 * h) -
         (y_[i] / h - m_[i] * h / 6.0) + (y_[i + 1] / h - m_[i + 1] * h / 6.0);
}

double NaturalCubicSpline::second_derivative(double x) const {
  const Eigen::Index i = segment(x);
  const double h = x_[i + 1] - x_[i];
  return (m_[i] * (x_[i + 1] - x) + m_[i + 1] * (x - x_[i])) / h;
}

namespace {

const char *tabulated_kind(int columns) {
  return columns == 3 ? "tabulated nk" : "tabulated n";
}

// Validate row layout and resolve the valid range against the table span.
ValidRange table_range(const std::vector<double> &rows, const ValidRange &range,
                       int columns) {
  const std::string kind = tabulated_kind(columns);
  if (columns != 2 && columns != 3) {
    throw ConfigurationError("Tabulated data must have 2 or 3 columns");
  }
  if (rows.size() % static_cast<size_t>(columns) != 0) {
    throw ConfigurationError(kind + ": " + std::to_string(rows.size()) +
                             " values do not form rows of " +
                             std::to_string(columns));
  }
  const size_t num_rows = rows.size() / static_cast<size_t>(columns);
  if (num_rows < 2) {
    throw ConfigurationError(kind + ": at least two rows are required");
  }
  const ValidRange span(rows.front(), rows[(num_rows - 1) * columns]);
  if (range.empty())
    return span;
  if (range.min < span.min || range.max > span.max) {
    std::ostringstream ss;
    ss << kind << ": range (" << range.min << ", " << range.max
       << ") exceeds table span (" << span.min << ", " << span.max << ")";
    throw ConfigurationError(ss.str());
  }
  return range;
}

Eigen::VectorXd column(const std::vector<double> &rows, int columns, int col) {
  const Eigen::Index num_rows =
      static_cast<Eigen::Index>(rows.size() / static_cast<size_t>(columns));
  Eigen::VectorXd out(num_rows);
  for (Eigen::Index r = 0; r < num_rows; ++r)
    out[r] = rows[static_cast<size_t>(r * columns + col)];
  return out;
}

} // namespace

TabulatedFormula::TabulatedFormula(const std::vector<double> &rows,
                                   const ValidRange &range, int columns)
    : DispersionFormula(tabulated_kind(columns), rows,
                        table_range(rows, range, columns)),
      columns_(columns) {
  const Eigen::VectorXd lambda = column(rows, columns, 0);
  index_ = NaturalCubicSpline(lambda, column(rows, columns, 1));
  if (columns == 3)
    extinction_ = NaturalCubicSpline(lambda, column(rows, columns, 2));
}

double TabulatedFormula::n(double lambda) const {
  return checked(index_(lambda), lambda);
}

double TabulatedFormula::dn_dlambda(double lambda) const {
  return index_.derivative(lambda);
}

double TabulatedFormula::d2n_dlambda2(double lambda) const {
  return index_.second_derivative(lambda);
}

double TabulatedFormula::extinction(double lambda) const {
  if (!has_extinction())
    return 0.0;
  return extinction_(lambda);
}

} // namespace materials
} // namespace ultrafast
