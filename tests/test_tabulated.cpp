#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "ultrafast/errors.hpp"
#include "ultrafast/materials/tabulated.hpp"

using namespace ultrafast;
using namespace ultrafast::materials;

namespace {

bool close(double a, double b, double tol) { return std::abs(a - b) < tol; }

template <typename Fn> bool throws_configuration(Fn fn) {
  try {
    fn();
  } catch (const ConfigurationError &) {
    return true;
  }
  return false;
}

} // namespace

void test_spline_passes_through_knots() {
  std::cout << "test_spline_passes_through_knots..." << std::endl;

  Eigen::VectorXd x(6), y(6);
  x << 0.4, 0.5, 0.55, 0.7, 0.9, 1.0;
  y << 1.34, 1.337, 1.336, 1.331, 1.329, 1.327;
  NaturalCubicSpline s(x, y);
  for (Eigen::Index i = 0; i < x.size(); ++i)
    assert(close(s(x[i]), y[i], 1e-12));

  // Natural end conditions
  assert(close(s.second_derivative(x[0]), 0.0, 1e-10));
  assert(close(s.second_derivative(x[5]), 0.0, 1e-10));
}

void test_spline_linear_data_exact() {
  std::cout << "test_spline_linear_data_exact..." << std::endl;

  Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(5, 1.0, 2.0);
  Eigen::VectorXd y = 3.0 - 0.5 * x.array();
  NaturalCubicSpline s(x, y);
  for (double t : {1.0, 1.13, 1.5, 1.77, 2.0}) {
    assert(close(s(t), 3.0 - 0.5 * t, 1e-12));
    assert(close(s.derivative(t), -0.5, 1e-10));
    assert(close(s.second_derivative(t), 0.0, 1e-10));
  }
}

void test_spline_smooth_function() {
  std::cout << "test_spline_smooth_function..." << std::endl;

  const int N = 41;
  Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(N, 0.0, 2.0);
  Eigen::VectorXd y = x.array().sin();
  NaturalCubicSpline s(x, y);

  double max_err = 0.0;
  for (double t = 0.3; t < 1.7; t += 0.013)
    max_err = std::max(max_err, std::abs(s(t) - std::sin(t)));
  std::cout << "  max interior error: " << max_err << std::endl;
  assert(max_err < 1e-5);
  assert(close(s.derivative(1.0), std::cos(1.0), 1e-3));
}

void test_spline_validation() {
  std::cout << "test_spline_validation..." << std::endl;

  Eigen::VectorXd one(1), y1(1);
  one << 1.0;
  y1 << 1.5;
  assert(throws_configuration([&] { NaturalCubicSpline s(one, y1); }));

  Eigen::VectorXd x(3), y(3);
  x << 0.5, 0.5, 0.7;
  y << 1.0, 1.1, 1.2;
  assert(throws_configuration([&] { NaturalCubicSpline s(x, y); }));

  x << 0.7, 0.6, 0.5;
  assert(throws_configuration([&] { NaturalCubicSpline s(x, y); }));
}

void test_tabulated_n() {
  std::cout << "test_tabulated_n..." << std::endl;

  const std::vector<double> rows = {0.4, 1.339, 0.6, 1.333, 0.8, 1.329,
                                    1.0, 1.327};
  TabulatedFormula f(rows, ValidRange(), 2);
  assert(f.kind() == "tabulated n");
  assert(f.columns() == 2);
  assert(!f.has_extinction());
  assert(f.num_rows() == 4);
  assert(f.range() == ValidRange(0.4, 1.0));
  assert(f.coefficients() == rows);

  assert(close(f.n(0.6), 1.333, 1e-12));
  double mid = f.n(0.7);
  assert(mid < 1.333 && mid > 1.329);
  assert(f.dn_dlambda(0.7) < 0.0);
  assert(f.extinction(0.7) == 0.0);
}

void test_tabulated_nk() {
  std::cout << "test_tabulated_nk..." << std::endl;

  const std::vector<double> rows = {0.5, 0.05, 3.1, 0.6, 0.06, 3.8,
                                    0.7, 0.04, 4.6, 0.8, 0.03, 5.3};
  TabulatedFormula f(rows, ValidRange(0.55, 0.75), 3);
  assert(f.kind() == "tabulated nk");
  assert(f.has_extinction());
  assert(f.range() == ValidRange(0.55, 0.75));
  assert(close(f.n(0.6), 0.06, 1e-12));
  assert(close(f.extinction(0.7), 4.6, 1e-12));
  double k = f.extinction(0.65);
  assert(k > 3.8 && k < 4.6);
}

void test_tabulated_validation() {
  std::cout << "test_tabulated_validation..." << std::endl;

  // Incomplete row
  assert(throws_configuration(
      [] { TabulatedFormula f({0.4, 1.3, 0.5}, ValidRange(), 2); }));
  // Single row
  assert(throws_configuration(
      [] { TabulatedFormula f({0.4, 1.3}, ValidRange(), 2); }));
  // Unsupported layout
  assert(throws_configuration(
      [] { TabulatedFormula f({0.4, 1.3, 0.5, 1.2}, ValidRange(), 4); }));
  // Requested range beyond the table
  assert(throws_configuration([] {
    TabulatedFormula f({0.4, 1.3, 0.5, 1.2}, ValidRange(0.3, 0.5), 2);
  }));
  // Unordered wavelengths
  assert(throws_configuration([] {
    TabulatedFormula f({0.4, 1.3, 0.6, 1.2, 0.5, 1.25}, ValidRange(), 2);
  }));
}

void test_tabulated_through_registry() {
  std::cout << "test_tabulated_through_registry..." << std::endl;

  auto f = FormulaRegistry::instance().create(
      "Tabulated NK", {0.5, 1.5, 0.0, 1.0, 1.45, 0.001}, ValidRange());
  assert(f->kind() == "tabulated nk");
  assert(close(f->n(0.75), 1.475, 1e-12));
}

int main() {
  std::cout << "=== Tabulated Data Unit Tests ===" << std::endl;
  test_spline_passes_through_knots();
  test_spline_linear_data_exact();
  test_spline_smooth_function();
  test_spline_validation();
  test_tabulated_n();
  test_tabulated_nk();
  test_tabulated_validation();
  test_tabulated_through_registry();
  std::cout << "=== All tests PASSED ===" << std::endl;
  return 0;
}
