#include "ultrafast/materials/formulas.hpp"

#include <cmath>
#include <string>

#include "ultrafast/errors.hpp"

namespace ultrafast {
namespace materials {

namespace {

void require_odd_count(const std::string &kind, const std::vector<double> &c) {
  if (c.empty() || c.size() % 2 == 0) {
    throw ConfigurationError(kind + ": expected a constant followed by "
                                    "coefficient pairs, got " +
                             std::to_string(c.size()) + " coefficients");
  }
}

void require_count(const std::string &kind, const std::vector<double> &c,
                   size_t count) {
  if (c.size() != count) {
    throw ConfigurationError(kind + ": expected " + std::to_string(count) +
                             " coefficients, got " + std::to_string(c.size()));
  }
}

// B * lambda^2 / (lambda^2 - P) and its first two lambda-derivatives.
// Writing x = lambda^2: g = B + B P / (x - P).
void pole_term(double B, double P, double lambda, double &g, double &d1,
               double &d2) {
  const double x = lambda * lambda;
  const double den = x - P;
  g = B * x / den;
  d1 = -2.0 * B * P * lambda / (den * den);
  d2 = 2.0 * B * P * (3.0 * x + P) / (den * den * den);
}

// a * lambda^p and its first two lambda-derivatives.
void power_term(double a, double p, double lambda, double &g, double &d1,
                double &d2) {
  g = a * std::pow(lambda, p);
  d1 = a * p * std::pow(lambda, p - 1.0);
  d2 = a * p * (p - 1.0) * std::pow(lambda, p - 2.0);
}

// Sum of (a_i, p_i) power terms over c[first], c[first+1], ...
void power_series(const std::vector<double> &c, size_t first, double lambda,
                  double &g, double &d1, double &d2) {
  g = d1 = d2 = 0.0;
  for (size_t i = first; i + 1 < c.size(); i += 2) {
    double t, t1, t2;
    power_term(c[i], c[i + 1], lambda, t, t1, t2);
    g += t;
    d1 += t1;
    d2 += t2;
  }
}

} // namespace

// ---------------------------------------------------------------------------
// Sellmeier (formulas 1, 2)

SellmeierFormula::SellmeierFormula(const std::vector<double> &coefficients,
                                   const ValidRange &range, bool squared_poles)
    : SquaredIndexFormula(squared_poles ? "formula 1" : "formula 2",
                          coefficients, range),
      squared_poles_(squared_poles) {
  require_odd_count(kind(), coefficients);
}

double SellmeierFormula::pole(size_t term) const {
  const double p = coefficients()[2 + 2 * term];
  return squared_poles_ ? p * p : p;
}

double SellmeierFormula::eps(double lambda) const {
  double d1, d2;
  const auto &c = coefficients();
  double e = 1.0 + c[0];
  for (size_t t = 0; 2 + 2 * t < c.size(); ++t) {
    double g;
    pole_term(c[1 + 2 * t], pole(t), lambda, g, d1, d2);
    e += g;
  }
  return e;
}

bool SellmeierFormula::eps_derivatives(double lambda, double &d1,
                                       double &d2) const {
  const auto &c = coefficients();
  d1 = d2 = 0.0;
  for (size_t t = 0; 2 + 2 * t < c.size(); ++t) {
    double g, g1, g2;
    pole_term(c[1 + 2 * t], pole(t), lambda, g, g1, g2);
    d1 += g1;
    d2 += g2;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Single pole

SinglePoleFormula::SinglePoleFormula(const std::vector<double> &coefficients,
                                     const ValidRange &range)
    : SquaredIndexFormula("single-pole", coefficients, range) {
  require_count(kind(), coefficients, 2);
}

double SinglePoleFormula::eps(double lambda) const {
  double g, d1, d2;
  pole_term(strength(), resonance() * resonance(), lambda, g, d1, d2);
  return 1.0 + g;
}

bool SinglePoleFormula::eps_derivatives(double lambda, double &d1,
                                        double &d2) const {
  double g;
  pole_term(strength(), resonance() * resonance(), lambda, g, d1, d2);
  return true;
}

// ---------------------------------------------------------------------------
// Polynomial (formula 3)

PolynomialFormula::PolynomialFormula(const std::vector<double> &coefficients,
                                     const ValidRange &range)
    : SquaredIndexFormula("formula 3", coefficients, range) {
  require_odd_count(kind(), coefficients);
}

double PolynomialFormula::eps(double lambda) const {
  double g, d1, d2;
  power_series(coefficients(), 1, lambda, g, d1, d2);
  return coefficients()[0] + g;
}

bool PolynomialFormula::eps_derivatives(double lambda, double &d1,
                                        double &d2) const {
  double g;
  power_series(coefficients(), 1, lambda, g, d1, d2);
  return true;
}

// ---------------------------------------------------------------------------
// RefractiveIndex.INFO (formula 4)

RiiFormula::RiiFormula(const std::vector<double> &coefficients,
                       const ValidRange &range)
    : SquaredIndexFormula("formula 4", coefficients, range) {
  if (coefficients.size() < 9 || coefficients.size() % 2 == 0) {
    throw ConfigurationError(
        kind() + ": expected 9 coefficients plus optional pairs, got " +
        std::to_string(coefficients.size()));
  }
}

double RiiFormula::eps(double lambda) const {
  const auto &c = coefficients();
  const double x = lambda * lambda;
  double e = c[0];
  e += c[1] * std::pow(lambda, c[2]) / (x - std::pow(c[3], c[4]));
  e += c[5] * std::pow(lambda, c[6]) / (x - std::pow(c[7], c[8]));
  double g, d1, d2;
  power_series(c, 9, lambda, g, d1, d2);
  return e + g;
}

// ---------------------------------------------------------------------------
// Cauchy (formula 5)

CauchyFormula::CauchyFormula(const std::vector<double> &coefficients,
                             const ValidRange &range)
    : DispersionFormula("formula 5", coefficients, range) {
  require_odd_count(kind(), coefficients);
}

double CauchyFormula::n(double lambda) const {
  double g, d1, d2;
  power_series(coefficients(), 1, lambda, g, d1, d2);
  return checked(coefficients()[0] + g, lambda);
}

double CauchyFormula::dn_dlambda(double lambda) const {
  double g, d1, d2;
  power_series(coefficients(), 1, lambda, g, d1, d2);
  return d1;
}

double CauchyFormula::d2n_dlambda2(double lambda) const {
  double g, d1, d2;
  power_series(coefficients(), 1, lambda, g, d1, d2);
  return d2;
}

// ---------------------------------------------------------------------------
// Gases (formula 6)

namespace {

// Sum of A_i / (D_i - lambda^-2) and its first two lambda-derivatives.
void gas_series(const std::vector<double> &c, double lambda, double &g,
                double &d1, double &d2) {
  const double u1 = 2.0 / (lambda * lambda * lambda);
  const double u2 = -6.0 / (lambda * lambda * lambda * lambda);
  g = d1 = d2 = 0.0;
  for (size_t i = 1; i + 1 < c.size(); i += 2) {
    const double A = c[i];
    const double u = c[i + 1] - 1.0 / (lambda * lambda);
    g += A / u;
    d1 += -A * u1 / (u * u);
    d2 += A * (2.0 * u1 * u1 / (u * u * u) - u2 / (u * u));
  }
}

} // namespace

GasFormula::GasFormula(const std::vector<double> &coefficients,
                       const ValidRange &range)
    : DispersionFormula("formula 6", coefficients, range) {
  require_odd_count(kind(), coefficients);
}

double GasFormula::n(double lambda) const {
  double g, d1, d2;
  gas_series(coefficients(), lambda, g, d1, d2);
  return checked(1.0 + coefficients()[0] + g, lambda);
}

double GasFormula::dn_dlambda(double lambda) const {
  double g, d1, d2;
  gas_series(coefficients(), lambda, g, d1, d2);
  return d1;
}

double GasFormula::d2n_dlambda2(double lambda) const {
  double g, d1, d2;
  gas_series(coefficients(), lambda, g, d1, d2);
  return d2;
}

// ---------------------------------------------------------------------------
// Herzberger (formula 7)

HerzbergerFormula::HerzbergerFormula(const std::vector<double> &coefficients,
                                     const ValidRange &range)
    : DispersionFormula("formula 7", coefficients, range) {
  if (coefficients.size() < 3) {
    throw ConfigurationError(kind() + ": expected at least 3 coefficients, got " +
                             std::to_string(coefficients.size()));
  }
}

double HerzbergerFormula::n(double lambda) const {
  const auto &c = coefficients();
  const double x = lambda * lambda;
  const double L = 1.0 / (x - 0.028);
  double value = c[0] + c[1] * L + c[2] * L * L;
  double power = x;
  for (size_t i = 3; i < c.size(); ++i) {
    value += c[i] * power;
    power *= x;
  }
  return checked(value, lambda);
}

// ---------------------------------------------------------------------------
// Retro (formula 8)

RetroFormula::RetroFormula(const std::vector<double> &coefficients,
                           const ValidRange &range)
    : SquaredIndexFormula("formula 8", coefficients, range) {
  require_count(kind(), coefficients, 4);
}

double RetroFormula::eps(double lambda) const {
  const auto &c = coefficients();
  const double x = lambda * lambda;
  const double a = c[0] + c[1] * x / (x - c[2]) + c[3] * x;
  return (1.0 + 2.0 * a) / (1.0 - a);
}

// ---------------------------------------------------------------------------
// Exotic (formula 9)

ExoticFormula::ExoticFormula(const std::vector<double> &coefficients,
                             const ValidRange &range)
    : SquaredIndexFormula("formula 9", coefficients, range) {
  require_count(kind(), coefficients, 6);
}

double ExoticFormula::eps(double lambda) const {
  const auto &c = coefficients();
  const double d = lambda - c[4];
  return c[0] + c[1] / (lambda * lambda - c[2]) + c[3] * d / (d * d + c[5]);
}

} // namespace materials
} // namespace ultrafast
