#pragma once

#include <vector>

#include "ultrafast/materials/formula.hpp"

namespace ultrafast {
namespace materials {

/// Sellmeier relations (RefractiveIndex.info formulas 1 and 2).
///
/// Formula: n^2 - 1 = C1 + Sum_i [ B_i * lambda^2 / (lambda^2 - P_i) ]
///
/// Coefficients are C1 followed by (B_i, c_i) pairs. For formula 1 the pole
/// is P_i = c_i^2 (c_i a resonance wavelength in um), for formula 2
/// P_i = c_i (already squared).
///
/// Example (fused silica, Malitson 1965, formula 1):
///   0, 0.6961663, 0.0684043, 0.4079426, 0.1162414, 0.8974794, 9.896161
class SellmeierFormula : public SquaredIndexFormula {
public:
  /// @param squared_poles true for formula 1, false for formula 2
  /// @throws ConfigurationError if the coefficient count is even or zero
  SellmeierFormula(const std::vector<double> &coefficients,
                   const ValidRange &range, bool squared_poles);

  bool has_analytic_derivatives() const override { return true; }
  bool squared_poles() const { return squared_poles_; }

protected:
  double eps(double lambda) const override;
  bool eps_derivatives(double lambda, double &d1, double &d2) const override;

private:
  double pole(size_t term) const;

  bool squared_poles_;
};

/// Single-pole Sellmeier relation.
///
/// Formula: n^2 = 1 + B * lambda^2 / (lambda^2 - lambda0^2)
///
/// Coefficients: (B, lambda0), lambda0 in um.
class SinglePoleFormula : public SquaredIndexFormula {
public:
  /// @throws ConfigurationError unless exactly two coefficients are given
  SinglePoleFormula(const std::vector<double> &coefficients,
                    const ValidRange &range);

  bool has_analytic_derivatives() const override { return true; }
  double strength() const { return coefficients()[0]; }
  double resonance() const { return coefficients()[1]; }

protected:
  double eps(double lambda) const override;
  bool eps_derivatives(double lambda, double &d1, double &d2) const override;
};

/// Polynomial relation (formula 3): n^2 = C1 + Sum_i C_i * lambda^e_i
class PolynomialFormula : public SquaredIndexFormula {
public:
  PolynomialFormula(const std::vector<double> &coefficients,
                    const ValidRange &range);

  bool has_analytic_derivatives() const override { return true; }

protected:
  double eps(double lambda) const override;
  bool eps_derivatives(double lambda, double &d1, double &d2) const override;
};

/// RefractiveIndex.INFO relation (formula 4):
///   n^2 = C1 + C2 lambda^C3 / (lambda^2 - C4^C5)
///            + C6 lambda^C7 / (lambda^2 - C8^C9) + Sum_i C_i lambda^e_i
class RiiFormula : public SquaredIndexFormula {
public:
  RiiFormula(const std::vector<double> &coefficients, const ValidRange &range);

protected:
  double eps(double lambda) const override;
};

/// Cauchy relation (formula 5): n = C1 + Sum_i C_i * lambda^e_i
class CauchyFormula : public DispersionFormula {
public:
  CauchyFormula(const std::vector<double> &coefficients,
                const ValidRange &range);

  double n(double lambda) const override;
  double dn_dlambda(double lambda) const override;
  double d2n_dlambda2(double lambda) const override;
  bool has_analytic_derivatives() const override { return true; }
};

/// Gas relation (formula 6): n - 1 = C1 + Sum_i C_i / (D_i - lambda^-2)
///
/// Example (air, Ciddor 1996):
///   0, 0.05792105, 238.0185, 0.00167917, 57.362
class GasFormula : public DispersionFormula {
public:
  GasFormula(const std::vector<double> &coefficients, const ValidRange &range);

  double n(double lambda) const override;
  double dn_dlambda(double lambda) const override;
  double d2n_dlambda2(double lambda) const override;
  bool has_analytic_derivatives() const override { return true; }
};

/// Herzberger relation (formula 7):
///   n = C1 + C2 / (lambda^2 - 0.028) + C3 / (lambda^2 - 0.028)^2
///          + C4 lambda^2 + C5 lambda^4 + C6 lambda^6 + ...
class HerzbergerFormula : public DispersionFormula {
public:
  HerzbergerFormula(const std::vector<double> &coefficients,
                    const ValidRange &range);

  double n(double lambda) const override;
};

/// Retro relation (formula 8):
///   (n^2 - 1) / (n^2 + 2) = C1 + C2 lambda^2 / (lambda^2 - C3) + C4 lambda^2
class RetroFormula : public SquaredIndexFormula {
public:
  RetroFormula(const std::vector<double> &coefficients,
               const ValidRange &range);

protected:
  double eps(double lambda) const override;
};

/// Exotic relation (formula 9):
///   n^2 = C1 + C2 / (lambda^2 - C3) + C4 (lambda - C5) / ((lambda - C5)^2 + C6)
class ExoticFormula : public SquaredIndexFormula {
public:
  ExoticFormula(const std::vector<double> &coefficients,
                const ValidRange &range);

protected:
  double eps(double lambda) const override;
};

} // namespace materials
} // namespace ultrafast
