#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace ultrafast {
namespace materials {

/// Closed wavelength interval [min, max] in um over which a dispersion
/// relation is considered accurate. A reversed pair is reordered.
struct ValidRange {
  double min = 0.0;
  double max = 0.0;

  ValidRange() = default;
  ValidRange(double a, double b) : min(a < b ? a : b), max(a < b ? b : a) {}

  /// A default-constructed range carries no information.
  bool empty() const { return min == 0.0 && max == 0.0; }
  bool contains(double lambda) const { return lambda >= min && lambda <= max; }
  std::pair<double, double> bounds() const { return {min, max}; }

  bool operator==(const ValidRange &o) const {
    return min == o.min && max == o.max;
  }
  bool operator!=(const ValidRange &o) const { return !(*this == o); }
};

/// Set the relative step used by the finite-difference derivative fallback.
/// @throws ConfigurationError unless 0 < step < 0.1
void set_default_derivative_step(double step);
double default_derivative_step();

/// Base class for a parametric or tabulated dispersion relation n(lambda).
///
/// Wavelengths are in um. Derivatives default to five-point central
/// differences; kinds with closed-form derivatives override them. The
/// relation itself performs no range check, DispersiveMaterial does.
class DispersionFormula {
public:
  /// @throws ConfigurationError if the range is empty, non-positive or not
  ///         finite, or a coefficient is not finite
  DispersionFormula(std::string kind, std::vector<double> coefficients,
                    ValidRange range);
  virtual ~DispersionFormula() = default;

  const std::string &kind() const { return kind_; }
  const std::vector<double> &coefficients() const { return coefficients_; }
  const ValidRange &range() const { return range_; }

  /// Refractive index at wavelength lambda (um).
  virtual double n(double lambda) const = 0;

  /// dn/dlambda (1/um).
  virtual double dn_dlambda(double lambda) const;

  /// d^2n/dlambda^2 (1/um^2).
  virtual double d2n_dlambda2(double lambda) const;

  /// Whether dn_dlambda/d2n_dlambda2 are closed form for this kind.
  virtual bool has_analytic_derivatives() const { return false; }

protected:
  double numeric_first_derivative(double lambda) const;
  double numeric_second_derivative(double lambda) const;

  /// sqrt(n2), rejecting non-physical values.
  /// @throws EvaluationError if n2 <= 0 or not finite
  double checked_sqrt(double n2, double lambda) const;

  /// @throws EvaluationError if value is not finite
  double checked(double value, double lambda) const;

private:
  std::string kind_;
  std::vector<double> coefficients_;
  ValidRange range_;
};

/// Relation defined through n^2 = eps(lambda). Subclasses supply eps and,
/// optionally, its first two derivatives.
class SquaredIndexFormula : public DispersionFormula {
public:
  using DispersionFormula::DispersionFormula;

  double n(double lambda) const override;
  double dn_dlambda(double lambda) const override;
  double d2n_dlambda2(double lambda) const override;

protected:
  virtual double eps(double lambda) const = 0;

  /// Fill d1 = deps/dlambda, d2 = d^2eps/dlambda^2. Return false when no
  /// closed form exists, which selects the numerical fallback.
  virtual bool eps_derivatives(double lambda, double &d1, double &d2) const {
    (void)lambda;
    (void)d1;
    (void)d2;
    return false;
  }
};

using FormulaPtr = std::shared_ptr<const DispersionFormula>;

/// Builds a formula of one kind from (coefficients, range).
using FormulaFactory =
    std::function<FormulaPtr(const std::vector<double> &, const ValidRange &)>;

/// Lower-case and trim a kind tag ("  Formula 1 " -> "formula 1").
std::string normalize_kind(const std::string &kind);

/// Process-wide registry mapping formula-kind tags to factories.
///
/// The RefractiveIndex.info kinds ("formula 1" .. "formula 9",
/// "tabulated n", "tabulated nk") and "single-pole" are registered on first
/// use. Further kinds may be added at runtime.
class FormulaRegistry {
public:
  static FormulaRegistry &instance();

  /// Register or replace the factory for a kind.
  void register_kind(const std::string &kind, FormulaFactory factory);

  bool has_kind(const std::string &kind) const;

  /// @throws ConfigurationError for an unknown kind or an invalid
  ///         coefficient set
  FormulaPtr create(const std::string &kind,
                    const std::vector<double> &coefficients,
                    const ValidRange &range) const;

  /// Registered kinds in normalized form, sorted.
  std::vector<std::string> kinds() const;

private:
  FormulaRegistry();
  FormulaRegistry(const FormulaRegistry &) = delete;
  FormulaRegistry &operator=(const FormulaRegistry &) = delete;

  mutable std::mutex mutex_;
  std::map<std::string, FormulaFactory> factories_;
};

} // namespace materials
} // namespace ultrafast
