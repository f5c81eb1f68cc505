#include "ultrafast/materials/formula.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <sstream>

#include "ultrafast/errors.hpp"
#include "ultrafast/materials/formulas.hpp"
#include "ultrafast/materials/tabulated.hpp"

namespace ultrafast {
namespace materials {

namespace {

std::atomic<double> g_derivative_step{1e-3};

template <typename Formula>
FormulaFactory make_factory() {
  return [](const std::vector<double> &coeffs, const ValidRange &range) {
    return FormulaPtr(std::make_shared<Formula>(coeffs, range));
  };
}

} // namespace

void set_default_derivative_step(double step) {
  if (!(step > 0.0 && step < 0.1)) {
    std::ostringstream ss;
    ss << "Derivative step must lie in (0, 0.1), got " << step;
    throw ConfigurationError(ss.str());
  }
  g_derivative_step.store(step);
}

double default_derivative_step() { return g_derivative_step.load(); }

DispersionFormula::DispersionFormula(std::string kind,
                                     std::vector<double> coefficients,
                                     ValidRange range)
    : kind_(std::move(kind)), coefficients_(std::move(coefficients)),
      range_(range) {
  if (range_.empty() || !(range_.min > 0.0) || !std::isfinite(range_.max)) {
    std::ostringstream ss;
    ss << kind_ << ": wavelength range (" << range_.min << ", " << range_.max
       << ") must be positive and finite";
    throw ConfigurationError(ss.str());
  }
  for (size_t i = 0; i < coefficients_.size(); ++i) {
    if (!std::isfinite(coefficients_[i])) {
      throw ConfigurationError(kind_ + ": coefficient " +
                               std::to_string(i + 1) + " is not finite");
    }
  }
}

double DispersionFormula::dn_dlambda(double lambda) const {
  return numeric_first_derivative(lambda);
}

double DispersionFormula::d2n_dlambda2(double lambda) const {
  return numeric_second_derivative(lambda);
}

double DispersionFormula::numeric_first_derivative(double lambda) const {
  // Five-point central difference, O(h^4)
  const double h = default_derivative_step() * lambda;
  const double fp2 = n(lambda + 2.0 * h);
  const double fp1 = n(lambda + h);
  const double fm1 = n(lambda - h);
  const double fm2 = n(lambda - 2.0 * h);
  return (-fp2 + 8.0 * fp1 - 8.0 * fm1 + fm2) / (12.0 * h);
}

double DispersionFormula::numeric_second_derivative(double lambda) const {
  const double h = default_derivative_step() * lambda;
  const double fp2 = n(lambda + 2.0 * h);
  const double fp1 = n(lambda + h);
  const double f0 = n(lambda);
  const double fm1 = n(lambda - h);
  const double fm2 = n(lambda - 2.0 * h);
  return (-fp2 + 16.0 * fp1 - 30.0 * f0 + 16.0 * fm1 - fm2) / (12.0 * h * h);
}

double DispersionFormula::checked_sqrt(double n2, double lambda) const {
  if (!(n2 > 0.0) || !std::isfinite(n2)) {
    std::ostringstream ss;
    ss << kind_ << ": n^2 = " << n2 << " at lambda = " << lambda << " um";
    throw EvaluationError(ss.str());
  }
  return std::sqrt(n2);
}

double DispersionFormula::checked(double value, double lambda) const {
  if (!std::isfinite(value)) {
    std::ostringstream ss;
    ss << kind_ << ": non-finite index at lambda = " << lambda << " um";
    throw EvaluationError(ss.str());
  }
  return value;
}

double SquaredIndexFormula::n(double lambda) const {
  return checked_sqrt(eps(lambda), lambda);
}

double SquaredIndexFormula::dn_dlambda(double lambda) const {
  double d1 = 0.0, d2 = 0.0;
  if (!eps_derivatives(lambda, d1, d2)) {
    return numeric_first_derivative(lambda);
  }
  // n^2 = eps  =>  2 n n' = eps'
  return d1 / (2.0 * n(lambda));
}

double SquaredIndexFormula::d2n_dlambda2(double lambda) const {
  double d1 = 0.0, d2 = 0.0;
  if (!eps_derivatives(lambda, d1, d2)) {
    return numeric_second_derivative(lambda);
  }
  // eps'' = 2 n'^2 + 2 n n''
  const double nv = n(lambda);
  const double n1 = d1 / (2.0 * nv);
  return (d2 - 2.0 * n1 * n1) / (2.0 * nv);
}

std::string normalize_kind(const std::string &kind) {
  auto begin = std::find_if_not(kind.begin(), kind.end(), [](unsigned char ch) {
    return std::isspace(ch) != 0;
  });
  auto end = std::find_if_not(kind.rbegin(), kind.rend(), [](unsigned char ch) {
               return std::isspace(ch) != 0;
             }).base();
  std::string out;
  bool last_space = false;
  for (auto it = begin; it < end; ++it) {
    unsigned char ch = static_cast<unsigned char>(*it);
    if (std::isspace(ch)) {
      if (!last_space)
        out.push_back(' ');
      last_space = true;
    } else {
      out.push_back(static_cast<char>(std::tolower(ch)));
      last_space = false;
    }
  }
  return out;
}

FormulaRegistry &FormulaRegistry::instance() {
  static FormulaRegistry registry;
  return registry;
}

FormulaRegistry::FormulaRegistry() {
  factories_["formula 1"] = [](const std::vector<double> &c, const ValidRange &r) {
    return FormulaPtr(std::make_shared<SellmeierFormula>(c, r, true));
  };
  factories_["formula 2"] = [](const std::vector<double> &c, const ValidRange &r) {
    return FormulaPtr(std::make_shared<SellmeierFormula>(c, r, false));
  };
  factories_["formula 3"] = make_factory<PolynomialFormula>();
  factories_["formula 4"] = make_factory<RiiFormula>();
  factories_["formula 5"] = make_factory<CauchyFormula>();
  factories_["formula 6"] = make_factory<GasFormula>();
  factories_["formula 7"] = make_factory<HerzbergerFormula>();
  factories_["formula 8"] = make_factory<RetroFormula>();
  factories_["formula 9"] = make_factory<ExoticFormula>();
  factories_["single-pole"] = make_factory<SinglePoleFormula>();
  factories_["tabulated n"] = [](const std::vector<double> &c, const ValidRange &r) {
    return FormulaPtr(std::make_shared<TabulatedFormula>(c, r, 2));
  };
  factories_["tabulated nk"] = [](const std::vector<double> &c, const ValidRange &r) {
    return FormulaPtr(std::make_shared<TabulatedFormula>(c, r, 3));
  };
}

void FormulaRegistry::register_kind(const std::string &kind,
                                    FormulaFactory factory) {
  const std::string key = normalize_kind(kind);
  if (key.empty()) {
    throw ConfigurationError("Formula kind must not be empty");
  }
  if (!factory) {
    throw ConfigurationError("Null factory for formula kind: " + kind);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  factories_[key] = std::move(factory);
}

bool FormulaRegistry::has_kind(const std::string &kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return factories_.count(normalize_kind(kind)) != 0;
}

FormulaPtr FormulaRegistry::create(const std::string &kind,
                                   const std::vector<double> &coefficients,
                                   const ValidRange &range) const {
  FormulaFactory factory;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = factories_.find(normalize_kind(kind));
    if (it == factories_.end()) {
      throw ConfigurationError("Unknown dispersion formula kind: '" + kind + "'");
    }
    factory = it->second;
  }
  return factory(coefficients, range);
}

std::vector<std::string> FormulaRegistry::kinds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto &kv : factories_)
    out.push_back(kv.first);
  return out;
}

} // namespace materials
} // namespace ultrafast
