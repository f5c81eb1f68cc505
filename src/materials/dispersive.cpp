#include "ultrafast/materials/dispersive.hpp"

#include <atomic>
#include <cmath>
#include <cstdlib>

#include "ultrafast/errors.hpp"
#include "ultrafast/log.hpp"
#include "ultrafast/materials/library.hpp"
#include "ultrafast/units.hpp"

namespace ultrafast {
namespace materials {

namespace {

std::atomic<RangePolicy> g_range_policy{RangePolicy::Reject};

RangePolicy resolve(RangePolicy policy) {
  return policy == RangePolicy::Default ? g_range_policy.load() : policy;
}

} // namespace

void set_default_range_policy(RangePolicy policy) {
  if (policy == RangePolicy::Default) {
    throw ConfigurationError("Default range policy must be Reject or Warn");
  }
  g_range_policy.store(policy);
}

RangePolicy default_range_policy() { return g_range_policy.load(); }

std::optional<double> MaterialInfo::temperature() const {
  auto it = specs.find("temperature");
  if (it == specs.end())
    return std::nullopt;
  const char *begin = it->second.c_str();
  char *end = nullptr;
  double value = std::strtod(begin, &end);
  if (end == begin)
    return std::nullopt;
  return value;
}

DispersiveMaterial::DispersiveMaterial(std::string name, FormulaPtr formula,
                                       MaterialInfo info)
    : name_(std::move(name)), formula_(std::move(formula)),
      info_(std::move(info)) {
  if (!formula_) {
    throw ConfigurationError("DispersiveMaterial '" + name_ +
                             "': dispersion formula is null");
  }
}

DispersiveMaterial::DispersiveMaterial(std::string name,
                                       const std::string &kind,
                                       const std::vector<double> &coefficients,
                                       const ValidRange &range,
                                       MaterialInfo info)
    : DispersiveMaterial(std::move(name),
                         FormulaRegistry::instance().create(kind, coefficients,
                                                            range),
                         std::move(info)) {}

ValidRange DispersiveMaterial::frequency_range() const {
  return ValidRange(frequency(range().min), frequency(range().max));
}

void DispersiveMaterial::check_range(double lambda, RangePolicy policy) const {
  if (range().contains(lambda))
    return;
  if (!(lambda > 0.0) || !std::isfinite(lambda) ||
      resolve(policy) == RangePolicy::Reject) {
    throw OutOfRangeError(lambda, range().bounds(),
                          "Wavelength out of material range for '" + name_ +
                              "'");
  }
  ULTRAFAST_LOG_WARN("{}: extrapolating {} outside valid range [{}, {}] um "
                     "at lambda = {} um",
                     name_, formula_->kind(), range().min, range().max, lambda);
}

double DispersiveMaterial::n(double lambda, RangePolicy policy) const {
  check_range(lambda, policy);
  return formula_->n(lambda);
}

Eigen::ArrayXd DispersiveMaterial::n(const Eigen::ArrayXd &lambda,
                                     RangePolicy policy) const {
  Eigen::ArrayXd out(lambda.size());
  for (Eigen::Index i = 0; i < lambda.size(); ++i)
    out[i] = n(lambda[i], policy);
  return out;
}

double DispersiveMaterial::dn_dlambda(double lambda, RangePolicy policy) const {
  check_range(lambda, policy);
  return formula_->dn_dlambda(lambda);
}

double DispersiveMaterial::d2n_dlambda2(double lambda,
                                        RangePolicy policy) const {
  check_range(lambda, policy);
  return formula_->d2n_dlambda2(lambda);
}

double DispersiveMaterial::group_index(double lambda,
                                       RangePolicy policy) const {
  check_range(lambda, policy);
  return formula_->n(lambda) - lambda * formula_->dn_dlambda(lambda);
}

Eigen::ArrayXd DispersiveMaterial::group_index(const Eigen::ArrayXd &lambda,
                                               RangePolicy policy) const {
  Eigen::ArrayXd out(lambda.size());
  for (Eigen::Index i = 0; i < lambda.size(); ++i)
    out[i] = group_index(lambda[i], policy);
  return out;
}

double DispersiveMaterial::group_velocity(double lambda,
                                          RangePolicy policy) const {
  return c / group_index(lambda, policy);
}

double DispersiveMaterial::gvd(double lambda, RangePolicy policy) const {
  check_range(lambda, policy);
  // lambda^3 / (2 pi c^2) d^2n/dlambda^2 is in fs^2/um
  const double per_um = lambda * lambda * lambda / (2.0 * PI * c * c) *
                        formula_->d2n_dlambda2(lambda);
  return per_um * 1e3;
}

Eigen::ArrayXd DispersiveMaterial::gvd(const Eigen::ArrayXd &lambda,
                                       RangePolicy policy) const {
  Eigen::ArrayXd out(lambda.size());
  for (Eigen::Index i = 0; i < lambda.size(); ++i)
    out[i] = gvd(lambda[i], policy);
  return out;
}

double DispersiveMaterial::n_at_frequency(double omega,
                                          RangePolicy policy) const {
  return n(wavelength(omega), policy);
}

double DispersiveMaterial::wavevector(double omega, RangePolicy policy) const {
  return omega * n_at_frequency(omega, policy) / c;
}

double DispersiveMaterial::brewster(double lambda,
                                    const DispersiveMaterial &incident,
                                    RangePolicy policy) const {
  return std::atan(n(lambda, policy) / incident.n(lambda, policy));
}

double DispersiveMaterial::brewster(double lambda, RangePolicy policy) const {
  return brewster(lambda, air(), policy);
}

} // namespace materials
} // namespace ultrafast
