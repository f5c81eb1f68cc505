#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "ultrafast/materials/formula.hpp"

namespace ultrafast {
namespace materials {

/// What to do when a wavelength lies outside a material's valid range.
enum class RangePolicy {
  Default, ///< Use the process-wide default (see set_default_range_policy)
  Reject,  ///< Throw OutOfRangeError
  Warn     ///< Log a warning and extrapolate the relation
};

/// Set the policy used for RangePolicy::Default. Initially Reject.
void set_default_range_policy(RangePolicy policy);
RangePolicy default_range_policy();

/// A data block as it appeared in the source record, type text unchanged.
struct SourceBlock {
  std::string type;
  ValidRange range;
  std::vector<double> coefficients;

  bool operator==(const SourceBlock &o) const {
    return type == o.type && range == o.range &&
           coefficients == o.coefficients;
  }
};

/// Descriptive metadata carried alongside a dispersion relation.
struct MaterialInfo {
  std::string references;
  std::string comments;
  std::map<std::string, std::string> specs; ///< Scalar SPECS fields

  /// Every block of the source record, including those the relation was not
  /// built from (e.g. "tabulated k"). Empty for materials not read from a
  /// catalog.
  std::vector<SourceBlock> blocks;
  std::size_t primary = 0; ///< Index into blocks of the block behind the relation

  /// Leading number of specs["temperature"] (e.g. "20.0 °C" -> 20.0).
  std::optional<double> temperature() const;

  bool operator==(const MaterialInfo &o) const {
    return references == o.references && comments == o.comments &&
           specs == o.specs && blocks == o.blocks && primary == o.primary;
  }
};

/// An optical material with a wavelength-dependent real refractive index.
///
/// Immutable after construction. All wavelengths are in um and angular
/// frequencies in rad/fs. Every evaluation checks the wavelength against the
/// relation's valid range first; outside it the call is rejected or, with
/// RangePolicy::Warn, logged and extrapolated.
///
/// Example (fused silica at 800 nm):
///   n = 1.4533, group index = 1.4671, GVD = 36.2 fs^2/mm
class DispersiveMaterial {
public:
  /// @throws ConfigurationError if formula is null
  DispersiveMaterial(std::string name, FormulaPtr formula,
                     MaterialInfo info = MaterialInfo());

  /// Build the relation through FormulaRegistry.
  /// @throws ConfigurationError for an unknown kind or invalid coefficients
  DispersiveMaterial(std::string name, const std::string &kind,
                     const std::vector<double> &coefficients,
                     const ValidRange &range,
                     MaterialInfo info = MaterialInfo());

  const std::string &name() const { return name_; }
  const DispersionFormula &formula() const { return *formula_; }
  FormulaPtr formula_ptr() const { return formula_; }
  const MaterialInfo &info() const { return info_; }

  /// Valid wavelength range (um).
  const ValidRange &range() const { return formula_->range(); }

  /// Valid angular-frequency range (rad/fs).
  ValidRange frequency_range() const;

  /// Refractive index n(lambda).
  double n(double lambda, RangePolicy policy = RangePolicy::Default) const;
  Eigen::ArrayXd n(const Eigen::ArrayXd &lambda,
                   RangePolicy policy = RangePolicy::Default) const;

  double dn_dlambda(double lambda,
                    RangePolicy policy = RangePolicy::Default) const;
  double d2n_dlambda2(double lambda,
                      RangePolicy policy = RangePolicy::Default) const;

  /// Group index n_g = n - lambda dn/dlambda.
  double group_index(double lambda,
                     RangePolicy policy = RangePolicy::Default) const;
  Eigen::ArrayXd group_index(const Eigen::ArrayXd &lambda,
                             RangePolicy policy = RangePolicy::Default) const;

  /// Group velocity c / n_g (um/fs).
  double group_velocity(double lambda,
                        RangePolicy policy = RangePolicy::Default) const;

  /// Group-velocity dispersion d^2k/domega^2 in fs^2/mm.
  double gvd(double lambda, RangePolicy policy = RangePolicy::Default) const;
  Eigen::ArrayXd gvd(const Eigen::ArrayXd &lambda,
                     RangePolicy policy = RangePolicy::Default) const;

  /// Refractive index at angular frequency omega (rad/fs).
  double n_at_frequency(double omega,
                        RangePolicy policy = RangePolicy::Default) const;

  /// Wavevector k = omega n / c (rad/um) at angular frequency omega.
  double wavevector(double omega,
                    RangePolicy policy = RangePolicy::Default) const;

  /// Brewster angle (rad) for light incident from `incident`.
  double brewster(double lambda, const DispersiveMaterial &incident,
                  RangePolicy policy = RangePolicy::Default) const;

  /// Brewster angle (rad) for light incident from air.
  double brewster(double lambda, RangePolicy policy = RangePolicy::Default) const;

private:
  void check_range(double lambda, RangePolicy policy) const;

  std::string name_;
  FormulaPtr formula_;
  MaterialInfo info_;
};

} // namespace materials
} // namespace ultrafast
