#include "ultrafast/units.hpp"

#include <cmath>
#include <limits>

#include "ultrafast/errors.hpp"

namespace ultrafast {
namespace {

// lambda <-> omega is an involution: x -> 2*pi*c / x
double convert(double value, const char *what) {
  if (!(value > 0.0) || !std::isfinite(value)) {
    throw RangeError(value, {0.0, std::numeric_limits<double>::infinity()},
                     std::string(what) + " must be positive and finite");
  }
  return 2.0 * PI * c / value;
}

} // namespace

double frequency(double lambda) { return convert(lambda, "Wavelength"); }

double wavelength(double omega) { return convert(omega, "Angular frequency"); }

} // namespace ultrafast
