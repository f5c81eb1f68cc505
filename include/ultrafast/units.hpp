#pragma once

namespace ultrafast {

/// Speed of light in vacuum (um/fs).
constexpr double c = 0.299792458;

constexpr double PI = 3.14159265358979323846;

/// Wavelength (um) to angular frequency (rad/fs).
/// @throws RangeError if lambda is not positive
double frequency(double lambda);

/// Angular frequency (rad/fs) to wavelength (um).
/// @throws RangeError if omega is not positive
double wavelength(double omega);

} // namespace ultrafast
