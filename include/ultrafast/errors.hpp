#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ultrafast {

/// Base class for all errors raised by the library.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &message) : std::runtime_error(message) {}
};

/// A numeric value fell outside its valid interval [low, high].
class RangeError : public Error {
public:
  RangeError(double value, std::pair<double, double> valid,
             const std::string &message);

  double value() const { return value_; }
  std::pair<double, double> valid() const { return valid_; }

private:
  double value_;
  std::pair<double, double> valid_;
};

/// Wavelength outside the validated range of a material.
class OutOfRangeError : public RangeError {
public:
  using RangeError::RangeError;
};

/// Material identifier is absent from the local catalog mirror.
class NotFoundError : public Error {
public:
  explicit NotFoundError(const std::string &id)
      : Error("Material not found in catalog: " + id), id_(id) {}

  const std::string &id() const { return id_; }

private:
  std::string id_;
};

/// Malformed catalog record or settings file.
class ParseError : public Error {
public:
  ParseError(const std::string &source, const std::string &message)
      : Error(source.empty() ? message : message + " (" + source + ")"),
        source_(source) {}

  const std::string &source() const { return source_; }

private:
  std::string source_;
};

/// Invalid or incomplete coefficient set, unknown formula kind, bad range or
/// bad setting.
class ConfigurationError : public Error {
public:
  using Error::Error;
};

/// A dispersion relation produced a non-physical value (n^2 <= 0, NaN).
class EvaluationError : public Error {
public:
  using Error::Error;
};

} // namespace ultrafast
