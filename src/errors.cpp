#include "ultrafast/errors.hpp"

#include <sstream>

namespace ultrafast {
namespace {

std::string format_range_message(double value,
                                 std::pair<double, double> valid,
                                 const std::string &message) {
  std::ostringstream ss;
  ss << message << ". Value: " << value << ". Valid range: (" << valid.first
     << ", " << valid.second << ")";
  return ss.str();
}

} // namespace

RangeError::RangeError(double value, std::pair<double, double> valid,
                       const std::string &message)
    : Error(format_range_message(value, valid, message)), value_(value),
      valid_(valid) {}

} // namespace ultrafast
