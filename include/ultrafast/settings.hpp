#pragma once

#include <filesystem>
#include <string>

#include <spdlog/common.h>

#include "ultrafast/materials/dispersive.hpp"

namespace ultrafast {

/// Library settings, read from a YAML file:
///
///   catalog:
///     root: /data/refractiveindex.info-database/database
///   evaluation:
///     range_policy: reject      # or warn
///     derivative_step: 1.0e-3   # relative finite-difference step
///   logging:
///     level: warn
///
/// The environment variable ULTRAFAST_CATALOG overrides catalog.root.
struct Settings {
  std::filesystem::path catalog_root;
  materials::RangePolicy range_policy = materials::RangePolicy::Reject;
  double derivative_step = 1e-3;
  spdlog::level::level_enum log_level = spdlog::level::warn;
};

/// Defaults plus environment overrides.
Settings default_settings();

/// @throws NotFoundError if the file does not exist
/// @throws ParseError on malformed YAML
/// @throws ConfigurationError on an invalid value
Settings load_settings(const std::filesystem::path &path);

/// Install settings process-wide: log level, default range policy and
/// derivative step.
/// @throws ConfigurationError on an invalid value
void apply(const Settings &settings);

} // namespace ultrafast
