#include "ultrafast/settings.hpp"

#include <cstdlib>

#include <yaml-cpp/yaml.h>

#include "ultrafast/errors.hpp"
#include "ultrafast/log.hpp"
#include "ultrafast/materials/formula.hpp"

namespace ultrafast {

namespace {

materials::RangePolicy parse_range_policy(const std::string &name) {
  if (name == "reject")
    return materials::RangePolicy::Reject;
  if (name == "warn")
    return materials::RangePolicy::Warn;
  throw ConfigurationError("Unknown range policy '" + name +
                           "' (expected reject or warn)");
}

void apply_environment(Settings &settings) {
  if (const char *root = std::getenv("ULTRAFAST_CATALOG")) {
    if (root[0] != '\0')
      settings.catalog_root = root;
  }
}

} // namespace

Settings default_settings() {
  Settings settings;
  apply_environment(settings);
  return settings;
}

Settings load_settings(const std::filesystem::path &path) {
  if (!std::filesystem::is_regular_file(path))
    throw NotFoundError(path.string());

  Settings settings;
  try {
    YAML::Node root = YAML::LoadFile(path.string());
    if (root && !root.IsNull() && !root.IsMap())
      throw ParseError(path.string(), "Settings file is not a map");

    if (YAML::Node catalog = root["catalog"]) {
      if (catalog["root"])
        settings.catalog_root = catalog["root"].as<std::string>();
    }
    if (YAML::Node eval = root["evaluation"]) {
      if (eval["range_policy"])
        settings.range_policy =
            parse_range_policy(eval["range_policy"].as<std::string>());
      if (eval["derivative_step"])
        settings.derivative_step = eval["derivative_step"].as<double>();
    }
    if (YAML::Node logging = root["logging"]) {
      if (logging["level"])
        settings.log_level = parse_log_level(logging["level"].as<std::string>());
    }
  } catch (const YAML::Exception &e) {
    throw ParseError(path.string(), std::string("Invalid settings: ") + e.what());
  }

  if (!(settings.derivative_step > 0.0 && settings.derivative_step < 0.1)) {
    throw ConfigurationError("evaluation.derivative_step must lie in (0, 0.1)");
  }
  apply_environment(settings);
  return settings;
}

void apply(const Settings &settings) {
  materials::set_default_derivative_step(settings.derivative_step);
  materials::set_default_range_policy(settings.range_policy);
  set_log_level(settings.log_level);
  ULTRAFAST_LOG_DEBUG("Settings applied (catalog root '{}')",
                      settings.catalog_root.string());
}

} // namespace ultrafast
