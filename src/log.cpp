#include "ultrafast/log.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "ultrafast/errors.hpp"

namespace ultrafast {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(once, [] {
    instance = spdlog::get("ultrafast");
    if (!instance) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
      instance = std::make_shared<spdlog::logger>("ultrafast", sink);
      instance->set_level(spdlog::level::warn);
      instance->flush_on(spdlog::level::err);
      spdlog::register_logger(instance);
    }
  });
  return instance;
}

void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }

spdlog::level::level_enum get_log_level() { return logger()->level(); }

spdlog::level::level_enum parse_log_level(const std::string &name) {
  std::string key(name);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (key == "trace")
    return spdlog::level::trace;
  if (key == "debug")
    return spdlog::level::debug;
  if (key == "info")
    return spdlog::level::info;
  if (key == "warn" || key == "warning")
    return spdlog::level::warn;
  if (key == "error" || key == "err")
    return spdlog::level::err;
  if (key == "critical")
    return spdlog::level::critical;
  if (key == "off")
    return spdlog::level::off;
  throw ConfigurationError("Unknown log level: " + name);
}

} // namespace ultrafast
