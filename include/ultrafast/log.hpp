#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ultrafast {

/// Library-wide logger ("ultrafast"), created on first use with a colored
/// stderr sink. Default level is warn so that library calls stay quiet unless
/// something needs attention.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);
spdlog::level::level_enum get_log_level();

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
/// @throws ConfigurationError on an unknown name
spdlog::level::level_enum parse_log_level(const std::string &name);

} // namespace ultrafast

#define ULTRAFAST_LOG_TRACE(...) ::ultrafast::logger()->trace(__VA_ARGS__)
#define ULTRAFAST_LOG_DEBUG(...) ::ultrafast::logger()->debug(__VA_ARGS__)
#define ULTRAFAST_LOG_INFO(...) ::ultrafast::logger()->info(__VA_ARGS__)
#define ULTRAFAST_LOG_WARN(...) ::ultrafast::logger()->warn(__VA_ARGS__)
#define ULTRAFAST_LOG_ERROR(...) ::ultrafast::logger()->error(__VA_ARGS__)
