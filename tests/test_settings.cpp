#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "ultrafast/errors.hpp"
#include "ultrafast/log.hpp"
#include "ultrafast/materials/formula.hpp"
#include "ultrafast/settings.hpp"

using namespace ultrafast;
namespace fs = std::filesystem;

namespace {

const fs::path kData = ULTRAFAST_TEST_DATA_DIR;

template <typename E, typename Fn> bool throws(Fn fn) {
  try {
    fn();
  } catch (const E &e) {
    std::cout << "  expected error: " << e.what() << std::endl;
    return true;
  }
  return false;
}

} // namespace

void test_defaults() {
  std::cout << "test_defaults..." << std::endl;

  unsetenv("ULTRAFAST_CATALOG");
  Settings s = default_settings();
  assert(s.catalog_root.empty());
  assert(s.range_policy == materials::RangePolicy::Reject);
  assert(s.derivative_step == 1e-3);
  assert(s.log_level == spdlog::level::warn);

  setenv("ULTRAFAST_CATALOG", "/srv/catalog", 1);
  assert(default_settings().catalog_root == fs::path("/srv/catalog"));
  unsetenv("ULTRAFAST_CATALOG");
}

void test_load_settings() {
  std::cout << "test_load_settings..." << std::endl;

  Settings s = load_settings(kData / "settings.yml");
  assert(s.catalog_root == fs::path("/opt/refractiveindex/database"));
  assert(s.range_policy == materials::RangePolicy::Warn);
  assert(s.derivative_step == 5.0e-4);
  assert(s.log_level == spdlog::level::err);

  // Environment wins over the file
  setenv("ULTRAFAST_CATALOG", "/srv/catalog", 1);
  assert(load_settings(kData / "settings.yml").catalog_root ==
         fs::path("/srv/catalog"));
  unsetenv("ULTRAFAST_CATALOG");
}

void test_invalid_settings() {
  std::cout << "test_invalid_settings..." << std::endl;

  assert(throws<ConfigurationError>(
      [] { load_settings(kData / "bad_settings.yml"); }));
  assert(throws<NotFoundError>([] { load_settings(kData / "missing.yml"); }));

  const fs::path tmp = fs::temp_directory_path() / "ultrafast_settings.yml";
  {
    std::ofstream out(tmp);
    out << "evaluation:\n  derivative_step: 0.5\n";
  }
  assert(throws<ConfigurationError>([&] { load_settings(tmp); }));
  {
    std::ofstream out(tmp);
    out << "logging:\n  level: chatty\n";
  }
  assert(throws<ConfigurationError>([&] { load_settings(tmp); }));
  {
    std::ofstream out(tmp);
    out << "evaluation:\n  derivative_step: small\n";
  }
  assert(throws<ParseError>([&] { load_settings(tmp); }));
  {
    std::ofstream out(tmp);
    out << "- just\n- a list\n";
  }
  assert(throws<ParseError>([&] { load_settings(tmp); }));
  fs::remove(tmp);
}

void test_apply() {
  std::cout << "test_apply..." << std::endl;

  Settings s = load_settings(kData / "settings.yml");
  apply(s);
  assert(materials::default_derivative_step() == 5.0e-4);
  assert(materials::default_range_policy() == materials::RangePolicy::Warn);
  assert(get_log_level() == spdlog::level::err);

  apply(Settings());
  assert(materials::default_derivative_step() == 1e-3);
  assert(materials::default_range_policy() == materials::RangePolicy::Reject);
  assert(get_log_level() == spdlog::level::warn);
}

void test_log_levels() {
  std::cout << "test_log_levels..." << std::endl;

  assert(parse_log_level("debug") == spdlog::level::debug);
  assert(parse_log_level("info") == spdlog::level::info);
  assert(parse_log_level("off") == spdlog::level::off);
  assert(throws<ConfigurationError>([] { parse_log_level("loud"); }));
}

int main() {
  std::cout << "=== Settings Unit Tests ===" << std::endl;
  test_defaults();
  test_load_settings();
  test_invalid_settings();
  test_apply();
  test_log_levels();
  std::cout << "=== All tests PASSED ===" << std::endl;
  return 0;
}
