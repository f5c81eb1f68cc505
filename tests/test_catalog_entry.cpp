#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>

#include "ultrafast/catalog/catalog_entry.hpp"
#include "ultrafast/errors.hpp"
#include "ultrafast/materials/library.hpp"

using namespace ultrafast;
using namespace ultrafast::catalog;
namespace fs = std::filesystem;

namespace {

const fs::path kData = ULTRAFAST_TEST_DATA_DIR;

bool close(double a, double b, double tol) { return std::abs(a - b) < tol; }

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

void test_parse_formula_entry() {
  std::cout << "test_parse_formula_entry..." << std::endl;

  CatalogEntry e = load_catalog_entry(kData / "catalog/data/main/SiO2/Malitson.yml");
  assert(e.references.find("Malitson") != std::string::npos);
  assert(e.comments == "Fused silica, 20 °C");
  assert(e.data.size() == 1);
  assert(e.data[0].type == "formula 1");
  assert(!e.data[0].is_tabulated());
  assert(e.data[0].columns() == 0);
  assert(e.data[0].range == materials::ValidRange(0.21, 6.7));
  assert(e.data[0].coefficients.size() == 7);
  assert(e.data[0].coefficients[1] == 0.6961663);
  assert(e.specs.at("temperature") == "20.0 °C");
  assert(e.specs.at("n_absolute") == "true");
}

void test_parse_tabulated_entry() {
  std::cout << "test_parse_tabulated_entry..." << std::endl;

  CatalogEntry e = load_catalog_entry(kData / "catalog/main/Ag/Johnson.yml");
  assert(e.comments.empty());
  assert(e.data.size() == 1);
  const DataBlock &b = e.data[0];
  assert(b.is_tabulated());
  assert(b.columns() == 3);
  assert(b.coefficients.size() == 18);
  assert(b.range == materials::ValidRange(0.4959, 0.8266));

  CatalogEntry schott =
      load_catalog_entry(kData / "catalog/data/main/BK7/nk/SCHOTT.yml");
  assert(schott.data.size() == 2);
  assert(schott.data[1].type == "tabulated k");
  assert(schott.data[1].columns() == 2);
  assert(schott.data[1].coefficients.size() == 8);
  assert(schott.data[1].coefficients[1] == 2.8607e-06);
  assert(schott.specs.at("glass_code") == "517642.251");
}

void test_case_insensitive_keys() {
  std::cout << "test_case_insensitive_keys..." << std::endl;

  const std::string text = "references: lower-case keys\n"
                           "Data:\n"
                           "  - Type: Formula 5\n"
                           "    Range: 0.4 1.0\n"
                           "    Coefficients: 1.5 0.004 -2\n"
                           "specs:\n"
                           "  thermal:\n"
                           "    dn/dT: 1.2e-5\n";
  CatalogEntry e = parse_catalog_entry(text, "inline");
  assert(e.references == "lower-case keys");
  assert(e.data.size() == 1);
  assert(e.data[0].range == materials::ValidRange(0.4, 1.0));
  assert(e.specs.at("thermal.dn/dT") == "1.2e-5");

  materials::DispersiveMaterial m = make_material(e, "cauchy");
  assert(m.formula().kind() == "formula 5");
  assert(close(m.n(0.5), 1.516, 1e-12));
}

void test_parse_errors() {
  std::cout << "test_parse_errors..." << std::endl;

  assert(throws<ParseError>(
      [] { load_catalog_entry(kData / "entries/Malformed.yml"); }));
  assert(throws<ParseError>(
      [] { load_catalog_entry(kData / "entries/NoData.yml"); }));
  assert(throws<ParseError>(
      [] { load_catalog_entry(kData / "entries/BadCoefficients.yml"); }));
  assert(throws<ParseError>(
      [] { load_catalog_entry(kData / "entries/BadRow.yml"); }));
  assert(throws<ParseError>([] { parse_catalog_entry("", "empty"); }));
  assert(throws<ParseError>([] {
    parse_catalog_entry("DATA:\n  - type: formula 1\n    coefficients: 0 1 0.1\n");
  }));
  assert(throws<NotFoundError>(
      [] { load_catalog_entry(kData / "entries/Missing.yml"); }));

  // The offending file is named in the error
  try {
    load_catalog_entry(kData / "entries/BadCoefficients.yml");
  } catch (const ParseError &e) {
    assert(e.source().find("BadCoefficients.yml") != std::string::npos);
    assert(std::string(e.what()).find("oops") != std::string::npos);
  }
}

void test_make_material() {
  std::cout << "test_make_material..." << std::endl;

  // Unusable k-only block is skipped in favour of the formula
  CatalogEntry schott =
      load_catalog_entry(kData / "catalog/data/main/BK7/nk/SCHOTT.yml");
  materials::DispersiveMaterial glass = make_material(schott, "BK7/SCHOTT");
  assert(glass.name() == "BK7/SCHOTT");
  assert(glass.formula().kind() == "formula 2");
  assert(close(glass.n(0.5875618), 1.5168, 1e-4));
  assert(glass.info().temperature() && *glass.info().temperature() == 20.0);

  materials::DispersiveMaterial pole =
      make_material(load_catalog_entry(kData / "entries/SinglePole.yml"), "pole");
  assert(close(pole.n(0.5), std::sqrt(1.0 + 1.1 * 0.25 / 0.24), 1e-12));

  assert(throws<ConfigurationError>([] {
    make_material(load_catalog_entry(kData / "entries/BadFormula.yml"), "bad");
  }));
  assert(throws<ParseError>([] {
    make_material(load_catalog_entry(kData / "entries/BadType.yml"), "k-only");
  }));
}

void test_material_roundtrip() {
  std::cout << "test_material_roundtrip..." << std::endl;

  CatalogEntry original =
      load_catalog_entry(kData / "catalog/data/main/SiO2/Malitson.yml");
  materials::DispersiveMaterial m = make_material(original, "SiO2/Malitson");
  CatalogEntry back = to_catalog_entry(m);
  assert(back == original);

  // Formula plus a k table: the k block is carried through unchanged
  CatalogEntry schott =
      load_catalog_entry(kData / "catalog/data/main/BK7/nk/SCHOTT.yml");
  materials::DispersiveMaterial glass = make_material(schott, "BK7/SCHOTT");
  assert(glass.info().blocks.size() == 2);
  assert(glass.info().primary == 0);
  CatalogEntry schott_back = to_catalog_entry(glass);
  assert(schott_back.data.size() == 2);
  assert(schott_back.data[1].type == "tabulated k");
  assert(schott_back == schott);

  // Type text keeps its original spelling, and a skipped block ahead of the
  // usable one keeps its position
  CatalogEntry mixed = parse_catalog_entry("DATA:\n"
                                           "  - type: Tabulated K\n"
                                           "    data: |\n"
                                           "        0.4 1.0e-7\n"
                                           "        1.0 2.0e-7\n"
                                           "  - Type: Formula 5\n"
                                           "    Range: 0.4 1.0\n"
                                           "    Coefficients: 1.5 0.004 -2\n",
                                           "mixed-case");
  materials::DispersiveMaterial cauchy = make_material(mixed, "cauchy");
  assert(cauchy.info().primary == 1);
  CatalogEntry mixed_back = to_catalog_entry(cauchy);
  assert(mixed_back.data[1].type == "Formula 5");
  assert(mixed_back == mixed);
  assert(parse_catalog_entry(to_yaml(mixed_back), "mixed-case") == mixed);

  // Built-in materials serialize to entries that rebuild identical relations
  const materials::DispersiveMaterial &silica = materials::fused_silica();
  materials::DispersiveMaterial rebuilt =
      make_material(to_catalog_entry(silica), "rebuilt");
  assert(rebuilt.range() == silica.range());
  assert(rebuilt.n(0.8) == silica.n(0.8));
  assert(rebuilt.gvd(0.8) == silica.gvd(0.8));
}

void test_yaml_roundtrip() {
  std::cout << "test_yaml_roundtrip..." << std::endl;

  for (const char *rel : {"catalog/data/main/SiO2/Malitson.yml",
                          "catalog/data/main/BK7/nk/SCHOTT.yml",
                          "catalog/main/Ag/Johnson.yml"}) {
    CatalogEntry e = load_catalog_entry(kData / rel);
    const std::string text = to_yaml(e);
    CatalogEntry back = parse_catalog_entry(text, rel);
    assert(back == e);
  }

  const fs::path tmp = fs::temp_directory_path() / "ultrafast_roundtrip.yml";
  CatalogEntry johnson = load_catalog_entry(kData / "catalog/main/Ag/Johnson.yml");
  write_catalog_entry(tmp, johnson);
  assert(load_catalog_entry(tmp) == johnson);
  fs::remove(tmp);
}

int main() {
  std::cout << "=== Catalog Entry Unit Tests ===" << std::endl;
  test_parse_formula_entry();
  test_parse_tabulated_entry();
  test_case_insensitive_keys();
  test_parse_errors();
  test_make_material();
  test_material_roundtrip();
  test_yaml_roundtrip();
  std::cout << "=== All tests PASSED ===" << std::endl;
  return 0;
}
