#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "ultrafast/materials/dispersive.hpp"

namespace ultrafast {
namespace catalog {

/// One item of an entry's DATA sequence.
///
/// Formula blocks carry their coefficients. Tabulated blocks ("tabulated n",
/// "tabulated nk", "tabulated k") carry their rows flattened, and their
/// range is the span of the first column.
struct DataBlock {
  std::string type;
  materials::ValidRange range;
  std::vector<double> coefficients;

  bool is_tabulated() const;

  /// Values per row for tabulated types (2 or 3), 0 for formulas.
  int columns() const;

  bool operator==(const DataBlock &o) const {
    return type == o.type && range == o.range &&
           coefficients == o.coefficients;
  }
  bool operator!=(const DataBlock &o) const { return !(*this == o); }
};

/// A RefractiveIndex.info database record, as stored in its YAML file.
struct CatalogEntry {
  std::string references;
  std::string comments;
  std::vector<DataBlock> data;
  std::map<std::string, std::string> specs;

  bool operator==(const CatalogEntry &o) const {
    return references == o.references && comments == o.comments &&
           data == o.data && specs == o.specs;
  }
  bool operator!=(const CatalogEntry &o) const { return !(*this == o); }
};

/// Parse an entry from YAML text.
/// @param source Path or label used in error messages
/// @throws ParseError on malformed YAML or an invalid record
CatalogEntry parse_catalog_entry(const std::string &yaml_text,
                                 const std::string &source = "");

/// Read and parse an entry file.
/// @throws NotFoundError if the file does not exist
/// @throws ParseError if it cannot be read or parsed
CatalogEntry load_catalog_entry(const std::filesystem::path &path);

/// Serialize an entry in the same schema. Numbers are written in shortest
/// round-trip form, so parse_catalog_entry(to_yaml(e)) == e.
std::string to_yaml(const CatalogEntry &entry);

/// Write to_yaml(entry) to a file.
/// @throws std::runtime_error if the file cannot be opened
void write_catalog_entry(const std::filesystem::path &path,
                         const CatalogEntry &entry);

/// Build a material from the first usable dispersion block of an entry.
/// Blocks whose type has no registered formula kind (e.g. "tabulated k")
/// are skipped, but every block is kept in MaterialInfo::blocks.
/// @throws ParseError if no block describes the refractive index
/// @throws ConfigurationError for an unknown "formula N" or invalid
///         coefficients
materials::DispersiveMaterial make_material(const CatalogEntry &entry,
                                            const std::string &name);

/// Re-serialize a material. A material read by make_material gives back its
/// source entry, all blocks and type spellings included; any other material
/// becomes a single-block entry.
CatalogEntry to_catalog_entry(const materials::DispersiveMaterial &material);

} // namespace catalog
} // namespace ultrafast
