#include "ultrafast/catalog/catalog_entry.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include "ultrafast/errors.hpp"
#include "ultrafast/log.hpp"

namespace ultrafast {
namespace catalog {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return s;
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

// Keys are matched case-insensitively: older files use "range", newer ones
// "wavelength_range"; top-level keys are upper case by convention.
YAML::Node find_child_ci(const YAML::Node &parent,
                         std::initializer_list<const char *> keys) {
  if (!parent || !parent.IsMap())
    return YAML::Node();
  for (const char *key : keys) {
    const std::string target = to_lower(key);
    for (auto it = parent.begin(); it != parent.end(); ++it) {
      if (it->first.IsScalar() && to_lower(it->first.Scalar()) == target)
        return it->second;
    }
  }
  return YAML::Node();
}

std::string scalar_or_empty(const YAML::Node &node, const std::string &what,
                            const std::string &source) {
  if (!node || node.IsNull())
    return std::string();
  if (!node.IsScalar())
    throw ParseError(source, what + " must be a scalar");
  return node.Scalar();
}

std::vector<double> parse_numbers(const std::string &text,
                                  const std::string &what,
                                  const std::string &source) {
  std::vector<double> out;
  std::istringstream in(text);
  std::string token;
  while (in >> token) {
    size_t used = 0;
    double value = 0.0;
    try {
      value = std::stod(token, &used);
    } catch (const std::exception &) {
      used = 0;
    }
    if (used != token.size()) {
      throw ParseError(source, "Non-numeric token '" + token + "' in " + what);
    }
    out.push_back(value);
  }
  return out;
}

std::vector<double> parse_rows(const std::string &text, int columns,
                               const std::string &what,
                               const std::string &source) {
  std::vector<double> out;
  std::istringstream in(text);
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::vector<double> row = parse_numbers(line, what, source);
    if (row.empty())
      continue;
    if (static_cast<int>(row.size()) != columns) {
      throw ParseError(source, what + " row " + std::to_string(line_no) +
                                   " has " + std::to_string(row.size()) +
                                   " values, expected " +
                                   std::to_string(columns));
    }
    out.insert(out.end(), row.begin(), row.end());
  }
  return out;
}

DataBlock parse_block(const YAML::Node &item, size_t index,
                      const std::string &source) {
  const std::string where = "DATA[" + std::to_string(index) + "]";
  if (!item.IsMap())
    throw ParseError(source, where + " is not a map");

  DataBlock block;
  block.type = scalar_or_empty(find_child_ci(item, {"type"}), where + ".type",
                               source);
  if (block.type.empty())
    throw ParseError(source, where + " has no type");

  if (block.is_tabulated()) {
    const std::string rows =
        scalar_or_empty(find_child_ci(item, {"data"}), where + ".data", source);
    block.coefficients = parse_rows(rows, block.columns(), where, source);
    if (block.coefficients.empty())
      throw ParseError(source, where + " has no tabulated data");
    const size_t last =
        block.coefficients.size() - static_cast<size_t>(block.columns());
    block.range =
        materials::ValidRange(block.coefficients.front(), block.coefficients[last]);
    return block;
  }

  const std::string range = scalar_or_empty(
      find_child_ci(item, {"wavelength_range", "range"}), where + ".range",
      source);
  const std::string coeffs = scalar_or_empty(
      find_child_ci(item, {"coefficients"}), where + ".coefficients", source);
  if (starts_with(to_lower(block.type), "formula")) {
    if (range.empty())
      throw ParseError(source, where + " has no wavelength range");
    if (coeffs.empty())
      throw ParseError(source, where + " has no coefficients");
  }
  if (!range.empty()) {
    std::vector<double> bounds = parse_numbers(range, where + ".range", source);
    if (bounds.size() != 2) {
      throw ParseError(source, where + ".range must hold two values, got " +
                                   std::to_string(bounds.size()));
    }
    block.range = materials::ValidRange(bounds[0], bounds[1]);
  }
  block.coefficients = parse_numbers(coeffs, where + ".coefficients", source);
  return block;
}

void collect_specs(const YAML::Node &node, const std::string &prefix,
                   std::map<std::string, std::string> &specs) {
  for (auto it = node.begin(); it != node.end(); ++it) {
    if (!it->first.IsScalar())
      continue;
    const std::string key =
        prefix.empty() ? it->first.Scalar() : prefix + "." + it->first.Scalar();
    if (it->second.IsScalar())
      specs[key] = it->second.Scalar();
    else if (it->second.IsMap())
      collect_specs(it->second, key, specs);
  }
}

std::string join_numbers(const std::vector<double> &values, size_t first,
                         size_t count) {
  std::string out;
  for (size_t i = first; i < first + count && i < values.size(); ++i) {
    if (i != first)
      out += ' ';
    out += fmt::format("{}", values[i]);
  }
  return out;
}

} // namespace

bool DataBlock::is_tabulated() const {
  return starts_with(materials::normalize_kind(type), "tabulated");
}

int DataBlock::columns() const {
  if (!is_tabulated())
    return 0;
  return materials::normalize_kind(type) == "tabulated nk" ? 3 : 2;
}

CatalogEntry parse_catalog_entry(const std::string &yaml_text,
                                 const std::string &source) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception &e) {
    throw ParseError(source, std::string("Invalid YAML: ") + e.what());
  }
  if (!root || !root.IsMap())
    throw ParseError(source, "Catalog entry is empty or not a map");

  CatalogEntry entry;
  try {
    entry.references =
        scalar_or_empty(find_child_ci(root, {"REFERENCES"}), "REFERENCES", source);
    entry.comments =
        scalar_or_empty(find_child_ci(root, {"COMMENTS"}), "COMMENTS", source);

    YAML::Node data = find_child_ci(root, {"DATA"});
    if (!data || !data.IsSequence() || data.size() == 0)
      throw ParseError(source, "Catalog entry has no DATA sequence");
    for (size_t i = 0; i < data.size(); ++i)
      entry.data.push_back(parse_block(data[i], i, source));

    YAML::Node specs = find_child_ci(root, {"SPECS"});
    if (specs && specs.IsMap())
      collect_specs(specs, "", entry.specs);
  } catch (const YAML::Exception &e) {
    throw ParseError(source, std::string("Invalid catalog entry: ") + e.what());
  }
  return entry;
}

CatalogEntry load_catalog_entry(const std::filesystem::path &path) {
  if (!std::filesystem::is_regular_file(path))
    throw NotFoundError(path.string());

  std::ifstream in(path);
  if (!in)
    throw ParseError(path.string(), "Cannot open catalog file");
  std::ostringstream ss;
  ss << in.rdbuf();

  CatalogEntry entry = parse_catalog_entry(ss.str(), path.string());
  ULTRAFAST_LOG_INFO("Loaded catalog entry {} ({} data block(s))",
                     path.string(), entry.data.size());
  return entry;
}

std::string to_yaml(const CatalogEntry &entry) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  if (!entry.references.empty())
    out << YAML::Key << "REFERENCES" << YAML::Value << entry.references;
  if (!entry.comments.empty())
    out << YAML::Key << "COMMENTS" << YAML::Value << entry.comments;

  out << YAML::Key << "DATA" << YAML::Value << YAML::BeginSeq;
  for (const auto &block : entry.data) {
    out << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << block.type;
    if (block.is_tabulated()) {
      const size_t cols = static_cast<size_t>(block.columns());
      std::string rows;
      for (size_t r = 0; r < block.coefficients.size(); r += cols)
        rows += join_numbers(block.coefficients, r, cols) + "\n";
      out << YAML::Key << "data" << YAML::Value << YAML::Literal << rows;
    } else {
      if (!block.range.empty()) {
        out << YAML::Key << "wavelength_range" << YAML::Value
            << fmt::format("{} {}", block.range.min, block.range.max);
      }
      out << YAML::Key << "coefficients" << YAML::Value
          << join_numbers(block.coefficients, 0, block.coefficients.size());
    }
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  if (!entry.specs.empty()) {
    out << YAML::Key << "SPECS" << YAML::Value << YAML::BeginMap;
    for (const auto &kv : entry.specs)
      out << YAML::Key << kv.first << YAML::Value << kv.second;
    out << YAML::EndMap;
  }
  out << YAML::EndMap;

  if (!out.good())
    throw std::runtime_error("YAML emitter error: " + out.GetLastError());
  return std::string(out.c_str()) + "\n";
}

void write_catalog_entry(const std::filesystem::path &path,
                         const CatalogEntry &entry) {
  std::ofstream ofs(path);
  if (!ofs) {
    throw std::runtime_error("Cannot open file for writing: " + path.string());
  }
  ofs << to_yaml(entry);
}

materials::DispersiveMaterial make_material(const CatalogEntry &entry,
                                            const std::string &name) {
  const auto &registry = materials::FormulaRegistry::instance();
  materials::MaterialInfo info{entry.references, entry.comments, entry.specs};
  for (const auto &block : entry.data)
    info.blocks.push_back({block.type, block.range, block.coefficients});

  for (size_t i = 0; i < entry.data.size(); ++i) {
    const DataBlock &block = entry.data[i];
    const std::string kind = materials::normalize_kind(block.type);
    if (!registry.has_kind(kind)) {
      if (starts_with(kind, "formula")) {
        throw ConfigurationError("Unsupported dispersion formula '" +
                                 block.type + "' in entry " + name);
      }
      ULTRAFAST_LOG_DEBUG("{}: skipping data block '{}'", name, block.type);
      continue;
    }
    info.primary = i;
    return materials::DispersiveMaterial(
        name, registry.create(kind, block.coefficients, block.range),
        std::move(info));
  }
  throw ParseError(name, "No dispersion data found in catalog entry");
}

CatalogEntry to_catalog_entry(const materials::DispersiveMaterial &material) {
  const auto &info = material.info();
  const auto &formula = material.formula();
  CatalogEntry entry;
  entry.references = info.references;
  entry.comments = info.comments;
  entry.specs = info.specs;

  // Source blocks are written back verbatim while they still describe the
  // relation; otherwise the relation alone is serialized.
  if (info.primary < info.blocks.size()) {
    const materials::SourceBlock &src = info.blocks[info.primary];
    if (materials::normalize_kind(src.type) == formula.kind() &&
        src.range == formula.range() &&
        src.coefficients == formula.coefficients()) {
      for (const auto &b : info.blocks)
        entry.data.push_back(DataBlock{b.type, b.range, b.coefficients});
      return entry;
    }
  }
  entry.data.push_back(
      DataBlock{formula.kind(), formula.range(), formula.coefficients()});
  return entry;
}

} // namespace catalog
} // namespace ultrafast
