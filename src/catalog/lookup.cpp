#include "ultrafast/catalog/lookup.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "ultrafast/errors.hpp"
#include "ultrafast/log.hpp"

namespace fs = std::filesystem;

namespace ultrafast {
namespace catalog {

namespace {

// Split on '/', keeping empty segments so the caller can reject them.
std::vector<std::string> split_id(const std::string &id) {
  std::vector<std::string> parts;
  std::string part;
  std::istringstream in(id);
  while (std::getline(in, part, '/'))
    parts.push_back(part);
  return parts;
}

bool is_yaml_file(const fs::path &p) {
  const std::string ext = p.extension().string();
  return (ext == ".yml" || ext == ".yaml") && fs::is_regular_file(p);
}

} // namespace

MaterialId MaterialId::parse(const std::string &id) {
  std::vector<std::string> parts = split_id(id);
  // A trailing '/' names a book without a page
  const bool book_only = !id.empty() && id.back() == '/';
  for (const auto &p : parts) {
    if (p.empty() || p == "." || p == "..")
      throw NotFoundError(id);
  }
  MaterialId out;
  switch (parts.size()) {
  case 1:
    out.book = parts[0];
    break;
  case 2:
    if (book_only) {
      out.shelf = parts[0];
      out.book = parts[1];
    } else {
      out.book = parts[0];
      out.page = parts[1];
    }
    break;
  case 3:
    if (book_only)
      throw NotFoundError(id);
    out.shelf = parts[0];
    out.book = parts[1];
    out.page = parts[2];
    break;
  default:
    throw NotFoundError(id);
  }
  return out;
}

std::string MaterialId::str() const {
  std::string s = shelf + "/" + book;
  if (!page.empty())
    s += "/" + page;
  return s;
}

RefractiveIndexLookup::RefractiveIndexLookup(fs::path root)
    : root_(std::move(root)) {
  if (!fs::is_directory(root_)) {
    throw NotFoundError("catalog root " + root_.string());
  }
}

std::vector<fs::path>
RefractiveIndexLookup::book_dirs(const MaterialId &id) const {
  return {root_ / "data" / id.shelf / id.book,
          root_ / "data" / id.shelf / id.book / "nk",
          root_ / id.shelf / id.book};
}

std::optional<fs::path>
RefractiveIndexLookup::try_resolve(const MaterialId &id) const {
  if (!id.page.empty()) {
    for (const auto &dir : book_dirs(id)) {
      const fs::path candidate = dir / (id.page + ".yml");
      ULTRAFAST_LOG_DEBUG("Trying {}", candidate.string());
      if (fs::is_regular_file(candidate))
        return candidate;
    }
    return std::nullopt;
  }

  // No page given: accept a book with exactly one page
  std::vector<fs::path> found;
  for (const auto &dir : book_dirs(id)) {
    if (!fs::is_directory(dir))
      continue;
    for (const auto &item : fs::directory_iterator(dir)) {
      if (is_yaml_file(item.path()))
        found.push_back(item.path());
    }
  }
  if (found.size() == 1)
    return found.front();
  if (found.size() > 1) {
    ULTRAFAST_LOG_DEBUG("Book {} has {} pages, a page must be given",
                        id.str(), found.size());
  }
  return std::nullopt;
}

fs::path RefractiveIndexLookup::resolve(const MaterialId &id) const {
  auto path = try_resolve(id);
  if (!path)
    throw NotFoundError(id.str());
  ULTRAFAST_LOG_DEBUG("Resolved {} -> {}", id.str(), path->string());
  return *path;
}

fs::path RefractiveIndexLookup::resolve(const std::string &id) const {
  const fs::path direct(id);
  if (is_yaml_file(direct))
    return direct;
  if (direct.is_relative() && is_yaml_file(root_ / direct))
    return root_ / direct;
  return resolve(MaterialId::parse(id));
}

bool RefractiveIndexLookup::exists(const std::string &id) const {
  try {
    resolve(id);
    return true;
  } catch (const NotFoundError &) {
    return false;
  }
}

CatalogEntry RefractiveIndexLookup::entry(const std::string &id) const {
  return load_catalog_entry(resolve(id));
}

materials::DispersiveMaterial
RefractiveIndexLookup::material(const std::string &id) const {
  const fs::path path = resolve(id);
  const std::string name =
      path.parent_path().filename() == "nk"
          ? path.parent_path().parent_path().filename().string()
          : path.parent_path().filename().string();
  return make_material(load_catalog_entry(path),
                       name + "/" + path.stem().string());
}

std::vector<std::string>
RefractiveIndexLookup::pages(const std::string &shelf,
                             const std::string &book) const {
  MaterialId id;
  id.shelf = shelf;
  id.book = book;
  bool any_dir = false;
  std::set<std::string> names;
  for (const auto &dir : book_dirs(id)) {
    if (!fs::is_directory(dir))
      continue;
    any_dir = true;
    for (const auto &item : fs::directory_iterator(dir)) {
      if (is_yaml_file(item.path()))
        names.insert(item.path().stem().string());
    }
  }
  if (!any_dir)
    throw NotFoundError(id.str());
  return std::vector<std::string>(names.begin(), names.end());
}

} // namespace catalog
} // namespace ultrafast
