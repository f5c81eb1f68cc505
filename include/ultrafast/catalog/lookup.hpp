#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ultrafast/catalog/catalog_entry.hpp"
#include "ultrafast/materials/dispersive.hpp"

namespace ultrafast {
namespace catalog {

/// RefractiveIndex.info address of a material page: shelf / book / page,
/// e.g. main / SiO2 / Malitson.
struct MaterialId {
  std::string shelf = "main";
  std::string book;
  std::string page; ///< May be empty when the book has a single page

  /// Parse "shelf/book/page", "book/page" or "book". A trailing '/' marks a
  /// book without a page ("shelf/book/", "book/").
  /// @throws NotFoundError for an empty or malformed identifier, including
  ///         empty segments
  static MaterialId parse(const std::string &id);

  std::string str() const;
};

/// Read-only client over a local mirror of the RefractiveIndex.info
/// database.
///
/// Pages are looked up under the mirror root at
///   data/<shelf>/<book>/<page>.yml
///   data/<shelf>/<book>/nk/<page>.yml
///   <shelf>/<book>/<page>.yml
/// in that order. Nothing is cached; every call reads the file again.
class RefractiveIndexLookup {
public:
  /// @throws NotFoundError if root is not a directory
  explicit RefractiveIndexLookup(std::filesystem::path root);

  const std::filesystem::path &root() const { return root_; }

  /// Resolve an identifier to a page file. A string naming an existing
  /// .yml file is returned as is.
  /// @throws NotFoundError if nothing matches
  std::filesystem::path resolve(const std::string &id) const;
  std::filesystem::path resolve(const MaterialId &id) const;

  bool exists(const std::string &id) const;

  /// @throws NotFoundError, ParseError
  CatalogEntry entry(const std::string &id) const;

  /// Material named "<book>/<page>".
  /// @throws NotFoundError, ParseError, ConfigurationError
  materials::DispersiveMaterial material(const std::string &id) const;

  /// Page names available for a book, sorted.
  /// @throws NotFoundError if the book does not exist
  std::vector<std::string> pages(const std::string &shelf,
                                 const std::string &book) const;

private:
  std::vector<std::filesystem::path> book_dirs(const MaterialId &id) const;
  std::optional<std::filesystem::path>
  try_resolve(const MaterialId &id) const;

  std::filesystem::path root_;
};

} // namespace catalog
} // namespace ultrafast
