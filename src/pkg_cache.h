#pragma once

#include "pkg_request.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

// A pre-fetched package archive, named "<flat-name>-<version>.tgz".
struct pkg_cache_entry {
  std::string name;
  std::filesystem::path artifact;
  std::string version;
};

// All archives in cache_dir for this package name, sorted by file name. The character
// after "<flat-name>-" must be a digit so "react" does not match "react-dom-18.2.0.tgz".
std::vector<pkg_cache_entry> pkg_cache_candidates(std::filesystem::path const &cache_dir,
                                                  std::string_view name);

// First candidate. With strict_versions, a request carrying a constraint only matches a
// candidate whose version equals the constraint exactly.
std::optional<pkg_cache_entry> pkg_cache_find(std::filesystem::path const &cache_dir,
                                              pkg_request const &request,
                                              bool strict_versions);

}  // namespace kiln
