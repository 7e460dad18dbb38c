#include "pkg_cache.h"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace kiln {

std::vector<pkg_cache_entry> pkg_cache_candidates(std::filesystem::path const &cache_dir,
                                                  std::string_view name) {
  std::vector<pkg_cache_entry> result;

  std::error_code ec;
  if (!std::filesystem::is_directory(cache_dir, ec)) { return result; }

  std::string const prefix{ pkg_flat_name(name) + "-" };
  constexpr std::string_view kSuffix{ ".tgz" };

  for (auto it{ std::filesystem::directory_iterator{ cache_dir, ec } };
       !ec && it != std::filesystem::directory_iterator{};
       it.increment(ec)) {
    if (!it->is_regular_file(ec)) { continue; }

    std::string const filename{ it->path().filename().string() };
    if (filename.size() <= prefix.size() + kSuffix.size()) { continue; }
    if (filename.compare(0, prefix.size(), prefix) != 0) { continue; }
    if (filename.compare(filename.size() - kSuffix.size(), kSuffix.size(), kSuffix) != 0) {
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(filename[prefix.size()]))) { continue; }

    result.push_back(pkg_cache_entry{
        .name = std::string{ name },
        .artifact = it->path(),
        .version = filename.substr(prefix.size(),
                                   filename.size() - prefix.size() - kSuffix.size()) });
  }

  std::sort(result.begin(), result.end(), [](auto const &a, auto const &b) {
    return a.artifact.filename() < b.artifact.filename();
  });
  return result;
}

std::optional<pkg_cache_entry> pkg_cache_find(std::filesystem::path const &cache_dir,
                                              pkg_request const &request,
                                              bool strict_versions) {
  for (auto &candidate : pkg_cache_candidates(cache_dir, request.name)) {
    if (strict_versions && request.version_constraint &&
        *request.version_constraint != candidate.version) {
      continue;
    }
    return std::move(candidate);
  }
  return std::nullopt;
}

}  // namespace kiln
