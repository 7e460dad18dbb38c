#pragma once

#include "pkg_cache.h"
#include "pkg_manager.h"
#include "pkg_request.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace kiln {

// Thrown when one or more packages could not be installed or verified.
class install_error : public std::runtime_error {
 public:
  install_error(std::string const &what, std::vector<std::string> failed);

  std::vector<std::string> const &failed_packages() const { return failed_; }

 private:
  std::vector<std::string> failed_;
};

struct retry_policy {
  int attempts{ 3 };
  std::chrono::milliseconds delay{ 2000 };   // between failed attempts
  std::chrono::milliseconds settle{ 2000 };  // after a successful attempt
};

struct installer_cfg {
  std::filesystem::path cache_dir;
  std::filesystem::path modules_dir;  // e.g. <target>/node_modules
  bool strict_versions{ false };
};

struct install_plan {
  std::vector<std::pair<pkg_request, pkg_cache_entry>> cached;
  std::vector<pkg_request> remote;
};

class installer : unmovable {
 public:
  using sleep_fn_t = std::function<void(std::chrono::milliseconds)>;

  installer(installer_cfg cfg, pkg_manager &manager, sleep_fn_t sleep = {});

  // Partition into cache hits and remote installs. Duplicate names keep the first request.
  install_plan plan(std::vector<pkg_request> const &requests) const;

  // Cached archives one at a time, then all remote packages in one invocation per
  // dependency kind, then verification of every request. Throws install_error naming
  // every package that failed at any step. An empty request list does nothing.
  void install(std::vector<pkg_request> const &requests);

  void install_with_retry(std::vector<pkg_request> const &requests,
                          retry_policy const &policy);

  bool verify(std::string_view package_name) const;

  installer_cfg const &cfg() const { return cfg_; }

 private:
  installer_cfg cfg_;
  pkg_manager &manager_;
  sleep_fn_t sleep_;
};

// Partition without installing anything; the plan install() would follow.
install_plan installer_plan(installer_cfg const &cfg, std::vector<pkg_request> const &requests);

// "[CACHED] zod -> zod-3.22.4.tgz" / "[NETWORK] next@15" lines plus a summary line.
std::vector<std::string> installer_describe_plan(install_plan const &plan);

}  // namespace kiln
