#pragma once

#include "installer.h"
#include "plan.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

// Header directives: -- @kiln <key> "<value>"
struct manifest_meta {
  std::optional<std::string> state_dir;
  std::optional<std::string> target;
};

manifest_meta parse_kiln_meta(std::string_view content);

// The INSTALLER global. Relative paths resolve against the target directory.
struct installer_settings {
  std::filesystem::path cache_dir;
  std::filesystem::path modules_dir;
  std::vector<std::string> managers{ "pnpm", "npm" };
  retry_policy retry;
  std::chrono::milliseconds timeout{ std::chrono::seconds{ 600 } };
  bool strict_versions{ false };
};

struct manifest : unmovable {
  std::filesystem::path manifest_path;
  std::filesystem::path manifest_dir;
  std::filesystem::path target_dir;  // default: manifest_dir
  std::filesystem::path state_dir;   // default: <target_dir>/.kiln
  installer_settings install_cfg;
  kiln::plan phases;

  manifest() = default;

  // Explicit path if given, else discovery from the current directory.
  // Returns an absolute path or throws.
  static std::filesystem::path find_manifest_path(
      std::optional<std::filesystem::path> const &explicit_path);

  // Walks up from `start` looking for kiln.lua, stopping at a .git directory.
  static std::optional<std::filesystem::path> discover(std::filesystem::path start);
  static std::optional<std::filesystem::path> discover();

  static std::unique_ptr<manifest> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(std::string_view script,
                                        std::filesystem::path const &manifest_path);

  std::filesystem::path state_file() const { return state_dir / "kiln.state"; }
  std::filesystem::path checkpoint_file() const { return state_dir / "kiln.checkpoint"; }
  std::filesystem::path lock_file() const { return state_dir / "kiln.lock"; }
};

}  // namespace kiln
