#include "cmd_common.h"

#include "manifest.h"
#include "pkg_manager.h"
#include "tui.h"

#include <stdexcept>
#include <system_error>

namespace kiln {

std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path) {
  auto const path{ manifest::find_manifest_path(manifest_path) };
  auto m{ manifest::load(path) };
  if (!m) { throw std::runtime_error("could not load manifest"); }
  return m;
}

std::unique_ptr<pkg_manager> create_pkg_manager(manifest const &m, shell_env_t const &env) {
  return pkg_manager_create(m.install_cfg.managers,
                            pkg_command_cfg{ .project_dir = m.target_dir,
                                             .env = env,
                                             .timeout = m.install_cfg.timeout });
}

std::unique_ptr<state_store> open_state_snapshot(manifest const &m) {
  std::error_code ec;
  if (!std::filesystem::exists(m.state_file(), ec)) {
    if (ec) {
      throw std::system_error(ec, "Failed to stat state file: " + m.state_file().string());
    }
    return std::make_unique<snapshot_state_store>(std::vector<execution_record>{});
  }
  file_state_store const store{ m.state_file() };
  return std::make_unique<snapshot_state_store>(store.records());
}

void ensure_directory(std::filesystem::path const &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) { throw std::system_error(ec, "Failed to create directory: " + dir.string()); }
}

void log_findings(std::vector<preflight_finding> const &findings) {
  for (auto const &finding : findings) {
    if (finding.severity == finding_severity::error) {
      tui::error("%s", finding.message.c_str());
    } else {
      tui::warn("%s", finding.message.c_str());
    }
  }
}

}  // namespace kiln
