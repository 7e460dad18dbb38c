#include "preflight.h"

#include "platform.h"

#include <algorithm>
#include <system_error>

namespace kiln {

namespace {

// The directory itself, or the closest existing ancestor that would hold it.
bool can_create_or_write(std::filesystem::path dir) {
  std::error_code ec;
  while (!dir.empty() && !std::filesystem::exists(dir, ec)) {
    auto parent{ dir.parent_path() };
    if (parent == dir) { break; }
    dir = std::move(parent);
  }
  return std::filesystem::is_directory(dir, ec) && platform::is_directory_writable(dir);
}

}  // namespace

std::vector<std::string> preflight_missing_commands(std::vector<std::string> const &commands,
                                                    shell_env_t const &env) {
  std::optional<std::string_view> search_path;
  if (auto const it{ env.find("PATH") }; it != env.end()) { search_path = it->second; }

  std::vector<std::string> missing;
  for (auto const &command : commands) {
    if (!platform::find_executable(command, search_path)) { missing.push_back(command); }
  }
  return missing;
}

std::vector<preflight_finding> preflight_check(preflight_input const &input) {
  std::vector<preflight_finding> findings;
  auto const error{ [&](std::string msg) {
    findings.push_back({ finding_severity::error, std::move(msg) });
  } };
  auto const warning{ [&](std::string msg) {
    findings.push_back({ finding_severity::warning, std::move(msg) });
  } };

  bool needs_packages{ false };

  for (auto const &phase : input.m.phases.phases()) {
    if (input.only_phase ? phase.id != *input.only_phase : !phase.enabled) { continue; }

    for (auto const &command : preflight_missing_commands(phase.required_commands, input.env)) {
      std::string msg{ "phase '" + phase.id + "': required command '" + command +
                       "' not found" };
      if (phase.prereq == prereq_mode::strict) {
        error(std::move(msg));
      } else {
        warning(std::move(msg));
      }
    }

    for (auto const &u : phase.units) {
      if (!u->required_packages().empty()) { needs_packages = true; }

      auto const *shell{ dynamic_cast<shell_unit const *>(u.get()) };
      if (!shell || !shell->cfg().script) { continue; }

      auto const &script{ *shell->cfg().script };
      auto const path{ script.is_absolute() ? script : input.m.manifest_dir / script };
      std::error_code ec;
      if (!std::filesystem::is_regular_file(path, ec)) {
        error("unit '" + u->id() + "': script not found: " + path.string());
      }
    }
  }

  if (!can_create_or_write(input.m.target_dir)) {
    error("target directory is not writable: " + input.m.target_dir.string());
  }
  if (!can_create_or_write(input.m.state_dir)) {
    error("state directory is not writable: " + input.m.state_dir.string());
  }

  if (needs_packages) {
    if (!input.pkg_manager_available) {
      std::string tried;
      for (auto const &name : input.m.install_cfg.managers) {
        tried += (tried.empty() ? "" : ", ") + name;
      }
      error("no package manager available (tried " + tried + ")");
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(input.m.install_cfg.cache_dir, ec)) {
      warning("package cache not found at " + input.m.install_cfg.cache_dir.string() +
              "; every package will be fetched from the registry");
    }
  }

  return findings;
}

bool preflight_has_errors(std::vector<preflight_finding> const &findings) {
  return std::any_of(findings.begin(), findings.end(), [](auto const &f) {
    return f.severity == finding_severity::error;
  });
}

}  // namespace kiln
