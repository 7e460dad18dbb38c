#pragma once

#include "preflight.h"
#include "shell.h"
#include "state_store.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace kiln {

struct manifest;
class pkg_manager;

std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path);

// First available manager from the manifest's preference list, running inside the
// target directory with the given environment. nullptr when none is installed.
std::unique_ptr<pkg_manager> create_pkg_manager(manifest const &m, shell_env_t const &env);

// Read-only view of the execution history; never creates the log.
std::unique_ptr<state_store> open_state_snapshot(manifest const &m);

// Creates the directory (and parents), throwing std::system_error on failure.
void ensure_directory(std::filesystem::path const &dir);

void log_findings(std::vector<preflight_finding> const &findings);

}  // namespace kiln
