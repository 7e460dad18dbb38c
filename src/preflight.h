#pragma once

#include "manifest.h"
#include "shell.h"

#include <optional>
#include <string>
#include <vector>

namespace kiln {

enum class finding_severity { warning, error };

struct preflight_finding {
  finding_severity severity;
  std::string message;
};

struct preflight_input {
  manifest const &m;
  shell_env_t const &env;
  bool pkg_manager_available;
  std::optional<std::string> only_phase;
};

// Environment checks for the phases that would run: required commands, script files,
// a writable target directory, and a package manager when any unit needs packages.
std::vector<preflight_finding> preflight_check(preflight_input const &input);

bool preflight_has_errors(std::vector<preflight_finding> const &findings);

// Commands not found on PATH (taken from env when it carries one).
std::vector<std::string> preflight_missing_commands(std::vector<std::string> const &commands,
                                                    shell_env_t const &env);

}  // namespace kiln
