#pragma once

#include "installer.h"
#include "pkg_request.h"
#include "shell.h"
#include "state_store.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

struct unit_result {
  status value;  // completed, failed or skipped
  std::string diagnostic;

  static unit_result completed() { return { status::completed, {} }; }
  static unit_result failed(std::string why) { return { status::failed, std::move(why) }; }
  static unit_result skipped(std::string why) { return { status::skipped, std::move(why) }; }
};

// Everything a unit may depend on; units read no process-wide state.
struct unit_context {
  std::filesystem::path target_dir;
  std::filesystem::path state_dir;
  std::filesystem::path manifest_dir;  // base for relative script paths
  std::string phase_id;
  bool dry_run{ false };
  bool forced{ false };
  installer *pkg_installer{ nullptr };  // null when no package manager is available
  retry_policy retry;
  shell_env_t env;
  std::optional<std::chrono::milliseconds> timeout;
};

// One idempotent setup step. Identity is fixed at construction.
class unit : unmovable {
 public:
  using ptr_t = std::unique_ptr<unit>;

  virtual ~unit() = default;

  std::string const &id() const { return id_; }
  std::string const &phase_id() const { return phase_id_; }
  std::vector<pkg_request> const &required_packages() const { return packages_; }

  // Failures are reported in the result; an exception is treated as a failure by the
  // orchestrator.
  virtual unit_result execute(unit_context const &ctx) = 0;

 protected:
  unit(std::string id, std::string phase_id, std::vector<pkg_request> packages);

 private:
  std::string id_;
  std::string phase_id_;
  std::vector<pkg_request> packages_;
};

struct shell_unit_cfg {
  std::string id;
  std::string phase_id;
  std::optional<std::string> run;               // inline script text
  std::optional<std::filesystem::path> script;  // relative to the manifest directory
  std::optional<std::string> check;             // exit 0 means already done
  std::vector<pkg_request> packages;
  std::optional<std::filesystem::path> cwd;     // relative to the target directory
  std::optional<std::chrono::milliseconds> timeout;
  shell_choice shell{ shell_choice::bash };
};

class shell_unit final : public unit {
 public:
  // Throws std::invalid_argument unless exactly one of run/script is set.
  explicit shell_unit(shell_unit_cfg cfg);

  unit_result execute(unit_context const &ctx) override;

  shell_unit_cfg const &cfg() const { return cfg_; }

 private:
  shell_unit_cfg cfg_;
};

// KILN_TARGET_DIR, KILN_STATE_DIR, KILN_UNIT_ID, KILN_PHASE_ID, KILN_FORCE on top of ctx.env.
shell_env_t unit_environment(unit const &u, unit_context const &ctx);

}  // namespace kiln
