#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace kiln {

struct run_report;

class cmd_run : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_run> {
    std::optional<std::string> phase;
    bool dry_run{ false };
    bool force_all{ false };
    std::vector<std::string> force_ids;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_run(cfg cfg, std::optional<std::filesystem::path> const &cli_manifest);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_manifest_;
};

// Operator-facing recap of a finished run.
void log_run_report(run_report const &report, bool dry_run);

}  // namespace kiln
