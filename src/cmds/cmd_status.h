#pragma once

#include "cmd.h"
#include "state_store.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace kiln {

class cmd_status : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_status> {
    bool history{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_status(cfg cfg, std::optional<std::filesystem::path> const &cli_manifest);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_manifest_;
};

class plan;

// "✓" completed, "●" in progress, "✗" failed, "−" skipped, " " pending.
char const *status_icon(status value);

struct plan_progress {
  std::size_t done;
  std::size_t total;
  int percent;
};

// Completed or skipped units among the plan's enabled phases.
plan_progress status_plan_progress(plan const &p, state_store const &store);

}  // namespace kiln
