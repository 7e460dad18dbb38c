#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace kiln {

class cmd_reset : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_reset> {
    std::optional<std::string> phase;  // reset only this phase's records
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_reset(cfg cfg, std::optional<std::filesystem::path> const &cli_manifest);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_manifest_;
};

}  // namespace kiln
