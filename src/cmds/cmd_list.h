#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace kiln {

class cmd_list : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_list> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_list(cfg cfg, std::optional<std::filesystem::path> const &cli_manifest);

  bool execute() override;

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_manifest_;
};

}  // namespace kiln
