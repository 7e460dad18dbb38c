#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace kiln {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;

  // False when the command ran but its outcome is a failure (exit status 1).
  virtual bool execute() = 0;

  // Create command with the global --manifest override (discovery when absent)
  template <typename config>
  static ptr_t create(config const &cfg,
                      std::optional<std::filesystem::path> const &cli_manifest);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg,
                       std::optional<std::filesystem::path> const &cli_manifest) {
  return std::make_unique<typename config::cmd_t>(cfg, cli_manifest);
}

}  // namespace kiln
