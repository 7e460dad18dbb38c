#pragma once

#include "cmds/cmd_check.h"
#include "cmds/cmd_list.h"
#include "cmds/cmd_reset.h"
#include "cmds/cmd_run.h"
#include "cmds/cmd_status.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kiln {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_check::cfg,
                                 cmd_list::cfg,
                                 cmd_reset::cfg,
                                 cmd_run::cfg,
                                 cmd_status::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<std::filesystem::path> manifest_path;  // Global manifest override
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace kiln
