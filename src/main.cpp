#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  kiln::tui::init();

  auto args{ kiln::cli_parse(argc, argv) };
  kiln::tui::configure_trace_outputs(args.trace_outputs);
  kiln::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      kiln::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    kiln::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  bool ok{ false };
  try {
    auto cmd{ std::visit(
        [&args](auto const &cfg) { return kiln::cmd::create(cfg, args.manifest_path); },
        *args.cmd_cfg) };
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    kiln::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
