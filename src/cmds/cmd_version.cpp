#include "cmd_version.h"

#include "tui.h"

#include "CLI/CLI.hpp"
#include "sol/sol.hpp"
#include "tbb/version.h"

#include <memory>

#ifndef KILN_VERSION_STR
#error "KILN_VERSION_STR must be defined by the build system"
#endif

namespace kiln {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg,
                         std::optional<std::filesystem::path> const & /*cli_manifest*/)
    : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("kiln version %s", KILN_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  oneTBB: %s (runtime %s)", TBB_VERSION_STRING, TBB_runtime_version());
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace kiln
