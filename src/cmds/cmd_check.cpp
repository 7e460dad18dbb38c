#include "cmd_check.h"
#include "cmd_common.h"

#include "installer.h"
#include "manifest.h"
#include "pkg_manager.h"
#include "plan.h"
#include "preflight.h"
#include "shell.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <vector>

namespace kiln {

void cmd_check::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("check", "Run preflight checks and show the install plan") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_check::cmd_check(cmd_check::cfg cfg,
                     std::optional<std::filesystem::path> const &cli_manifest)
    : cfg_{ std::move(cfg) }, cli_manifest_{ cli_manifest } {}

bool cmd_check::execute() {
  auto const m{ load_manifest_or_throw(cli_manifest_) };
  auto const env{ shell_getenv() };
  auto const manager{ create_pkg_manager(*m, env) };

  auto const findings{ preflight_check(preflight_input{ .m = *m,
                                                        .env = env,
                                                        .pkg_manager_available =
                                                            manager != nullptr,
                                                        .only_phase = std::nullopt }) };
  log_findings(findings);

  std::vector<pkg_request> requests;
  for (auto const &phase : m->phases.phases()) {
    if (!phase.enabled) { continue; }
    for (auto const &u : phase.units) {
      requests.insert(requests.end(),
                      u->required_packages().begin(),
                      u->required_packages().end());
    }
  }

  if (!requests.empty()) {
    tui::print_stdout("Packages (%s):\n",
                      manager ? std::string{ manager->name() }.c_str() : "no manager");
    auto const p{ installer_plan(
        installer_cfg{ .cache_dir = m->install_cfg.cache_dir,
                       .modules_dir = m->install_cfg.modules_dir,
                       .strict_versions = m->install_cfg.strict_versions },
        requests) };
    for (auto const &line : installer_describe_plan(p)) {
      tui::print_stdout("  %s\n", line.c_str());
    }
  }

  if (preflight_has_errors(findings)) {
    tui::error("Preflight failed");
    return false;
  }
  tui::info("Preflight passed (%zu warning(s))", findings.size());
  return true;
}

}  // namespace kiln
