#include "cmd_run.h"
#include "cmd_common.h"

#include "checkpoint.h"
#include "installer.h"
#include "manifest.h"
#include "orchestrator.h"
#include "platform.h"
#include "pkg_manager.h"
#include "preflight.h"
#include "shell.h"
#include "state_store.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace kiln {

namespace {

// Ids never contain ':', so a bare --force cannot collide with a real id.
constexpr char kForceAll[]{ ":all" };

}  // namespace

void cmd_run::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("run", "Run the setup plan, resuming where it stopped") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  auto forced{ std::make_shared<std::vector<std::string>>() };

  sub->add_option("--phase", cfg_ptr->phase, "Run only this phase");
  sub->add_flag("--dry-run", cfg_ptr->dry_run, "Report what would run without running it");
  sub->add_flag(std::string{ "--force{" } + kForceAll + "}",
                *forced,
                "Re-run completed work: everything when bare, or --force=ID for one "
                "phase or unit (repeatable)");

  sub->callback([cfg_ptr, forced, on_selected = std::move(on_selected)] {
    cfg_ptr->force_ids.clear();
    cfg_ptr->force_all = false;
    for (auto const &id : *forced) {
      if (id == kForceAll) {
        cfg_ptr->force_all = true;
      } else if (!id.empty()) {
        cfg_ptr->force_ids.push_back(id);
      }
    }
    on_selected(*cfg_ptr);
  });
}

cmd_run::cmd_run(cmd_run::cfg cfg, std::optional<std::filesystem::path> const &cli_manifest)
    : cfg_{ std::move(cfg) }, cli_manifest_{ cli_manifest } {}

bool cmd_run::execute() {
  auto const m{ load_manifest_or_throw(cli_manifest_) };
  if (cfg_.phase && !m->phases.find_phase(*cfg_.phase)) {
    throw std::runtime_error("Unknown phase: " + *cfg_.phase);
  }

  auto env{ shell_getenv() };
  auto manager{ create_pkg_manager(*m, env) };
  if (manager) {
    tui::debug("Package manager: %.*s",
               static_cast<int>(manager->name().size()),
               manager->name().data());
  }

  auto const findings{ preflight_check(preflight_input{ .m = *m,
                                                        .env = env,
                                                        .pkg_manager_available =
                                                            manager != nullptr,
                                                        .only_phase = cfg_.phase }) };
  log_findings(findings);
  if (preflight_has_errors(findings)) {
    if (!cfg_.dry_run) {
      tui::error("Preflight failed; nothing was run");
      return false;
    }
    tui::warn("Preflight reported errors; continuing because this is a dry run");
  }

  std::unique_ptr<installer> pkg_installer;
  if (manager) {
    pkg_installer = std::make_unique<installer>(
        installer_cfg{ .cache_dir = m->install_cfg.cache_dir,
                       .modules_dir = m->install_cfg.modules_dir,
                       .strict_versions = m->install_cfg.strict_versions },
        *manager);
  }

  unit_context base{ .target_dir = m->target_dir,
                     .state_dir = m->state_dir,
                     .manifest_dir = m->manifest_dir,
                     .phase_id = {},
                     .dry_run = cfg_.dry_run,
                     .forced = false,
                     .pkg_installer = pkg_installer.get(),
                     .retry = m->install_cfg.retry,
                     .env = std::move(env),
                     .timeout = std::nullopt };

  run_options const opts{ .dry_run = cfg_.dry_run,
                          .force_all = cfg_.force_all,
                          .force_ids = cfg_.force_ids,
                          .only_phase = cfg_.phase };

  checkpoint_manager checkpoints{ m->checkpoint_file() };

  run_report report;
  if (cfg_.dry_run) {
    auto store{ open_state_snapshot(*m) };
    orchestrator orch{ m->phases, *store, checkpoints, std::move(base) };
    report = orch.run(opts);
  } else {
    ensure_directory(m->target_dir);
    ensure_directory(m->state_dir);
    platform::file_lock const lock{ m->lock_file() };
    file_state_store store{ m->state_file() };
    orchestrator orch{ m->phases, store, checkpoints, std::move(base) };
    report = orch.run(opts);
  }

  log_run_report(report, cfg_.dry_run);
  return report.ok();
}

void log_run_report(run_report const &report, bool dry_run) {
  double const seconds{ static_cast<double>(report.elapsed.count()) / 1000.0 };

  if (dry_run) {
    for (auto const &id : report.would_execute) { tui::info("  would execute: %s", id.c_str()); }
    tui::info("Dry run: %zu unit(s) would execute, %zu already complete",
              report.would_execute.size(),
              report.skipped);
    return;
  }

  if (!report.ok()) {
    tui::error("Phase '%s' failed at unit '%s': %s",
               report.failed_phase.value_or("?").c_str(),
               report.failed_unit.value_or("-").c_str(),
               report.diagnostic.c_str());
    tui::info("Fix the problem and re-run 'kiln run' to resume");
    return;
  }

  tui::info("Setup complete: %zu executed, %zu skipped (%.1fs)",
            report.executed,
            report.skipped,
            seconds);
}

}  // namespace kiln
