#include "cmd_status.h"
#include "cmd_common.h"

#include "checkpoint.h"
#include "manifest.h"
#include "plan.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <cstdint>
#include <ctime>
#include <memory>
#include <string>

namespace kiln {

void cmd_status::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("status", "Show setup progress and the resume point") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_flag("--history", cfg_ptr->history, "Print every execution record");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

char const *status_icon(status value) {
  switch (value) {
    case status::completed: return "✓";
    case status::in_progress: return "●";
    case status::failed: return "✗";
    case status::skipped: return "−";
    case status::pending: return " ";
  }
  return "?";
}

plan_progress status_plan_progress(plan const &p, state_store const &store) {
  plan_progress progress{ .done = 0, .total = 0, .percent = 0 };
  for (auto const &id : p.active_unit_ids()) {
    ++progress.total;
    auto const value{ store.status_of(record_kind::script, id) };
    if (value == status::completed || value == status::skipped) { ++progress.done; }
  }
  if (progress.total > 0) {
    progress.percent = static_cast<int>(progress.done * 100 / progress.total);
  }
  return progress;
}

namespace {

std::string format_time(std::int64_t epoch_seconds) {
  std::time_t const t{ static_cast<std::time_t>(epoch_seconds) };
  std::tm local_tm{};
  localtime_r(&t, &local_tm);
  char buf[32]{};
  std::strftime(buf, sizeof buf, "%Y-%m-%d %H:%M:%S", &local_tm);
  return buf;
}

}  // namespace

cmd_status::cmd_status(cmd_status::cfg cfg,
                       std::optional<std::filesystem::path> const &cli_manifest)
    : cfg_{ std::move(cfg) }, cli_manifest_{ cli_manifest } {}

bool cmd_status::execute() {
  auto const m{ load_manifest_or_throw(cli_manifest_) };
  auto const store{ open_state_snapshot(*m) };

  auto const progress{ status_plan_progress(m->phases, *store) };
  tui::print_stdout("Target:   %s\n", m->target_dir.string().c_str());
  tui::print_stdout("Progress: %zu/%zu (%d%%)\n\n",
                    progress.done,
                    progress.total,
                    progress.percent);

  for (auto const &phase : m->phases.phases()) {
    auto const value{ store->status_of(record_kind::phase, phase.id) };
    tui::print_stdout("[%s] %s%s\n",
                      phase.enabled ? status_icon(value) : status_icon(status::skipped),
                      phase.name.c_str(),
                      phase.enabled ? "" : " (disabled)");
    for (auto const &u : phase.units) {
      tui::print_stdout("    [%s] %s\n",
                        status_icon(store->status_of(record_kind::script, u->id())),
                        u->id().c_str());
    }
  }

  if (auto const cp{ checkpoint_manager{ m->checkpoint_file() }.load() }) {
    tui::print_stdout("\nCheckpoint: phase '%s'%s%s%s (saved %s)\n",
                      cp->phase_id.c_str(),
                      cp->unit_id.empty() ? "" : ", unit '",
                      cp->unit_id.c_str(),
                      cp->unit_id.empty() ? "" : "'",
                      format_time(cp->timestamp).c_str());
  }

  if (cfg_.history) {
    tui::print_stdout("\nHistory:\n");
    for (auto const &record : store->records()) {
      tui::print_stdout("  %s  %s\n",
                        format_time(record.timestamp).c_str(),
                        state_format_record(record).c_str());
    }
  }

  return true;
}

}  // namespace kiln
