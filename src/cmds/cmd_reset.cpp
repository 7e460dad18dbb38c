#include "cmd_reset.h"
#include "cmd_common.h"

#include "checkpoint.h"
#include "manifest.h"
#include "platform.h"
#include "plan.h"
#include "state_store.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <stdexcept>

namespace kiln {

void cmd_reset::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("reset", "Forget recorded progress") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--phase",
                  cfg_ptr->phase,
                  "Mark one phase and its units pending instead of clearing everything");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_reset::cmd_reset(cmd_reset::cfg cfg,
                     std::optional<std::filesystem::path> const &cli_manifest)
    : cfg_{ std::move(cfg) }, cli_manifest_{ cli_manifest } {}

bool cmd_reset::execute() {
  auto const m{ load_manifest_or_throw(cli_manifest_) };

  phase_def const *phase{ nullptr };
  if (cfg_.phase) {
    phase = m->phases.find_phase(*cfg_.phase);
    if (!phase) { throw std::runtime_error("Unknown phase: " + *cfg_.phase); }
  }

  ensure_directory(m->state_dir);
  platform::file_lock const lock{ m->lock_file() };

  if (phase) {
    file_state_store store{ m->state_file() };
    store.reset_phase(phase->id, phase_unit_ids(*phase));
    tui::info("Phase '%s' reset (%zu unit(s) marked pending)",
              phase->id.c_str(),
              phase->units.size());
    return true;
  }

  file_state_store::remove(m->state_file());
  checkpoint_manager{ m->checkpoint_file() }.clear();
  tui::info("All progress cleared");
  return true;
}

}  // namespace kiln
