#include "cmd_list.h"
#include "cmd_common.h"

#include "manifest.h"
#include "pkg_request.h"
#include "plan.h"
#include "tui.h"
#include "unit.h"

#include "CLI/CLI.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace kiln {

void cmd_list::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("list", "List phases and units in execution order") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_list::cmd_list(cmd_list::cfg cfg, std::optional<std::filesystem::path> const &cli_manifest)
    : cfg_{ std::move(cfg) }, cli_manifest_{ cli_manifest } {}

bool cmd_list::execute() {
  auto const m{ load_manifest_or_throw(cli_manifest_) };

  for (auto const &phase : m->phases.phases()) {
    auto const seconds{
      std::chrono::duration_cast<std::chrono::seconds>(phase.timeout).count()
    };
    tui::print_stdout("%s%s (timeout %llds, concurrency %d)\n",
                      phase.id.c_str(),
                      phase.enabled ? "" : " [disabled]",
                      static_cast<long long>(seconds),
                      phase.concurrency);
    if (!phase.description.empty()) {
      tui::print_stdout("  %s\n", phase.description.c_str());
    }
    for (auto const &u : phase.units) {
      std::string packages;
      for (auto const &req : u->required_packages()) {
        packages += packages.empty() ? " [" : ", ";
        packages += pkg_request_spec(req);
      }
      if (!packages.empty()) { packages += "]"; }
      tui::print_stdout("  - %s%s\n", u->id().c_str(), packages.c_str());
    }
  }
  return true;
}

}  // namespace kiln
