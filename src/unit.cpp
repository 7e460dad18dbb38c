#include "unit.h"

#include "tui.h"

#include <stdexcept>
#include <system_error>

namespace kiln {

namespace {

void log_output_line(std::string_view line) {
  tui::debug("  %.*s", static_cast<int>(line.size()), line.data());
}

std::string join_specs(std::vector<pkg_request> const &packages) {
  std::string out;
  for (auto const &request : packages) {
    if (!out.empty()) { out += ' '; }
    out += pkg_request_spec(request);
  }
  return out;
}

}  // namespace

unit::unit(std::string id, std::string phase_id, std::vector<pkg_request> packages)
    : id_{ std::move(id) }, phase_id_{ std::move(phase_id) }, packages_{ std::move(packages) } {}

shell_env_t unit_environment(unit const &u, unit_context const &ctx) {
  shell_env_t env{ ctx.env };
  env["KILN_TARGET_DIR"] = ctx.target_dir.string();
  env["KILN_STATE_DIR"] = ctx.state_dir.string();
  env["KILN_UNIT_ID"] = u.id();
  env["KILN_PHASE_ID"] = u.phase_id();
  env["KILN_FORCE"] = ctx.forced ? "1" : "0";
  return env;
}

shell_unit::shell_unit(shell_unit_cfg cfg)
    : unit{ cfg.id, cfg.phase_id, cfg.packages }, cfg_{ std::move(cfg) } {
  if (cfg_.run.has_value() == cfg_.script.has_value()) {
    throw std::invalid_argument("unit '" + cfg_.id + "' needs exactly one of 'run' or 'script'");
  }
}

unit_result shell_unit::execute(unit_context const &ctx) {
  if (ctx.dry_run) { return unit_result::skipped("dry run"); }

  std::filesystem::path cwd{ ctx.target_dir };
  if (cfg_.cwd) { cwd = cfg_.cwd->is_absolute() ? *cfg_.cwd : ctx.target_dir / *cfg_.cwd; }

  shell_run_cfg run_cfg{ .on_output_line = log_output_line,
                         .on_stdout_line = {},
                         .on_stderr_line = {},
                         .cwd = cwd,
                         .env = unit_environment(*this, ctx),
                         .shell = cfg_.shell,
                         .timeout = cfg_.timeout ? cfg_.timeout : ctx.timeout };

  if (cfg_.check && !ctx.forced) {
    auto const probe{ shell_run(*cfg_.check, run_cfg) };
    if (probe.exit_code == 0 && !probe.signal && !probe.timed_out) {
      return unit_result::skipped("check passed");
    }
    tui::debug("%s: check %s, running", id().c_str(), shell_describe_result(probe).c_str());
  }

  if (!required_packages().empty()) {
    if (!ctx.pkg_installer) {
      return unit_result::failed("no package manager available to install: " +
                                 join_specs(required_packages()));
    }
    try {
      ctx.pkg_installer->install_with_retry(required_packages(), ctx.retry);
    } catch (install_error const &e) {
      return unit_result::failed(e.what());
    }
  }

  std::string body;
  if (cfg_.run) {
    body = *cfg_.run;
  } else {
    auto const path{ cfg_.script->is_absolute() ? *cfg_.script : ctx.manifest_dir / *cfg_.script };
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      return unit_result::failed("script not found: " + path.string());
    }
    body = util_load_text_file(path);
  }

  auto const result{ shell_run(body, run_cfg) };
  if (result.exit_code == 0 && !result.signal && !result.timed_out) {
    return unit_result::completed();
  }
  return unit_result::failed(shell_describe_result(result));
}

}  // namespace kiln
