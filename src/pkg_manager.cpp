#include "pkg_manager.h"

#include "platform.h"
#include "tui.h"

#include <stdexcept>

namespace kiln {

std::optional<pkg_tool> pkg_tool_parse(std::string_view name) {
  if (name == "pnpm") { return pkg_tool::pnpm; }
  if (name == "npm") { return pkg_tool::npm; }
  return std::nullopt;
}

char const *pkg_tool_name(pkg_tool tool) {
  switch (tool) {
    case pkg_tool::pnpm: return "pnpm";
    case pkg_tool::npm: return "npm";
  }
  return "unknown";
}

std::vector<std::string> pkg_tool_artifact_argv(pkg_tool tool,
                                                std::filesystem::path const &artifact,
                                                bool dev) {
  switch (tool) {
    case pkg_tool::pnpm:
      return { "pnpm", "add", artifact.string(), dev ? "--save-dev" : "--save" };
    case pkg_tool::npm:
      return { "npm", "install", artifact.string(), dev ? "--save-dev" : "--save" };
  }
  throw std::logic_error("unhandled pkg_tool");
}

std::vector<std::string> pkg_tool_batch_argv(pkg_tool tool,
                                             std::vector<pkg_request> const &requests,
                                             bool dev) {
  std::vector<std::string> argv;
  switch (tool) {
    case pkg_tool::pnpm:
      argv = { "pnpm", "add" };
      if (dev) { argv.emplace_back("-D"); }
      break;
    case pkg_tool::npm:
      argv = { "npm", "install" };
      if (dev) { argv.emplace_back("--save-dev"); }
      break;
  }
  for (auto const &request : requests) { argv.push_back(pkg_request_spec(request)); }
  return argv;
}

pkg_command_manager::pkg_command_manager(pkg_command_cfg cfg) : cfg_{ std::move(cfg) } {}

std::string_view pkg_command_manager::name() const { return pkg_tool_name(cfg_.tool); }

bool pkg_command_manager::install_artifact(std::filesystem::path const &artifact, bool dev) {
  return invoke(pkg_tool_artifact_argv(cfg_.tool, artifact, dev));
}

bool pkg_command_manager::install_batch(std::vector<pkg_request> const &requests, bool dev) {
  if (requests.empty()) { return true; }
  return invoke(pkg_tool_batch_argv(cfg_.tool, requests, dev));
}

bool pkg_command_manager::invoke(std::vector<std::string> const &argv) {
  std::string command_line;
  for (auto const &arg : argv) {
    if (!command_line.empty()) { command_line += ' '; }
    command_line += arg;
  }
  tui::debug("%s", command_line.c_str());

  shell_run_cfg run_cfg{ .on_output_line =
                             [](std::string_view line) {
                               tui::debug("  %.*s", static_cast<int>(line.size()), line.data());
                             },
                         .on_stdout_line = {},
                         .on_stderr_line = {},
                         .cwd = cfg_.project_dir,
                         .env = cfg_.env,
                         .shell = shell_choice::sh,
                         .timeout = cfg_.timeout };

  auto const result{ shell_exec(argv, run_cfg) };
  if (result.exit_code == 0 && !result.signal && !result.timed_out) { return true; }

  tui::warn("%s %s: %s",
            pkg_tool_name(cfg_.tool),
            argv.size() > 1 ? argv[1].c_str() : "",
            shell_describe_result(result).c_str());
  return false;
}

std::optional<pkg_tool> pkg_tool_probe(std::vector<std::string> const &preferred,
                                       shell_env_t const &env) {
  std::optional<std::string_view> search_path;
  if (auto const it{ env.find("PATH") }; it != env.end()) { search_path = it->second; }

  for (auto const &candidate : preferred) {
    auto const tool{ pkg_tool_parse(candidate) };
    if (!tool) {
      throw std::invalid_argument("unsupported package manager '" + candidate +
                                  "' (expected pnpm or npm)");
    }
    if (platform::find_executable(pkg_tool_name(*tool), search_path)) { return tool; }
  }
  return std::nullopt;
}

std::unique_ptr<pkg_manager> pkg_manager_create(std::vector<std::string> const &preferred,
                                                pkg_command_cfg cfg) {
  auto const tool{ pkg_tool_probe(preferred, cfg.env) };
  if (!tool) { return nullptr; }
  cfg.tool = *tool;
  return std::make_unique<pkg_command_manager>(std::move(cfg));
}

}  // namespace kiln
