#include "manifest.h"

#include "platform.h"
#include "shell.h"
#include "sol_util.h"
#include "tui.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <stdexcept>

namespace kiln {

namespace {

size_t skip_whitespace(std::string_view s, size_t pos) {
  while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) { ++pos; }
  return pos;
}

std::string_view parse_identifier(std::string_view s, size_t &pos) {
  size_t const start{ pos };
  while ((pos < s.size()) && (std::isalnum(static_cast<unsigned char>(s[pos])) ||
                              s[pos] == '_' || s[pos] == '-')) {
    ++pos;
  }
  return s.substr(start, pos - start);
}

// Expects pos at the opening quote; leaves it past the closing quote
std::optional<std::string> parse_quoted_value(std::string_view s, size_t &pos) {
  if (pos >= s.size() || s[pos] != '"') { return std::nullopt; }
  ++pos;

  std::string result;
  while (pos < s.size() && s[pos] != '"') {
    if (s[pos] == '\\' && pos + 1 < s.size() && (s[pos + 1] == '"' || s[pos + 1] == '\\')) {
      result += s[pos + 1];
      pos += 2;
      continue;
    }
    result += s[pos++];
  }

  if (pos >= s.size()) { return std::nullopt; }
  ++pos;
  return result;
}

std::optional<std::pair<std::string, std::string>> parse_directive_line(
    std::string_view line) {
  constexpr std::string_view kTag{ "@kiln" };

  size_t pos{ skip_whitespace(line, 0) };
  if (line.substr(pos, 2) != "--") { return std::nullopt; }
  pos = skip_whitespace(line, pos + 2);

  if (line.substr(pos, kTag.size()) != kTag) { return std::nullopt; }
  pos += kTag.size();

  if (pos >= line.size() || (line[pos] != ' ' && line[pos] != '\t')) {
    return std::nullopt;
  }
  pos = skip_whitespace(line, pos);

  auto const key{ parse_identifier(line, pos) };
  if (key.empty()) { return std::nullopt; }

  pos = skip_whitespace(line, pos);
  auto const value{ parse_quoted_value(line, pos) };
  if (!value) { return std::nullopt; }

  return std::make_pair(std::string{ key }, *value);
}

void reject_unknown_fields(sol::table const &table,
                           std::initializer_list<std::string_view> known,
                           std::string const &context) {
  for (auto const &[key, value] : table) {
    if (key.get_type() != sol::type::string) {
      throw std::runtime_error(context + ": unexpected array entry");
    }
    auto const name{ key.as<std::string>() };
    if (std::find(known.begin(), known.end(), name) == known.end()) {
      throw std::runtime_error(context + ": unknown field '" + name + "'");
    }
  }
}

constexpr double kMaxTimeoutSeconds{ 7 * 24 * 60 * 60 };  // one week

std::optional<std::chrono::milliseconds> get_seconds(sol::table const &table,
                                                     std::string_view key,
                                                     std::string const &context) {
  auto const seconds{ sol_util_get_optional<double>(table, key, context) };
  if (!seconds) { return std::nullopt; }
  if (!(*seconds > 0.0) || !std::isfinite(*seconds)) {
    throw std::runtime_error(context + ": " + std::string{ key } + " must be positive");
  }
  if (*seconds > kMaxTimeoutSeconds) {
    throw std::runtime_error(context + ": " + std::string{ key } + " must not exceed " +
                             std::to_string(static_cast<long>(kMaxTimeoutSeconds)) +
                             " seconds");
  }
  return std::chrono::milliseconds{ static_cast<std::int64_t>(std::llround(*seconds * 1000.0)) };
}

std::filesystem::path resolve(std::filesystem::path const &base, std::string const &value) {
  auto const expanded{ platform::expand_path(value) };
  return (expanded.is_absolute() ? expanded : base / expanded).lexically_normal();
}

std::vector<pkg_request> parse_packages(sol::table const &unit_table, std::string const &context) {
  std::vector<pkg_request> result;

  auto const add_list{ [&](std::string_view key, bool dev) {
    sol::object const raw{ unit_table[key] };
    if (raw.get_type() == sol::type::lua_nil) { return; }
    if (raw.get_type() != sol::type::table) {
      throw std::runtime_error(context + ": " + std::string{ key } + " must be a table");
    }

    sol::table list{ raw.as<sol::table>() };
    for (std::size_t i{ 1 }; i <= list.size(); ++i) {
      sol::object const item{ list[i] };
      std::string const item_context{ context + ": " + std::string{ key } + "[" +
                                      std::to_string(i) + "]" };
      try {
        if (item.get_type() == sol::type::string) {
          result.push_back(pkg_request_parse(item.as<std::string>(), dev));
        } else if (item.get_type() == sol::type::table) {
          sol::table const entry{ item.as<sol::table>() };
          reject_unknown_fields(entry, { "name", "version", "dev" }, item_context);
          auto request{ pkg_request_parse(
              sol_util_get_required<std::string>(entry, "name", item_context),
              sol_util_get_or_default<bool>(entry, "dev", dev, item_context)) };
          if (auto version{ sol_util_get_optional<std::string>(entry, "version", item_context) }) {
            request.version_constraint = std::move(*version);
          }
          result.push_back(std::move(request));
        } else {
          throw std::runtime_error(item_context + " must be a string or a table");
        }
      } catch (std::invalid_argument const &e) {
        throw std::runtime_error(item_context + ": " + e.what());
      }
    }
  } };

  add_list("packages", false);
  add_list("dev_packages", true);
  return result;
}

shell_unit_cfg parse_unit(sol::table const &t,
                          std::string const &phase_id,
                          std::size_t index) {
  std::string const position{ "phase '" + phase_id + "' unit " + std::to_string(index) };
  auto id{ sol_util_get_required<std::string>(t, "id", position) };
  std::string const context{ "unit '" + id + "'" };

  reject_unknown_fields(t,
                        { "id", "run", "script", "check", "packages", "dev_packages", "cwd",
                          "timeout", "shell" },
                        context);

  shell_unit_cfg cfg{ .id = std::move(id),
                      .phase_id = phase_id,
                      .run = sol_util_get_optional<std::string>(t, "run", context),
                      .script = std::nullopt,
                      .check = sol_util_get_optional<std::string>(t, "check", context),
                      .packages = parse_packages(t, context),
                      .cwd = std::nullopt,
                      .timeout = get_seconds(t, "timeout", context),
                      .shell = shell_choice::bash };

  if (auto script{ sol_util_get_optional<std::string>(t, "script", context) }) {
    cfg.script = std::filesystem::path{ *script };
  }
  if (auto cwd{ sol_util_get_optional<std::string>(t, "cwd", context) }) {
    cfg.cwd = std::filesystem::path{ *cwd };
  }
  try {
    cfg.shell = shell_parse_choice(sol_util_get_optional<std::string>(t, "shell", context));
  } catch (std::invalid_argument const &e) {
    throw std::runtime_error(context + ": " + e.what());
  }
  return cfg;
}

phase_def parse_phase(sol::table const &t, std::size_t index) {
  auto id{ sol_util_get_required<std::string>(t, "id", "PHASES[" + std::to_string(index) + "]") };
  std::string const context{ "phase '" + id + "'" };

  reject_unknown_fields(t,
                        { "id", "name", "description", "enabled", "timeout", "concurrency",
                          "requires", "prereq", "units" },
                        context);

  phase_def def{ .id = std::move(id),
                 .name = sol_util_get_or_default<std::string>(t, "name", "", context),
                 .description = sol_util_get_or_default<std::string>(t, "description", "", context),
                 .enabled = sol_util_get_or_default<bool>(t, "enabled", true, context),
                 .required_commands = sol_util_get_string_list(t, "requires", context) };

  if (auto timeout{ get_seconds(t, "timeout", context) }) { def.timeout = *timeout; }
  def.concurrency = sol_util_get_or_default<int>(t, "concurrency", 1, context);

  auto const prereq{ sol_util_get_or_default<std::string>(t, "prereq", "strict", context) };
  if (prereq == "strict") {
    def.prereq = prereq_mode::strict;
  } else if (prereq == "warn") {
    def.prereq = prereq_mode::warn;
  } else {
    throw std::runtime_error(context + ": prereq must be 'strict' or 'warn'");
  }
  return def;
}

installer_settings parse_installer(sol::state &lua, std::filesystem::path const &target_dir) {
  installer_settings settings{ .cache_dir = target_dir / ".download-cache" / "npm",
                               .modules_dir = target_dir / "node_modules" };

  sol::object const obj{ lua["INSTALLER"] };
  if (obj.get_type() == sol::type::lua_nil) { return settings; }
  if (obj.get_type() != sol::type::table) {
    throw std::runtime_error("INSTALLER must be a table");
  }

  sol::table const t{ obj.as<sol::table>() };
  std::string const context{ "INSTALLER" };
  reject_unknown_fields(t,
                        { "cache_dir", "modules_dir", "managers", "attempts", "delay_ms",
                          "settle_ms", "timeout", "strict_versions" },
                        context);

  if (auto dir{ sol_util_get_optional<std::string>(t, "cache_dir", context) }) {
    settings.cache_dir = resolve(target_dir, *dir);
  }
  if (auto dir{ sol_util_get_optional<std::string>(t, "modules_dir", context) }) {
    settings.modules_dir = resolve(target_dir, *dir);
  }
  if (auto managers{ sol_util_get_string_list(t, "managers", context) }; !managers.empty()) {
    for (auto const &name : managers) {
      if (!pkg_tool_parse(name)) {
        throw std::runtime_error(context + ": unsupported package manager '" + name + "'");
      }
    }
    settings.managers = std::move(managers);
  }

  settings.retry.attempts = sol_util_get_or_default<int>(t, "attempts", 3, context);
  if (settings.retry.attempts < 1) {
    throw std::runtime_error(context + ": attempts must be at least 1");
  }

  auto const delay_ms{ sol_util_get_or_default<int>(t, "delay_ms", 2000, context) };
  auto const settle_ms{ sol_util_get_or_default<int>(t, "settle_ms", 2000, context) };
  if (delay_ms < 0 || settle_ms < 0) {
    throw std::runtime_error(context + ": delay_ms and settle_ms must not be negative");
  }
  settings.retry.delay = std::chrono::milliseconds{ delay_ms };
  settings.retry.settle = std::chrono::milliseconds{ settle_ms };

  if (auto timeout{ get_seconds(t, "timeout", context) }) { settings.timeout = *timeout; }
  settings.strict_versions = sol_util_get_or_default<bool>(t, "strict_versions", false, context);
  return settings;
}

}  // namespace

manifest_meta parse_kiln_meta(std::string_view content) {
  manifest_meta result;

  for (auto const line : util_split(content, '\n')) {
    if (auto const directive{ parse_directive_line(line) }) {
      auto const &[key, value]{ *directive };
      if (key == "state-dir") {
        result.state_dir = value;
      } else if (key == "target") {
        result.target = value;
      } else {
        tui::warn("Ignoring unknown directive '@kiln %s'", key.c_str());
      }
    }
  }

  return result;
}

std::optional<std::filesystem::path> manifest::discover(std::filesystem::path start) {
  namespace fs = std::filesystem;

  auto cur{ fs::absolute(start) };
  for (;;) {
    auto const manifest_path{ cur / "kiln.lua" };
    if (fs::exists(manifest_path)) { return manifest_path; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

std::optional<std::filesystem::path> manifest::discover() {
  return discover(std::filesystem::current_path());
}

std::filesystem::path manifest::find_manifest_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw std::runtime_error("manifest not found: " + path.string());
    }
    return path;
  }

  if (auto const discovered{ discover() }) { return *discovered; }
  throw std::runtime_error("manifest not found: no kiln.lua in this directory or its parents");
}

std::unique_ptr<manifest> manifest::load(std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest from file: %s", manifest_path.string().c_str());
  return load(util_load_text_file(manifest_path), manifest_path);
}

std::unique_ptr<manifest> manifest::load(std::string_view script,
                                         std::filesystem::path const &manifest_path) {
  auto const meta{ parse_kiln_meta(script) };

  auto state{ sol_util_make_lua_state() };
  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error, "@" + manifest_path.string()) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error(std::string("Failed to execute manifest script: ") + err.what());
  }

  auto m{ std::make_unique<manifest>() };
  m->manifest_path = std::filesystem::absolute(manifest_path).lexically_normal();
  m->manifest_dir = m->manifest_path.parent_path();
  m->target_dir = meta.target ? resolve(m->manifest_dir, *meta.target) : m->manifest_dir;
  m->state_dir = meta.state_dir ? resolve(m->manifest_dir, *meta.state_dir)
                                : m->target_dir / ".kiln";

  sol::object const phases_obj{ (*state)["PHASES"] };
  if (!phases_obj.valid() || phases_obj.get_type() != sol::type::table) {
    throw std::runtime_error("Manifest must define 'PHASES' global as a table");
  }

  try {
    m->install_cfg = parse_installer(*state, m->target_dir);

    plan_builder builder;
    sol::table phases_table{ phases_obj.as<sol::table>() };
    for (std::size_t i{ 1 }; i <= phases_table.size(); ++i) {
      sol::object const phase_obj{ phases_table[i] };
      if (phase_obj.get_type() != sol::type::table) {
        throw std::runtime_error("PHASES[" + std::to_string(i) + "] must be a table");
      }
      sol::table const phase_table{ phase_obj.as<sol::table>() };
      auto def{ parse_phase(phase_table, i) };
      std::string const phase_id{ def.id };
      builder.phase(std::move(def));

      sol::object const units_obj{ phase_table["units"] };
      if (units_obj.get_type() == sol::type::lua_nil) { continue; }
      if (units_obj.get_type() != sol::type::table) {
        throw std::runtime_error("phase '" + phase_id + "': units must be a table");
      }

      sol::table units_table{ units_obj.as<sol::table>() };
      for (std::size_t j{ 1 }; j <= units_table.size(); ++j) {
        sol::object const unit_obj{ units_table[j] };
        if (unit_obj.get_type() != sol::type::table) {
          throw std::runtime_error("phase '" + phase_id + "' unit " + std::to_string(j) +
                                   " must be a table");
        }
        builder.unit(std::make_unique<shell_unit>(
            parse_unit(unit_obj.as<sol::table>(), phase_id, j)));
      }
    }
    m->phases = builder.build();
  } catch (std::logic_error const &e) {
    throw std::runtime_error(m->manifest_path.string() + ": " + e.what());
  }

  tui::debug("Loaded %zu phases from %s",
             m->phases.phases().size(),
             m->manifest_path.string().c_str());
  return m;
}

}  // namespace kiln
