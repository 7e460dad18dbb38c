#include "checkpoint.h"

#include "platform.h"
#include "tui.h"
#include "util.h"

#include <cerrno>
#include <charconv>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace kiln {

namespace {

// Accepts `KEY="value"`, `KEY='value'` and bare `KEY=value`.
std::string_view unquote(std::string_view value) {
  if (value.size() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

}  // namespace

std::optional<checkpoint> checkpoint_parse(std::string_view text) {
  std::optional<std::string> phase;
  std::string unit;
  std::int64_t timestamp{ 0 };

  for (auto const raw_line : util_split(text, '\n')) {
    auto const line{ util_trim(raw_line) };
    if (line.empty() || line.front() == '#') { continue; }

    auto const eq{ line.find('=') };
    if (eq == std::string_view::npos) { continue; }

    auto const key{ util_trim(line.substr(0, eq)) };
    auto const value{ unquote(util_trim(line.substr(eq + 1))) };

    if (key == "CHECKPOINT_PHASE") {
      phase = std::string{ value };
    } else if (key == "CHECKPOINT_SCRIPT") {
      unit = std::string{ value };
    } else if (key == "CHECKPOINT_TIMESTAMP") {
      auto const [ptr, ec]{ std::from_chars(value.data(),
                                            value.data() + value.size(),
                                            timestamp) };
      if (ec != std::errc{} || ptr != value.data() + value.size()) { timestamp = 0; }
    }
  }

  if (!phase || phase->empty()) { return std::nullopt; }
  return checkpoint{ .phase_id = std::move(*phase),
                     .unit_id = std::move(unit),
                     .timestamp = timestamp };
}

std::string checkpoint_format(checkpoint const &cp) {
  std::string out;
  out.append("# kiln checkpoint\n");
  out.append("CHECKPOINT_PHASE=\"").append(cp.phase_id).append("\"\n");
  out.append("CHECKPOINT_SCRIPT=\"").append(cp.unit_id).append("\"\n");
  out.append("CHECKPOINT_TIMESTAMP=\"").append(std::to_string(cp.timestamp)).append("\"\n");
  return out;
}

checkpoint_manager::checkpoint_manager(std::filesystem::path path, clock_fn_t clock)
    : path_{ std::move(path) }, clock_{ std::move(clock) } {}

void checkpoint_manager::save(std::string_view phase_id, std::string_view unit_id) {
  if (phase_id.empty()) { throw std::invalid_argument("checkpoint save: empty phase id"); }

  checkpoint const cp{ .phase_id = std::string{ phase_id },
                       .unit_id = std::string{ unit_id },
                       .timestamp = clock_ ? clock_() : util_epoch_seconds() };

  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw std::system_error(ec,
                              "Failed to create checkpoint directory: " +
                                  path_.parent_path().string());
    }
  }

  auto tmp_path{ path_ };
  tmp_path += ".tmp";
  scoped_path_cleanup tmp_cleanup{ tmp_path };

  {
    auto file{ util_open_file(tmp_path, "wb") };
    if (!file) {
      throw std::system_error(errno,
                              std::system_category(),
                              "Failed to create checkpoint file: " + tmp_path.string());
    }
    util_write_durable(file.get(), checkpoint_format(cp), tmp_path);
  }

  platform::atomic_rename(tmp_path, path_);
  tmp_cleanup.reset();
  platform::flush_directory(path_.has_parent_path() ? path_.parent_path()
                                                    : std::filesystem::path{ "." });
}

std::optional<checkpoint> checkpoint_manager::load() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    if (ec) {
      throw std::system_error(ec, "Failed to stat checkpoint file: " + path_.string());
    }
    return std::nullopt;
  }

  auto const text{ util_load_text_file(path_) };
  auto cp{ checkpoint_parse(text) };
  if (!cp) {
    tui::warn("Ignoring malformed checkpoint file %s", path_.c_str());
    return std::nullopt;
  }
  return cp;
}

void checkpoint_manager::clear() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    throw std::system_error(ec, "Failed to remove checkpoint file: " + path_.string());
  }
}

}  // namespace kiln
