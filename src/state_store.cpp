#include "state_store.h"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <ctime>
#include <set>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace kiln {

char const *status_name(status value) {
  switch (value) {
    case status::pending: return "pending";
    case status::in_progress: return "in_progress";
    case status::completed: return "completed";
    case status::failed: return "failed";
    case status::skipped: return "skipped";
  }
  return "unknown";
}

std::optional<status> status_parse(std::string_view text) {
  if (text == "pending") { return status::pending; }
  if (text == "in_progress") { return status::in_progress; }
  if (text == "completed") { return status::completed; }
  if (text == "failed") { return status::failed; }
  if (text == "skipped") { return status::skipped; }
  return std::nullopt;
}

bool status_is_terminal(status value) {
  return value == status::completed || value == status::failed ||
         value == status::skipped;
}

char const *record_kind_name(record_kind kind) {
  switch (kind) {
    case record_kind::script: return "SCRIPT";
    case record_kind::phase: return "PHASE";
  }
  return "UNKNOWN";
}

std::optional<execution_record> state_parse_line(std::string_view line) {
  line = util_trim(line);
  if (line.empty() || line.front() == '#') { return std::nullopt; }

  auto const fields{ util_split(line, ':') };
  if (fields.size() != 4) { return std::nullopt; }

  execution_record record{};
  if (fields[0] == "SCRIPT") {
    record.kind = record_kind::script;
  } else if (fields[0] == "PHASE") {
    record.kind = record_kind::phase;
  } else {
    return std::nullopt;
  }

  if (fields[1].empty()) { return std::nullopt; }
  record.key = std::string{ fields[1] };

  auto const parsed_status{ status_parse(fields[2]) };
  if (!parsed_status) { return std::nullopt; }
  record.value = *parsed_status;

  auto const ts{ fields[3] };
  auto const [ptr, ec]{ std::from_chars(ts.data(), ts.data() + ts.size(), record.timestamp) };
  if (ec != std::errc{} || ptr != ts.data() + ts.size()) { return std::nullopt; }

  return record;
}

std::string state_format_record(execution_record const &record) {
  std::string line{ record_kind_name(record.kind) };
  line.push_back(':');
  line.append(record.key);
  line.push_back(':');
  line.append(status_name(record.value));
  line.push_back(':');
  line.append(std::to_string(record.timestamp));
  return line;
}

void state_store::mark_in_progress(std::string_view unit_id) {
  append(record_kind::script, unit_id, status::in_progress);
}

void state_store::mark_result(std::string_view unit_id, status result) {
  if (!status_is_terminal(result)) {
    throw std::invalid_argument(std::string{ "mark_result: non-terminal status '" } +
                                status_name(result) + "' for " + std::string{ unit_id });
  }
  append(record_kind::script, unit_id, result);
}

bool state_store::has_completed(std::string_view unit_id) const {
  return status_of(record_kind::script, unit_id) == status::completed;
}

void state_store::mark_phase(std::string_view phase_id, status value) {
  append(record_kind::phase, phase_id, value);
}

bool state_store::phase_completed(std::string_view phase_id) const {
  return status_of(record_kind::phase, phase_id) == status::completed;
}

status state_store::status_of(record_kind kind, std::string_view key) const {
  std::optional<execution_record> latest;
  for (auto &record : records()) {
    if (record.kind != kind || record.key != key) { continue; }
    if (!latest || record.timestamp >= latest->timestamp) { latest = std::move(record); }
  }
  return latest ? latest->value : status::pending;
}

progress_counts state_store::progress() const {
  auto const all{ records() };

  std::set<std::string> keys;
  for (auto const &record : all) {
    if (record.kind == record_kind::script) { keys.insert(record.key); }
  }

  progress_counts counts{ .done = 0, .total = keys.size() };
  for (auto const &key : keys) {
    execution_record const *latest{ nullptr };
    for (auto const &record : all) {
      if (record.kind != record_kind::script || record.key != key) { continue; }
      if (!latest || record.timestamp >= latest->timestamp) { latest = &record; }
    }
    if (latest &&
        (latest->value == status::completed || latest->value == status::skipped)) {
      ++counts.done;
    }
  }

  return counts;
}

void state_store::reset_phase(std::string_view phase_id,
                              std::vector<std::string> const &unit_ids) {
  for (auto const &unit_id : unit_ids) {
    append(record_kind::script, unit_id, status::pending);
  }
  append(record_kind::phase, phase_id, status::pending);
}

namespace {

std::string make_header(std::int64_t timestamp) {
  std::time_t const t{ static_cast<std::time_t>(timestamp) };
  std::tm local_tm{};
  localtime_r(&t, &local_tm);
  char generated[32]{};
  std::strftime(generated, sizeof generated, "%Y-%m-%d %H:%M:%S", &local_tm);

  std::string header;
  header.append("# kiln execution state\n");
  header.append("# Generated: ").append(generated).append("\n");
  header.append("# Format: KIND:KEY:STATUS:TIMESTAMP\n");
  header.append("#   KIND: SCRIPT or PHASE\n");
  header.append("#   STATUS: pending, in_progress, completed, failed, skipped\n");
  header.append("STATE:initialized:").append(std::to_string(timestamp)).append("\n");
  return header;
}

}  // namespace

file_state_store::file_state_store(std::filesystem::path path, clock_fn_t clock)
    : path_{ std::move(path) }, clock_{ std::move(clock) } {
  std::error_code ec;
  bool const exists{ std::filesystem::exists(path_, ec) };
  if (ec) {
    throw std::system_error(ec, "Failed to stat state file: " + path_.string());
  }
  if (exists) { return; }

  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw std::system_error(ec,
                              "Failed to create state directory: " +
                                  path_.parent_path().string());
    }
  }

  auto file{ util_open_file(path_, "ab") };
  if (!file) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to create state file: " + path_.string());
  }
  util_write_durable(file.get(), make_header(now()), path_);
}

std::int64_t file_state_store::now() const {
  return clock_ ? clock_() : util_epoch_seconds();
}

void file_state_store::append(record_kind kind, std::string_view key, status value) {
  if (key.empty() || key.find_first_of(":\r\n") != std::string_view::npos) {
    throw std::invalid_argument("Invalid state key: '" + std::string{ key } + "'");
  }

  auto const line{ state_format_record(execution_record{
                       .kind = kind,
                       .key = std::string{ key },
                       .value = value,
                       .timestamp = now() }) +
                   "\n" };

  auto file{ util_open_file(path_, "ab") };
  if (!file) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open state file for append: " + path_.string());
  }
  util_write_durable(file.get(), line, path_);
}

std::vector<execution_record> file_state_store::records() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    if (ec) { throw std::system_error(ec, "Failed to stat state file: " + path_.string()); }
    return {};
  }

  auto const text{ util_load_text_file(path_) };

  std::vector<execution_record> result;
  for (auto const line : util_split(text, '\n')) {
    if (auto record{ state_parse_line(line) }) { result.push_back(std::move(*record)); }
  }
  return result;
}

void file_state_store::remove(std::filesystem::path const &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) { throw std::system_error(ec, "Failed to remove state file: " + path.string()); }
}

snapshot_state_store::snapshot_state_store(std::vector<execution_record> records)
    : records_{ std::move(records) } {}

void snapshot_state_store::append(record_kind kind, std::string_view key, status value) {
  std::int64_t const ts{ records_.empty() ? util_epoch_seconds()
                                          : std::max(records_.back().timestamp,
                                                     util_epoch_seconds()) };
  records_.push_back(execution_record{
      .kind = kind, .key = std::string{ key }, .value = value, .timestamp = ts });
}

}  // namespace kiln
