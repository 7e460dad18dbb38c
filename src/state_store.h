#pragma once

#include "util.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

enum class status { pending, in_progress, completed, failed, skipped };

char const *status_name(status value);
std::optional<status> status_parse(std::string_view text);
bool status_is_terminal(status value);

enum class record_kind { script, phase };

char const *record_kind_name(record_kind kind);  // "SCRIPT", "PHASE"

struct execution_record {
  record_kind kind;
  std::string key;
  status value;
  std::int64_t timestamp;  // epoch seconds
};

struct progress_counts {
  std::size_t done;   // latest status completed or skipped
  std::size_t total;  // distinct unit keys ever recorded
};

// Durable execution history. Records are only ever appended; the current status of a
// key is the status of its latest record (highest timestamp, later record on ties).
// Implementations throw on any storage failure.
class state_store : unmovable {
 public:
  virtual ~state_store() = default;

  virtual void mark_in_progress(std::string_view unit_id);
  virtual void mark_result(std::string_view unit_id, status result);  // terminal only
  virtual bool has_completed(std::string_view unit_id) const;
  virtual progress_counts progress() const;

  virtual void mark_phase(std::string_view phase_id, status value);
  bool phase_completed(std::string_view phase_id) const;

  // Resolved status; pending when the key has no records.
  virtual status status_of(record_kind kind, std::string_view key) const;

  // Appends pending records for the phase and each unit; nothing is erased.
  void reset_phase(std::string_view phase_id, std::vector<std::string> const &unit_ids);

  virtual std::vector<execution_record> records() const = 0;

 protected:
  virtual void append(record_kind kind, std::string_view key, status value) = 0;
};

// Text log of KIND:KEY:STATUS:TIMESTAMP lines. Every append is fsynced before returning.
class file_state_store : public state_store {
 public:
  using clock_fn_t = std::function<std::int64_t()>;

  // Creates the log (with a comment header) if it does not exist.
  explicit file_state_store(std::filesystem::path path, clock_fn_t clock = {});

  std::vector<execution_record> records() const override;

  std::filesystem::path const &path() const { return path_; }

  // Remove the log; the next store opened on this path starts empty.
  static void remove(std::filesystem::path const &path);

 protected:
  void append(record_kind kind, std::string_view key, status value) override;

 private:
  std::int64_t now() const;

  std::filesystem::path path_;
  clock_fn_t clock_;
};

// In-memory copy of an existing history. Appends never reach the disk, so a dry run can
// read state without creating or touching the log.
class snapshot_state_store : public state_store {
 public:
  explicit snapshot_state_store(std::vector<execution_record> records);

  std::vector<execution_record> records() const override { return records_; }

 protected:
  void append(record_kind kind, std::string_view key, status value) override;

 private:
  std::vector<execution_record> records_;
};

// Parse one log line. Comments, blank lines, STATE lines, unknown kinds and malformed
// lines yield nullopt.
std::optional<execution_record> state_parse_line(std::string_view line);

std::string state_format_record(execution_record const &record);

}  // namespace kiln
