#pragma once

// Helpers shared by the unit tests (compiled into kiln_unit_tests only).

#include "pkg_manager.h"
#include "unit.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::test {

// Fresh directory under the system temp dir, removed on destruction.
struct temp_dir_fixture {
  temp_dir_fixture();
  ~temp_dir_fixture();

  std::filesystem::path root;
};

void write_file(std::filesystem::path const &path, std::string_view content);
// Non-empty lines of a text file.
std::vector<std::string> read_lines(std::filesystem::path const &path);

// Settable clock for stores that take a clock_fn_t.
struct manual_clock {
  std::int64_t now{ 1'700'000'000 };

  std::function<std::int64_t()> fn() {
    return [this] { return now; };
  }
};

// In-memory package manager. Successful installs create <modules_dir>/<name>.
class fake_pkg_manager : public pkg_manager {
 public:
  explicit fake_pkg_manager(std::filesystem::path modules_dir);

  std::string_view name() const override { return "fake"; }
  bool install_artifact(std::filesystem::path const &artifact, bool dev) override;
  bool install_batch(std::vector<pkg_request> const &requests, bool dev) override;

  std::filesystem::path modules_dir;
  std::set<std::string> fail_names;   // any invocation touching these fails
  std::set<std::string> ghost_names;  // reported installed but never materialized
  int transient_failures{ 0 };        // next N invocations fail outright

  std::vector<std::string> artifact_calls;  // archive file names, in order
  std::vector<std::vector<std::string>> batch_calls;
  std::vector<bool> batch_dev;

 private:
  bool consume_transient();
  void materialize(std::string const &name);
};

// Thread-safe record of which units ran, in order.
class execution_log {
 public:
  void record(std::string id);
  std::vector<std::string> entries() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> entries_;
};

// Completes unless `behavior` says otherwise. Installs its packages through the
// context's installer like a real unit would.
class fake_unit : public unit {
 public:
  fake_unit(std::string id,
            std::string phase_id,
            execution_log *log = nullptr,
            std::vector<pkg_request> packages = {});

  unit_result execute(unit_context const &ctx) override;

  std::function<unit_result(unit_context const &)> behavior;
  std::atomic<int> calls{ 0 };
  std::atomic<bool> last_forced{ false };

 private:
  execution_log *log_;
};

}  // namespace kiln::test
