#include "cmds/cmd_check.h"
#include "cmds/cmd_list.h"
#include "cmds/cmd_reset.h"
#include "cmds/cmd_run.h"
#include "cmds/cmd_status.h"

#include "checkpoint.h"
#include "manifest.h"
#include "platform.h"
#include "state_store.h"

#include "doctest/doctest.h"
#include "test_support.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

namespace fs = std::filesystem;

constexpr char kManifest[]{ R"lua(
PHASES = {
  {
    id = "foundation",
    units = {
      { id = "one", run = "echo one >> one.log" },
      { id = "two", run = "echo two >> two.log" },
    },
  },
  {
    id = "features",
    units = {
      { id = "three", run = "test -f gate && echo three >> three.log" },
    },
  },
}
)lua" };

struct cmd_fixture : kiln::test::temp_dir_fixture {
  cmd_fixture() : manifest_path{ root / "kiln.lua" } {
    kiln::test::write_file(manifest_path, kManifest);
  }

  bool run(kiln::cmd_run::cfg cfg = {}) {
    return kiln::cmd::create(cfg, std::optional<fs::path>{ manifest_path })->execute();
  }

  bool reset(std::optional<std::string> phase = std::nullopt) {
    kiln::cmd_reset::cfg cfg{};
    cfg.phase = std::move(phase);
    return kiln::cmd::create(cfg, std::optional<fs::path>{ manifest_path })->execute();
  }

  std::size_t lines(char const *name) const {
    auto const path{ root / name };
    return fs::exists(path) ? kiln::test::read_lines(path).size() : 0;
  }

  fs::path state_dir() const { return root / ".kiln"; }

  fs::path manifest_path;
};

}  // namespace

TEST_CASE_FIXTURE(cmd_fixture, "run fails at the first failing unit and keeps a checkpoint") {
  CHECK_FALSE(run());
  CHECK(lines("one.log") == 1);
  CHECK(lines("two.log") == 1);
  CHECK(lines("three.log") == 0);

  auto const cp{ kiln::checkpoint_manager{ state_dir() / "kiln.checkpoint" }.load() };
  REQUIRE(cp.has_value());
  CHECK(cp->phase_id == "features");
}

TEST_CASE_FIXTURE(cmd_fixture, "a second run resumes without repeating completed units") {
  CHECK_FALSE(run());
  kiln::test::write_file(root / "gate", "");

  CHECK(run());
  CHECK(lines("one.log") == 1);
  CHECK(lines("two.log") == 1);
  CHECK(lines("three.log") == 1);
  CHECK_FALSE(fs::exists(state_dir() / "kiln.checkpoint"));

  CHECK(run());
  CHECK(lines("one.log") == 1);
  CHECK(lines("three.log") == 1);
}

TEST_CASE_FIXTURE(cmd_fixture, "dry run touches neither the target nor the state directory") {
  kiln::cmd_run::cfg cfg{};
  cfg.dry_run = true;
  CHECK(run(cfg));
  CHECK_FALSE(fs::exists(state_dir()));
  CHECK(lines("one.log") == 0);
}

TEST_CASE_FIXTURE(cmd_fixture, "forced units run again") {
  kiln::test::write_file(root / "gate", "");
  CHECK(run());

  kiln::cmd_run::cfg cfg{};
  cfg.force_ids = { "two" };
  CHECK(run(cfg));
  CHECK(lines("one.log") == 1);
  CHECK(lines("two.log") == 2);

  kiln::cmd_run::cfg all{};
  all.force_all = true;
  CHECK(run(all));
  CHECK(lines("one.log") == 2);
  CHECK(lines("three.log") == 2);
}

TEST_CASE_FIXTURE(cmd_fixture, "single phase run leaves other phases alone") {
  kiln::cmd_run::cfg cfg{};
  cfg.phase = "foundation";
  CHECK(run(cfg));
  CHECK(lines("one.log") == 1);
  CHECK(lines("three.log") == 0);

  kiln::cmd_run::cfg unknown{};
  unknown.phase = "nope";
  CHECK_THROWS_AS(run(unknown), std::runtime_error);
}

TEST_CASE_FIXTURE(cmd_fixture, "full reset clears history and checkpoint") {
  CHECK_FALSE(run());
  REQUIRE(fs::exists(state_dir() / "kiln.checkpoint"));

  CHECK(reset());
  CHECK_FALSE(fs::exists(state_dir() / "kiln.state"));
  CHECK_FALSE(fs::exists(state_dir() / "kiln.checkpoint"));

  kiln::test::write_file(root / "gate", "");
  CHECK(run());
  CHECK(lines("one.log") == 2);
}

TEST_CASE_FIXTURE(cmd_fixture, "phase reset re-runs only that phase") {
  kiln::test::write_file(root / "gate", "");
  CHECK(run());

  CHECK(reset("features"));
  kiln::file_state_store const store{ state_dir() / "kiln.state" };
  CHECK(store.has_completed("one"));
  CHECK_FALSE(store.has_completed("three"));

  CHECK(run());
  CHECK(lines("one.log") == 1);
  CHECK(lines("three.log") == 2);

  CHECK_THROWS_AS(reset("nope"), std::runtime_error);
}

TEST_CASE_FIXTURE(cmd_fixture, "run refuses to start while another holder has the lock") {
  fs::create_directories(state_dir());
  kiln::platform::file_lock const held{ state_dir() / "kiln.lock" };
  CHECK_THROWS_AS(run(), std::runtime_error);
  CHECK(lines("one.log") == 0);
}

TEST_CASE_FIXTURE(cmd_fixture, "preflight errors stop the run before any unit") {
  kiln::test::write_file(manifest_path, R"lua(
PHASES = {
  { id = "tools", requires = { "kiln-no-such-command-xyz" },
    units = { { id = "one", run = "echo one >> one.log" } } },
}
)lua");

  CHECK_FALSE(run());
  CHECK(lines("one.log") == 0);

  CHECK_FALSE(kiln::cmd::create(kiln::cmd_check::cfg{}, std::optional<fs::path>{ manifest_path })
                  ->execute());
}

TEST_CASE_FIXTURE(cmd_fixture, "status, check and list succeed on a valid manifest") {
  kiln::test::write_file(root / "gate", "");
  CHECK(run());

  kiln::cmd_status::cfg status_cfg{};
  status_cfg.history = true;
  CHECK(kiln::cmd::create(status_cfg, std::optional<fs::path>{ manifest_path })->execute());
  CHECK(kiln::cmd::create(kiln::cmd_check::cfg{}, std::optional<fs::path>{ manifest_path })
            ->execute());
  CHECK(kiln::cmd::create(kiln::cmd_list::cfg{}, std::optional<fs::path>{ manifest_path })
            ->execute());
}

TEST_CASE_FIXTURE(cmd_fixture, "status progress counts plan units") {
  CHECK_FALSE(run());

  auto const m{ kiln::manifest::load(manifest_path) };
  kiln::file_state_store const store{ state_dir() / "kiln.state" };
  auto const progress{ kiln::status_plan_progress(m->phases, store) };
  CHECK(progress.done == 2);
  CHECK(progress.total == 3);
  CHECK(progress.percent == 66);
}

TEST_CASE("status icons") {
  CHECK(std::string{ kiln::status_icon(kiln::status::completed) } == "✓");
  CHECK(std::string{ kiln::status_icon(kiln::status::in_progress) } == "●");
  CHECK(std::string{ kiln::status_icon(kiln::status::failed) } == "✗");
  CHECK(std::string{ kiln::status_icon(kiln::status::skipped) } == "−");
  CHECK(std::string{ kiln::status_icon(kiln::status::pending) } == " ");
}
