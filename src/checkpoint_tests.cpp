#include "checkpoint.h"

#include "doctest/doctest.h"
#include "test_support.h"

#include <algorithm>
#include <filesystem>
#include <string>

namespace {

struct checkpoint_fixture : kiln::test::temp_dir_fixture {
  checkpoint_fixture() : path{ root / "kiln.checkpoint" }, manager{ path, clock.fn() } {}

  std::filesystem::path path;
  kiln::test::manual_clock clock;
  kiln::checkpoint_manager manager;
};

}  // namespace

TEST_CASE_FIXTURE(checkpoint_fixture, "load without a checkpoint file returns nullopt") {
  CHECK_FALSE(manager.load().has_value());
}

TEST_CASE_FIXTURE(checkpoint_fixture, "save then load returns the same pointer") {
  clock.now = 1700000042;
  manager.save("docker", "docker/db-compose");

  auto const cp{ manager.load() };
  REQUIRE(cp.has_value());
  CHECK(cp->phase_id == "docker");
  CHECK(cp->unit_id == "docker/db-compose");
  CHECK(cp->timestamp == 1700000042);
}

TEST_CASE_FIXTURE(checkpoint_fixture, "saved file uses CHECKPOINT_* keys") {
  clock.now = 7;
  manager.save("foundation", "");

  auto const lines{ kiln::test::read_lines(path) };
  CHECK(std::find(lines.begin(), lines.end(), "CHECKPOINT_PHASE=\"foundation\"") !=
        lines.end());
  CHECK(std::find(lines.begin(), lines.end(), "CHECKPOINT_SCRIPT=\"\"") != lines.end());
  CHECK(std::find(lines.begin(), lines.end(), "CHECKPOINT_TIMESTAMP=\"7\"") !=
        lines.end());
  CHECK_FALSE(std::filesystem::exists(path.string() + ".tmp"));
}

TEST_CASE_FIXTURE(checkpoint_fixture, "save replaces the previous checkpoint") {
  manager.save("a", "a/1");
  manager.save("b", "");

  auto const cp{ manager.load() };
  REQUIRE(cp.has_value());
  CHECK(cp->phase_id == "b");
  CHECK(cp->unit_id.empty());
}

TEST_CASE_FIXTURE(checkpoint_fixture, "clear removes the checkpoint and tolerates absence") {
  manager.save("a", "");
  manager.clear();
  CHECK_FALSE(std::filesystem::exists(path));
  CHECK_FALSE(manager.load().has_value());
  CHECK_NOTHROW(manager.clear());
}

TEST_CASE_FIXTURE(checkpoint_fixture, "malformed checkpoint is treated as absent") {
  kiln::test::write_file(path, "garbage without keys\n");
  CHECK_FALSE(manager.load().has_value());

  kiln::test::write_file(path, "CHECKPOINT_PHASE=\"\"\nCHECKPOINT_SCRIPT=\"x\"\n");
  CHECK_FALSE(manager.load().has_value());
}

TEST_CASE("checkpoint_parse accepts shell-style quoting") {
  auto const cp{ kiln::checkpoint_parse("# Bootstrap Checkpoint\n"
                                        "CHECKPOINT_PHASE='core'\n"
                                        "CHECKPOINT_SCRIPT=core/env\n"
                                        "CHECKPOINT_TIMESTAMP=\"12\"\n") };
  REQUIRE(cp.has_value());
  CHECK(cp->phase_id == "core");
  CHECK(cp->unit_id == "core/env");
  CHECK(cp->timestamp == 12);
}

TEST_CASE("checkpoint_parse tolerates a bad timestamp") {
  auto const cp{ kiln::checkpoint_parse("CHECKPOINT_PHASE=\"core\"\n"
                                        "CHECKPOINT_TIMESTAMP=\"later\"\n") };
  REQUIRE(cp.has_value());
  CHECK(cp->timestamp == 0);
  CHECK(cp->unit_id.empty());
}

TEST_CASE_FIXTURE(checkpoint_fixture, "save creates a missing parent directory") {
  kiln::checkpoint_manager nested{ root / "deep" / "state" / "kiln.checkpoint" };
  nested.save("p", "u");
  CHECK(nested.load().has_value());
}
