#include "state_store.h"

#include "doctest/doctest.h"
#include "test_support.h"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace {

struct state_fixture : kiln::test::temp_dir_fixture {
  state_fixture() : path{ root / "state" / "kiln.state" } {}

  kiln::file_state_store make_store() { return kiln::file_state_store{ path, clock.fn() }; }

  std::filesystem::path path;
  kiln::test::manual_clock clock;
};

}  // namespace

TEST_CASE("state_parse_line accepts well-formed records") {
  auto const record{ kiln::state_parse_line("SCRIPT:docker/db-compose:failed:1700000123") };
  REQUIRE(record.has_value());
  CHECK(record->kind == kiln::record_kind::script);
  CHECK(record->key == "docker/db-compose");
  CHECK(record->value == kiln::status::failed);
  CHECK(record->timestamp == 1700000123);

  auto const phase{ kiln::state_parse_line("PHASE:foundation:completed:5\r") };
  REQUIRE(phase.has_value());
  CHECK(phase->kind == kiln::record_kind::phase);
  CHECK(phase->value == kiln::status::completed);
}

TEST_CASE("state_parse_line ignores comments and foreign lines") {
  CHECK_FALSE(kiln::state_parse_line("").has_value());
  CHECK_FALSE(kiln::state_parse_line("# Format: KIND:KEY:STATUS:TIMESTAMP").has_value());
  CHECK_FALSE(kiln::state_parse_line("STATE:initialized:1700000000").has_value());
  CHECK_FALSE(kiln::state_parse_line("CHECKPOINT:x:completed:1").has_value());
  CHECK_FALSE(kiln::state_parse_line("SCRIPT:x:done:1").has_value());
  CHECK_FALSE(kiln::state_parse_line("SCRIPT:x:completed:soon").has_value());
  CHECK_FALSE(kiln::state_parse_line("SCRIPT::completed:1").has_value());
  CHECK_FALSE(kiln::state_parse_line("SCRIPT:a:b:completed:1").has_value());
}

TEST_CASE("status names round-trip through status_parse") {
  for (auto const s : { kiln::status::pending,
                        kiln::status::in_progress,
                        kiln::status::completed,
                        kiln::status::failed,
                        kiln::status::skipped }) {
    CHECK(kiln::status_parse(kiln::status_name(s)) == s);
  }
  CHECK_FALSE(kiln::status_parse("COMPLETED").has_value());
}

TEST_CASE_FIXTURE(state_fixture, "new store writes a header and no records") {
  auto store{ make_store() };
  REQUIRE(std::filesystem::exists(path));

  auto const lines{ kiln::test::read_lines(path) };
  REQUIRE(!lines.empty());
  CHECK(lines.front().rfind("#", 0) == 0);
  CHECK(lines.back() == "STATE:initialized:1700000000");

  CHECK(store.records().empty());
  CHECK(store.progress().done == 0);
  CHECK(store.progress().total == 0);
}

TEST_CASE_FIXTURE(state_fixture, "reopening an existing store keeps its records") {
  {
    auto store{ make_store() };
    store.mark_in_progress("core/init");
    store.mark_result("core/init", kiln::status::completed);
  }

  auto reopened{ make_store() };
  CHECK(reopened.has_completed("core/init"));
  CHECK(reopened.records().size() == 2);
}

TEST_CASE_FIXTURE(state_fixture, "appended lines use the KIND:KEY:STATUS:TIMESTAMP format") {
  auto store{ make_store() };
  clock.now = 1700000100;
  store.mark_in_progress("core/init");
  clock.now = 1700000105;
  store.mark_result("core/init", kiln::status::completed);
  store.mark_phase("foundation", kiln::status::completed);

  auto const lines{ kiln::test::read_lines(path) };
  REQUIRE(lines.size() >= 3);
  CHECK(lines[lines.size() - 3] == "SCRIPT:core/init:in_progress:1700000100");
  CHECK(lines[lines.size() - 2] == "SCRIPT:core/init:completed:1700000105");
  CHECK(lines[lines.size() - 1] == "PHASE:foundation:completed:1700000105");
}

TEST_CASE_FIXTURE(state_fixture, "has_completed reflects only the latest record") {
  auto store{ make_store() };

  CHECK_FALSE(store.has_completed("unit"));
  CHECK(store.status_of(kiln::record_kind::script, "unit") == kiln::status::pending);

  store.mark_in_progress("unit");
  CHECK_FALSE(store.has_completed("unit"));

  clock.now += 1;
  store.mark_result("unit", kiln::status::failed);
  CHECK_FALSE(store.has_completed("unit"));

  clock.now += 1;
  store.mark_in_progress("unit");
  clock.now += 1;
  store.mark_result("unit", kiln::status::completed);
  CHECK(store.has_completed("unit"));

  clock.now += 1;
  store.mark_in_progress("unit");
  CHECK_FALSE(store.has_completed("unit"));
}

TEST_CASE_FIXTURE(state_fixture, "timestamp ties resolve to the later record") {
  auto store{ make_store() };
  store.mark_in_progress("unit");
  store.mark_result("unit", kiln::status::completed);
  CHECK(store.has_completed("unit"));

  store.mark_in_progress("unit");
  CHECK(store.status_of(kiln::record_kind::script, "unit") == kiln::status::in_progress);
}

TEST_CASE_FIXTURE(state_fixture, "latest timestamp wins over line order") {
  kiln::test::write_file(path,
                         "# hand edited\n"
                         "SCRIPT:unit:completed:200\n"
                         "SCRIPT:unit:failed:100\n"
                         "PHASE:p:failed:300\n"
                         "PHASE:p:completed:299\n");
  auto store{ make_store() };
  CHECK(store.has_completed("unit"));
  CHECK(store.status_of(kiln::record_kind::phase, "p") == kiln::status::failed);
  CHECK_FALSE(store.phase_completed("p"));
}

TEST_CASE_FIXTURE(state_fixture, "script and phase records with the same key are distinct") {
  auto store{ make_store() };
  store.mark_phase("shared", kiln::status::completed);
  CHECK(store.phase_completed("shared"));
  CHECK_FALSE(store.has_completed("shared"));
}

TEST_CASE_FIXTURE(state_fixture, "mark_result rejects non-terminal statuses") {
  auto store{ make_store() };
  CHECK_THROWS_AS(store.mark_result("unit", kiln::status::in_progress),
                  std::invalid_argument);
  CHECK_THROWS_AS(store.mark_result("unit", kiln::status::pending), std::invalid_argument);
  CHECK(store.records().empty());
}

TEST_CASE_FIXTURE(state_fixture, "keys that would corrupt the log are rejected") {
  auto store{ make_store() };
  CHECK_THROWS_AS(store.mark_in_progress("a:b"), std::invalid_argument);
  CHECK_THROWS_AS(store.mark_in_progress("a\nSCRIPT:x:completed:1"), std::invalid_argument);
  CHECK_THROWS_AS(store.mark_in_progress(""), std::invalid_argument);
  CHECK(store.records().empty());
}

TEST_CASE_FIXTURE(state_fixture, "progress counts completed and skipped units") {
  auto store{ make_store() };
  store.mark_result("a", kiln::status::completed);
  store.mark_result("b", kiln::status::skipped);
  store.mark_result("c", kiln::status::failed);
  store.mark_in_progress("d");
  store.mark_phase("p", kiln::status::completed);

  auto const counts{ store.progress() };
  CHECK(counts.done == 2);
  CHECK(counts.total == 4);
}

TEST_CASE_FIXTURE(state_fixture, "reset_phase appends pending records and keeps history") {
  auto store{ make_store() };
  store.mark_result("a", kiln::status::completed);
  store.mark_result("b", kiln::status::completed);
  store.mark_phase("p", kiln::status::completed);
  auto const before{ store.records().size() };

  clock.now += 10;
  store.reset_phase("p", { "a", "b" });

  CHECK(store.records().size() == before + 3);
  CHECK_FALSE(store.has_completed("a"));
  CHECK_FALSE(store.has_completed("b"));
  CHECK_FALSE(store.phase_completed("p"));
  CHECK(store.status_of(kiln::record_kind::script, "a") == kiln::status::pending);
}

TEST_CASE_FIXTURE(state_fixture, "remove deletes the log and a new store starts empty") {
  {
    auto store{ make_store() };
    store.mark_result("a", kiln::status::completed);
  }
  kiln::file_state_store::remove(path);
  CHECK_FALSE(std::filesystem::exists(path));
  CHECK_NOTHROW(kiln::file_state_store::remove(path));

  auto store{ make_store() };
  CHECK_FALSE(store.has_completed("a"));
}

TEST_CASE_FIXTURE(state_fixture, "appending to an unwritable location throws") {
  auto store{ make_store() };
  std::filesystem::remove(path);
  std::filesystem::create_directory(path);  // a directory where the log should be
  CHECK_THROWS(store.mark_in_progress("unit"));
}

TEST_CASE_FIXTURE(state_fixture, "snapshot store reads history and never writes the log") {
  {
    auto store{ make_store() };
    store.mark_result("a", kiln::status::completed);
  }
  auto const before{ std::filesystem::file_size(path) };

  kiln::snapshot_state_store snapshot{ make_store().records() };
  CHECK(snapshot.has_completed("a"));

  snapshot.mark_result("b", kiln::status::completed);
  CHECK(snapshot.has_completed("b"));
  CHECK(std::filesystem::file_size(path) == before);
}
