#include "tui.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

struct captured_output {
  std::vector<std::string> lines;

  captured_output() {
    kiln::tui::set_output_handler([this](std::string_view value) { lines.emplace_back(value); });
  }

  ~captured_output() {
    kiln::tui::configure_trace_outputs({});
    kiln::tui::set_output_handler([](std::string_view) {});
  }
};

std::vector<std::string> read_nonempty_lines(std::filesystem::path const &path) {
  std::ifstream in{ path };
  std::vector<std::string> out;
  for (std::string line; std::getline(in, line);) {
    if (!line.empty()) { out.push_back(line); }
  }
  return out;
}

}  // namespace

TEST_CASE("tui lifecycle is guarded against misuse") {
  CHECK_THROWS_AS(kiln::tui::init(), std::logic_error);
  CHECK_THROWS_AS(kiln::tui::shutdown(), std::logic_error);

  {
    kiln::tui::scope s{ kiln::tui::level::TUI_INFO, false };
    CHECK_THROWS_AS(kiln::tui::run(std::nullopt), std::logic_error);
    CHECK_THROWS_AS(kiln::tui::set_output_handler([](std::string_view) {}), std::logic_error);
    CHECK_THROWS_AS(kiln::tui::configure_trace_outputs({}), std::logic_error);
  }

  CHECK_NOTHROW(kiln::tui::set_output_handler([](std::string_view) {}));
}

TEST_CASE_FIXTURE(captured_output, "default verbosity hides script output lines") {
  {
    kiln::tui::scope s{ kiln::tui::level::TUI_INFO, false };
    kiln::tui::info("Running %s", "init");
    kiln::tui::debug("%s", "+ git init -q");
    kiln::tui::info("%s completed in %s", "init", "12ms");
    kiln::tui::error("%s failed: %s", "schema", "exit code 1");
  }

  CHECK(lines == std::vector<std::string>{ "Running init\n",
                                           "init completed in 12ms\n",
                                           "schema failed: exit code 1\n" });
}

TEST_CASE_FIXTURE(captured_output, "warn threshold keeps only problems") {
  {
    kiln::tui::scope s{ kiln::tui::level::TUI_WARN, false };
    kiln::tui::info("Phase %s (%d units)", "docker", 2);
    kiln::tui::warn("checkpoint unreadable; ignoring");
    kiln::tui::error("Execution failed: %s", "disk full");
  }

  REQUIRE(lines.size() == 2);
  CHECK(lines[0] == "checkpoint unreadable; ignoring\n");
  CHECK(lines[1] == "Execution failed: disk full\n");
}

TEST_CASE_FIXTURE(captured_output, "decorated logging prefixes timestamp and level") {
  {
    kiln::tui::scope s{ kiln::tui::level::TUI_DEBUG, true };
    kiln::tui::debug("cache hit %s", "zod");
    kiln::tui::warn("retrying install");
  }

  std::regex const prefix{ R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[(DBG|WRN)\] )" };
  REQUIRE(lines.size() == 2);
  std::smatch m;
  REQUIRE(std::regex_search(lines[0], m, prefix));
  CHECK(m[1] == "DBG");
  CHECK(lines[0].substr(m.length(0)) == "cache hit zod\n");
  REQUIRE(std::regex_search(lines[1], m, prefix));
  CHECK(m[1] == "WRN");
}

TEST_CASE_FIXTURE(captured_output, "logs before the writer starts are delivered inline") {
  kiln::tui::error("Invalid trace output spec: %s", "bogus");
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "Invalid trace output spec: bogus\n");
}

TEST_CASE_FIXTURE(captured_output, "long messages are not truncated") {
  std::string const long_path(3000, 'p');
  kiln::tui::info("cwd=%s", long_path.c_str());
  REQUIRE(lines.size() == 1);
  CHECK(lines[0].size() == 4 + long_path.size() + 1);
}

TEST_CASE_FIXTURE(captured_output, "trace goes to stderr text and file JSON together") {
  auto const trace_path{ std::filesystem::temp_directory_path() / "kiln_tui_dual_trace.jsonl" };
  std::error_code ec;
  std::filesystem::remove(trace_path, ec);

  kiln::tui::configure_trace_outputs(
      { { kiln::tui::trace_output_type::std_err, std::nullopt },
        { kiln::tui::trace_output_type::file, trace_path } });
  CHECK(kiln::tui::g_trace_enabled);
  {
    kiln::tui::scope s{ kiln::tui::level::TUI_TRACE, false };
    KILN_TRACE_PHASE_START(std::string{ "foundation" }, 2);
    KILN_TRACE_UNIT_START(std::string{ "foundation" }, std::string{ "init" }, true);
  }
  kiln::tui::configure_trace_outputs({});

  REQUIRE(lines.size() == 2);
  CHECK(lines[0].rfind("phase_start ", 0) == 0);
  CHECK(lines[1].find("unit=init") != std::string::npos);

  auto const json{ read_nonempty_lines(trace_path) };
  REQUIRE(json.size() == 2);
  CHECK(json[0].find("\"event\":\"phase_start\"") != std::string::npos);
  CHECK(json[0].find("\"unit_count\":2") != std::string::npos);
  CHECK(json[1].find("\"event\":\"unit_start\"") != std::string::npos);
  std::filesystem::remove(trace_path, ec);
}

TEST_CASE_FIXTURE(captured_output, "trace file write failure disables file tracing") {
  if (!std::filesystem::exists("/dev/full")) { return; }

  kiln::tui::configure_trace_outputs({ { kiln::tui::trace_output_type::file, "/dev/full" } });
  KILN_TRACE_CACHE_MISS(std::string{ "zod" });
  KILN_TRACE_CACHE_MISS(std::string{ "pg" });

  REQUIRE(lines.size() == 1);
  CHECK(lines[0].find("file tracing disabled") != std::string::npos);
}

TEST_CASE("trace configuration errors leave tracing off") {
  CHECK_THROWS_AS(kiln::tui::configure_trace_outputs(
                      { { kiln::tui::trace_output_type::file,
                          std::filesystem::path{ "/nonexistent-kiln-dir/trace.jsonl" } } }),
                  std::runtime_error);
  CHECK_FALSE(kiln::tui::g_trace_enabled);

  auto const tmp{ std::filesystem::temp_directory_path() };
  CHECK_THROWS_AS(kiln::tui::configure_trace_outputs(
                      { { kiln::tui::trace_output_type::file, tmp / "kiln_trace_a.jsonl" },
                        { kiln::tui::trace_output_type::file, tmp / "kiln_trace_b.jsonl" } }),
                  std::logic_error);
  CHECK_FALSE(kiln::tui::g_trace_enabled);
}

TEST_CASE("trace_event_to_json escapes unit ids") {
  auto const json{ kiln::trace_event_to_json(kiln::trace_events::unit_complete{
      .phase = "db",
      .unit = "docker/\"compose\"",
      .status = "failed",
      .duration_ms = 1234,
  }) };

  CHECK(json.front() == '{');
  CHECK(json.back() == '}');
  CHECK(json.find("\"unit\":\"docker/\\\"compose\\\"\"") != std::string::npos);
  CHECK(json.find("\"duration_ms\":1234") != std::string::npos);
}

TEST_CASE("trace_event_to_string renders install progress") {
  CHECK(kiln::trace_event_to_string(kiln::trace_events::cache_hit{
            .package = "zod",
            .artifact = "/cache/zod-3.22.4.tgz",
        }) == "cache_hit package=zod artifact=/cache/zod-3.22.4.tgz");
  CHECK(kiln::trace_event_to_string(kiln::trace_events::install_attempt{
            .attempt = 2,
            .max_attempts = 3,
            .package_count = 4,
        }) == "install_attempt attempt=2/3 packages=4");
}
