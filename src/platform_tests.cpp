#include "platform.h"

#include "doctest/doctest.h"
#include "test_support.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace kiln {

using test::temp_dir_fixture;

TEST_CASE_FIXTURE(temp_dir_fixture, "platform::file_lock refuses a second holder") {
  auto const lock_path{ root / "kiln.lock" };
  platform::file_lock first{ lock_path };
  CHECK(static_cast<bool>(first));
  CHECK_THROWS_AS(platform::file_lock{ lock_path }, std::runtime_error);
}

TEST_CASE_FIXTURE(temp_dir_fixture, "platform::file_lock can be reacquired after release") {
  auto const lock_path{ root / "kiln.lock" };
  { platform::file_lock first{ lock_path }; }
  platform::file_lock second{ lock_path };
  CHECK(static_cast<bool>(second));
}

TEST_CASE_FIXTURE(temp_dir_fixture, "platform::atomic_rename replaces destination") {
  {
    std::ofstream{ root / "a" } << "new";
    std::ofstream{ root / "b" } << "old";
  }
  platform::atomic_rename(root / "a", root / "b");
  CHECK_FALSE(std::filesystem::exists(root / "a"));
  CHECK(util_load_text_file(root / "b") == "new");
}

TEST_CASE_FIXTURE(temp_dir_fixture, "platform::find_executable searches the given path") {
  auto const bin{ root / "bin" };
  std::filesystem::create_directories(bin);
  std::ofstream{ bin / "fakepm" } << "#!/bin/sh\n";
  std::ofstream{ bin / "notexec" } << "#!/bin/sh\n";
  std::filesystem::permissions(bin / "fakepm",
                               std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace);

  auto const search{ "/nonexistent-kiln-dir:" + bin.string() };
  auto const found{ platform::find_executable("fakepm", search) };
  REQUIRE(found.has_value());
  CHECK(*found == bin / "fakepm");

  CHECK_FALSE(platform::find_executable("notexec", search).has_value());
  CHECK_FALSE(platform::find_executable("missing", search).has_value());
  CHECK_FALSE(platform::find_executable("", search).has_value());
}

TEST_CASE("platform::find_executable locates sh on PATH") {
  CHECK(platform::find_executable("sh").has_value());
}

TEST_CASE_FIXTURE(temp_dir_fixture, "platform::is_directory_writable") {
  CHECK(platform::is_directory_writable(root));
  CHECK_FALSE(platform::is_directory_writable(root / "missing"));
}

TEST_CASE("platform::expand_path plain path returns unchanged") {
  CHECK(platform::expand_path("").empty());
  CHECK(platform::expand_path("/absolute/path") == "/absolute/path");
  CHECK(platform::expand_path("relative/path") == "relative/path");
}

TEST_CASE("platform::expand_path tilde expands to HOME") {
  char const *home{ std::getenv("HOME") };
  REQUIRE(home != nullptr);
  CHECK(platform::expand_path("~/foo") == std::filesystem::path{ home } / "foo");
  CHECK(platform::expand_path("$HOME/test") == std::filesystem::path{ home } / "test");
}

TEST_CASE("platform::expand_path keeps spaces and glob characters literal") {
  CHECK(platform::expand_path("/tmp/My Projects/app/.kiln") == "/tmp/My Projects/app/.kiln");
  CHECK(platform::expand_path("/tmp/*.lua") == "/tmp/*.lua");
  CHECK(platform::expand_path("/tmp/a\"b") == "/tmp/a\"b");

  char const *home{ std::getenv("HOME") };
  REQUIRE(home != nullptr);
  CHECK(platform::expand_path("~") == std::filesystem::path{ home });
  CHECK(platform::expand_path("~/My Projects") == std::filesystem::path{ home } / "My Projects");
}

TEST_CASE("platform::expand_path rejects undefined variables") {
  CHECK_THROWS_AS(platform::expand_path("$KILN_SURELY_UNDEFINED_VAR/x"),
                  std::runtime_error);
}

}  // namespace kiln
