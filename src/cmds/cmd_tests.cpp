#include "cmd.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <optional>

namespace {

class test_cmd : public kiln::cmd {
 public:
  struct cfg : kiln::cmd_cfg<test_cmd> {};
  test_cmd(cfg, std::optional<std::filesystem::path> const &cli_manifest)
      : manifest{ cli_manifest } {}
  bool execute() override { return true; }

  std::optional<std::filesystem::path> manifest;
};

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  using config_type = test_cmd::cfg;
  using expected_command = test_cmd;
  using actual_command = config_type::cmd_t;
  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd factory creates command from cfg") {
  test_cmd::cfg cfg{};
  std::optional<std::filesystem::path> const cli_manifest{ "/work/kiln.lua" };
  auto cmd{ kiln::cmd::create(cfg, cli_manifest) };
  REQUIRE(cmd);
  auto *typed{ dynamic_cast<test_cmd *>(cmd.get()) };
  REQUIRE(typed);
  CHECK(typed->manifest == cli_manifest);
  CHECK(cmd->execute());
}
