#pragma once

#include "pkg_request.h"
#include "shell.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

// Something that can add packages to the target project. Failures are reported as
// `false`; exceptions are reserved for not being able to run the tool at all.
class pkg_manager : unmovable {
 public:
  virtual ~pkg_manager() = default;

  virtual std::string_view name() const = 0;

  // Install one pre-fetched archive, saved as a dev or runtime dependency.
  virtual bool install_artifact(std::filesystem::path const &artifact, bool dev) = 0;

  // Install a set of packages from the remote registry in one invocation.
  virtual bool install_batch(std::vector<pkg_request> const &requests, bool dev) = 0;

 protected:
  pkg_manager() = default;
};

enum class pkg_tool { pnpm, npm };

std::optional<pkg_tool> pkg_tool_parse(std::string_view name);
char const *pkg_tool_name(pkg_tool tool);

std::vector<std::string> pkg_tool_artifact_argv(pkg_tool tool,
                                                std::filesystem::path const &artifact,
                                                bool dev);
std::vector<std::string> pkg_tool_batch_argv(pkg_tool tool,
                                             std::vector<pkg_request> const &requests,
                                             bool dev);

struct pkg_command_cfg {
  pkg_tool tool{ pkg_tool::pnpm };
  std::filesystem::path project_dir;
  shell_env_t env;
  std::optional<std::chrono::milliseconds> timeout;
};

// Drives the real pnpm/npm binaries via shell_exec inside the project directory.
class pkg_command_manager final : public pkg_manager {
 public:
  explicit pkg_command_manager(pkg_command_cfg cfg);

  std::string_view name() const override;
  bool install_artifact(std::filesystem::path const &artifact, bool dev) override;
  bool install_batch(std::vector<pkg_request> const &requests, bool dev) override;

 private:
  bool invoke(std::vector<std::string> const &argv);

  pkg_command_cfg cfg_;
};

// First tool in `preferred` found on PATH (taken from env when it has one).
std::optional<pkg_tool> pkg_tool_probe(std::vector<std::string> const &preferred,
                                       shell_env_t const &env);

// nullptr when no preferred tool is available.
std::unique_ptr<pkg_manager> pkg_manager_create(std::vector<std::string> const &preferred,
                                                pkg_command_cfg cfg);

}  // namespace kiln
