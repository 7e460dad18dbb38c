#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kiln {

using shell_env_t = std::unordered_map<std::string, std::string>;

struct shell_result {
  int exit_code;
  std::optional<int> signal;
  bool timed_out{ false };
};

enum class shell_choice { bash, sh };

struct shell_run_cfg {
  std::function<void(std::string_view)> on_output_line;  // both streams
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  std::optional<std::filesystem::path> cwd;
  shell_env_t env;
  shell_choice shell{ shell_choice::bash };

  // On expiry the whole child process group is killed and the result has timed_out set.
  std::optional<std::chrono::milliseconds> timeout;
};

shell_choice shell_parse_choice(std::optional<std::string_view> value);

shell_env_t shell_getenv();

// Run `script` through the configured shell (written to a temp file first).
shell_result shell_run(std::string_view script, shell_run_cfg const &cfg);

// Run argv directly, no shell. argv[0] is resolved against PATH from cfg.env when it
// carries one, else the process PATH. cfg.shell is ignored.
shell_result shell_exec(std::vector<std::string> const &argv, shell_run_cfg const &cfg);

// "exit code 2", "killed by signal 9", "timed out"
std::string shell_describe_result(shell_result const &result);

}  // namespace kiln
