#include "shell.h"

#include "util.h"

#include <stdexcept>
#include <string>

namespace kiln {

shell_choice shell_parse_choice(std::optional<std::string_view> value) {
  if (!value || value->empty()) { return shell_choice::bash; }
  if (*value == "bash") { return shell_choice::bash; }
  if (*value == "sh") { return shell_choice::sh; }
  throw std::invalid_argument("shell option must be 'bash' or 'sh'");
}

std::string shell_describe_result(shell_result const &result) {
  if (result.timed_out) { return "timed out"; }
  if (result.signal) { return "killed by signal " + std::to_string(*result.signal); }
  return "exit code " + std::to_string(result.exit_code);
}

}  // namespace kiln
