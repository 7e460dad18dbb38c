#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace kiln {

struct pkg_request {
  std::string name;                               // "zod", "@types/node"
  std::optional<std::string> version_constraint;  // "15", "^3.22.0"
  bool dev_only{ false };
};

// "next@15" -> {next, 15}; "@types/node@22" -> {@types/node, 22}; "zod" -> {zod}.
// A leading '@' is a scope marker, not a version separator.
// Throws std::invalid_argument on empty names or constraints.
pkg_request pkg_request_parse(std::string_view spec, bool dev_only = false);

// Inverse of pkg_request_parse (dev flag is not part of the spec string).
std::string pkg_request_spec(pkg_request const &request);

// Cache file naming: strip a leading '@', map '/' to '-'. "@types/node" -> "types-node"
std::string pkg_flat_name(std::string_view name);

}  // namespace kiln
