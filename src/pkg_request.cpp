#include "pkg_request.h"

#include <stdexcept>

namespace kiln {

pkg_request pkg_request_parse(std::string_view spec, bool dev_only) {
  if (spec.empty()) { throw std::invalid_argument("empty package spec"); }

  std::size_t const search_from{ spec.front() == '@' ? std::size_t{ 1 } : std::size_t{ 0 } };
  auto const at{ spec.find('@', search_from) };

  pkg_request request{ .name = std::string{ spec.substr(0, at) },
                       .version_constraint = std::nullopt,
                       .dev_only = dev_only };

  if (request.name.empty() || request.name == "@") {
    throw std::invalid_argument("package spec has no name: '" + std::string{ spec } + "'");
  }

  if (request.name.front() == '@' && request.name.find('/') == std::string::npos) {
    throw std::invalid_argument("scoped package needs '@scope/name': '" +
                                std::string{ spec } + "'");
  }

  if (at != std::string_view::npos) {
    auto const constraint{ spec.substr(at + 1) };
    if (constraint.empty()) {
      throw std::invalid_argument("package spec has empty version: '" +
                                  std::string{ spec } + "'");
    }
    request.version_constraint = std::string{ constraint };
  }

  return request;
}

std::string pkg_request_spec(pkg_request const &request) {
  if (!request.version_constraint) { return request.name; }
  return request.name + "@" + *request.version_constraint;
}

std::string pkg_flat_name(std::string_view name) {
  std::string flat{ name.size() > 0 && name.front() == '@' ? name.substr(1) : name };
  for (auto &c : flat) {
    if (c == '/') { c = '-'; }
  }
  return flat;
}

}  // namespace kiln
