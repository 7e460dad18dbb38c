#include "sol_util.h"

namespace kiln {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::package,
                      sol::lib::string,
                      sol::lib::os,
                      sol::lib::math,
                      sol::lib::table,
                      sol::lib::debug,
                      sol::lib::io);

  // error() and assert() carry a traceback so manifest mistakes point at a line
  lua->script(R"lua(
do
  local orig_error = error
  local orig_assert = assert

  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end

  _G.assert = function(condition, message, ...)
    if not condition then
      message = message or "assertion failed"
      return orig_assert(false, debug.traceback(tostring(message), 2))
    end
    return condition, message, ...
  end
end
)lua");

  return lua;
}

namespace detail {

void throw_type_error(std::string_view context,
                      std::string_view key,
                      std::string_view expected) {
  throw std::runtime_error(std::string(context) + ": " + std::string(key) + " must be a " +
                           std::string(expected));
}

}  // namespace detail

std::vector<std::string> sol_util_get_string_list(sol::table const &table,
                                                  std::string_view key,
                                                  std::string_view context) {
  sol::optional<sol::object> obj = table[key];
  if (!obj || !obj->valid() || obj->get_type() == sol::type::lua_nil) { return {}; }

  if (obj->get_type() == sol::type::string) { return { obj->as<std::string>() }; }

  if (obj->get_type() != sol::type::table) {
    detail::throw_type_error(context, key, "string or array of strings");
  }

  sol::table items{ obj->as<sol::table>() };
  std::vector<std::string> result;
  for (std::size_t i{ 1 }; i <= items.size(); ++i) {
    sol::object const item{ items[i] };
    if (item.get_type() != sol::type::string) {
      detail::throw_type_error(context,
                               std::string(key) + "[" + std::to_string(i) + "]",
                               "string");
    }
    result.push_back(item.as<std::string>());
  }
  return result;
}

}  // namespace kiln
