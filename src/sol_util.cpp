#include "sol_util.h"

extern "C" {
#include "lua.h"
}

namespace strata {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::string,
                      sol::lib::math,
                      sol::lib::table,
                      sol::lib::os,
                      sol::lib::debug);

  // error() and assert() carry a stack trace into the load failure message
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

bool sol_util_is_integer(sol::object const &obj) {
  if (obj.get_type() != sol::type::number) { return false; }
  lua_State *lua{ obj.lua_state() };
  obj.push();
  bool const result{ lua_isinteger(lua, -1) != 0 };
  lua_pop(lua, 1);
  return result;
}

}  // namespace strata
