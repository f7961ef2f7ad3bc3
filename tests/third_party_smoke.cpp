#include <tbb/concurrent_queue.h>
#include <tbb/global_control.h>

#include "CLI/CLI.hpp"
#include "picojson.h"
#include "sol/sol.hpp"

extern "C" {
#include "lauxlib.h"
#include "lua.h"
#include "lualib.h"
}

#include <cstdint>
#include <string>

int main() {
    lua_State *L = luaL_newstate();
    if (!L) {
        return 1;
    }
    luaL_openlibs(L);
    if (luaL_dostring(L, "return 6 * 7") != LUA_OK || lua_tointeger(L, -1) != 42) {
        lua_close(L);
        return 1;
    }
    lua_close(L);

    sol::state lua;
    lua.open_libraries(sol::lib::base);
    if (lua.safe_script("x = 'ok'", sol::script_pass_on_error).valid() == false ||
        lua.get<std::string>("x") != "ok") {
        return 1;
    }

    tbb::global_control control(tbb::global_control::max_allowed_parallelism, 2);
    tbb::concurrent_bounded_queue<int> queue;
    queue.set_capacity(1);
    queue.push(7);
    int popped = 0;
    if (!queue.try_pop(popped) || popped != 7) {
        return 1;
    }

    CLI::App app{"smoke"};
    int n = 0;
    app.add_option("-n", n);
    char arg0[] = "smoke";
    char arg1[] = "-n";
    char arg2[] = "3";
    char *argv[] = {arg0, arg1, arg2};
    app.parse(3, argv);
    if (n != 3) {
        return 1;
    }

    picojson::value v;
    std::string const err = picojson::parse(v, "{\"serial\": 9007199254740993}");
    if (!err.empty() || !v.get("serial").is<std::int64_t>() ||
        v.get("serial").get<std::int64_t>() != 9007199254740993LL) {
        return 1;
    }

    return 0;
}
