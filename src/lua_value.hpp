#pragma once
#include <sol/sol.hpp>
#include <nlohmann/json.hpp>

// Conversions between the JSON values handed to the runner and the Lua
// values a fragment sees. Tables with keys exactly 1..n become arrays,
// every other table becomes an object. Functions, userdata and threads
// have no JSON form and come back as null.
nlohmann::json lua_to_json(const sol::object& v);
sol::object json_to_lua(sol::state_view L, const nlohmann::json& j);
