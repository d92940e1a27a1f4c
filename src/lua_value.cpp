#include "lua_value.hpp"
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_set>

using json = nlohmann::json;

// Nesting deeper than this is rejected rather than risking the worker's stack.
static constexpr std::size_t kMaxTableDepth = 200;

// Tables on the current conversion path, for cycle detection.
struct ConvertState {
    std::unordered_set<const void*> open;
    std::size_t depth = 0;
};

static json to_json_impl(const sol::object& v, ConvertState& st);
static json table_to_json(const sol::table& t, ConvertState& st);

static json number_to_json(const sol::object& v) {
    lua_State* L = v.lua_state();
    v.push();
    const bool is_int = lua_isinteger(L, -1) != 0;
    const lua_Integer i = lua_tointeger(L, -1);
    const double d = lua_tonumber(L, -1);
    lua_pop(L, 1);

    if (is_int) return static_cast<long long>(i);
    // Lua numbers with an exact integer value come back as integers
    if (std::isfinite(d) && std::floor(d) == d &&
        d >= static_cast<double>(std::numeric_limits<long long>::min()) &&
        d < static_cast<double>(std::numeric_limits<long long>::max())) {
        return static_cast<long long>(d);
    }
    return d;
}

json lua_to_json(const sol::object& v) {
    ConvertState st;
    return to_json_impl(v, st);
}

static json to_json_impl(const sol::object& v, ConvertState& st) {
    if (!v.valid()) return nullptr;

    switch (v.get_type()) {
        case sol::type::lua_nil: return nullptr;
        case sol::type::number: return number_to_json(v);
        case sol::type::string: return v.as<std::string>();
        case sol::type::boolean: return v.as<bool>();
        case sol::type::table: return table_to_json(v.as<sol::table>(), st);
        default: return nullptr;
    }
}

// Keys 1..n with no gaps, nothing else.
static bool is_sequence(const sol::table& t, std::size_t& n) {
    n = 0;
    std::size_t count = 0;
    for (const auto& kv : t) {
        if (kv.first.get_type() != sol::type::number) return false;
        double d = kv.first.as<double>();
        if (std::floor(d) != d || d < 1) return false;
        if (d > static_cast<double>(PTRDIFF_MAX)) return false;
        std::size_t idx = static_cast<std::size_t>(d);
        if (idx > n) n = idx;
        ++count;
    }
    return count > 0 && count == n;
}

static std::string key_to_string(const sol::object& key) {
    if (key.get_type() == sol::type::string) return key.as<std::string>();
    if (key.get_type() == sol::type::number) return number_to_json(key).dump();
    if (key.get_type() == sol::type::boolean) return key.as<bool>() ? "true" : "false";
    return {};
}

// Releases the table's slot on the conversion path, also when unwinding.
class OpenTable {
public:
    OpenTable(ConvertState& st, const void* p) : st_(st), p_(p) {
        if (st_.depth >= kMaxTableDepth) {
            throw std::runtime_error("result table nested deeper than " + std::to_string(kMaxTableDepth));
        }
        if (!st_.open.insert(p_).second) {
            throw std::runtime_error("result table contains a reference cycle");
        }
        ++st_.depth;
    }
    ~OpenTable() {
        st_.open.erase(p_);
        --st_.depth;
    }

    OpenTable(const OpenTable&) = delete;
    OpenTable& operator=(const OpenTable&) = delete;

private:
    ConvertState& st_;
    const void* p_;
};

static const void* table_identity(const sol::table& t) {
    lua_State* L = t.lua_state();
    t.push();
    const void* p = lua_topointer(L, -1);
    lua_pop(L, 1);
    return p;
}

static json table_to_json(const sol::table& t, ConvertState& st) {
    OpenTable guard(st, table_identity(t));

    std::size_t n = 0;
    if (is_sequence(t, n)) {
        json arr = json::array();
        for (std::size_t i = 1; i <= n; ++i) {
            arr.push_back(to_json_impl(t.get<sol::object>(i), st));
        }
        return arr;
    }

    json obj = json::object();
    for (const auto& kv : t) {
        std::string k = key_to_string(kv.first);
        if (k.empty() && kv.first.get_type() != sol::type::string) continue;
        obj[k] = to_json_impl(kv.second, st);
    }
    return obj;
}

sol::object json_to_lua(sol::state_view L, const json& j) {
    switch (j.type()) {
        case json::value_t::null: return sol::make_object(L, sol::lua_nil);
        case json::value_t::boolean: return sol::make_object(L, j.get<bool>());
        case json::value_t::number_integer: return sol::make_object(L, j.get<long long>());
        case json::value_t::number_unsigned: {
            auto u = j.get<unsigned long long>();
            if (u > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
                return sol::make_object(L, static_cast<double>(u));
            }
            return sol::make_object(L, static_cast<long long>(u));
        }
        case json::value_t::number_float: return sol::make_object(L, j.get<double>());
        case json::value_t::string: return sol::make_object(L, j.get<std::string>());
        case json::value_t::array: {
            sol::table t = L.create_table(static_cast<int>(j.size()), 0);
            int idx = 1;
            for (const auto& v : j) {
                t[idx++] = json_to_lua(L, v);
            }
            return t;
        }
        case json::value_t::object: {
            sol::table t = L.create_table(0, static_cast<int>(j.size()));
            for (auto it = j.begin(); it != j.end(); ++it) {
                t[it.key()] = json_to_lua(L, it.value());
            }
            return t;
        }
        default: return sol::make_object(L, sol::lua_nil);
    }
}
