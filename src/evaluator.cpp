#include "evaluator.hpp"
#include "execution_result.hpp"
#include "log.hpp"
#include "lua_value.hpp"

using json = nlohmann::json;

// Instructions between two polls of the cancel flag.
static constexpr int kCancelPollInterval = 1000;

// The flag of the run currently executing Lua on this thread. Coroutines
// created by the fragment run on the same OS thread and inherit the hook.
static thread_local const std::atomic_bool* t_cancel = nullptr;

static void cancel_hook(lua_State* L, lua_Debug*) {
    if (t_cancel && t_cancel->load(std::memory_order_relaxed)) {
        luaL_error(L, "execution cancelled");
    }
}

// Installs the count hook for the duration of one load or invoke.
class CancelScope {
public:
    CancelScope(lua_State* L, const std::atomic_bool* flag) : L_(L), prev_(t_cancel) {
        if (!flag) return;
        t_cancel = flag;
        lua_sethook(L_, cancel_hook, LUA_MASKCOUNT, kCancelPollInterval);
        active_ = true;
    }
    ~CancelScope() {
        if (!active_) return;
        lua_sethook(L_, nullptr, 0, 0);
        t_cancel = prev_;
    }

    CancelScope(const CancelScope&) = delete;
    CancelScope& operator=(const CancelScope&) = delete;

private:
    lua_State* L_;
    const std::atomic_bool* prev_;
    bool active_ = false;
};

Program::Program(CancelToken cancel) : cancel_(std::move(cancel)) {
    L_.open_libraries(sol::lib::base, sol::lib::coroutine, sol::lib::math,
                      sol::lib::string, sol::lib::table, sol::lib::utf8);
}

Program::~Program() = default;

[[noreturn]] static void fail_load(const Program& program, const std::string& fragment,
                                   const std::string& detail) {
    // An abandoned run unwinding after cancellation has nobody to report to.
    const auto& cancel = program.cancel_token();
    if (!cancel || !cancel->load()) {
        LOG_ERROR("fragment failed to load: " + detail + "\n" + fragment);
    }
    throw FragmentLoadError("lua load error: " + detail, fragment);
}

std::unique_ptr<Program> Evaluator::load(const std::string& fragment, Program::CancelToken cancel) {
    auto program = std::make_unique<Program>(std::move(cancel));
    sol::state& L = program->L_;
    CancelScope scope(L.lua_state(), program->cancel_.get());

    sol::load_result chunk = L.load(fragment, "fragment", sol::load_mode::text);
    if (!chunk.valid()) {
        sol::error err = chunk;
        fail_load(*program, fragment, err.what());
    }

    // Top level runs once, defining solve and whatever else it needs.
    sol::protected_function top = chunk;
    sol::protected_function_result r = top();
    if (!r.valid()) {
        sol::error err = r;
        fail_load(*program, fragment, err.what());
    }

    sol::object solve = L["solve"];
    if (solve.get_type() == sol::type::function) {
        program->solve_ = solve.as<sol::protected_function>();
    } else {
        LOG_DEBUG("fragment defines no solve function, using identity");
    }
    return program;
}

json Evaluator::invoke(Program& program, const json& input) {
    if (program.is_identity()) return input;

    CancelScope scope(program.L_.lua_state(), program.cancel_.get());

    sol::object arg = json_to_lua(program.L_, input);
    sol::protected_function_result r = program.solve_(arg);
    if (!r.valid()) {
        sol::error err = r;
        throw FragmentRuntimeError(std::string("lua runtime error: ") + err.what());
    }
    if (r.return_count() == 0) return nullptr;

    sol::object out = r;
    try {
        return lua_to_json(out);
    } catch (const std::runtime_error& e) {
        throw FragmentRuntimeError(std::string("unrepresentable result: ") + e.what());
    }
}
