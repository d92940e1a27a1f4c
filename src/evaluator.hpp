#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <sol/sol.hpp>
#include <nlohmann/json.hpp>

// A loaded fragment: its own Lua state plus the resolved solve function.
// Not thread-safe; a Program is created, invoked and destroyed on one
// worker thread.
class Program {
public:
    using CancelToken = std::shared_ptr<std::atomic_bool>;

    explicit Program(CancelToken cancel = nullptr);
    ~Program();

    Program(const Program&) = delete;
    Program& operator=(const Program&) = delete;

    // True when the fragment defined no callable solve and invoke falls
    // back to returning its input.
    bool is_identity() const { return !solve_.valid(); }

    const CancelToken& cancel_token() const { return cancel_; }

private:
    friend class Evaluator;

    sol::state L_;
    sol::protected_function solve_;
    CancelToken cancel_;
};

class Evaluator {
public:
    using json = nlohmann::json;

    // Compile the fragment, run its top level and resolve `solve`.
    // Throws FragmentLoadError (fragment text logged at error first).
    static std::unique_ptr<Program> load(const std::string& fragment,
                                         Program::CancelToken cancel = nullptr);

    // solve(input), or input unchanged when solve is missing.
    // Throws FragmentRuntimeError.
    static json invoke(Program& program, const json& input);
};
