#pragma once
#include <chrono>
#include <future>
#include <string>
#include <nlohmann/json.hpp>
#include "execution_result.hpp"

// Runs one fragment against one input under a wall-clock deadline.
//
// Every run gets its own detached worker thread and its own Program, so
// the caller never waits on the fragment itself: run() returns by the
// deadline with exactly one of Success, EvaluationError or TimeoutError.
//
// Cancellation abandons the wait, it does not kill the worker. On timeout
// the run's cancel flag is raised and the Lua count hook unwinds pure-Lua
// loops at its next poll, but a fragment blocked inside a host function
// keeps its thread until that function returns. Whatever the abandoned
// worker eventually produces is dropped.
class BoundedRunner {
public:
    using json = nlohmann::json;
    static constexpr std::chrono::seconds kDefaultTimeout{60};

    ExecutionResult run(const ExecutionRequest& request) const;
    ExecutionResult run(std::string fragment, json input,
                        std::chrono::milliseconds timeout = kDefaultTimeout) const;

    // Value of solve(input). Throws TimeoutException, FragmentLoadError or
    // FragmentRuntimeError.
    json run_or_throw(std::string fragment, json input,
                      std::chrono::milliseconds timeout = kDefaultTimeout) const;

    // Same contract as run(), resolved on another thread.
    std::future<ExecutionResult> run_async(ExecutionRequest request) const;
};
