#include "bounded_runner.hpp"
#include "evaluator.hpp"
#include "log.hpp"
#include <atomic>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>
#include <thread>

using json = nlohmann::json;

static std::string format_seconds(std::chrono::steady_clock::duration d) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << std::chrono::duration<double>(d).count();
    return ss.str();
}

ExecutionResult BoundedRunner::run(const ExecutionRequest& request) const {
    LOG_INFO("Running solution...");
    const auto started = std::chrono::steady_clock::now();
    // started + timeout overflows for very large timeouts; wait forever instead.
    auto deadline = std::chrono::steady_clock::time_point::max();
    if (request.timeout < std::chrono::duration_cast<std::chrono::milliseconds>(deadline - started)) {
        deadline = started + request.timeout;
    }

    auto cancel = std::make_shared<std::atomic_bool>(false);

    // The worker owns copies of the fragment and input; nothing it touches
    // outlives the call except through the packaged_task's shared state.
    std::packaged_task<json()> work(
        [fragment = request.fragment, input = request.input, cancel]() {
            auto program = Evaluator::load(fragment, cancel);
            return Evaluator::invoke(*program, input);
        });
    // A packaged_task future does not block on destruction, so dropping it
    // on timeout leaves the worker running on its own.
    std::future<json> done = work.get_future();

    ExecutionResult result;
    bool started_worker = false;
    try {
        std::thread(std::move(work)).detach();
        started_worker = true;
    } catch (const std::system_error& e) {
        LOG_ERROR(std::string("Failed to start worker: ") + e.what());
        result = EvaluationError{EvaluationError::Stage::Runtime,
                                 std::string("failed to start worker: ") + e.what(), {}};
    }

    if (started_worker) {
        if (done.wait_until(deadline) == std::future_status::ready) {
            try {
                result = Success{done.get()};
            } catch (const FragmentLoadError& e) {
                LOG_ERROR(std::string("Error executing fragment: ") + e.what());
                result = EvaluationError{EvaluationError::Stage::Load, e.what(), e.fragment()};
            } catch (const std::exception& e) {
                // FragmentRuntimeError, or anything else the worker threw
                LOG_ERROR(std::string("Error executing fragment: ") + e.what());
                result = EvaluationError{EvaluationError::Stage::Runtime, e.what(), {}};
            }
        } else {
            cancel->store(true);
            result = TimeoutError{request.timeout};
        }
    }

    LOG_INFO("Code solution runtime: " + format_seconds(std::chrono::steady_clock::now() - started) + " seconds");
    return result;
}

ExecutionResult BoundedRunner::run(std::string fragment, json input,
                                   std::chrono::milliseconds timeout) const {
    return run(ExecutionRequest{std::move(fragment), std::move(input), timeout});
}

json BoundedRunner::run_or_throw(std::string fragment, json input,
                                 std::chrono::milliseconds timeout) const {
    ExecutionResult r = run(std::move(fragment), std::move(input), timeout);
    if (auto* ok = std::get_if<Success>(&r)) return std::move(ok->value);
    if (is_timeout(r)) throw TimeoutException("Function call timed out");

    auto& err = std::get<EvaluationError>(r);
    if (err.stage == EvaluationError::Stage::Load) {
        throw FragmentLoadError(err.cause, std::move(err.fragment));
    }
    throw FragmentRuntimeError(err.cause);
}

std::future<ExecutionResult> BoundedRunner::run_async(ExecutionRequest request) const {
    return std::async(std::launch::async,
                      [runner = *this, request = std::move(request)]() { return runner.run(request); });
}
