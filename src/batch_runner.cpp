#include "batch_runner.hpp"
#include "log.hpp"
#include "thread_pool.hpp"
#include <algorithm>
#include <cstdint>
#include <future>

using json = nlohmann::json;

static inline int64_t now_ms_epoch() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

BatchRunner::BatchRunner(BatchOptions options) : options_(options) {
    if (options_.concurrency == 0) options_.concurrency = 1;
}

std::string BatchRunner::output_text(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return {};
    // Lua strings are raw bytes; invalid UTF-8 is replaced, not thrown on.
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

json BatchRunner::run_problem(const Problem& problem) const {
    const auto t_start_ms = now_ms_epoch();
    const auto started = std::chrono::steady_clock::now();

    LOG_DEBUG("[batch] problem " + problem.id);
    ExecutionResult result = runner_.run(ExecutionRequest{problem.code, problem.input, options_.timeout});

    const auto ended = std::chrono::steady_clock::now();
    double processing_ms = std::chrono::duration<double, std::milli>(ended - started).count();

    json report = {
        {"id", problem.id},
        {"status", status_name(result)},
        {"timings", {
            {"tStart", t_start_ms},
            {"tEnd", now_ms_epoch()},
            {"processingTimeMs", processing_ms}
        }}
    };

    if (const auto* ok = std::get_if<Success>(&result)) {
        report["result"] = ok->value;
        if (problem.expected_output) {
            CheckResult check = check_solution(*problem.expected_output, output_text(ok->value));
            if (!check.passed) {
                LOG_WARN("[batch] problem " + problem.id + ": " + std::to_string(check.matched) + "/" +
                         std::to_string(check.total) + " lines matched");
            }
            report["check"] = to_json(check);
        }
    } else if (const auto* err = std::get_if<EvaluationError>(&result)) {
        report["error"] = err->cause;
        report["stage"] = stage_name(err->stage);
    } else {
        const auto& t = std::get<TimeoutError>(result);
        report["error"] = "timed out after " + std::to_string(t.timeout.count()) + " ms";
    }
    return report;
}

std::vector<json> BatchRunner::run_all(const std::vector<Problem>& problems) const {
    std::vector<json> reports;
    reports.reserve(problems.size());
    if (problems.empty()) return reports;

    ThreadPool pool(std::min(options_.concurrency, problems.size()));
    std::vector<std::future<json>> pending;
    pending.reserve(problems.size());
    for (const auto& p : problems) {
        pending.push_back(pool.enqueue([this, &p]() { return run_problem(p); }));
    }
    for (auto& f : pending) reports.push_back(f.get());

    std::size_t ok = 0;
    for (const auto& r : reports) {
        if (passed(r)) ++ok;
    }
    LOG_INFO("[batch] " + std::to_string(ok) + "/" + std::to_string(reports.size()) + " problems passed");
    return reports;
}

bool BatchRunner::passed(const json& report) {
    if (report.value("status", std::string()) != "ok") return false;
    if (report.contains("check")) return report["check"].value("matches", false);
    return true;
}
