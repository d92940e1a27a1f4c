#include <chrono>
#include <future>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "bounded_runner.hpp"
#include "log_capture.hpp"

namespace {

using json = nlohmann::json;
using namespace std::chrono_literals;

const char* kIncrement = "function solve(x) return x + 1 end";
const char* kSpin = "function solve(x)\n    while true do end\nend";

double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

TEST(BoundedRunnerTest, ReturnsSolveValue) {
    BoundedRunner runner;
    auto result = runner.run(kIncrement, 2, 60s);
    ASSERT_TRUE(is_success(result));
    EXPECT_EQ(std::get<Success>(result).value, json(3));
}

TEST(BoundedRunnerTest, RaisingSolveIsEvaluationError) {
    BoundedRunner runner;
    auto result = runner.run("function solve(x) error('bad') end", 1, 60s);
    ASSERT_TRUE(is_evaluation_error(result));
    const auto& err = std::get<EvaluationError>(result);
    EXPECT_EQ(err.stage, EvaluationError::Stage::Runtime);
    EXPECT_NE(err.cause.find("bad"), std::string::npos);
}

TEST(BoundedRunnerTest, InfiniteLoopTimesOutNearDeadline) {
    BoundedRunner runner;
    const auto t0 = std::chrono::steady_clock::now();
    auto result = runner.run(kSpin, 1, 1s);
    const double elapsed = seconds_since(t0);

    ASSERT_TRUE(is_timeout(result));
    EXPECT_EQ(std::get<TimeoutError>(result).timeout, 1000ms);
    EXPECT_GE(elapsed, 0.95);
    EXPECT_LT(elapsed, 3.0);
}

TEST(BoundedRunnerTest, TopLevelLoopAlsoTimesOut) {
    BoundedRunner runner;
    auto result = runner.run("while true do end", 1, 200ms);
    EXPECT_TRUE(is_timeout(result));
}

TEST(BoundedRunnerTest, MissingSolveReturnsInput) {
    BoundedRunner runner;
    auto result = runner.run("x = 5", 7, 60s);
    ASSERT_TRUE(is_success(result));
    EXPECT_EQ(std::get<Success>(result).value, json(7));
}

TEST(BoundedRunnerTest, SyntaxErrorIsLoadErrorWithFragmentLogged) {
    LogCapture logs;
    BoundedRunner runner;
    const std::string fragment = "function solve(x)";
    auto result = runner.run(fragment, "anything", 60s);

    ASSERT_TRUE(is_evaluation_error(result));
    const auto& err = std::get<EvaluationError>(result);
    EXPECT_EQ(err.stage, EvaluationError::Stage::Load);
    EXPECT_EQ(err.fragment, fragment);
    EXPECT_TRUE(logs.contains(LogLevel::ERROR, fragment));
}

TEST(BoundedRunnerTest, LogsStartAndElapsedForEveryOutcome) {
    BoundedRunner runner;
    for (const char* fragment : {kIncrement, "function solve(x) error('bad') end", kSpin}) {
        LogCapture logs;
        runner.run(fragment, 1, 100ms);
        EXPECT_TRUE(logs.contains(LogLevel::INFO, "Running solution")) << fragment;
        EXPECT_TRUE(logs.contains(LogLevel::INFO, "Code solution runtime:")) << fragment;
    }
}

TEST(BoundedRunnerTest, RuntimeFailureLoggedAtError) {
    LogCapture logs;
    BoundedRunner runner;
    runner.run("function solve(x) error('kaput') end", 1, 60s);
    EXPECT_TRUE(logs.contains(LogLevel::ERROR, "kaput"));
}

TEST(BoundedRunnerTest, ZeroTimeoutStillDispatchesAndExpires) {
    BoundedRunner runner;
    auto result = runner.run(kSpin, 1, 0ms);
    EXPECT_TRUE(is_timeout(result));

    // A trivial fragment may or may not beat a zero deadline, but the
    // outcome is never an evaluation error.
    auto quick = runner.run(kIncrement, 1, 0ms);
    EXPECT_FALSE(is_evaluation_error(quick));
}

TEST(BoundedRunnerTest, NegativeTimeoutBehavesLikeZero) {
    BoundedRunner runner;
    EXPECT_TRUE(is_timeout(runner.run(kSpin, 1, -5ms)));
}

TEST(BoundedRunnerTest, UnboundedTimeoutStillSucceeds) {
    BoundedRunner runner;
    auto result = runner.run(kIncrement, 2, std::chrono::milliseconds::max());
    ASSERT_TRUE(is_success(result));
    EXPECT_EQ(std::get<Success>(result).value, json(3));
}

TEST(BoundedRunnerTest, CyclicResultIsRuntimeError) {
    BoundedRunner runner;
    auto result = runner.run("function solve(x) local t = {} t.self = t return t end", 1, 60s);
    ASSERT_TRUE(is_evaluation_error(result));
    const auto& err = std::get<EvaluationError>(result);
    EXPECT_EQ(err.stage, EvaluationError::Stage::Runtime);
    EXPECT_NE(err.cause.find("cycle"), std::string::npos);
}

TEST(BoundedRunnerTest, SlowButFinishingFragmentSucceeds) {
    BoundedRunner runner;
    const char* fragment =
        "function solve(n)\n"
        "  local s = 0\n"
        "  for i = 1, n do s = s + i end\n"
        "  return s\n"
        "end";
    auto result = runner.run(fragment, 100000, 10s);
    ASSERT_TRUE(is_success(result));
    EXPECT_EQ(std::get<Success>(result).value, json(5000050000LL));
}

TEST(BoundedRunnerTest, ConcurrentRunsAreIndependent) {
    BoundedRunner runner;
    std::vector<std::future<ExecutionResult>> runs;
    for (int i = 0; i < 6; ++i) {
        const std::string fragment = (i % 2 == 0) ? "function solve(x) return x * 10 end" : kSpin;
        runs.push_back(std::async(std::launch::async, [&runner, fragment, i]() {
            return runner.run(fragment, i, 300ms);
        }));
    }
    for (int i = 0; i < 6; ++i) {
        auto result = runs[i].get();
        if (i % 2 == 0) {
            ASSERT_TRUE(is_success(result)) << i;
            EXPECT_EQ(std::get<Success>(result).value, json(i * 10));
        } else {
            EXPECT_TRUE(is_timeout(result)) << i;
        }
    }
}

TEST(BoundedRunnerTest, RunOrThrowReturnsValue) {
    BoundedRunner runner;
    EXPECT_EQ(runner.run_or_throw(kIncrement, 2), json(3));
}

TEST(BoundedRunnerTest, RunOrThrowDistinguishesFailures) {
    BoundedRunner runner;
    EXPECT_THROW(runner.run_or_throw(kSpin, 1, 100ms), TimeoutException);
    EXPECT_THROW(runner.run_or_throw("function solve(x) error('bad') end", 1), FragmentRuntimeError);
    EXPECT_THROW(runner.run_or_throw("function solve(x)", 1), FragmentLoadError);
}

TEST(BoundedRunnerTest, RunAsyncResolvesWithSameContract) {
    BoundedRunner runner;
    auto ok = runner.run_async(ExecutionRequest{kIncrement, 41, 60s});
    auto slow = runner.run_async(ExecutionRequest{kSpin, 1, 100ms});
    auto r1 = ok.get();
    ASSERT_TRUE(is_success(r1));
    EXPECT_EQ(std::get<Success>(r1).value, json(42));
    EXPECT_TRUE(is_timeout(slow.get()));
}

}  // namespace
