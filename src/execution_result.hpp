#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

// The fragment did not compile, or its top level raised.
class FragmentLoadError : public std::runtime_error {
public:
    FragmentLoadError(const std::string& what, std::string fragment)
        : std::runtime_error(what), fragment_(std::move(fragment)) {}

    const std::string& fragment() const { return fragment_; }

private:
    std::string fragment_;
};

// solve(input) raised.
class FragmentRuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown by BoundedRunner::run_or_throw when the deadline passes first.
class TimeoutException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ExecutionRequest {
    std::string fragment;
    nlohmann::json input;
    std::chrono::milliseconds timeout{std::chrono::seconds(60)};
};

struct Success {
    nlohmann::json value;
};

struct EvaluationError {
    enum class Stage { Load, Runtime };
    Stage stage{Stage::Runtime};
    std::string cause;
    std::string fragment; // set for load failures
};

struct TimeoutError {
    std::chrono::milliseconds timeout{0};
};

// Exactly one terminal outcome per request.
using ExecutionResult = std::variant<Success, EvaluationError, TimeoutError>;

inline bool is_success(const ExecutionResult& r) { return std::holds_alternative<Success>(r); }
inline bool is_evaluation_error(const ExecutionResult& r) { return std::holds_alternative<EvaluationError>(r); }
inline bool is_timeout(const ExecutionResult& r) { return std::holds_alternative<TimeoutError>(r); }

inline const char* status_name(const ExecutionResult& r) {
    if (is_success(r)) return "ok";
    if (is_timeout(r)) return "timeout";
    return "error";
}

inline const char* stage_name(EvaluationError::Stage s) {
    return s == EvaluationError::Stage::Load ? "load" : "runtime";
}
