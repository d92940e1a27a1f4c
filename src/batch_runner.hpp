#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bounded_runner.hpp"
#include "problem_set.hpp"

struct BatchOptions {
    std::chrono::milliseconds timeout{BoundedRunner::kDefaultTimeout};
    std::size_t concurrency{1};
};

// Runs a problem set through the BoundedRunner, `concurrency` problems at
// a time, and turns each outcome into a JSON report.
class BatchRunner {
public:
    using json = nlohmann::json;

    explicit BatchRunner(BatchOptions options = {});

    json run_problem(const Problem& problem) const;

    // Reports come back in problem order.
    std::vector<json> run_all(const std::vector<Problem>& problems) const;

    // status == "ok" and, when an expected output was given, it matched.
    static bool passed(const json& report);

    // The text a value is checked as: strings verbatim, null as "",
    // anything else as its JSON dump.
    static std::string output_text(const json& value);

    const BatchOptions& options() const { return options_; }

private:
    BatchOptions options_;
    BoundedRunner runner_;
};
