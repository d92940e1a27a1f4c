#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

struct Problem {
    std::string id;
    std::string code;
    nlohmann::json input;
    std::optional<std::string> expected_output;
};

struct CheckResult {
    std::size_t matched{0};
    std::size_t total{0};
    bool passed{false};
    std::vector<std::pair<std::string, std::string>> offending_cases; // (expected, actual)
};

// One JSON value per non-blank line. Throws std::runtime_error naming the
// file and line on unreadable input.
std::vector<nlohmann::json> load_jsonl(const std::filesystem::path& file);

// Problem fields: id|name, code|solution, input, expected_output|output.
// A missing id becomes "line-<n>".
Problem problem_from_json(const nlohmann::json& j, std::size_t line);
std::vector<Problem> load_problems(const std::filesystem::path& file);

// Trim, then drop a leading ```<lang> and a trailing ``` fence.
std::string strip_code_fences(const std::string& solution);

// Compares trimmed lines pairwise up to the shorter of the two texts;
// passes when every expected line matched.
CheckResult check_solution(const std::string& expected, const std::string& actual);

nlohmann::json to_json(const CheckResult& r);
