#include "problem_set.hpp"
#include "log.hpp"
#include <algorithm>
#include <fstream>
#include <regex>
#include <stdexcept>

using json = nlohmann::json;

static std::string trim(const std::string& s) {
    static const char* ws = " \t\r\n\f\v";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    for (;;) {
        const auto nl = s.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(s.substr(start));
            return lines;
        }
        lines.push_back(s.substr(start, nl - start));
        start = nl + 1;
    }
}

// Calls fn(value, line number) for every non-blank line.
template <typename Fn>
static void read_jsonl(const std::filesystem::path& file, Fn&& fn) {
    std::ifstream in(file);
    if (!in) throw std::runtime_error("cannot open " + file.string());

    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (trim(line).empty()) continue;
        json j;
        try {
            j = json::parse(line);
        } catch (const json::parse_error& e) {
            throw std::runtime_error(file.string() + ":" + std::to_string(lineno) + ": " + e.what());
        }
        fn(std::move(j), lineno);
    }
}

std::vector<json> load_jsonl(const std::filesystem::path& file) {
    std::vector<json> rows;
    read_jsonl(file, [&rows](json j, std::size_t) { rows.push_back(std::move(j)); });
    LOG_DEBUG("Loaded " + std::to_string(rows.size()) + " rows from " + file.string());
    return rows;
}

Problem problem_from_json(const json& j, std::size_t line) {
    if (!j.is_object()) {
        throw std::runtime_error("line " + std::to_string(line) + ": problem is not a JSON object");
    }
    auto get_str = [&j](const char* key) -> std::optional<std::string> {
        if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
        return std::nullopt;
    };

    Problem p;
    if (j.contains("id") && j["id"].is_number()) p.id = j["id"].dump();
    else p.id = get_str("id").value_or(get_str("name").value_or("line-" + std::to_string(line)));

    auto code = get_str("code");
    if (!code) code = get_str("solution");
    if (!code) {
        throw std::runtime_error("line " + std::to_string(line) + ": problem '" + p.id + "' has no code");
    }
    p.code = strip_code_fences(*code);
    p.input = j.value("input", json());

    auto expected = get_str("expected_output");
    if (!expected) expected = get_str("output");
    p.expected_output = expected;
    return p;
}

std::vector<Problem> load_problems(const std::filesystem::path& file) {
    std::vector<Problem> problems;
    read_jsonl(file, [&](json j, std::size_t lineno) {
        try {
            problems.push_back(problem_from_json(j, lineno));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(file.string() + ": " + e.what());
        }
    });
    LOG_DEBUG("Loaded " + std::to_string(problems.size()) + " problems from " + file.string());
    return problems;
}

std::string strip_code_fences(const std::string& solution) {
    static const std::regex leading("^```[A-Za-z0-9_+-]*\\s*");
    static const std::regex trailing("\\s*```$");
    std::string s = trim(solution);
    s = std::regex_replace(s, leading, "", std::regex_constants::format_first_only);
    s = std::regex_replace(s, trailing, "");
    return s;
}

CheckResult check_solution(const std::string& expected, const std::string& actual) {
    const auto expected_lines = split_lines(trim(expected));
    const auto actual_lines = split_lines(trim(actual));

    CheckResult r;
    r.total = expected_lines.size();
    const std::size_t n = std::min(expected_lines.size(), actual_lines.size());
    for (std::size_t i = 0; i < n; ++i) {
        std::string e = trim(expected_lines[i]);
        std::string a = trim(actual_lines[i]);
        if (e == a) {
            ++r.matched;
        } else {
            r.offending_cases.emplace_back(std::move(e), std::move(a));
        }
    }
    r.passed = r.matched == r.total;
    return r;
}

json to_json(const CheckResult& r) {
    json offending = json::array();
    for (const auto& [e, a] : r.offending_cases) {
        offending.push_back({{"expected", e}, {"actual", a}});
    }
    return {
        {"matches", r.passed},
        {"matched", r.matched},
        {"total", r.total},
        {"offending_cases", offending}
    };
}
