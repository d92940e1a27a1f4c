#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <chrono>
#include <cstdlib>
#include <algorithm>
#include <nlohmann/json.hpp>
#include "batch_runner.hpp"
#include "bounded_runner.hpp"
#include "log.hpp"
#include "problem_set.hpp"

using json = nlohmann::json;

// Very small CLI parser
struct Args {
    std::string problems;          // JSONL problem set
    std::string code;              // single fragment file
    std::string input = "null";    // JSON input for --code
    int timeout_s = 60;
    int concurrency = 1;
    bool debug = false;
    bool quiet = false;
};

static void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --problems FILE [--timeout S] [--concurrency N] [--debug|--quiet]\n";
    std::cout << "       " << argv0 << " --code FILE [--input JSON] [--timeout S] [--debug|--quiet]\n";
    std::cout << "\nFragments are Lua chunks defining solve(input). --problems prints one JSON\n"
                 "report per line; --code prints the value solve returned.\n";
}

static int parse_int(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        int v = std::stoi(value, &used);
        if (used == value.size()) return v;
    } catch (const std::exception&) {
    }
    std::cerr << "Invalid value for " << flag << ": " << value << "\n";
    std::exit(2);
}

static Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--help" || s == "-h") { print_help(argv[0]); std::exit(0); }
        else if (s == "--problems" && i + 1 < argc) { a.problems = argv[++i]; }
        else if (s == "--code" && i + 1 < argc) { a.code = argv[++i]; }
        else if (s == "--input" && i + 1 < argc) { a.input = argv[++i]; }
        else if (s == "--timeout" && i + 1 < argc) { a.timeout_s = parse_int(s, argv[++i]); }
        else if (s == "--concurrency" && i + 1 < argc) { a.concurrency = std::max(1, parse_int(s, argv[++i])); }
        else if (s == "--debug") { a.debug = true; }
        else if (s == "--quiet") { a.quiet = true; }
        else {
            std::cerr << "Unknown arg: " << s << "\n";
            print_help(argv[0]);
            std::exit(2);
        }
    }
    if (a.problems.empty() == a.code.empty()) {
        std::cerr << "Exactly one of --problems or --code is required\n";
        print_help(argv[0]);
        std::exit(2);
    }
    return a;
}

static int run_problems(const Args& args) {
    std::vector<Problem> problems;
    try {
        problems = load_problems(args.problems);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load problems: " << e.what() << "\n";
        return 2;
    }

    BatchOptions opts;
    opts.timeout = std::chrono::seconds(args.timeout_s);
    opts.concurrency = static_cast<std::size_t>(args.concurrency);
    BatchRunner batch{opts};

    bool all_passed = true;
    for (const auto& report : batch.run_all(problems)) {
        std::cout << report.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
        if (!BatchRunner::passed(report)) all_passed = false;
    }
    std::cout.flush();
    return all_passed ? 0 : 1;
}

static int run_code(const Args& args) {
    std::ifstream in(args.code);
    if (!in) {
        std::cerr << "Cannot open " << args.code << "\n";
        return 2;
    }
    std::stringstream ss;
    ss << in.rdbuf();

    json input = json::parse(args.input, nullptr, false);
    if (input.is_discarded()) {
        std::cerr << "--input is not valid JSON: " << args.input << "\n";
        return 2;
    }

    BoundedRunner runner;
    ExecutionResult result = runner.run(strip_code_fences(ss.str()), std::move(input),
                                        std::chrono::seconds(args.timeout_s));
    if (const auto* ok = std::get_if<Success>(&result)) {
        std::cout << ok->value.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
        return 0;
    }
    if (const auto* err = std::get_if<EvaluationError>(&result)) {
        std::cerr << "Evaluation failed (" << stage_name(err->stage) << "): " << err->cause << "\n";
        return 1;
    }
    std::cerr << "Function call timed out after " << args.timeout_s << "s\n";
    return 1;
}

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);

    if (args.debug) Logger::get().set_level(LogLevel::DEBUG);
    else if (args.quiet) Logger::get().set_level(LogLevel::WARN);

    if (!args.problems.empty()) return run_problems(args);
    return run_code(args);
}
