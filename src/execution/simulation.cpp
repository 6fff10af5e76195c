#include "execution/simulation.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <memory>
#include <mutex>
#include <random>
#include <regex>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace coderun {
using namespace std;

const vector<string> SIMULATED_FAILURES = {
    "Runtime Error: Null pointer exception",
    "Runtime Error: Array index out of bounds",
    "Runtime Error: Division by zero",
    "Time Limit Exceeded: Code took too long to execute",
    "Memory Limit Exceeded: Code used too much memory"};

random_source make_random_source(optional<unsigned long long> seed) {
    auto engine = make_shared<mt19937_64>(seed ? *seed : random_device{}());
    auto lock = make_shared<mutex>();
    return [engine, lock]() {
        lock_guard<mutex> guard(*lock);
        return uniform_real_distribution<double>(0.0, 1.0)(*engine);
    };
}

bool has_entry_point(const string &code, language lang) {
    static const regex python_entry(R"(print\s*\(|if\s+__name__\s*==\s*['"]__main__['"]|def\s+main)");
    static const regex java_entry(R"(public\s+static\s+void\s+main\s*\(\s*String\s*\[\s*\]\s*\w+\s*\))");
    static const regex cpp_entry(R"(int\s+main\s*\(\s*\)|cout\s*<<)");

    switch (lang) {
        case language::python:
            return regex_search(code, python_entry);
        case language::java:
            return regex_search(code, java_entry);
        case language::cpp:
            return regex_search(code, cpp_entry);
        default:
            return true;
    }
}

optional<string> check_basic_syntax(const string &code, language lang) {
    switch (lang) {
        case language::python: {
            // 以冒号结尾的行之后必须是缩进的代码块
            vector<string> lines;
            boost::split(lines, code, boost::is_any_of("\n"));
            for (size_t i = 0; i + 1 < lines.size(); ++i) {
                if (!boost::algorithm::ends_with(boost::algorithm::trim_copy(lines[i]), ":")) continue;
                const string &next = lines[i + 1];
                if (!boost::algorithm::trim_copy(next).empty() && next[0] != ' ' && next[0] != '\t')
                    return fmt::format("Indentation error after line {}", i + 1);
            }
            return nullopt;
        }
        case language::java:
            if (code.find("class") == string::npos)
                return string("Missing class declaration");
            if (code.find('{') == string::npos)
                return string("Missing opening brace for class");
            return nullopt;
        case language::cpp:
            if (code.find("#include") == string::npos)
                return string("Missing include statements");
            return nullopt;
        default:
            return nullopt;
    }
}

double analyze_code_quality(const string &code, language lang) {
    double quality = 0.7;

    if (has_entry_point(code, lang)) quality += 0.2;

    size_t length = boost::algorithm::trim_copy(code).size();
    if (length > 50 && length < 2000) quality += 0.1;

    if (code.find("for") != string::npos || code.find("while") != string::npos || code.find("if") != string::npos)
        quality += 0.1;

    return min(1.0, quality);
}

/**
 * @brief 按 parseInt 的规则解析行首的十进制整数
 * 跳过前导空白，允许正负号，遇到第一个非数字字符为止，没有数字时返回 nullopt
 */
static optional<long long> parse_leading_integer(const string &text) {
    size_t i = 0;
    while (i < text.size() && isspace((unsigned char)text[i])) ++i;
    bool negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) negative = text[i++] == '-';
    size_t begin = i;
    long long value = 0;
    for (; i < text.size() && isdigit((unsigned char)text[i]); ++i) {
        if (i - begin >= 18) return nullopt;  // 超出 long long 精度的数字不参与计算
        value = value * 10 + (text[i] - '0');
    }
    if (i == begin) return nullopt;
    return negative ? -value : value;
}

static string floor_divide(long long a, long long b) {
    if (b == 0) {
        if (a > 0) return "Infinity";
        if (a < 0) return "-Infinity";
        return "NaN";
    }
    long long q = a / b;
    if (a % b != 0 && ((a < 0) != (b < 0))) --q;
    return std::to_string(q);
}

/**
 * @brief 乘积超出 long long 时按双精度浮点数计算，不小于 1e21 时使用科学计数法
 */
static string multiply(long long a, long long b) {
    long long product;
    if (!__builtin_mul_overflow(a, b, &product))
        return std::to_string(product);
    double approx = (double)a * (double)b;
    if (fabs(approx) < 1e21) return fmt::format("{:.0f}", approx);
    return fmt::format("{}", approx);
}

string synthesize_output(const string &input, const string &code) {
    if (input.empty()) return "";

    vector<string> lines;
    for (auto &line : split_lines(input))
        if (!boost::algorithm::trim_copy(line).empty()) lines.push_back(line);

    string lower = boost::algorithm::to_lower_copy(code);
    optional<long long> first = lines.size() > 0 ? parse_leading_integer(lines[0]) : nullopt;
    optional<long long> second = lines.size() > 1 ? parse_leading_integer(lines[1]) : nullopt;

    if (lower.find("sum") != string::npos || code.find('+') != string::npos) {
        vector<long long> numbers;
        for (auto &line : lines)
            if (auto number = parse_leading_integer(line)) numbers.push_back(*number);
        if (numbers.size() >= 2)
            return std::to_string(numbers[0] + numbers[1]);
    }

    if (lower.find("factorial") != string::npos && first && *first >= 0 && *first <= 10) {
        long long factorial = 1;
        for (long long i = 1; i <= *first; ++i)
            factorial *= i;
        return std::to_string(factorial);
    }

    if (lower.find("fibonacci") != string::npos && first && *first >= 0 && *first <= 20) {
        if (*first <= 1) return std::to_string(*first);
        long long a = 0, b = 1;
        for (long long i = 2; i <= *first; ++i) {
            long long c = a + b;
            a = b;
            b = c;
        }
        return std::to_string(b);
    }

    if (first && second) {
        if (code.find('*') != string::npos) return multiply(*first, *second);
        if (code.find('/') != string::npos) return floor_divide(*first, *second);
        if (code.find('%') != string::npos) return *second == 0 ? "NaN" : std::to_string(*first % *second);
    }

    return lines.empty() ? "" : lines[0];
}

execution_result simulate(const string &code, language lang, const string &stdin_data, const random_source &rng) {
    LOG(WARNING) << "Using simulation fallback for " << to_string(lang);

    if (boost::algorithm::trim_copy(code).empty())
        throw execution_error("Empty code submission - cannot simulate execution");

    if (!has_entry_point(code, lang))
        throw execution_error(fmt::format("Code must include a main function for {}", to_string(lang)));

    if (auto syntax_error = check_basic_syntax(code, lang))
        throw execution_error("Compilation Error: " + *syntax_error);

    double quality = analyze_code_quality(code, lang);
    if (rng() >= quality) {
        size_t index = min(SIMULATED_FAILURES.size() - 1, (size_t)(rng() * SIMULATED_FAILURES.size()));
        throw execution_error(SIMULATED_FAILURES[index]);
    }

    execution_result result;
    result.backend = "simulation";
    result.simulated = true;
    result.stdout_data = synthesize_output(stdin_data, code);
    result.exit_code = 0;
    result.runtime = fmt::format("{}ms", 100 + (int)(rng() * 300));
    result.memory = fmt::format("{:.1f}MB", rng() * 50 + 20);

    LOG(INFO) << "Simulation generated output: \"" << result.stdout_data << "\"";
    return result;
}

simulation_executor::simulation_executor(random_source rng)
    : rng(move(rng)) {}

string simulation_executor::name() const {
    return "simulation";
}

execution_result simulation_executor::execute(const execution_request &request) const {
    return simulate(request.code, request.lang, request.stdin_data, rng);
}

}  // namespace coderun
