#include "execution/request.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <cmath>
#include <regex>
#include <unordered_map>

namespace coderun {
using namespace std;
using namespace nlohmann;

const char *const MEMORY_UNAVAILABLE = "—";

// clang-format off
static const unordered_map<string, language> language_names = boost::assign::map_list_of
    ("java", language::java)
    ("cpp", language::cpp)
    ("c++", language::cpp)
    ("python", language::python)
    ("python3", language::python)
    ("py", language::python)
    ("script", language::script)
    ("javascript", language::script)
    ("js", language::script);
// clang-format on

optional<language> parse_language(const string &name) {
    auto it = language_names.find(boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name)));
    if (it == language_names.end()) return nullopt;
    return it->second;
}

const char *to_string(language lang) {
    switch (lang) {
        case language::java:
            return "java";
        case language::cpp:
            return "cpp";
        case language::python:
            return "python";
        case language::script:
            return "script";
    }
    return "unknown";
}

void to_json(json &j, const execution_result &result) {
    j = {{"stdout", result.stdout_data},
         {"output", result.stdout_data},
         {"runtime", result.runtime},
         {"memory", result.memory},
         {"simulated", result.simulated},
         {"backend", result.backend}};
    j["stderr"] = result.stderr_data ? json(*result.stderr_data) : json(nullptr);
    j["exitCode"] = result.exit_code ? json(*result.exit_code) : json(nullptr);
}

optional<long long> parse_runtime_ms(const string &text) {
    static const regex ms_pattern(R"(([0-9]+(?:\.[0-9]+)?)\s*ms)", regex::icase);
    static const regex sec_pattern(R"(([0-9]+(?:\.[0-9]+)?)\s*s(ec)?)", regex::icase);
    static const regex number_pattern(R"(^\s*([0-9]+(?:\.[0-9]+)?)\s*$)");

    smatch matches;
    if (regex_search(text, matches, ms_pattern))
        return llround(stod(matches[1].str()));
    if (regex_search(text, matches, sec_pattern))
        return llround(stod(matches[1].str()) * 1000);
    if (regex_search(text, matches, number_pattern))
        return llround(stod(matches[1].str()));
    return nullopt;
}

}  // namespace coderun
