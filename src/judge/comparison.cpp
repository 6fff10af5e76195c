#include "judge/comparison.hpp"
#include <boost/algorithm/string.hpp>
#include <cctype>

namespace coderun {
using namespace std;

comparison_options make_comparison_options(const string &compare_mode, optional<bool> ignore_whitespace, optional<bool> ignore_case) {
    bool lenient = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(compare_mode)) != "strict";
    comparison_options options;
    options.ignore_whitespace = ignore_whitespace.value_or(lenient);
    options.ignore_case = ignore_case.value_or(lenient);
    return options;
}

string normalize(const string &text, const comparison_options &options) {
    string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            result += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            result += text[i];
        }
    }
    while (!result.empty() && result.back() == '\n')
        result.pop_back();

    if (options.ignore_whitespace) {
        string collapsed;
        bool in_space = false;
        for (char ch : result) {
            if (isspace((unsigned char)ch)) {
                in_space = true;
            } else {
                if (in_space && !collapsed.empty()) collapsed += ' ';
                in_space = false;
                collapsed += ch;
            }
        }
        result = move(collapsed);
    }

    if (options.ignore_case)
        boost::algorithm::to_lower(result);

    return result;
}

bool outputs_match(const string &actual, const string &expected, const comparison_options &options) {
    return normalize(actual, options) == normalize(expected, options);
}

}  // namespace coderun
