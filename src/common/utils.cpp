#include "common/utils.hpp"
#include <cstdlib>

namespace coderun {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

optional<string> first_env(const vector<string> &keys) {
    for (auto &key : keys) {
        string value = get_env(key, "");
        if (!value.empty()) return value;
    }
    return nullopt;
}

vector<string> split_lines(const string &text) {
    vector<string> lines;
    size_t begin = 0;
    while (true) {
        size_t end = text.find('\n', begin);
        if (end == string::npos) {
            lines.push_back(text.substr(begin));
            break;
        }
        size_t len = end - begin;
        if (len > 0 && text[end - 1] == '\r') --len;  // \r\n
        lines.push_back(text.substr(begin, len));
        begin = end + 1;
    }
    return lines;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

long long epoch_milliseconds() {
    return chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace coderun
