#include "common/status.hpp"
#include "execution/request.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace coderun;

TEST(RequestTest, ParseLanguageAcceptsAliases) {
    EXPECT_EQ(language::java, parse_language("Java"));
    EXPECT_EQ(language::cpp, parse_language("cpp"));
    EXPECT_EQ(language::cpp, parse_language("C++"));
    EXPECT_EQ(language::python, parse_language(" python3 "));
    EXPECT_EQ(language::python, parse_language("py"));
    EXPECT_EQ(language::script, parse_language("javascript"));
    EXPECT_EQ(language::script, parse_language("JS"));
    EXPECT_FALSE(parse_language("ruby").has_value());
    EXPECT_FALSE(parse_language("").has_value());
}

TEST(RequestTest, LanguageNames) {
    EXPECT_STREQ("java", to_string(language::java));
    EXPECT_STREQ("cpp", to_string(language::cpp));
    EXPECT_STREQ("python", to_string(language::python));
    EXPECT_STREQ("script", to_string(language::script));
}

TEST(RequestTest, ParseRuntime) {
    EXPECT_EQ(123, parse_runtime_ms("123ms"));
    EXPECT_EQ(12, parse_runtime_ms("11.6 ms"));
    EXPECT_EQ(1500, parse_runtime_ms("1.5s"));
    EXPECT_EQ(2000, parse_runtime_ms("2 sec"));
    EXPECT_EQ(42, parse_runtime_ms("42"));
    EXPECT_FALSE(parse_runtime_ms("").has_value());
    EXPECT_FALSE(parse_runtime_ms("fast").has_value());
}

TEST(RequestTest, ExecutionResultToJson) {
    execution_result result;
    result.stdout_data = "7";
    result.exit_code = 0;
    result.runtime = "12ms";
    result.memory = MEMORY_UNAVAILABLE;
    result.backend = "service";

    json expected = {{"stdout", "7"},
                     {"output", "7"},
                     {"stderr", nullptr},
                     {"exitCode", 0},
                     {"runtime", "12ms"},
                     {"memory", "—"},
                     {"simulated", false},
                     {"backend", "service"}};
    EXPECT_JSON_EQ(expected, json(result));

    result.stderr_data = "boom";
    result.exit_code.reset();
    json j = result;
    EXPECT_EQ("boom", j["stderr"].get<string>());
    EXPECT_TRUE(j["exitCode"].is_null());
}

TEST(RequestTest, StatusDisplayMessages) {
    EXPECT_STREQ("Accepted", get_display_message(status::ACCEPTED));
    EXPECT_STREQ("Wrong Answer", get_display_message(status::WRONG_ANSWER));
    EXPECT_STREQ("Time Limit Exceeded", get_display_message(status::TIME_LIMIT_EXCEEDED));
    EXPECT_STREQ("Compilation Error", get_display_message(status::COMPILATION_ERROR));
    EXPECT_STREQ("Runtime Error", get_display_message(status::RUNTIME_ERROR));
}
