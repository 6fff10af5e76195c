#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "execution/compiler_api_executor.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"
#include "test/mock_transport.hpp"

using namespace std;
using namespace nlohmann;
using namespace coderun;

class CompilerApiExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.url = "https://compiler.example/api/v1/execute";
    }

    execution_result run(const execution_request &request) {
        compiler_api_executor executor(config, mock.transport());
        return executor.execute(request);
    }

    backend_error run_failure(const execution_request &request) {
        try {
            run(request);
        } catch (backend_error &e) {
            return e;
        }
        ADD_FAILURE() << "backend_error expected";
        return backend_error("compiler-api", failure_cause::http_error, "");
    }

    compiler_api_config config;
    mock_transport mock;
    execution_request request{"#include <iostream>\nint main() {}", language::cpp, "1 2", 8000};
};

TEST_F(CompilerApiExecutorTest, LanguageTable) {
    EXPECT_EQ("java", find_provider_language(language::java)->id);
    EXPECT_EQ("cpp17", find_provider_language(language::cpp)->id);
    EXPECT_EQ("python3", find_provider_language(language::python)->id);
    EXPECT_EQ(0, find_provider_language(language::python)->version_index);
    EXPECT_FALSE(find_provider_language(language::script).has_value());
}

TEST_F(CompilerApiExecutorTest, UnsupportedLanguageFailsBeforeNetwork) {
    backend_error error = run_failure({"print(1)", language::script, "", 1000});
    EXPECT_EQ(failure_cause::unsupported_language, error.cause);
    EXPECT_EQ(0u, mock.calls());
}

TEST_F(CompilerApiExecutorTest, SendsProviderPayload) {
    mock.respond(200, R"({"output": "3\n", "errors": "", "executionTime": 12, "memory": 3400})");
    execution_result result = run(request);

    ASSERT_EQ(1u, mock.calls());
    const http_request &sent = mock.requests()[0];
    EXPECT_EQ(config.url, sent.url);
    EXPECT_EQ("application/json", sent.headers.at("Content-Type"));
    EXPECT_EQ("application/json", sent.headers.at("Accept"));
    EXPECT_EQ("coderun/1.0", sent.headers.at("User-Agent"));
    EXPECT_EQ(13000, sent.timeout_ms);

    json expected = {{"language", "cpp17"},
                     {"versionIndex", 0},
                     {"code", request.code},
                     {"input", "1 2"},
                     {"save", false},
                     {"timeout", 8.0}};
    EXPECT_JSON_EQ(expected, json::parse(sent.body));

    EXPECT_EQ("3\n", result.stdout_data);
    EXPECT_FALSE(result.stderr_data.has_value());
    EXPECT_EQ("12ms", result.runtime);
    EXPECT_EQ("3400KB", result.memory);
    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ("compiler-api", result.backend);
}

TEST_F(CompilerApiExecutorTest, TimeoutIsCapped) {
    mock.respond(200, R"({"stdout": "ok"})");
    request.timeout_ms = 120000;
    run(request);

    json sent = json::parse(mock.requests()[0].body);
    EXPECT_DOUBLE_EQ(30.0, sent["timeout"].get<double>());
    EXPECT_EQ(125000, mock.requests()[0].timeout_ms);
}

TEST_F(CompilerApiExecutorTest, AlternativeFieldNames) {
    mock.respond(200, R"({"stdout": "", "stderr": "error: expected ';'", "runtime": "0.5s", "memory": "1.2MB"})");
    execution_result result = run(request);

    EXPECT_EQ("", result.stdout_data);
    EXPECT_EQ("error: expected ';'", result.stderr_data);
    EXPECT_EQ("500ms", result.runtime);
    EXPECT_EQ("1.2MB", result.memory);
    EXPECT_EQ(1, result.exit_code);
}

TEST_F(CompilerApiExecutorTest, ClassifiesHttpErrors) {
    mock.respond(422, R"({"message": "language not recognized"})")
        .respond(429, "slow down")
        .respond(502, "bad gateway")
        .respond(403, "forbidden")
        .refuse()
        .time_out();

    backend_error format = run_failure(request);
    EXPECT_EQ(failure_cause::request_format, format.cause);
    EXPECT_STREQ("Compiler API format error: language not recognized", format.what());
    EXPECT_EQ(422, format.http_status);

    EXPECT_EQ(failure_cause::rate_limited, run_failure(request).cause);
    EXPECT_EQ(failure_cause::server_error, run_failure(request).cause);
    EXPECT_EQ(failure_cause::http_error, run_failure(request).cause);

    backend_error unreachable = run_failure(request);
    EXPECT_EQ(failure_cause::unreachable, unreachable.cause);
    EXPECT_STREQ("Unable to connect to compiler API", unreachable.what());

    EXPECT_EQ(failure_cause::http_error, run_failure(request).cause);
    EXPECT_EQ(6u, mock.calls());
}

TEST_F(CompilerApiExecutorTest, EmptyOrMalformedResponseFails) {
    mock.respond(200, "").respond(200, "{}").respond(200, "not json").respond(200, R"({"errors": "only errors"})");
    for (int i = 0; i < 4; ++i)
        EXPECT_EQ(failure_cause::malformed_response, run_failure(request).cause) << i;
}
