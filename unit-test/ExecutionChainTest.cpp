#include "common/exceptions.hpp"
#include "execution/chain.hpp"
#include "gtest/gtest.h"
#include "test/mock_transport.hpp"

using namespace std;
using namespace coderun;

static const string CPP_SUM = R"(#include <iostream>
int main() {
    int a, b;
    std::cin >> a >> b;
    std::cout << a + b;
})";

class ExecutionChainTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.service.base_url = "http://service";
        config.compiler_api.url = "http://compiler/execute";
    }

    execution_chain make_chain() {
        return make_default_chain(config, mock.transport(), fixed_random({0.0}));
    }

    configuration config;
    mock_transport mock;
};

TEST_F(ExecutionChainTest, DefaultOrder) {
    execution_chain chain = make_chain();
    ASSERT_EQ(4u, chain.executors.size());
    EXPECT_EQ("sandbox", executor_name(chain.executors[0]));
    EXPECT_EQ("service", executor_name(chain.executors[1]));
    EXPECT_EQ("compiler-api", executor_name(chain.executors[2]));
    EXPECT_EQ("simulation", executor_name(chain.executors[3]));

    config.sandbox_enabled = false;
    EXPECT_EQ(3u, make_chain().executors.size());
}

TEST_F(ExecutionChainTest, FirstSuccessfulBackendWins) {
    mock.respond(200, R"({"stdout": "7"})");
    execution_result result = make_chain().execute_best_effort({CPP_SUM, language::cpp, "3 4", 1000});

    EXPECT_EQ("service", result.backend);
    EXPECT_EQ("7", result.stdout_data);
    EXPECT_EQ(1u, mock.calls());
}

TEST_F(ExecutionChainTest, FallsThroughToCompilerApi) {
    mock.respond(500, "internal error").respond(200, R"({"output": "7"})");
    execution_result result = make_chain().execute_best_effort({CPP_SUM, language::cpp, "3 4", 1000});

    EXPECT_EQ("compiler-api", result.backend);
    EXPECT_EQ("7", result.stdout_data);
    ASSERT_EQ(2u, mock.calls());
    EXPECT_EQ("http://service/api/execute", mock.requests()[0].url);
    EXPECT_EQ("http://compiler/execute", mock.requests()[1].url);
}

TEST_F(ExecutionChainTest, FallsThroughToSimulation) {
    mock.refuse().time_out();
    execution_result result = make_chain().execute_best_effort({CPP_SUM, language::cpp, "3\n4", 1000});

    EXPECT_EQ("simulation", result.backend);
    EXPECT_TRUE(result.simulated);
    EXPECT_EQ("7", result.stdout_data);
    EXPECT_EQ(2u, mock.calls());
}

TEST_F(ExecutionChainTest, ScriptRunsInSandbox) {
    execution_result result = make_chain().execute_best_effort({"print(int(readLine()) * 2)", language::script, "21", 1000});

    EXPECT_EQ("sandbox", result.backend);
    EXPECT_EQ("42\n", result.stdout_data);
    EXPECT_EQ(0u, mock.calls());
}

TEST_F(ExecutionChainTest, ScriptWithoutSandboxSkipsCompilerApi) {
    config.sandbox_enabled = false;
    mock.refuse();
    execution_result result = make_chain().execute_best_effort({"print(1)", language::script, "hello", 1000});

    // 第三方编译 API 不支持 script，不会发出请求
    EXPECT_EQ(1u, mock.calls());
    EXPECT_EQ("simulation", result.backend);
    EXPECT_EQ("hello", result.stdout_data);
}

TEST_F(ExecutionChainTest, EmptyChainIsConfigurationError) {
    execution_chain chain;
    EXPECT_THROW(chain.execute_best_effort({CPP_SUM, language::cpp, "", 1000}), internal_error);
}

TEST_F(ExecutionChainTest, LastExecutorErrorPropagates) {
    execution_chain simulation_only;
    simulation_only.executors.emplace_back(simulation_executor(fixed_random({0.0})));
    EXPECT_THROW(simulation_only.execute_best_effort({"", language::cpp, "", 1000}), execution_error);

    execution_chain remote_only;
    remote_only.executors.emplace_back(service_executor(config.service, mock.transport()));
    remote_only.executors.emplace_back(compiler_api_executor(config.compiler_api, mock.transport()));
    mock.refuse().respond(429, "too many requests");
    try {
        remote_only.execute_best_effort({CPP_SUM, language::cpp, "", 1000});
        FAIL() << "backend_error expected";
    } catch (backend_error &e) {
        EXPECT_EQ("compiler-api", e.backend);
        EXPECT_EQ(failure_cause::rate_limited, e.cause);
    }
}

TEST_F(ExecutionChainTest, RunOnceReportsFailuresAsResult) {
    execution_chain chain;
    chain.executors.emplace_back(simulation_executor(fixed_random({0.0})));

    execution_result failed = run_once(chain, "x = 1", "python", "", 1000);
    EXPECT_EQ("Code must include a main function for python", failed.stderr_data);
    EXPECT_EQ("", failed.stdout_data);
    EXPECT_EQ(1, failed.exit_code);
    EXPECT_EQ("Runtime Error", classify_run_status(failed));

    execution_result passed = run_once(chain, CPP_SUM, "c++", "1\n2", 1000);
    EXPECT_EQ("3", passed.stdout_data);
    EXPECT_EQ("Completed", classify_run_status(passed));

    EXPECT_THROW(run_once(chain, CPP_SUM, "cobol", "", 1000), validation_error);
}

TEST_F(ExecutionChainTest, ClassifyRunStatus) {
    execution_result result;
    EXPECT_EQ("Completed", classify_run_status(result));

    result.stderr_data = "  ";
    EXPECT_EQ("Completed", classify_run_status(result));

    result.stderr_data = "main.cpp: failed to compile";
    EXPECT_EQ("Compilation Error", classify_run_status(result));

    // 只匹配 compile，不匹配 compilation
    result.stderr_data = "Compilation Error: Missing include statements";
    EXPECT_EQ("Runtime Error", classify_run_status(result));

    result.stderr_data = "TimeoutError: Script execution timeout: exceeded 100ms";
    EXPECT_EQ("Time Limit Exceeded", classify_run_status(result));

    result.stderr_data = "ValueError: bad value";
    EXPECT_EQ("Runtime Error", classify_run_status(result));
}
