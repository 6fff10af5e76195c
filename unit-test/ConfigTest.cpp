#include <stdlib.h>
#include <filesystem>
#include <fstream>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace nlohmann;
using namespace coderun;

static const char *const URL_VARIABLES[] = {"SELF_URL", "SERVER_URL", "API_BASE_URL", "RENDER_EXTERNAL_URL", "COMPILER_API_URL"};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char *key : URL_VARIABLES)
            unsetenv(key);
    }

    void TearDown() override {
        for (const char *key : URL_VARIABLES)
            unsetenv(key);
    }
};

TEST_F(ConfigTest, NormalizeBaseUrl) {
    EXPECT_EQ("http://host", normalize_base_url("http://host"));
    EXPECT_EQ("http://host", normalize_base_url("http://host/"));
    EXPECT_EQ("http://host", normalize_base_url("http://host/api"));
    EXPECT_EQ("http://host", normalize_base_url("http://host/api/"));
    EXPECT_EQ("http://host/v2", normalize_base_url("http://host/v2//"));
    EXPECT_EQ("http://host/apis", normalize_base_url("http://host/apis"));
}

TEST_F(ConfigTest, Defaults) {
    configuration config;
    resolve_configuration(config);

    EXPECT_EQ("http://localhost:5000", config.service.base_url);
    EXPECT_EQ("https://www.onlinegdb.com/api/v1/execute", config.compiler_api.url);
    EXPECT_DOUBLE_EQ(30, config.compiler_api.max_timeout_seconds);
    EXPECT_EQ(5000, config.compiler_api.request_buffer_ms);
    EXPECT_TRUE(config.sandbox_enabled);
    EXPECT_EQ(8000, config.time_limit_ms);
    EXPECT_FALSE(config.simulation_seed.has_value());
}

TEST_F(ConfigTest, EnvironmentFallbackOrder) {
    setenv("API_BASE_URL", "http://api-base/api", 1);
    setenv("RENDER_EXTERNAL_URL", "http://render", 1);
    {
        configuration config;
        resolve_configuration(config);
        EXPECT_EQ("http://api-base", config.service.base_url);
    }

    setenv("SELF_URL", "http://self/", 1);
    {
        configuration config;
        resolve_configuration(config);
        EXPECT_EQ("http://self", config.service.base_url);
    }

    setenv("COMPILER_API_URL", "http://compiler/run", 1);
    {
        configuration config;
        resolve_configuration(config);
        EXPECT_EQ("http://compiler/run", config.compiler_api.url);
    }
}

TEST_F(ConfigTest, FileValuesWinOverEnvironment) {
    setenv("SELF_URL", "http://self", 1);
    json j = R"({
        "service": {"baseUrl": "http://configured/api/"},
        "compilerApi": {"maxTimeoutSeconds": 10, "requestBufferMs": 1000, "userAgent": "test-agent"},
        "sandbox": {"enabled": false},
        "grading": {"timeLimitMs": 2000},
        "simulation": {"seed": 7}
    })"_json;
    configuration config = j.get<configuration>();
    resolve_configuration(config);

    EXPECT_EQ("http://configured", config.service.base_url);
    EXPECT_DOUBLE_EQ(10, config.compiler_api.max_timeout_seconds);
    EXPECT_EQ(1000, config.compiler_api.request_buffer_ms);
    EXPECT_EQ("test-agent", config.compiler_api.user_agent);
    EXPECT_FALSE(config.sandbox_enabled);
    EXPECT_EQ(2000, config.time_limit_ms);
    EXPECT_EQ(7u, config.simulation_seed);
}

TEST_F(ConfigTest, RejectsNonPositiveTimeLimit) {
    configuration config;
    config.time_limit_ms = 0;
    EXPECT_THROW(resolve_configuration(config), internal_error);
}

TEST_F(ConfigTest, LoadConfigurationFile) {
    filesystem::path path = filesystem::temp_directory_path() / "coderun-config-test.json";
    {
        ofstream fout(path);
        fout << R"({"grading": {"timeLimitMs": 1234}})";
    }
    configuration config = load_configuration(path);
    EXPECT_EQ(1234, config.time_limit_ms);
    EXPECT_EQ("http://localhost:5000", config.service.base_url);
    filesystem::remove(path);

    EXPECT_THROW(load_configuration(filesystem::temp_directory_path() / "coderun-missing.json"), internal_error);
    EXPECT_EQ(8000, load_configuration("").time_limit_ms);
}
