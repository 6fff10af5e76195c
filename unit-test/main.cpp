#include <curl/curl.h>
#include <glog/logging.h>
#include <memory>
#include "common/python.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    curl_global_init(CURL_GLOBAL_ALL);
    interpreter = std::make_unique<coderun::embedded_interpreter>();
  }
  virtual void TearDown() {
    interpreter.reset();
    curl_global_cleanup();
  }

 private:
  std::unique_ptr<coderun::embedded_interpreter> interpreter;
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
