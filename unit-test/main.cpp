#include <curl/curl.h>
#include <glog/logging.h>
#include "executor/checker.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        grader::executor::register_default_checkers();
    }

    void TearDown() override {
        curl_global_cleanup();
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    ::testing::AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
