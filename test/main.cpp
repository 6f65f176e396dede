#include <gtest/gtest.h>

#include "logger.h"
#include "observability.h"

class test_env : public testing::Environment {
  public:
    void SetUp() override {
        // 进程 logger 只输出错误；各用例通过注入的 Logger 捕获日志。
        poolq::core::Logger::getInstance().set_level(poolq::core::LogLevel::Error);
    }

    void TearDown() override {
        poolq::core::set_metrics_sink(nullptr);
        poolq::core::set_trace_hook(nullptr);
    }
};

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);

    testing::AddGlobalTestEnvironment(new test_env);

    return RUN_ALL_TESTS();
}
