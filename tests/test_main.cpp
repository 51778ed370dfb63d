#include "../include/logger.hpp"
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // 测试期间不输出到终端，也不写日志文件
    Logger::setEcho(false);
    Logger::setLogFile("");
    Logger::setLevel(Logger::Level::Debug);
    return RUN_ALL_TESTS();
}
