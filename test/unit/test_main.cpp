#include <gtest/gtest.h>
#include "xlbind/utils/Logger.hpp"
#include <iostream>

// 测试主函数
int main(int argc, char** argv) {
    std::cout << "xlbind 单元测试开始..." << std::endl;

    // 测试只关心警告以上的日志，写到单独的文件里
    xlbind::Logger::getInstance().initialize("logs/xlbind_unit_tests.log",
                                             xlbind::Logger::Level::WARN, false);

    // 初始化 GoogleTest
    ::testing::InitGoogleTest(&argc, argv);

    // 运行所有测试
    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "所有测试通过！" << std::endl;
    } else {
        std::cout << "有测试失败！" << std::endl;
    }

    xlbind::Logger::getInstance().flush();
    return result;
}
