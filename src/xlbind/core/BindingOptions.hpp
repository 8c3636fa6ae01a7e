#pragma once

#include "xlbind/utils/Logger.hpp"
#include <string>
#include <cstddef>

namespace xlbind {
namespace core {

/**
 * @brief 进程级配置
 *
 * 默认值即推荐值；fromEnvironment() 用环境变量覆盖：
 * - XLBIND_LOG_LEVEL     trace/debug/info/warn/error/critical/off
 * - XLBIND_LOG_FILE      日志文件路径，空串表示不写文件
 * - XLBIND_LOG_CONSOLE   1/0, true/false, on/off, yes/no
 * - XLBIND_STRICT_EXPAND 同上
 * - XLBIND_AUTOSTART     同上
 */
struct BindingOptions {
    // 日志选项
    std::string log_file_path = "logs/xlbind.log";
    Logger::Level log_level = Logger::Level::INFO;
    bool log_to_console = true;
    size_t log_max_file_size = 10 * 1024 * 1024;
    size_t log_max_files = 5;

    // 区域扩展默认是否使用严格空值判断（公式算出空白也算空）
    bool strict_expand = false;

    // 请求活动实例而没有实例在运行时，是否自动启动一个
    bool auto_start_instance = true;

    // 标识符不匹配任何已打开文档但是磁盘上的文件时，是否打开它
    bool open_missing_from_disk = true;

    /**
     * @brief 以base为基础叠加环境变量
     * @throws InvalidArgumentsException 变量值无法解析，parameter名为变量名
     */
    static BindingOptions fromEnvironment(const BindingOptions& base);
    static BindingOptions fromEnvironment();

    /**
     * @brief 解析布尔开关
     * @return 无法识别时返回false，value保持不变
     */
    static bool parseFlag(const std::string& text, bool& value);
};

}} // namespace xlbind::core
