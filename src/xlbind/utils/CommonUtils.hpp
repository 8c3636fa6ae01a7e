#pragma once

#include <string>
#include <cstdint>

namespace xlbind {
namespace utils {

/**
 * @brief 通用字符串工具
 *
 * 宿主里的文档名、工作表名、定义名称都按“不区分大小写”比较，
 * 名称可能包含非ASCII字符，所以大小写折叠按UTF-8码点进行。
 */
class CommonUtils {
public:
    /**
     * @brief UTF-8字符串大小写折叠
     *
     * 覆盖ASCII、Latin-1补充、Latin扩展A、希腊字母和西里尔字母的简单折叠。
     * 非法UTF-8序列先替换为U+FFFD再折叠。
     */
    static std::string foldCase(const std::string& text);

    /**
     * @brief 不区分大小写比较两个UTF-8字符串
     */
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    /**
     * @brief 去掉首尾空白（仅ASCII空白）
     */
    static std::string trim(const std::string& text);

    /**
     * @brief 单个码点的小写映射
     */
    static char32_t foldCodePoint(char32_t cp);
};

}} // namespace xlbind::utils
