/**
 * @file ColumnReferenceUtils.hpp
 * @brief 列字母与列号互转
 */

#pragma once

#include <string>
#include <string_view>
#include <cstdint>

namespace xlbind {
namespace utils {

/**
 * @brief 列引用工具，列号一律1基（A=1, Z=26, AA=27, XFD=16384）
 */
class ColumnReferenceUtils {
public:
    /**
     * @brief 解析纯列引用（如 "C", "aa"），不区分大小写
     * @return 列号（1基）；格式非法或超过XFD时返回0
     */
    static uint32_t parseColumnOnly(std::string_view col_ref);

    /**
     * @brief 从单元格引用的前缀解析列号（如 "C23" -> 3）
     * @return 列号（1基）；没有字母前缀时返回0
     */
    static uint32_t parseColumnPrefix(std::string_view cell_ref);

    /**
     * @brief 列号转列字母
     * @param column 列号（1基）
     * @return 列字母；column为0时返回空串
     */
    static std::string columnToLetters(uint32_t column);
};

}} // namespace xlbind::utils
