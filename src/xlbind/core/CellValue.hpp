#pragma once

#include <string>
#include <variant>

namespace xlbind {
namespace core {

/**
 * @brief 宿主日期值（序列号，见 utils::TimeUtils）
 */
struct DateValue {
    double serial = 0.0;

    bool operator==(const DateValue& other) const { return serial == other.serial; }
    bool operator!=(const DateValue& other) const { return !(*this == other); }
};

/**
 * @brief 单个单元格的原始值
 *
 * std::monostate 表示空单元格。
 */
using CellValue = std::variant<std::monostate, double, bool, std::string, DateValue>;

/**
 * @brief 字面空白：空单元格或空字符串
 */
inline bool isBlank(const CellValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    const std::string* text = std::get_if<std::string>(&value);
    return text != nullptr && text->empty();
}

/**
 * @brief 日志和调试用的简短描述
 */
std::string describe(const CellValue& value);

}} // namespace xlbind::core
