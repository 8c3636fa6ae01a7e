#pragma once

#include "xlbind/core/CellValue.hpp"
#include <string>
#include <map>

namespace xlbind {
namespace range {

/**
 * @brief 读取时数字的表示
 */
enum class NumberType {
    Float,    ///< 原样返回double
    Integer   ///< 向零截断为整数值
};

/**
 * @brief 读取时日期的表示
 */
enum class DateType {
    Date,     ///< core::DateValue
    Serial,   ///< 序列号（double）
    Iso       ///< ISO 8601文本
};

/**
 * @brief 区域读取前自动扩展的方式
 */
enum class ExpandMode {
    None,
    Table,
    Vertical,
    Horizontal
};

/**
 * @brief 附着在Range上的读写选项
 *
 * | 键          | 取值                                   | 默认      |
 * |-------------|----------------------------------------|-----------|
 * | convert     | 转换器注册名                           | "default" |
 * | ndim        | 0(自动) / 1 / 2                        | 0         |
 * | numberType  | float / int                            | float     |
 * | dateType    | date / serial / iso                    | date      |
 * | emptyValue  | 空单元格读出的文本；"none"表示保持空    | 保持空    |
 * | transpose   | true / false                           | false     |
 * | expand      | none / table / vertical / horizontal   | none      |
 */
struct RangeOptions {
    std::string convert = "default";
    int ndim = 0;
    NumberType number_type = NumberType::Float;
    DateType date_type = DateType::Date;
    core::CellValue empty_value;
    bool transpose = false;
    ExpandMode expand = ExpandMode::None;

    /**
     * @brief 从键值文本构造；未知键或非法值抛 InvalidArgumentsException（参数名为键名）
     */
    static RangeOptions parse(const std::map<std::string, std::string>& values);

    bool operator==(const RangeOptions& other) const;
    bool operator!=(const RangeOptions& other) const { return !(*this == other); }
};

const char* toString(ExpandMode mode);

}} // namespace xlbind::range
