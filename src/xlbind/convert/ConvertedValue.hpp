#pragma once

#include "xlbind/core/CellValue.hpp"
#include <variant>
#include <vector>

namespace xlbind {
namespace convert {

using Row = std::vector<core::CellValue>;
using Matrix = std::vector<Row>;

/**
 * @brief 转换器读写的结构化值：标量、一维行、二维矩阵
 */
using ConvertedValue = std::variant<core::CellValue, Row, Matrix>;

}} // namespace xlbind::convert
