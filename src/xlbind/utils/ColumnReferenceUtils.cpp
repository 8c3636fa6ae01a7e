/**
 * @file ColumnReferenceUtils.cpp
 * @brief 列引用工具实现
 */

#include "xlbind/utils/ColumnReferenceUtils.hpp"
#include "xlbind/core/Constants.hpp"
#include <cctype>
#include <algorithm>

namespace xlbind {
namespace utils {

uint32_t ColumnReferenceUtils::parseColumnOnly(std::string_view col_ref) {
    if (col_ref.empty() || col_ref.size() > static_cast<size_t>(core::Constants::kMaxColumnLetters)) {
        return 0;
    }

    uint32_t col = 0;
    for (char c : col_ref) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return 0;
        col = col * 26 + static_cast<uint32_t>(std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
    }

    if (col > static_cast<uint32_t>(core::Constants::kMaxColumns)) {
        return 0;
    }
    return col;
}

uint32_t ColumnReferenceUtils::parseColumnPrefix(std::string_view cell_ref) {
    size_t col_end = 0;
    while (col_end < cell_ref.size() && std::isalpha(static_cast<unsigned char>(cell_ref[col_end]))) {
        ++col_end;
    }
    if (col_end == 0) return 0;
    return parseColumnOnly(cell_ref.substr(0, col_end));
}

std::string ColumnReferenceUtils::columnToLetters(uint32_t column) {
    std::string result;
    while (column > 0) {
        --column;
        result.push_back(static_cast<char>('A' + (column % 26)));
        column /= 26;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

}} // namespace xlbind::utils
