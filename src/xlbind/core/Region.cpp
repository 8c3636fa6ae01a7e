#include "Region.hpp"
#include "Constants.hpp"
#include "Exception.hpp"
#include "xlbind/utils/AddressParser.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace xlbind {
namespace core {

namespace {

int32_t checkAxis(int64_t value, int32_t limit, const char* axis) {
    if (value == 0) {
        XLBIND_THROW(ZeroBasedAccessError,
                     fmt::format("Attempted to access 0-based Range ({} 0). "
                                 "Rows and columns are 1-based.", axis),
                     axis);
    }
    if (value < 0 || value > limit) {
        XLBIND_THROW(IndexOutOfRangeException,
                     fmt::format("{} {} is outside the sheet (1..{})", axis, value, limit),
                     static_cast<long long>(value), static_cast<size_t>(limit));
    }
    return static_cast<int32_t>(value);
}

} // namespace

CellCoordinate::CellCoordinate(int64_t row, int64_t column)
    : row_(checkAxis(row, Constants::kMaxRows, "row")),
      column_(checkAxis(column, Constants::kMaxColumns, "column")) {
}

std::string CellCoordinate::toString() const {
    return utils::AddressParser::formatCell(row_, column_);
}

Region::Region(const CellCoordinate& cell)
    : top_left_(cell), bottom_right_(cell) {
}

Region::Region(const CellCoordinate& a, const CellCoordinate& b)
    : top_left_(std::min(a.row(), b.row()), std::min(a.column(), b.column())),
      bottom_right_(std::max(a.row(), b.row()), std::max(a.column(), b.column())) {
}

Region Region::fromAddress(const std::string& address) {
    utils::ParsedReference ref = utils::AddressParser::parse(address);
    return Region(CellCoordinate(ref.first_row, ref.first_column),
                  CellCoordinate(ref.last_row, ref.last_column));
}

bool Region::contains(const CellCoordinate& cell) const {
    return cell.row() >= firstRow() && cell.row() <= lastRow() &&
           cell.column() >= firstColumn() && cell.column() <= lastColumn();
}

CellCoordinate Region::cellAt(size_t index) const {
    if (index >= size()) {
        XLBIND_THROW(IndexOutOfRangeException,
                     fmt::format("Cell index {} out of range for region of {} cells", index, size()),
                     static_cast<long long>(index), size());
    }
    const size_t columns = static_cast<size_t>(columnCount());
    return CellCoordinate(firstRow() + static_cast<int64_t>(index / columns),
                          firstColumn() + static_cast<int64_t>(index % columns));
}

Region Region::offset(int64_t row_offset, int64_t column_offset) const {
    // 先和剩余空间比较再相加，极端偏移量不会溢出
    // 偏移结果落在第0行/列也算越界，不是0基访问
    if (row_offset < 1 - static_cast<int64_t>(firstRow()) ||
        row_offset > static_cast<int64_t>(Constants::kMaxRows) - lastRow()) {
        XLBIND_THROW(IndexOutOfRangeException,
                     fmt::format("Row offset {} moves {} off the sheet", row_offset, toString()),
                     static_cast<long long>(row_offset),
                     static_cast<size_t>(Constants::kMaxRows));
    }
    if (column_offset < 1 - static_cast<int64_t>(firstColumn()) ||
        column_offset > static_cast<int64_t>(Constants::kMaxColumns) - lastColumn()) {
        XLBIND_THROW(IndexOutOfRangeException,
                     fmt::format("Column offset {} moves {} off the sheet", column_offset, toString()),
                     static_cast<long long>(column_offset),
                     static_cast<size_t>(Constants::kMaxColumns));
    }
    return Region(CellCoordinate(firstRow() + row_offset, firstColumn() + column_offset),
                  CellCoordinate(lastRow() + row_offset, lastColumn() + column_offset));
}

Region Region::resized(int64_t rows, int64_t columns) const {
    XLBIND_THROW_IF(rows <= 0, InvalidArgumentsException,
                    fmt::format("Row size must be positive, got {}", rows), "row_size");
    XLBIND_THROW_IF(columns <= 0, InvalidArgumentsException,
                    fmt::format("Column size must be positive, got {}", columns), "column_size");
    if (rows > static_cast<int64_t>(Constants::kMaxRows) - firstRow() + 1) {
        XLBIND_THROW(IndexOutOfRangeException,
                     fmt::format("{} rows from {} do not fit on the sheet", rows, top_left_.toString()),
                     static_cast<long long>(rows), static_cast<size_t>(Constants::kMaxRows));
    }
    if (columns > static_cast<int64_t>(Constants::kMaxColumns) - firstColumn() + 1) {
        XLBIND_THROW(IndexOutOfRangeException,
                     fmt::format("{} columns from {} do not fit on the sheet", columns, top_left_.toString()),
                     static_cast<long long>(columns), static_cast<size_t>(Constants::kMaxColumns));
    }
    return Region(top_left_,
                  CellCoordinate(firstRow() + rows - 1, firstColumn() + columns - 1));
}

Region Region::spanning(const Region& other) const {
    return Region(CellCoordinate(std::min(firstRow(), other.firstRow()),
                                 std::min(firstColumn(), other.firstColumn())),
                  CellCoordinate(std::max(lastRow(), other.lastRow()),
                                 std::max(lastColumn(), other.lastColumn())));
}

std::string Region::toString(bool row_absolute, bool column_absolute) const {
    return utils::AddressParser::formatRegion(firstRow(), firstColumn(), lastRow(), lastColumn(),
                                              row_absolute, column_absolute);
}

}} // namespace xlbind::core
