#include "xlbind/range/Range.hpp"
#include "xlbind/range/RangeIndexer.hpp"
#include "xlbind/range/RegionExpander.hpp"
#include "xlbind/core/Constants.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/core/HostSession.hpp"
#include "xlbind/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace xlbind {
namespace range {

using core::Constants;

Range::Range(core::HostSession& session, const host::SheetRef& sheet, const core::Region& region,
             const RangeOptions& options)
    : session_(&session), sheet_(sheet), region_(region), options_(options) {
}

Range Range::withOptions(const RangeOptions& options) const {
    return Range(*session_, sheet_, region_, options);
}

Range Range::cell(int64_t row, int64_t column) const {
    // 相对坐标先和剩余空间比较，极端值不会在相加时溢出
    if (row < 2 - static_cast<int64_t>(region_.firstRow()) ||
        row > static_cast<int64_t>(Constants::kMaxRows) - region_.firstRow() + 1) {
        XLBIND_THROW(core::IndexOutOfRangeException,
                     fmt::format("Cell ({}, {}) relative to {} is outside the sheet",
                                 row, column, region_.toString()),
                     static_cast<long long>(row), static_cast<size_t>(Constants::kMaxRows));
    }
    if (column < 2 - static_cast<int64_t>(region_.firstColumn()) ||
        column > static_cast<int64_t>(Constants::kMaxColumns) - region_.firstColumn() + 1) {
        XLBIND_THROW(core::IndexOutOfRangeException,
                     fmt::format("Cell ({}, {}) relative to {} is outside the sheet",
                                 row, column, region_.toString()),
                     static_cast<long long>(column), static_cast<size_t>(Constants::kMaxColumns));
    }
    return Range(*session_, sheet_,
                 core::Region(core::CellCoordinate(region_.firstRow() + row - 1,
                                                   region_.firstColumn() + column - 1)),
                 options_);
}

convert::ConvertedValue Range::value() const {
    const convert::IValueConverter& converter = session_->converters().get(options_.convert);
    switch (options_.expand) {
        case ExpandMode::Table:
            return converter.read(table(), options_);
        case ExpandMode::Vertical:
            return converter.read(vertical(), options_);
        case ExpandMode::Horizontal:
            return converter.read(horizontal(), options_);
        case ExpandMode::None:
            break;
    }
    return converter.read(*this, options_);
}

void Range::setValue(const convert::ConvertedValue& value) const {
    const convert::IValueConverter& converter = session_->converters().get(options_.convert);
    RANGE_DEBUG("Writing to {} with converter '{}'", toString(), options_.convert);
    converter.write(value, *this, options_);
}

core::CellValue Range::rawValue() const {
    return session_->automation().cellValue(sheet_, row(), column());
}

std::string Range::formula() const {
    return session_->automation().cellFormula(sheet_, row(), column());
}

bool Range::resolveStrict(std::optional<bool> strict) const {
    return strict.value_or(session_->options().strict_expand);
}

Range Range::table(std::optional<bool> strict) const {
    RegionExpander expander(session_->automation());
    return Range(*session_, sheet_, expander.table(sheet_, region_, resolveStrict(strict)), options_);
}

Range Range::vertical(std::optional<bool> strict) const {
    RegionExpander expander(session_->automation());
    return Range(*session_, sheet_, expander.vertical(sheet_, region_, resolveStrict(strict)), options_);
}

Range Range::horizontal(std::optional<bool> strict) const {
    RegionExpander expander(session_->automation());
    return Range(*session_, sheet_, expander.horizontal(sheet_, region_, resolveStrict(strict)), options_);
}

Range Range::offset(int64_t row_offset, int64_t column_offset) const {
    return Range(*session_, sheet_, region_.offset(row_offset, column_offset), options_);
}

Range Range::resize(std::optional<int64_t> row_size, std::optional<int64_t> column_size) const {
    return Range(*session_, sheet_,
                 region_.resized(row_size.value_or(rowCount()), column_size.value_or(columnCount())),
                 options_);
}

Range Range::lastCell() const {
    return Range(*session_, sheet_, core::Region(region_.bottomRight()), options_);
}

std::string Range::getAddress(bool row_absolute, bool column_absolute,
                              bool include_sheet, bool external) const {
    return session_->automation().address(sheet_, region_, row_absolute, column_absolute,
                                          include_sheet, external);
}

std::string Range::toString() const {
    return fmt::format("<Range [{}]{}!{}>", sheet_.document.name, sheet_.name, getAddress());
}

Range Range::operator[](long long index) const {
    return RangeIndexer(*this).at(index);
}

Range Range::at(long long row_index, long long column_index) const {
    return RangeIndexer(*this).at(row_index, column_index);
}

RangeSelection Range::slice(const Slice& slice) const {
    return RangeIndexer(*this).slice(slice);
}

RangeSelection Range::slice(const AxisIndex& rows, const AxisIndex& columns) const {
    return RangeIndexer(*this).slice(rows, columns);
}

Range Range::Iterator::operator*() const {
    return Range(range_->session(), range_->sheet(),
                 core::Region(range_->region().cellAt(index_)), range_->options());
}

}} // namespace xlbind::range
