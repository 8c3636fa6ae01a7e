#include "xlbind/range/RangeIndexer.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace xlbind {
namespace range {

const Range& RangeSelection::range() const {
    if (!range_) {
        XLBIND_THROW(core::IndexOutOfRangeException, "Selection is empty", 0LL, static_cast<size_t>(0));
    }
    return *range_;
}

RangeIndexer::RangeIndexer(const Range& range) : range_(range) {
}

size_t RangeIndexer::normalizeIndex(long long index, size_t count) {
    const long long length = static_cast<long long>(count);
    if (index >= length || index < -length) {
        XLBIND_THROW(core::IndexOutOfRangeException,
                     fmt::format("Index {} out of range ({} elements)", index, count),
                     index, count);
    }
    return static_cast<size_t>(index < 0 ? length + index : index);
}

std::pair<size_t, size_t> RangeIndexer::normalizeSlice(const Slice& slice, size_t count) {
    if (slice.step && *slice.step != 1) {
        XLBIND_THROW(core::UnsupportedSliceStepException, *slice.step);
    }

    const long long length = static_cast<long long>(count);

    long long start = slice.start.value_or(0);
    if (slice.start) {
        if (start >= length || start < -length) {
            XLBIND_THROW(core::IndexOutOfRangeException,
                         fmt::format("Start index {} out of range ({} elements)", start, count),
                         start, count);
        }
        if (start < 0) {
            start += length;
        }
    }

    long long stop = slice.stop.value_or(length);
    if (slice.stop) {
        if (stop > length || stop <= -length) {
            XLBIND_THROW(core::IndexOutOfRangeException,
                         fmt::format("Stop index {} out of range ({} elements)", stop, count),
                         stop, count);
        }
        if (stop < 0) {
            stop += length;
        }
    }

    return {static_cast<size_t>(start), static_cast<size_t>(stop)};
}

Range RangeIndexer::at(long long index) const {
    const size_t position = normalizeIndex(index, count());
    return Range(range_.session(), range_.sheet(),
                 core::Region(range_.region().cellAt(position)), range_.options());
}

Range RangeIndexer::at(long long row_index, long long column_index) const {
    const size_t row = normalizeIndex(row_index, static_cast<size_t>(range_.rowCount()));
    const size_t column = normalizeIndex(column_index, static_cast<size_t>(range_.columnCount()));
    return fromOffsets(row, column, row, column);
}

RangeSelection RangeIndexer::slice(const Slice& slice) const {
    const auto bounds = normalizeSlice(slice, count());
    if (bounds.second <= bounds.first) {
        RANGE_DEBUG("Empty slice [{}, {}) of {}", bounds.first, bounds.second, range_.toString());
        return RangeSelection();
    }
    const core::Region& region = range_.region();
    core::Region spanned(region.cellAt(bounds.first), region.cellAt(bounds.second - 1));
    return RangeSelection(Range(range_.session(), range_.sheet(), spanned, range_.options()));
}

RangeSelection RangeIndexer::slice(const AxisIndex& rows, const AxisIndex& columns) const {
    const auto row_bounds = normalizeAxis(rows, static_cast<size_t>(range_.rowCount()));
    const auto column_bounds = normalizeAxis(columns, static_cast<size_t>(range_.columnCount()));
    if (row_bounds.second <= row_bounds.first || column_bounds.second <= column_bounds.first) {
        return RangeSelection();
    }
    return RangeSelection(fromOffsets(row_bounds.first, column_bounds.first,
                                      row_bounds.second - 1, column_bounds.second - 1));
}

std::pair<size_t, size_t> RangeIndexer::normalizeAxis(const AxisIndex& index, size_t count) const {
    if (const long long* position = std::get_if<long long>(&index)) {
        const size_t normalized = normalizeIndex(*position, count);
        return {normalized, normalized + 1};
    }
    return normalizeSlice(std::get<Slice>(index), count);
}

Range RangeIndexer::fromOffsets(size_t first_row, size_t first_column,
                                size_t last_row, size_t last_column) const {
    const core::Region& region = range_.region();
    core::CellCoordinate top_left(region.firstRow() + static_cast<int64_t>(first_row),
                                  region.firstColumn() + static_cast<int64_t>(first_column));
    core::CellCoordinate bottom_right(region.firstRow() + static_cast<int64_t>(last_row),
                                      region.firstColumn() + static_cast<int64_t>(last_column));
    return Range(range_.session(), range_.sheet(), core::Region(top_left, bottom_right), range_.options());
}

}} // namespace xlbind::range
