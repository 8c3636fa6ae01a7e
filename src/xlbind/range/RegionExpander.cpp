#include "xlbind/range/RegionExpander.hpp"
#include "xlbind/core/Constants.hpp"
#include "xlbind/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace xlbind {
namespace range {

using core::Constants;
using host::Direction;

RegionExpander::RegionExpander(const host::IAutomation& automation) : automation_(automation) {
}

bool RegionExpander::isEmpty(const host::SheetRef& sheet, int32_t row, int32_t column, bool strict) const {
    const bool blank = core::isBlank(automation_.cellValue(sheet, row, column));
    if (strict) {
        XLBIND_LOG_PROBE_DEBUG("strict probe {}:{} -> {}", row, column, blank);
        return blank;
    }
    const bool empty = blank && automation_.cellFormula(sheet, row, column).empty();
    XLBIND_LOG_PROBE_DEBUG("probe {}:{} -> {}", row, column, empty);
    return empty;
}

int32_t RegionExpander::extent(const host::SheetRef& sheet, const core::CellCoordinate& anchor,
                               Direction direction, bool strict) const {
    const bool down = direction == Direction::Down;
    const int32_t origin = down ? anchor.row() : anchor.column();
    const int32_t limit = down ? Constants::kMaxRows : Constants::kMaxColumns;

    auto emptyAt = [&](int32_t step) {
        if (origin + step > limit) {
            return true;
        }
        return down ? isEmpty(sheet, origin + step, anchor.column(), strict)
                    : isEmpty(sheet, anchor.row(), origin + step, strict);
    };

    if (emptyAt(1)) {
        return origin;
    }
    if (emptyAt(2)) {
        return origin + 1;
    }

    const core::CellCoordinate next = down ? core::CellCoordinate(origin + 1, anchor.column())
                                           : core::CellCoordinate(anchor.row(), origin + 1);
    if (strict) {
        return strictScan(sheet, next, direction);
    }
    const core::CellCoordinate end = automation_.endOf(sheet, next, direction);
    return down ? end.row() : end.column();
}

int32_t RegionExpander::strictScan(const host::SheetRef& sheet, const core::CellCoordinate& from,
                                   Direction direction) const {
    const bool down = direction == Direction::Down;
    // 已用区域之外都是空格
    const int32_t bound = down ? std::min(automation_.rowCount(sheet), Constants::kMaxRows)
                               : std::min(automation_.columnCount(sheet), Constants::kMaxColumns);

    int32_t position = down ? from.row() : from.column();
    while (position < bound) {
        const bool empty = down ? isEmpty(sheet, position + 1, from.column(), true)
                                : isEmpty(sheet, from.row(), position + 1, true);
        if (empty) {
            break;
        }
        ++position;
    }
    return position;
}

core::Region RegionExpander::table(const host::SheetRef& sheet, const core::Region& region, bool strict) const {
    automation_.requireAlive(sheet);
    const core::CellCoordinate& origin = region.topLeft();
    const int32_t bottom = extent(sheet, origin, Direction::Down, strict);
    const int32_t right = extent(sheet, origin, Direction::Right, strict);
    core::Region result(origin, core::CellCoordinate(bottom, right));
    EXPAND_DEBUG("table from {} -> {} (strict={})", origin.toString(), result.toString(), strict);
    return result;
}

core::Region RegionExpander::vertical(const host::SheetRef& sheet, const core::Region& region, bool strict) const {
    automation_.requireAlive(sheet);
    const int32_t bottom = extent(sheet, region.topLeft(), Direction::Down, strict);
    core::Region result(region.topLeft(), core::CellCoordinate(bottom, region.lastColumn()));
    EXPAND_DEBUG("vertical from {} -> {} (strict={})", region.toString(), result.toString(), strict);
    return result;
}

core::Region RegionExpander::horizontal(const host::SheetRef& sheet, const core::Region& region, bool strict) const {
    automation_.requireAlive(sheet);
    const int32_t right = extent(sheet, region.topLeft(), Direction::Right, strict);
    core::Region result(region.topLeft(), core::CellCoordinate(region.lastRow(), right));
    EXPAND_DEBUG("horizontal from {} -> {} (strict={})", region.toString(), result.toString(), strict);
    return result;
}

}} // namespace xlbind::range
