#include "xlbind/host/IAutomation.hpp"
#include "xlbind/core/Constants.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/utils/AddressParser.hpp"
#include "xlbind/utils/CommonUtils.hpp"
#include "xlbind/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace xlbind {
namespace host {

using core::Constants;

const char* toString(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Shape:   return "Shape";
        case ShapeKind::Chart:   return "Chart";
        case ShapeKind::Picture: return "Picture";
    }
    return "Unknown";
}

void IAutomation::requireAlive(const DocumentHandle& document) const {
    if (!isAlive(document)) {
        XLBIND_THROW(core::StaleHandleException,
                     fmt::format("Document '{}' has been closed", document.name),
                     document.name);
    }
}

void IAutomation::requireAlive(const SheetRef& sheet) const {
    requireAlive(sheet.document);
    if (!isAlive(sheet)) {
        XLBIND_THROW(core::StaleHandleException,
                     fmt::format("Sheet '{}' in '{}' has been deleted", sheet.name, sheet.document.name),
                     sheet.name);
    }
}

SheetRef IAutomation::sheet(const DocumentHandle& document, const std::string& name) const {
    for (const auto& candidate : listSheets(document)) {
        if (utils::CommonUtils::equalsIgnoreCase(candidate.name, name)) {
            return candidate;
        }
    }
    XLBIND_THROW(core::NotFoundException,
                 fmt::format("No sheet named '{}' in '{}'", name, document.name),
                 name);
}

SheetRef IAutomation::sheet(const DocumentHandle& document, int32_t index) const {
    auto sheets = listSheets(document);
    if (index < 1 || static_cast<size_t>(index) > sheets.size()) {
        XLBIND_THROW(core::IndexOutOfRangeException,
                     fmt::format("Sheet index {} out of range for '{}' with {} sheets",
                                 index, document.name, sheets.size()),
                     static_cast<long long>(index), sheets.size());
    }
    return sheets[static_cast<size_t>(index - 1)];
}

bool IAutomation::probeEmpty(const SheetRef& sheet, int32_t row, int32_t column) const {
    return cellFormula(sheet, row, column).empty() &&
           core::isBlank(cellValue(sheet, row, column));
}

core::CellCoordinate IAutomation::endOf(const SheetRef& sheet, const core::CellCoordinate& from,
                                        Direction direction) const {
    requireAlive(sheet);

    int32_t dr = 0;
    int32_t dc = 0;
    switch (direction) {
        case Direction::Down:  dr = 1; break;
        case Direction::Up:    dr = -1; break;
        case Direction::Right: dc = 1; break;
        case Direction::Left:  dc = -1; break;
    }

    // 已用区域之外全是空格，向下/向右最远探测到已用区域边界
    const int32_t used_rows = rowCount(sheet);
    const int32_t used_columns = columnCount(sheet);
    const int32_t edge_row = dr > 0 ? Constants::kMaxRows : 1;
    const int32_t edge_column = dc > 0 ? Constants::kMaxColumns : 1;

    auto inside = [&](int32_t r, int32_t c) {
        return r >= 1 && c >= 1 && r <= Constants::kMaxRows && c <= Constants::kMaxColumns;
    };
    auto beyondUsed = [&](int32_t r, int32_t c) {
        return (dr > 0 && r > used_rows) || (dc > 0 && c > used_columns);
    };
    auto emptyAt = [&](int32_t r, int32_t c) {
        return beyondUsed(r, c) || probeEmpty(sheet, r, c);
    };

    int32_t row = from.row();
    int32_t column = from.column();

    if (!inside(row + dr, column + dc)) {
        return from;
    }

    if (!emptyAt(row, column) && !emptyAt(row + dr, column + dc)) {
        while (inside(row + dr, column + dc) && !emptyAt(row + dr, column + dc)) {
            row += dr;
            column += dc;
        }
        return core::CellCoordinate(row, column);
    }

    // 跳过空格找下一个非空格
    row += dr;
    column += dc;
    while (inside(row, column) && emptyAt(row, column)) {
        if (beyondUsed(row, column)) {
            return core::CellCoordinate(dr != 0 ? edge_row : row, dc != 0 ? edge_column : column);
        }
        row += dr;
        column += dc;
    }
    if (!inside(row, column)) {
        return core::CellCoordinate(dr != 0 ? edge_row : row, dc != 0 ? edge_column : column);
    }
    return core::CellCoordinate(row, column);
}

std::string IAutomation::address(const SheetRef& sheet, const core::Region& region,
                                 bool row_absolute, bool column_absolute,
                                 bool include_sheet, bool external) const {
    requireAlive(sheet);
    std::string local = region.toString(row_absolute, column_absolute);
    if (external) {
        return utils::AddressParser::qualify(local, sheet.name, sheet.document.name);
    }
    if (include_sheet) {
        return utils::AddressParser::qualify(local, sheet.name);
    }
    return local;
}

}} // namespace xlbind::host
