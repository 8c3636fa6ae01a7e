#include "xlbind/convert/ValueConverter.hpp"
#include "xlbind/core/Constants.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/core/HostSession.hpp"
#include "xlbind/range/Range.hpp"
#include "xlbind/utils/TimeUtils.hpp"
#include "xlbind/utils/ModuleLoggers.hpp"
#include <cmath>
#include <fmt/format.h>

namespace xlbind {
namespace convert {

using range::DateType;
using range::NumberType;

// ========== DefaultConverter ==========

core::CellValue DefaultConverter::convertCell(const core::CellValue& value,
                                              const range::RangeOptions& options) {
    if (std::holds_alternative<std::monostate>(value)) {
        return options.empty_value;
    }
    if (const double* number = std::get_if<double>(&value)) {
        if (options.number_type == NumberType::Integer) {
            return std::trunc(*number);
        }
        return *number;
    }
    if (const core::DateValue* date = std::get_if<core::DateValue>(&value)) {
        switch (options.date_type) {
            case DateType::Date:
                return *date;
            case DateType::Serial:
                return date->serial;
            case DateType::Iso:
                return utils::TimeUtils::formatSerialISO8601(date->serial);
        }
    }
    return value;
}

Matrix DefaultConverter::transposed(const Matrix& matrix) {
    if (matrix.empty()) {
        return matrix;
    }
    Matrix result(matrix.front().size(), Row(matrix.size()));
    for (size_t r = 0; r < matrix.size(); ++r) {
        for (size_t c = 0; c < matrix[r].size(); ++c) {
            result[c][r] = matrix[r][c];
        }
    }
    return result;
}

ConvertedValue DefaultConverter::read(const range::Range& range, const range::RangeOptions& options) const {
    host::IAutomation& automation = range.session().automation();
    automation.requireAlive(range.sheet());

    const core::Region& region = range.region();
    Matrix matrix;
    matrix.reserve(static_cast<size_t>(region.rowCount()));
    for (int32_t r = region.firstRow(); r <= region.lastRow(); ++r) {
        Row row;
        row.reserve(static_cast<size_t>(region.columnCount()));
        for (int32_t c = region.firstColumn(); c <= region.lastColumn(); ++c) {
            row.push_back(convertCell(automation.cellValue(range.sheet(), r, c), options));
        }
        matrix.push_back(std::move(row));
    }

    if (options.transpose) {
        matrix = transposed(matrix);
    }

    const size_t rows = matrix.size();
    const size_t columns = rows ? matrix.front().size() : 0;
    CONVERT_DEBUG("Read {}x{} from {} (ndim={})", rows, columns, range.getAddress(), options.ndim);

    if (options.ndim == 2) {
        return matrix;
    }

    if (options.ndim == 0 && rows == 1 && columns == 1) {
        return matrix.front().front();
    }

    if (rows == 1) {
        return matrix.front();
    }
    if (columns == 1) {
        Row flat;
        flat.reserve(rows);
        for (auto& row : matrix) {
            flat.push_back(std::move(row.front()));
        }
        return flat;
    }

    if (options.ndim == 1) {
        XLBIND_THROW(core::InvalidArgumentsException,
                     fmt::format("ndim=1 requires a single row or column, got {}x{}", rows, columns),
                     "ndim");
    }
    return matrix;
}

void DefaultConverter::writeMatrix(const Matrix& matrix, const range::Range& range) {
    host::IAutomation& automation = range.session().automation();
    const int32_t top = range.row();
    const int32_t left = range.column();

    if (!matrix.empty()) {
        const int64_t last_row = top + static_cast<int64_t>(matrix.size()) - 1;
        const int64_t last_column = left + static_cast<int64_t>(matrix.front().size()) - 1;
        if (last_row > core::Constants::kMaxRows || last_column > core::Constants::kMaxColumns) {
            XLBIND_THROW(core::IndexOutOfRangeException,
                         fmt::format("{}x{} values do not fit on the sheet from {}",
                                     matrix.size(), matrix.front().size(), range.getAddress(false, false)),
                         static_cast<long long>(last_row > core::Constants::kMaxRows ? last_row : last_column),
                         static_cast<size_t>(last_row > core::Constants::kMaxRows
                                                 ? core::Constants::kMaxRows
                                                 : core::Constants::kMaxColumns));
        }
    }

    for (size_t r = 0; r < matrix.size(); ++r) {
        for (size_t c = 0; c < matrix[r].size(); ++c) {
            automation.setCellValue(range.sheet(), top + static_cast<int32_t>(r),
                                    left + static_cast<int32_t>(c), matrix[r][c]);
        }
    }
}

void DefaultConverter::write(const ConvertedValue& value, const range::Range& range,
                             const range::RangeOptions& options) const {
    range.session().automation().requireAlive(range.sheet());

    if (const core::CellValue* scalar = std::get_if<core::CellValue>(&value)) {
        Matrix filled(static_cast<size_t>(range.rowCount()),
                      Row(static_cast<size_t>(range.columnCount()), *scalar));
        writeMatrix(filled, range);
        return;
    }

    if (const Row* row = std::get_if<Row>(&value)) {
        Matrix matrix;
        if (options.transpose) {
            for (const auto& cell : *row) {
                matrix.push_back(Row{cell});
            }
        } else {
            matrix.push_back(*row);
        }
        writeMatrix(matrix, range);
        return;
    }

    const Matrix& matrix = std::get<Matrix>(value);
    for (size_t r = 1; r < matrix.size(); ++r) {
        if (matrix[r].size() != matrix.front().size()) {
            XLBIND_THROW(core::InvalidArgumentsException,
                         fmt::format("Row {} has {} values, expected {}", r, matrix[r].size(),
                                     matrix.front().size()),
                         "value");
        }
    }
    writeMatrix(options.transpose ? transposed(matrix) : matrix, range);
}

// ========== ConverterRegistry ==========

ConverterRegistry::ConverterRegistry() {
    converters_[core::Constants::kDefaultConverter] = std::make_unique<DefaultConverter>();
}

void ConverterRegistry::add(const std::string& name, std::unique_ptr<IValueConverter> converter) {
    XLBIND_THROW_IF(name.empty(), core::InvalidArgumentsException,
                    "Converter name must not be empty", "name");
    XLBIND_THROW_IF(!converter, core::InvalidArgumentsException,
                    fmt::format("Converter '{}' is null", name), "converter");
    converters_[name] = std::move(converter);
    CONVERT_DEBUG("Registered converter '{}'", name);
}

const IValueConverter& ConverterRegistry::get(const std::string& name) const {
    auto it = converters_.find(name);
    if (it == converters_.end()) {
        XLBIND_THROW(core::NotFoundException,
                     fmt::format("No converter registered as '{}'", name),
                     name);
    }
    return *it->second;
}

bool ConverterRegistry::contains(const std::string& name) const {
    return converters_.find(name) != converters_.end();
}

std::vector<std::string> ConverterRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(converters_.size());
    for (const auto& entry : converters_) {
        result.push_back(entry.first);
    }
    return result;
}

}} // namespace xlbind::convert
