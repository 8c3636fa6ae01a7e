#include "xlbind/range/RangeOptions.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/core/BindingOptions.hpp"
#include "xlbind/utils/CommonUtils.hpp"
#include <fmt/format.h>

namespace xlbind {
namespace range {

using utils::CommonUtils;

namespace {

[[noreturn]] void rejectValue(const std::string& key, const std::string& value) {
    XLBIND_THROW(core::InvalidArgumentsException,
                 fmt::format("Invalid value '{}' for option '{}'", value, key),
                 key);
}

} // namespace

const char* toString(ExpandMode mode) {
    switch (mode) {
        case ExpandMode::None:       return "none";
        case ExpandMode::Table:      return "table";
        case ExpandMode::Vertical:   return "vertical";
        case ExpandMode::Horizontal: return "horizontal";
    }
    return "none";
}

RangeOptions RangeOptions::parse(const std::map<std::string, std::string>& values) {
    RangeOptions options;
    for (const auto& entry : values) {
        const std::string& key = entry.first;
        const std::string value = CommonUtils::trim(entry.second);
        const std::string lowered = CommonUtils::foldCase(value);

        if (key == "convert") {
            if (value.empty()) {
                rejectValue(key, entry.second);
            }
            options.convert = value;
        } else if (key == "ndim") {
            if (lowered == "0" || lowered == "auto") {
                options.ndim = 0;
            } else if (lowered == "1") {
                options.ndim = 1;
            } else if (lowered == "2") {
                options.ndim = 2;
            } else {
                rejectValue(key, entry.second);
            }
        } else if (key == "numberType") {
            if (lowered == "float" || lowered == "double") {
                options.number_type = NumberType::Float;
            } else if (lowered == "int" || lowered == "integer") {
                options.number_type = NumberType::Integer;
            } else {
                rejectValue(key, entry.second);
            }
        } else if (key == "dateType") {
            if (lowered == "date" || lowered == "datetime") {
                options.date_type = DateType::Date;
            } else if (lowered == "serial" || lowered == "number") {
                options.date_type = DateType::Serial;
            } else if (lowered == "iso" || lowered == "string") {
                options.date_type = DateType::Iso;
            } else {
                rejectValue(key, entry.second);
            }
        } else if (key == "emptyValue") {
            if (lowered == "none") {
                options.empty_value = std::monostate{};
            } else {
                options.empty_value = entry.second;
            }
        } else if (key == "transpose") {
            if (!core::BindingOptions::parseFlag(value, options.transpose)) {
                rejectValue(key, entry.second);
            }
        } else if (key == "expand") {
            if (lowered == "none" || lowered.empty()) {
                options.expand = ExpandMode::None;
            } else if (lowered == "table") {
                options.expand = ExpandMode::Table;
            } else if (lowered == "vertical") {
                options.expand = ExpandMode::Vertical;
            } else if (lowered == "horizontal") {
                options.expand = ExpandMode::Horizontal;
            } else {
                rejectValue(key, entry.second);
            }
        } else {
            XLBIND_THROW(core::InvalidArgumentsException,
                         fmt::format("Unknown range option '{}'", key),
                         key);
        }
    }
    return options;
}

bool RangeOptions::operator==(const RangeOptions& other) const {
    return convert == other.convert && ndim == other.ndim &&
           number_type == other.number_type && date_type == other.date_type &&
           empty_value == other.empty_value && transpose == other.transpose &&
           expand == other.expand;
}

}} // namespace xlbind::range
