#include "CellValue.hpp"
#include <fmt/format.h>

namespace xlbind {
namespace core {

namespace {

struct Describer {
    std::string operator()(std::monostate) const { return "<empty>"; }
    std::string operator()(double v) const { return fmt::format("{}", v); }
    std::string operator()(bool v) const { return v ? "TRUE" : "FALSE"; }
    std::string operator()(const std::string& v) const { return fmt::format("'{}'", v); }
    std::string operator()(const DateValue& v) const { return fmt::format("date({})", v.serial); }
};

} // namespace

std::string describe(const CellValue& value) {
    return std::visit(Describer{}, value);
}

}} // namespace xlbind::core
