#include "xlbind/range/RangeBuilder.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/core/HostSession.hpp"
#include "xlbind/utils/AddressParser.hpp"
#include "xlbind/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <limits>

namespace xlbind {
namespace range {

using utils::AddressParser;

RangeBuilder::RangeBuilder(core::HostSession& session) : session_(session) {
}

core::CellCoordinate RangeBuilder::toCoordinate(const CellTuple& cell) {
    if (cell.first == 0) {
        XLBIND_THROW(core::ZeroBasedAccessError,
                     "Attempted to access 0-based Range, ranges are 1-based", "row");
    }
    if (cell.second == 0) {
        XLBIND_THROW(core::ZeroBasedAccessError,
                     "Attempted to access 0-based Range, ranges are 1-based", "column");
    }
    return core::CellCoordinate(cell.first, cell.second);
}

host::SheetRef RangeBuilder::resolveSheet(const SheetSelector& sheet) const {
    if (const std::string* name = std::get_if<std::string>(&sheet)) {
        return session_.sheet(session_.activeDocument(), *name);
    }
    if (const long long* index = std::get_if<long long>(&sheet)) {
        if (*index == 0) {
            XLBIND_THROW(core::ZeroBasedAccessError,
                         "Sheet index 0 requested, sheet indices are 1-based", "sheet");
        }
        const host::DocumentHandle document = session_.activeDocument();
        if (*index < 0 || *index > std::numeric_limits<int32_t>::max()) {
            XLBIND_THROW(core::IndexOutOfRangeException,
                         fmt::format("Sheet index {} out of range", *index),
                         *index, session_.sheets(document).size());
        }
        return session_.sheet(document, static_cast<int32_t>(*index));
    }
    const host::SheetRef& ref = std::get<host::SheetRef>(sheet);
    session_.automation().requireAlive(ref);
    return ref;
}

host::SheetRef RangeBuilder::resolvePrefix(const host::SheetRef& context, const std::string& book,
                                           const std::string& sheet) const {
    if (!book.empty()) {
        const host::DocumentHandle document = session_.document(book);
        return sheet.empty() ? session_.automation().activeSheet(document) : session_.sheet(document, sheet);
    }
    if (!sheet.empty()) {
        return session_.sheet(context.document, sheet);
    }
    return context;
}

Range RangeBuilder::resolveName(const host::SheetRef& context, const std::string& prefix,
                                const std::string& name) const {
    host::IAutomation& automation = session_.automation();
    std::optional<host::NamedReference> named;

    if (!prefix.empty()) {
        // 借用地址解析器处理前缀中的引号和 [Book]
        const utils::ParsedReference parsed = AddressParser::parse(prefix + "!A1");
        const host::SheetRef scope = resolvePrefix(context, parsed.book, parsed.sheet);
        named = automation.definedName(scope.document, scope, name);
    } else {
        named = automation.definedName(context.document, context, name);
        if (!named) {
            named = automation.definedName(context.document, std::nullopt, name);
        }
    }

    if (!named) {
        XLBIND_THROW(core::NotFoundException,
                     fmt::format("'{}' is neither an address nor a defined name in workbook '{}'",
                                 prefix.empty() ? name : prefix + "!" + name, context.document.name),
                     name);
    }
    RANGE_DEBUG("Name '{}' -> {}!{}", name, named->target.name, named->region.toString());
    return Range(session_, named->target, named->region);
}

Range RangeBuilder::resolveToken(const host::SheetRef& context, const std::string& token) const {
    XLBIND_THROW_IF(token.empty(), core::InvalidArgumentsException, "Empty range address", "address");

    const size_t bang = token.rfind('!');
    const std::string body = bang == std::string::npos ? token : token.substr(bang + 1);

    const bool address_like = AddressParser::looksLikeAddress(token) ||
                              body.find(':') != std::string::npos ||
                              body.find('$') != std::string::npos;
    if (!address_like) {
        return resolveName(context, bang == std::string::npos ? "" : token.substr(0, bang), body);
    }

    const utils::ParsedReference parsed = AddressParser::parse(token);
    const host::SheetRef target = resolvePrefix(context, parsed.book, parsed.sheet);
    core::Region region(core::CellCoordinate(parsed.first_row, parsed.first_column),
                        core::CellCoordinate(parsed.last_row, parsed.last_column));
    return Range(session_, target, region);
}

Range RangeBuilder::fromAddress(const std::string& address) const {
    return resolveToken(session_.activeSheet(), address);
}

Range RangeBuilder::fromAddress(const SheetSelector& sheet, const std::string& address) const {
    return resolveToken(resolveSheet(sheet), address);
}

Range RangeBuilder::fromCell(const CellTuple& cell) const {
    const core::CellCoordinate coordinate = toCoordinate(cell);
    return Range(session_, session_.activeSheet(), core::Region(coordinate));
}

Range RangeBuilder::fromCell(const SheetSelector& sheet, const CellTuple& cell) const {
    const core::CellCoordinate coordinate = toCoordinate(cell);
    return Range(session_, resolveSheet(sheet), core::Region(coordinate));
}

Range RangeBuilder::fromCells(const CellTuple& first, const CellTuple& second) const {
    const core::CellCoordinate a = toCoordinate(first);
    const core::CellCoordinate b = toCoordinate(second);
    return Range(session_, session_.activeSheet(), core::Region(a, b));
}

Range RangeBuilder::fromCells(const SheetSelector& sheet, const CellTuple& first,
                              const CellTuple& second) const {
    const core::CellCoordinate a = toCoordinate(first);
    const core::CellCoordinate b = toCoordinate(second);
    return Range(session_, resolveSheet(sheet), core::Region(a, b));
}

Range RangeBuilder::spanning(const Range& first, const Range& second) const {
    if (first.sheet() != second.sheet()) {
        XLBIND_THROW(core::InvalidArgumentsException,
                     fmt::format("Ranges are not on the same sheet ({} and {})",
                                 first.toString(), second.toString()),
                     "range");
    }
    return Range(session_, first.sheet(), first.region().spanning(second.region()), first.options());
}

Range RangeBuilder::build(const std::vector<RangeArg>& args, const RangeOptions& options) const {
    if (args.size() == 2 && std::holds_alternative<Range>(args[0]) && std::holds_alternative<Range>(args[1])) {
        return spanning(std::get<Range>(args[0]), std::get<Range>(args[1])).withOptions(options);
    }
    if (args.size() == 1 && std::holds_alternative<std::string>(args[0])) {
        return fromAddress(std::get<std::string>(args[0])).withOptions(options);
    }
    if (args.empty() || args.size() > 3) {
        XLBIND_THROW(core::InvalidArgumentsException,
                     fmt::format("Invalid arguments: expected 1 to 3, got {}", args.size()), "args");
    }

    // 区域由最后一个参数（或最后两个坐标）决定
    size_t spec_size = 0;
    const RangeArg& last = args.back();
    if (std::holds_alternative<CellTuple>(last)) {
        spec_size = (args.size() > 1 && std::holds_alternative<CellTuple>(args[args.size() - 2])) ? 2 : 1;
        for (size_t i = args.size() - spec_size; i < args.size(); ++i) {
            toCoordinate(std::get<CellTuple>(args[i]));
        }
    } else if (std::holds_alternative<std::string>(last)) {
        spec_size = 1;
    } else {
        XLBIND_THROW(core::InvalidArgumentsException,
                     "Invalid arguments: the last argument must be an address, a name or a (row, column) pair",
                     "args");
    }

    const size_t residual = args.size() - spec_size;
    if (residual > 1) {
        XLBIND_THROW(core::InvalidArgumentsException,
                     "Invalid arguments: at most one sheet may precede the range", "args");
    }

    host::SheetRef sheet = session_.activeSheet();
    if (residual == 1) {
        const RangeArg& selector = args.front();
        if (const std::string* name = std::get_if<std::string>(&selector)) {
            sheet = resolveSheet(*name);
        } else if (const long long* index = std::get_if<long long>(&selector)) {
            sheet = resolveSheet(*index);
        } else if (const host::SheetRef* ref = std::get_if<host::SheetRef>(&selector)) {
            sheet = resolveSheet(*ref);
        } else {
            XLBIND_THROW(core::InvalidArgumentsException,
                         "Invalid arguments: the sheet must be a name, a 1-based index or a sheet reference",
                         "sheet");
        }
    }

    if (spec_size == 2) {
        core::Region region(toCoordinate(std::get<CellTuple>(args[args.size() - 2])),
                            toCoordinate(std::get<CellTuple>(last)));
        return Range(session_, sheet, region, options);
    }
    if (const CellTuple* cell = std::get_if<CellTuple>(&last)) {
        return Range(session_, sheet, core::Region(toCoordinate(*cell)), options);
    }
    return resolveToken(sheet, std::get<std::string>(last)).withOptions(options);
}

}} // namespace xlbind::range
