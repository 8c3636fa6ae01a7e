#include "xlbind/core/HostSession.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/utils/CommonUtils.hpp"
#include "xlbind/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace xlbind {
namespace core {

namespace {

// 0基、可负数的位置索引 -> 0基非负位置
size_t wrapIndex(long long index, size_t count, const char* what) {
    const long long l = static_cast<long long>(count);
    if (index >= l || index < -l) {
        XLBIND_THROW(IndexOutOfRangeException,
                     fmt::format("{} index {} out of range ({} {}s)", what, index, count,
                                 utils::CommonUtils::foldCase(what)),
                     index, count);
    }
    return static_cast<size_t>(index < 0 ? index + l : index);
}

} // namespace

HostSession::HostSession(host::IAutomation& automation, const BindingOptions& options)
    : automation_(automation),
      options_(options),
      registry_(automation),
      resolver_(registry_, options) {
}

host::ApplicationInstance HostSession::activeApplication() {
    return registry_.activeInstance(options_.auto_start_instance);
}

host::DocumentHandle HostSession::activeDocument() {
    return resolver_.resolveActive();
}

host::SheetRef HostSession::activeSheet() {
    return automation_.activeSheet(activeDocument());
}

host::DocumentHandle HostSession::document(const std::string& identifier) {
    return resolver_.resolve(identifier);
}

host::DocumentHandle HostSession::documentAt(const host::ApplicationInstance& instance,
                                             long long index) const {
    auto documents = automation_.listDocuments(instance);
    return documents[wrapIndex(index, documents.size(), "Workbook")];
}

std::vector<host::SheetRef> HostSession::sheets(const host::DocumentHandle& document) const {
    return automation_.listSheets(document);
}

host::SheetRef HostSession::sheet(const host::DocumentHandle& document, const std::string& name) const {
    return automation_.sheet(document, name);
}

host::SheetRef HostSession::sheet(const host::DocumentHandle& document, int32_t index) const {
    return automation_.sheet(document, index);
}

host::SheetRef HostSession::sheetAt(const host::DocumentHandle& document, long long index) const {
    auto all = automation_.listSheets(document);
    return all[wrapIndex(index, all.size(), "Sheet")];
}

host::SheetRef HostSession::addSheet(const host::DocumentHandle& document, const std::string& name,
                                     const host::SheetPlacement& placement) {
    if (!name.empty()) {
        for (const auto& existing : automation_.listSheets(document)) {
            if (utils::CommonUtils::equalsIgnoreCase(existing.name, name)) {
                XLBIND_THROW(DuplicateNameException,
                             fmt::format("Sheet named '{}' already present in workbook", name),
                             name);
            }
        }
    }
    host::SheetRef added = automation_.addSheet(document, name, placement);
    CORE_DEBUG("Added sheet '{}' to '{}'", added.name, document.name);
    return added;
}

std::vector<host::ShapeRef> HostSession::shapes(const host::SheetRef& sheet,
                                                std::optional<host::ShapeKind> kind) const {
    std::vector<host::ShapeRef> result;
    for (auto& shape : automation_.listShapes(sheet)) {
        if (!kind || shape.kind == *kind) {
            result.push_back(std::move(shape));
        }
    }
    return result;
}

host::ShapeRef HostSession::shape(const host::SheetRef& sheet, const std::string& name) const {
    for (const auto& candidate : automation_.listShapes(sheet)) {
        if (utils::CommonUtils::equalsIgnoreCase(candidate.name, name)) {
            return candidate;
        }
    }
    XLBIND_THROW(NotFoundException,
                 fmt::format("No shape named '{}' on sheet '{}'", name, sheet.name),
                 name);
}

}} // namespace xlbind::core
