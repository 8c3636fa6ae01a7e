#include "xlbind/host/MemoryAutomation.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/core/Path.hpp"
#include "xlbind/utils/CommonUtils.hpp"
#include "xlbind/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace xlbind {
namespace host {

using utils::CommonUtils;

// ========== 内部查找 ==========

MemoryAutomation::Instance* MemoryAutomation::findInstance(uint64_t id) {
    auto it = std::find_if(instances_.begin(), instances_.end(),
                           [id](const Instance& i) { return i.id == id; });
    return it == instances_.end() ? nullptr : &*it;
}

const MemoryAutomation::Instance* MemoryAutomation::findInstance(uint64_t id) const {
    return const_cast<MemoryAutomation*>(this)->findInstance(id);
}

MemoryAutomation::Document* MemoryAutomation::findDocument(const DocumentHandle& handle) {
    Instance* instance = findInstance(handle.instance.id);
    if (!instance) {
        return nullptr;
    }
    auto it = std::find_if(instance->documents.begin(), instance->documents.end(),
                           [&handle](const Document& d) { return d.id == handle.id; });
    return it == instance->documents.end() ? nullptr : &*it;
}

const MemoryAutomation::Document* MemoryAutomation::findDocument(const DocumentHandle& handle) const {
    return const_cast<MemoryAutomation*>(this)->findDocument(handle);
}

MemoryAutomation::Sheet* MemoryAutomation::findSheet(const SheetRef& ref) {
    Document* document = findDocument(ref.document);
    if (!document) {
        return nullptr;
    }
    auto it = std::find_if(document->sheets.begin(), document->sheets.end(),
                           [&ref](const Sheet& s) { return s.id == ref.id; });
    return it == document->sheets.end() ? nullptr : &*it;
}

const MemoryAutomation::Sheet* MemoryAutomation::findSheet(const SheetRef& ref) const {
    return const_cast<MemoryAutomation*>(this)->findSheet(ref);
}

MemoryAutomation::Instance& MemoryAutomation::requireInstance(const ApplicationInstance& instance) {
    Instance* found = findInstance(instance.id);
    if (!found) {
        XLBIND_THROW(core::StaleHandleException,
                     fmt::format("Application instance {} is not running", instance.id),
                     fmt::format("instance {}", instance.id));
    }
    return *found;
}

const MemoryAutomation::Instance& MemoryAutomation::requireInstance(const ApplicationInstance& instance) const {
    return const_cast<MemoryAutomation*>(this)->requireInstance(instance);
}

MemoryAutomation::Document& MemoryAutomation::requireDocument(const DocumentHandle& handle) {
    Document* found = findDocument(handle);
    if (!found) {
        XLBIND_THROW(core::StaleHandleException,
                     fmt::format("Document '{}' has been closed", handle.name),
                     handle.name);
    }
    return *found;
}

const MemoryAutomation::Document& MemoryAutomation::requireDocument(const DocumentHandle& handle) const {
    return const_cast<MemoryAutomation*>(this)->requireDocument(handle);
}

MemoryAutomation::Sheet& MemoryAutomation::requireSheet(const SheetRef& ref) {
    requireDocument(ref.document);
    Sheet* found = findSheet(ref);
    if (!found) {
        XLBIND_THROW(core::StaleHandleException,
                     fmt::format("Sheet '{}' in '{}' has been deleted", ref.name, ref.document.name),
                     ref.name);
    }
    return *found;
}

const MemoryAutomation::Sheet& MemoryAutomation::requireSheet(const SheetRef& ref) const {
    return const_cast<MemoryAutomation*>(this)->requireSheet(ref);
}

DocumentHandle MemoryAutomation::makeHandle(const Instance& instance, const Document& document) const {
    DocumentHandle handle;
    handle.instance.id = instance.id;
    handle.id = document.id;
    handle.name = document.name;
    handle.full_path = document.full_path;
    return handle;
}

SheetRef MemoryAutomation::makeRefAt(const DocumentHandle& handle, const Document& document,
                                     size_t position) const {
    SheetRef ref;
    ref.document = handle;
    ref.id = document.sheets[position].id;
    ref.name = document.sheets[position].name;
    ref.index = static_cast<int32_t>(position + 1);
    return ref;
}

SheetRef MemoryAutomation::makeRefById(const DocumentHandle& handle, const Document& document,
                                       uint64_t sheet_id) const {
    for (size_t i = 0; i < document.sheets.size(); ++i) {
        if (document.sheets[i].id == sheet_id) {
            return makeRefAt(handle, document, i);
        }
    }
    XLBIND_THROW(core::HostException,
                 fmt::format("Sheet id {} missing from '{}'", sheet_id, document.name),
                 "makeRefById");
}

MemoryAutomation::Sheet MemoryAutomation::makeSheet(const std::string& name) {
    Sheet sheet;
    sheet.id = next_id_++;
    sheet.name = name;
    return sheet;
}

MemoryAutomation::Document& MemoryAutomation::addDocument(Instance& instance, const std::string& name,
                                                          const std::string& full_path) {
    Document document;
    document.id = next_id_++;
    document.name = name;
    document.full_path = full_path;
    document.sheets.push_back(makeSheet("Sheet1"));
    document.active_sheet = document.sheets.front().id;
    instance.documents.push_back(std::move(document));
    touch(instance.focus, instance.documents.back().id);
    touch(instance_focus_, instance.id);
    return instance.documents.back();
}

void MemoryAutomation::touch(std::vector<uint64_t>& focus, uint64_t id) {
    forget(focus, id);
    focus.push_back(id);
}

void MemoryAutomation::forget(std::vector<uint64_t>& focus, uint64_t id) {
    focus.erase(std::remove(focus.begin(), focus.end(), id), focus.end());
}

// ========== 实例与文档 ==========

std::vector<ApplicationInstance> MemoryAutomation::listInstances() const {
    std::vector<ApplicationInstance> result;
    result.reserve(instances_.size());
    for (const auto& instance : instances_) {
        result.push_back(ApplicationInstance{instance.id});
    }
    return result;
}

std::vector<DocumentHandle> MemoryAutomation::listDocuments(const ApplicationInstance& instance) const {
    const Instance& found = requireInstance(instance);
    std::vector<DocumentHandle> result;
    result.reserve(found.documents.size());
    for (const auto& document : found.documents) {
        result.push_back(makeHandle(found, document));
    }
    return result;
}

std::optional<ApplicationInstance> MemoryAutomation::activeInstance() const {
    if (instance_focus_.empty()) {
        return std::nullopt;
    }
    return ApplicationInstance{instance_focus_.back()};
}

std::optional<DocumentHandle> MemoryAutomation::activeDocument(const ApplicationInstance& instance) const {
    const Instance& found = requireInstance(instance);
    if (found.focus.empty()) {
        return std::nullopt;
    }
    uint64_t id = found.focus.back();
    for (const auto& document : found.documents) {
        if (document.id == id) {
            return makeHandle(found, document);
        }
    }
    return std::nullopt;
}

ApplicationInstance MemoryAutomation::startInstance() {
    Instance instance;
    instance.id = next_id_++;
    instances_.push_back(std::move(instance));
    touch(instance_focus_, instances_.back().id);
    HOST_INFO("Started application instance {}", instances_.back().id);
    return ApplicationInstance{instances_.back().id};
}

DocumentHandle MemoryAutomation::open(const ApplicationInstance& instance, const std::string& path) {
    Instance& target = requireInstance(instance);
    core::Path requested(path);

    // 同一路径已经打开时直接激活
    for (auto& document : target.documents) {
        if (!document.full_path.empty() && core::Path(document.full_path).equivalentTo(requested)) {
            touch(target.focus, document.id);
            touch(instance_focus_, target.id);
            return makeHandle(target, document);
        }
    }

    Document& document = addDocument(target, requested.filename(), path);
    HOST_INFO("Opened '{}' in instance {}", path, target.id);
    return makeHandle(target, document);
}

DocumentHandle MemoryAutomation::create(const ApplicationInstance& instance) {
    Instance& target = requireInstance(instance);
    Document& document = addDocument(target, fmt::format("Book{}", ++book_counter_), "");
    HOST_DEBUG("Created '{}' in instance {}", document.name, target.id);
    return makeHandle(target, document);
}

bool MemoryAutomation::isAlive(const DocumentHandle& document) const {
    return findDocument(document) != nullptr;
}

// ========== 工作表 ==========

std::vector<SheetRef> MemoryAutomation::listSheets(const DocumentHandle& document) const {
    const Document& found = requireDocument(document);
    std::vector<SheetRef> result;
    result.reserve(found.sheets.size());
    for (size_t i = 0; i < found.sheets.size(); ++i) {
        result.push_back(makeRefAt(document, found, i));
    }
    return result;
}

SheetRef MemoryAutomation::activeSheet(const DocumentHandle& document) const {
    const Document& found = requireDocument(document);
    return makeRefById(document, found, found.active_sheet);
}

SheetRef MemoryAutomation::addSheet(const DocumentHandle& document, const std::string& name,
                                    const SheetPlacement& placement) {
    Document& found = requireDocument(document);

    if (placement.before && placement.after) {
        XLBIND_THROW(core::InvalidArgumentsException,
                     "Specify either 'before' or 'after', not both", "placement");
    }

    std::string sheet_name = name;
    if (sheet_name.empty()) {
        int n = static_cast<int>(found.sheets.size()) + 1;
        auto taken = [&found](const std::string& candidate) {
            return std::any_of(found.sheets.begin(), found.sheets.end(), [&](const Sheet& s) {
                return CommonUtils::equalsIgnoreCase(s.name, candidate);
            });
        };
        while (taken(fmt::format("Sheet{}", n))) {
            ++n;
        }
        sheet_name = fmt::format("Sheet{}", n);
    }

    for (const auto& existing : found.sheets) {
        if (CommonUtils::equalsIgnoreCase(existing.name, sheet_name)) {
            XLBIND_THROW(core::DuplicateNameException,
                         fmt::format("Sheet named '{}' already present in workbook", sheet_name),
                         sheet_name);
        }
    }

    auto positionOf = [&found](const SheetRef& ref) {
        for (size_t i = 0; i < found.sheets.size(); ++i) {
            if (found.sheets[i].id == ref.id) {
                return i;
            }
        }
        XLBIND_THROW(core::StaleHandleException,
                     fmt::format("Sheet '{}' has been deleted", ref.name), ref.name);
    };

    size_t position;
    if (placement.before) {
        position = positionOf(*placement.before);
    } else if (placement.after) {
        position = positionOf(*placement.after) + 1;
    } else {
        position = positionOf(makeRefById(document, found, found.active_sheet));
    }

    found.sheets.insert(found.sheets.begin() + static_cast<std::ptrdiff_t>(position),
                        makeSheet(sheet_name));
    found.active_sheet = found.sheets[position].id;
    HOST_DEBUG("Added sheet '{}' at position {} in '{}'", sheet_name, position + 1, found.name);
    return makeRefAt(document, found, position);
}

bool MemoryAutomation::isAlive(const SheetRef& sheet) const {
    return findSheet(sheet) != nullptr;
}

// ========== 单元格 ==========

core::CellValue MemoryAutomation::cellValue(const SheetRef& sheet, int32_t row, int32_t column) const {
    const Sheet& found = requireSheet(sheet);
    ++cell_reads_;
    auto it = found.cells.find({row, column});
    return it == found.cells.end() ? core::CellValue{} : it->second.value;
}

std::string MemoryAutomation::cellFormula(const SheetRef& sheet, int32_t row, int32_t column) const {
    const Sheet& found = requireSheet(sheet);
    auto it = found.cells.find({row, column});
    return it == found.cells.end() ? std::string() : it->second.formula;
}

void MemoryAutomation::setCellValue(const SheetRef& sheet, int32_t row, int32_t column,
                                    const core::CellValue& value) {
    Sheet& found = requireSheet(sheet);
    if (std::holds_alternative<std::monostate>(value)) {
        found.cells.erase({row, column});
        return;
    }
    Cell& cell = found.cells[{row, column}];
    cell.value = value;
    cell.formula.clear();
}

void MemoryAutomation::setCellFormula(const SheetRef& sheet, int32_t row, int32_t column,
                                      const std::string& formula, const core::CellValue& computed) {
    Sheet& found = requireSheet(sheet);
    Cell& cell = found.cells[{row, column}];
    cell.formula = formula;
    cell.value = computed;
}

int32_t MemoryAutomation::rowCount(const SheetRef& sheet) const {
    const Sheet& found = requireSheet(sheet);
    int32_t last = 0;
    for (const auto& entry : found.cells) {
        last = std::max(last, entry.first.first);
    }
    return last;
}

int32_t MemoryAutomation::columnCount(const SheetRef& sheet) const {
    const Sheet& found = requireSheet(sheet);
    int32_t last = 0;
    for (const auto& entry : found.cells) {
        last = std::max(last, entry.first.second);
    }
    return last;
}

core::CellCoordinate MemoryAutomation::endOf(const SheetRef& sheet, const core::CellCoordinate& from,
                                             Direction direction) const {
    ++end_of_calls_;
    return IAutomation::endOf(sheet, from, direction);
}

// ========== 名称与图形 ==========

std::optional<NamedReference> MemoryAutomation::definedName(const DocumentHandle& document,
                                                            const std::optional<SheetRef>& scope,
                                                            const std::string& name) const {
    const Document& found = requireDocument(document);
    for (const auto& entry : found.names) {
        bool same_scope = scope ? (entry.scope_sheet && *entry.scope_sheet == scope->id)
                                : !entry.scope_sheet.has_value();
        if (!same_scope || !CommonUtils::equalsIgnoreCase(entry.name, name)) {
            continue;
        }
        std::optional<SheetRef> scope_ref;
        if (entry.scope_sheet) {
            scope_ref = makeRefById(document, found, *entry.scope_sheet);
        }
        return NamedReference{entry.name, scope_ref,
                              makeRefById(document, found, entry.target_sheet), entry.region};
    }
    return std::nullopt;
}

std::vector<ShapeRef> MemoryAutomation::listShapes(const SheetRef& sheet) const {
    const Sheet& found = requireSheet(sheet);
    std::vector<ShapeRef> result;
    result.reserve(found.shapes.size());
    for (const auto& shape : found.shapes) {
        result.push_back(ShapeRef{shape.first, sheet, shape.second});
    }
    return result;
}

// ========== 模拟宿主侧的操作 ==========

void MemoryAutomation::activate(const ApplicationInstance& instance) {
    requireInstance(instance);
    touch(instance_focus_, instance.id);
}

void MemoryAutomation::activate(const DocumentHandle& document) {
    requireDocument(document);
    Instance& instance = requireInstance(document.instance);
    touch(instance.focus, document.id);
    touch(instance_focus_, instance.id);
}

void MemoryAutomation::activate(const SheetRef& sheet) {
    requireSheet(sheet);
    activate(sheet.document);
    requireDocument(sheet.document).active_sheet = sheet.id;
}

void MemoryAutomation::close(const DocumentHandle& document) {
    requireDocument(document);
    Instance& instance = requireInstance(document.instance);
    instance.documents.erase(
        std::remove_if(instance.documents.begin(), instance.documents.end(),
                       [&document](const Document& d) { return d.id == document.id; }),
        instance.documents.end());
    forget(instance.focus, document.id);
    HOST_DEBUG("Closed '{}' in instance {}", document.name, instance.id);
}

void MemoryAutomation::quit(const ApplicationInstance& instance) {
    requireInstance(instance);
    instances_.erase(std::remove_if(instances_.begin(), instances_.end(),
                                    [&instance](const Instance& i) { return i.id == instance.id; }),
                     instances_.end());
    forget(instance_focus_, instance.id);
    HOST_INFO("Application instance {} quit", instance.id);
}

void MemoryAutomation::deleteSheet(const SheetRef& sheet) {
    requireSheet(sheet);
    Document& document = requireDocument(sheet.document);
    if (document.sheets.size() == 1) {
        XLBIND_THROW(core::HostException,
                     fmt::format("Cannot delete the only sheet of '{}'", document.name),
                     "deleteSheet");
    }
    auto it = std::find_if(document.sheets.begin(), document.sheets.end(),
                           [&sheet](const Sheet& s) { return s.id == sheet.id; });
    size_t position = static_cast<size_t>(it - document.sheets.begin());
    document.sheets.erase(it);
    document.names.erase(std::remove_if(document.names.begin(), document.names.end(),
                                        [&sheet](const Name& n) {
                                            return n.target_sheet == sheet.id ||
                                                   (n.scope_sheet && *n.scope_sheet == sheet.id);
                                        }),
                         document.names.end());
    if (document.active_sheet == sheet.id) {
        document.active_sheet = document.sheets[std::min(position, document.sheets.size() - 1)].id;
    }
}

void MemoryAutomation::defineName(const DocumentHandle& document, const std::string& name,
                                  const SheetRef& target, const core::Region& region,
                                  const std::optional<SheetRef>& scope) {
    Document& found = requireDocument(document);
    requireSheet(target);
    std::optional<uint64_t> scope_id;
    if (scope) {
        requireSheet(*scope);
        scope_id = scope->id;
    }
    for (auto& entry : found.names) {
        if (entry.scope_sheet == scope_id && CommonUtils::equalsIgnoreCase(entry.name, name)) {
            entry.target_sheet = target.id;
            entry.region = region;
            return;
        }
    }
    found.names.push_back(Name{name, scope_id, target.id, region});
}

ShapeRef MemoryAutomation::addShape(const SheetRef& sheet, ShapeKind kind, const std::string& name) {
    Sheet& found = requireSheet(sheet);
    for (const auto& shape : found.shapes) {
        if (CommonUtils::equalsIgnoreCase(shape.second, name)) {
            XLBIND_THROW(core::DuplicateNameException,
                         fmt::format("Shape named '{}' already present on '{}'", name, sheet.name),
                         name);
        }
    }
    found.shapes.emplace_back(kind, name);
    return ShapeRef{kind, sheet, name};
}

}} // namespace xlbind::host
