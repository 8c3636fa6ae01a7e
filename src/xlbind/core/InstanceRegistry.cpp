#include "xlbind/core/InstanceRegistry.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/core/Path.hpp"
#include "xlbind/utils/CommonUtils.hpp"
#include "xlbind/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace xlbind {
namespace core {

InstanceRegistry::InstanceRegistry(host::IAutomation& automation)
    : automation_(automation) {
}

std::vector<host::ApplicationInstance> InstanceRegistry::listInstances() const {
    return automation_.listInstances();
}

std::vector<host::DocumentHandle> InstanceRegistry::documentsOf(const host::ApplicationInstance& instance) const {
    return automation_.listDocuments(instance);
}

host::ApplicationInstance InstanceRegistry::activeInstance(bool start_if_none) {
    auto active = automation_.activeInstance();
    if (active) {
        return *active;
    }
    if (!start_if_none) {
        XLBIND_THROW(NotFoundException, "No running application instance", "active");
    }
    CORE_INFO("No running application instance, starting one");
    return automation_.startInstance();
}

std::optional<host::DocumentHandle> InstanceRegistry::activeDocument() const {
    auto instance = automation_.activeInstance();
    if (!instance) {
        return std::nullopt;
    }
    return automation_.activeDocument(*instance);
}

bool InstanceRegistry::matches(const host::DocumentHandle& document, const std::string& folded_name,
                               const std::string& path_key) const {
    if (utils::CommonUtils::foldCase(document.name) == folded_name) {
        return true;
    }
    return !document.full_path.empty() && Path(document.full_path).comparisonKey() == path_key;
}

std::vector<DocumentMatch> InstanceRegistry::findDocuments(const std::string& identifier) const {
    std::vector<DocumentMatch> result;
    for (const auto& instance : automation_.listInstances()) {
        auto found = findDocuments(instance, identifier);
        result.insert(result.end(), found.begin(), found.end());
    }
    RESOLVE_DEBUG("'{}' matched {} open document(s)", identifier, result.size());
    return result;
}

std::vector<DocumentMatch> InstanceRegistry::findDocuments(const host::ApplicationInstance& instance,
                                                           const std::string& identifier) const {
    const std::string folded_name = utils::CommonUtils::foldCase(identifier);
    const std::string path_key = Path(identifier).comparisonKey();

    std::vector<DocumentMatch> result;
    for (const auto& document : automation_.listDocuments(instance)) {
        XLBIND_LOG_SCAN_DEBUG("Scanning instance {} document '{}' ('{}')",
                              instance.id, document.name, document.full_path);
        if (matches(document, folded_name, path_key)) {
            result.push_back(DocumentMatch{instance, document});
        }
    }
    return result;
}

}} // namespace xlbind::core
