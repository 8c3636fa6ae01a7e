#include "xlbind/core/DocumentResolver.hpp"
#include "xlbind/core/Constants.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/core/Path.hpp"
#include "xlbind/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace xlbind {
namespace core {

DocumentIdentifier DocumentIdentifier::parse(const std::string& text) {
    if (text == Constants::kNewDocument) {
        return newDocument();
    }
    if (text == Constants::kActiveDocument) {
        return active();
    }
    return named(text);
}

DocumentResolver::DocumentResolver(InstanceRegistry& registry, const BindingOptions& options)
    : registry_(registry), options_(options) {
}

host::DocumentHandle DocumentResolver::resolve(const std::string& identifier) {
    return resolve(DocumentIdentifier::parse(identifier));
}

host::DocumentHandle DocumentResolver::resolve(const DocumentIdentifier& identifier) {
    switch (identifier.kind()) {
        case DocumentIdentifier::Kind::NewDocument:
            return createNew();
        case DocumentIdentifier::Kind::ActiveDocument:
            return resolveActive();
        case DocumentIdentifier::Kind::Named:
            break;
    }
    return resolveNamed(identifier.text());
}

Expected<host::DocumentHandle> DocumentResolver::tryResolve(const std::string& identifier) {
    return tryResolve(DocumentIdentifier::parse(identifier));
}

Expected<host::DocumentHandle> DocumentResolver::tryResolve(const DocumentIdentifier& identifier) {
    try {
        return resolve(identifier);
    } catch (const XlBindException& e) {
        RESOLVE_DEBUG("tryResolve('{}') failed: {}", identifier.text(), e.what());
        return e.toError();
    }
}

host::DocumentHandle DocumentResolver::resolveActive() {
    host::ApplicationInstance instance = registry_.activeInstance(options_.auto_start_instance);
    auto document = registry_.automation().activeDocument(instance);
    if (!document) {
        XLBIND_THROW(NotFoundException,
                     fmt::format("Application instance {} has no open workbook", instance.id),
                     Constants::kActiveDocument);
    }
    return *document;
}

host::DocumentHandle DocumentResolver::createNew() {
    host::ApplicationInstance instance = registry_.activeInstance(options_.auto_start_instance);
    host::DocumentHandle document = registry_.automation().create(instance);
    RESOLVE_INFO("Created new workbook '{}' in instance {}", document.name, instance.id);
    return document;
}

host::DocumentHandle DocumentResolver::openFromDisk(const host::ApplicationInstance& instance,
                                                    const std::string& identifier) {
    RESOLVE_INFO("Opening '{}' from disk in instance {}", identifier, instance.id);
    return registry_.automation().open(instance, identifier);
}

host::DocumentHandle DocumentResolver::resolveNamed(const std::string& identifier) {
    if (identifier.empty()) {
        XLBIND_THROW(InvalidArgumentsException, "Workbook identifier must not be empty", "identifier");
    }

    std::vector<DocumentMatch> candidates = registry_.findDocuments(identifier);

    if (candidates.size() == 1) {
        RESOLVE_DEBUG("Resolved '{}' to '{}' in instance {}", identifier,
                      candidates.front().document.name, candidates.front().instance.id);
        return candidates.front().document;
    }

    if (candidates.size() > 1) {
        RESOLVE_WARN("'{}' is open in {} application instances", identifier, candidates.size());
        XLBIND_THROW(AmbiguousReferenceException,
                     fmt::format("Workbook '{}' is open in more than one application instance",
                                 identifier),
                     identifier, candidates.size());
    }

    if (options_.open_missing_from_disk && Path(identifier).isFile()) {
        // 按原始大小写打开，大小写敏感的文件系统上才能找到文件
        return openFromDisk(registry_.activeInstance(true), identifier);
    }

    XLBIND_THROW(NotFoundException,
                 fmt::format("Could not connect to workbook '{}'", identifier),
                 identifier);
}

host::DocumentHandle DocumentResolver::resolveInInstance(const host::ApplicationInstance& instance,
                                                         const std::string& identifier) {
    if (identifier.empty()) {
        return registry_.automation().create(instance);
    }

    std::vector<DocumentMatch> candidates = registry_.findDocuments(instance, identifier);
    if (!candidates.empty()) {
        return candidates.front().document;
    }

    if (options_.open_missing_from_disk && Path(identifier).isFile()) {
        return openFromDisk(instance, identifier);
    }

    XLBIND_THROW(NotFoundException,
                 fmt::format("Could not connect to workbook '{}'", identifier),
                 identifier);
}

}} // namespace xlbind::core
