#include "xlbind/core/BindingOptions.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/utils/CommonUtils.hpp"
#include <cstdlib>
#include <fmt/format.h>

namespace xlbind {
namespace core {

namespace {

void overlayFlag(const char* variable, bool& target) {
    const char* raw = std::getenv(variable);
    if (!raw) {
        return;
    }
    if (!BindingOptions::parseFlag(raw, target)) {
        XLBIND_THROW(InvalidArgumentsException,
                     fmt::format("Invalid boolean '{}' in {}", raw, variable),
                     variable);
    }
}

} // namespace

bool BindingOptions::parseFlag(const std::string& text, bool& value) {
    std::string lowered = utils::CommonUtils::foldCase(utils::CommonUtils::trim(text));
    if (lowered == "1" || lowered == "true" || lowered == "on" || lowered == "yes") {
        value = true;
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "off" || lowered == "no") {
        value = false;
        return true;
    }
    return false;
}

BindingOptions BindingOptions::fromEnvironment() {
    return fromEnvironment(BindingOptions{});
}

BindingOptions BindingOptions::fromEnvironment(const BindingOptions& base) {
    BindingOptions options = base;

    if (const char* level = std::getenv("XLBIND_LOG_LEVEL")) {
        if (!Logger::parseLevel(utils::CommonUtils::trim(level), options.log_level)) {
            XLBIND_THROW(InvalidArgumentsException,
                         fmt::format("Invalid log level '{}' in XLBIND_LOG_LEVEL", level),
                         "XLBIND_LOG_LEVEL");
        }
    }

    if (const char* file = std::getenv("XLBIND_LOG_FILE")) {
        options.log_file_path = file;
    }

    overlayFlag("XLBIND_LOG_CONSOLE", options.log_to_console);
    overlayFlag("XLBIND_STRICT_EXPAND", options.strict_expand);
    overlayFlag("XLBIND_AUTOSTART", options.auto_start_instance);

    return options;
}

}} // namespace xlbind::core
