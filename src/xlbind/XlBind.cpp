#include "xlbind/XlBind.hpp"
#include "xlbind/utils/Logger.hpp"
#include <iostream>
#include <filesystem>

namespace xlbind {

XLBIND_API bool initialize(const core::BindingOptions& options) {
    try {
        Logger& logger = Logger::getInstance();
        logger.initialize(options.log_file_path, options.log_level, options.log_to_console,
                          options.log_max_file_size, options.log_max_files);
        // 日志器可能已被更早的日志调用按默认值初始化过
        logger.setLevel(options.log_level);
        logger.setConsoleEnabled(options.log_to_console);

        XLBIND_LOG_INFO("xlbind initialized");
        XLBIND_LOG_INFO("Version: {}", getVersion());
        XLBIND_LOG_DEBUG("strict_expand={}, auto_start_instance={}, open_missing_from_disk={}",
                         options.strict_expand, options.auto_start_instance,
                         options.open_missing_from_disk);
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        if (options.log_to_console) {
            std::cerr << "Failed to initialize xlbind: " << e.what() << std::endl;
        }
        return false;
    } catch (const std::ios_base::failure& e) {
        if (options.log_to_console) {
            std::cerr << "Failed to initialize xlbind: " << e.what() << std::endl;
        }
        return false;
    }
}

XLBIND_API void cleanup() {
    XLBIND_LOG_INFO("xlbind cleanup completed");
    Logger::getInstance().flush();
}

} // namespace xlbind
