#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace xlbind {

/**
 * @brief 进程级日志器
 *
 * 控制台彩色输出 + 滚动日志文件。未显式初始化时，第一次写日志会按默认参数初始化。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "logs/xlbind.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;

    void setConsoleEnabled(bool enabled) { enable_console_.store(enabled); }
    bool isConsoleEnabled() const { return enable_console_.load(); }
    bool isInitialized() const { return initialized_.load(); }

    /**
     * @brief 解析级别名（不区分大小写）："trace" "debug" "info" "warn" "error" "critical" "off"
     * @return 解析失败返回false，level保持不变
     */
    static bool parseLevel(const std::string& text, Level& level);
    static const char* levelName(Level level);

    void trace(const std::string& message)    { write(Level::TRACE, message); }
    void debug(const std::string& message)    { write(Level::DEBUG, message); }
    void info(const std::string& message)     { write(Level::INFO, message); }
    void warn(const std::string& message)     { write(Level::WARN, message); }
    void error(const std::string& message)    { write(Level::ERROR, message); }
    void critical(const std::string& message) { write(Level::CRITICAL, message); }

    /**
     * @brief 带源码位置的格式化日志（供宏使用）
     */
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        std::string body;
        try {
            body = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            body = fmt::format("{} <format error: {}>", fmt_str, e.what());
        }
        write(level, fmt::format("[{}:{}:{}] {}", baseFilename(file), line,
                                 extractFunctionName(func), body));
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void write(Level level, const std::string& message);
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    // 去掉命名空间和参数列表
    static inline std::string extractFunctionName(const char* func_sig) {
        if (!func_sig) return "";
        std::string sig(func_sig);
        size_t paren = sig.find('(');
        if (paren != std::string::npos) {
            sig = sig.substr(0, paren);
        }
        size_t last_colon = sig.rfind("::");
        if (last_colon != std::string::npos) {
            sig = sig.substr(last_colon + 2);
        }
        return sig;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    std::atomic<size_t> current_file_size_{0};
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define XLBIND_FUNC __FUNCTION__
#else
#  define XLBIND_FUNC __func__
#endif

#define XLBIND_LOG_AT(level, fmt, ...) \
    xlbind::Logger::getInstance().logCtx(level, __FILE__, __LINE__, XLBIND_FUNC, fmt, ##__VA_ARGS__)

#define XLBIND_LOG_TRACE(fmt, ...)    XLBIND_LOG_AT(xlbind::Logger::Level::TRACE, fmt, ##__VA_ARGS__)
#define XLBIND_LOG_DEBUG(fmt, ...)    XLBIND_LOG_AT(xlbind::Logger::Level::DEBUG, fmt, ##__VA_ARGS__)
#define XLBIND_LOG_INFO(fmt, ...)     XLBIND_LOG_AT(xlbind::Logger::Level::INFO, fmt, ##__VA_ARGS__)
#define XLBIND_LOG_WARN(fmt, ...)     XLBIND_LOG_AT(xlbind::Logger::Level::WARN, fmt, ##__VA_ARGS__)
#define XLBIND_LOG_ERROR(fmt, ...)    XLBIND_LOG_AT(xlbind::Logger::Level::ERROR, fmt, ##__VA_ARGS__)
#define XLBIND_LOG_CRITICAL(fmt, ...) XLBIND_LOG_AT(xlbind::Logger::Level::CRITICAL, fmt, ##__VA_ARGS__)

} // namespace xlbind
