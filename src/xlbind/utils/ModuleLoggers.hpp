#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    XLBIND_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     XLBIND_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     XLBIND_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    XLBIND_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 宿主自动化模块 (host)
#define HOST_DEBUG(...)    XLBIND_LOG_DEBUG("[DBG][host] " __VA_ARGS__)
#define HOST_INFO(...)     XLBIND_LOG_INFO("[INF][host] " __VA_ARGS__)
#define HOST_WARN(...)     XLBIND_LOG_WARN("[WRN][host] " __VA_ARGS__)
#define HOST_ERROR(...)    XLBIND_LOG_ERROR("[ERR][host] " __VA_ARGS__)

// 文档解析模块 (resolve)
#define RESOLVE_DEBUG(...) XLBIND_LOG_DEBUG("[DBG][rslv] " __VA_ARGS__)
#define RESOLVE_INFO(...)  XLBIND_LOG_INFO("[INF][rslv] " __VA_ARGS__)
#define RESOLVE_WARN(...)  XLBIND_LOG_WARN("[WRN][rslv] " __VA_ARGS__)
#define RESOLVE_ERROR(...) XLBIND_LOG_ERROR("[ERR][rslv] " __VA_ARGS__)

// 区域构造与索引模块 (range)
#define RANGE_DEBUG(...)   XLBIND_LOG_DEBUG("[DBG][rnge] " __VA_ARGS__)
#define RANGE_INFO(...)    XLBIND_LOG_INFO("[INF][rnge] " __VA_ARGS__)
#define RANGE_WARN(...)    XLBIND_LOG_WARN("[WRN][rnge] " __VA_ARGS__)
#define RANGE_ERROR(...)   XLBIND_LOG_ERROR("[ERR][rnge] " __VA_ARGS__)

// 连续区域扩展模块 (expand)
#define EXPAND_DEBUG(...)  XLBIND_LOG_DEBUG("[DBG][expd] " __VA_ARGS__)
#define EXPAND_INFO(...)   XLBIND_LOG_INFO("[INF][expd] " __VA_ARGS__)
#define EXPAND_WARN(...)   XLBIND_LOG_WARN("[WRN][expd] " __VA_ARGS__)

// 值转换模块 (convert)
#define CONVERT_DEBUG(...) XLBIND_LOG_DEBUG("[DBG][conv] " __VA_ARGS__)
#define CONVERT_WARN(...)  XLBIND_LOG_WARN("[WRN][conv] " __VA_ARGS__)
#define CONVERT_ERROR(...) XLBIND_LOG_ERROR("[ERR][conv] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)   XLBIND_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)    XLBIND_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)   XLBIND_LOG_ERROR("[ERR][util] " __VA_ARGS__)

// 示例程序 (demo)
#define DEMO_INFO(...)     XLBIND_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define DEMO_ERROR(...)    XLBIND_LOG_ERROR("[ERR][demo] " __VA_ARGS__)

// 条件日志宏
#if ENABLE_PROBE_DEBUG_LOGS
    #define XLBIND_LOG_PROBE_DEBUG(...) EXPAND_DEBUG(__VA_ARGS__)
#else
    #define XLBIND_LOG_PROBE_DEBUG(...) do {} while(0)
#endif

#if ENABLE_SCAN_DEBUG_LOGS
    #define XLBIND_LOG_SCAN_DEBUG(...) RESOLVE_DEBUG(__VA_ARGS__)
#else
    #define XLBIND_LOG_SCAN_DEBUG(...) do {} while(0)
#endif
