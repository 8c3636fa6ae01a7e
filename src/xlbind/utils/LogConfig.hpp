#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用；编译选项中已定义时以编译选项为准

#ifndef ENABLE_PROBE_DEBUG_LOGS
#define ENABLE_PROBE_DEBUG_LOGS 0    // 区域扩展时逐个单元格的探测日志
#endif

#ifndef ENABLE_SCAN_DEBUG_LOGS
#define ENABLE_SCAN_DEBUG_LOGS 0     // 文档解析时逐个实例/文档的扫描日志
#endif

// 条件日志宏在ModuleLoggers.hpp中定义：
// XLBIND_LOG_PROBE_DEBUG -> EXPAND_DEBUG
// XLBIND_LOG_SCAN_DEBUG  -> RESOLVE_DEBUG
