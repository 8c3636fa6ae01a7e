#pragma once

// xlbind - 宿主电子表格绑定核心
// 文档解析 + 区域寻址 + 连续区域扩展

// === 核心公共接口 ===
#include "xlbind/core/Constants.hpp"
#include "xlbind/core/ErrorCode.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/core/Expected.hpp"
#include "xlbind/core/Region.hpp"
#include "xlbind/core/CellValue.hpp"
#include "xlbind/core/BindingOptions.hpp"
#include "xlbind/core/InstanceRegistry.hpp"
#include "xlbind/core/DocumentResolver.hpp"
#include "xlbind/core/HostSession.hpp"

#include "xlbind/host/HostTypes.hpp"
#include "xlbind/host/IAutomation.hpp"

#include "xlbind/range/RangeOptions.hpp"
#include "xlbind/range/Range.hpp"
#include "xlbind/range/RangeBuilder.hpp"
#include "xlbind/range/RangeIndexer.hpp"
#include "xlbind/range/RegionExpander.hpp"

#include "xlbind/convert/ValueConverter.hpp"

#include "xlbind/utils/Logger.hpp"

#include <string>

// 版本信息
#define XLBIND_VERSION_MAJOR 1
#define XLBIND_VERSION_MINOR 0
#define XLBIND_VERSION_PATCH 0
#define XLBIND_VERSION_STRING "1.0.0"

// 导出宏定义
#ifdef _WIN32
    #ifdef XLBIND_SHARED
        #ifdef XLBIND_EXPORTS
            #define XLBIND_API __declspec(dllexport)
        #else
            #define XLBIND_API __declspec(dllimport)
        #endif
    #else
        #define XLBIND_API
    #endif
#else
    #define XLBIND_API
#endif

namespace xlbind {

inline std::string getVersion() {
    return XLBIND_VERSION_STRING;
}

/**
 * @brief 初始化xlbind（日志系统）
 * @param options 配置，通常来自 BindingOptions::fromEnvironment()
 * @return 初始化是否成功
 */
XLBIND_API bool initialize(const core::BindingOptions& options = core::BindingOptions());

/**
 * @brief 清理xlbind资源（刷新并关闭日志）
 */
XLBIND_API void cleanup();

} // namespace xlbind
