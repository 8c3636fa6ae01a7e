#pragma once

#include <cstdint>

namespace xlbind {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // 宿主工作表的最大尺寸（1基坐标的上界）
    static constexpr int32_t kMaxRows = 1048576;
    static constexpr int32_t kMaxColumns = 16384;

    // 列字母最多3位（XFD）
    static constexpr int kMaxColumnLetters = 3;

    // 文档标识符中的特殊值
    static constexpr const char* kNewDocument = "new";
    static constexpr const char* kActiveDocument = "active";

    // 默认转换器名称
    static constexpr const char* kDefaultConverter = "default";
};

} // namespace core
} // namespace xlbind
