#pragma once

#include "xlbind/core/Region.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace xlbind {
namespace host {

/**
 * @brief 一个运行中的宿主进程
 */
struct ApplicationInstance {
    uint64_t id = 0;

    bool operator==(const ApplicationInstance& other) const { return id == other.id; }
    bool operator!=(const ApplicationInstance& other) const { return !(*this == other); }
};

/**
 * @brief 某个实例中一个打开的文档
 *
 * 只是不透明的引用，不持有任何资源；文档关闭后句柄失效，
 * 之后对它的任何操作都抛 StaleHandleException。
 * 相等性只看 (实例, 文档id)，名字和路径只是打开时的快照。
 */
struct DocumentHandle {
    ApplicationInstance instance;
    uint64_t id = 0;
    std::string name;       ///< 显示名，例如 "Book1.xlsx"
    std::string full_path;  ///< 完整路径，从未保存过时为空

    bool operator==(const DocumentHandle& other) const {
        return instance == other.instance && id == other.id;
    }
    bool operator!=(const DocumentHandle& other) const { return !(*this == other); }
};

/**
 * @brief 文档中的一个工作表
 *
 * index为1基位置；名字在同一文档内不区分大小写唯一。
 */
struct SheetRef {
    DocumentHandle document;
    uint64_t id = 0;
    std::string name;
    int32_t index = 1;

    bool operator==(const SheetRef& other) const {
        return document == other.document && id == other.id;
    }
    bool operator!=(const SheetRef& other) const { return !(*this == other); }
};

/**
 * @brief 定义名称解析结果
 */
struct NamedReference {
    std::string name;
    std::optional<SheetRef> scope;  ///< 工作表级名称的作用域；文档级为空
    SheetRef target;                ///< 名称指向的工作表
    core::Region region;
};

/**
 * @brief 图形对象的种类
 *
 * 三者只在创建参数上不同，运行时按种类区分即可，不需要继承层次。
 */
enum class ShapeKind {
    Shape,
    Chart,
    Picture
};

const char* toString(ShapeKind kind);

struct ShapeRef {
    ShapeKind kind = ShapeKind::Shape;
    SheetRef sheet;
    std::string name;

    bool operator==(const ShapeRef& other) const {
        return kind == other.kind && sheet == other.sheet && name == other.name;
    }
};

/**
 * @brief 方向（用于“跳到连续区域末端”）
 */
enum class Direction {
    Down,
    Right,
    Up,
    Left
};

/**
 * @brief 新工作表插入位置
 */
struct SheetPlacement {
    std::optional<SheetRef> before;
    std::optional<SheetRef> after;
};

}} // namespace xlbind::host
