#pragma once

#include "xlbind/host/IAutomation.hpp"
#include <string>
#include <vector>
#include <optional>

namespace xlbind {
namespace core {

/**
 * @brief 一次文档查找命中的 (实例, 文档)
 */
struct DocumentMatch {
    host::ApplicationInstance instance;
    host::DocumentHandle document;
};

/**
 * @brief 运行中宿主实例及其文档的只读视图
 *
 * 不缓存任何状态：每个调用都重新向宿主查询，因此总是反映当前的打开/关闭和焦点情况。
 */
class InstanceRegistry {
public:
    explicit InstanceRegistry(host::IAutomation& automation);

    std::vector<host::ApplicationInstance> listInstances() const;
    std::vector<host::DocumentHandle> documentsOf(const host::ApplicationInstance& instance) const;

    /**
     * @brief 最近获得焦点的实例
     * @param start_if_none 没有实例在运行时启动一个（这是有意的副作用）
     * @throws NotFoundException 没有实例在运行且start_if_none为false
     */
    host::ApplicationInstance activeInstance(bool start_if_none = false);

    /**
     * @brief 活动实例中的活动文档；没有实例或实例中没有文档时为空
     */
    std::optional<host::DocumentHandle> activeDocument() const;

    /**
     * @brief 扫描所有实例，收集显示名或完整路径与identifier相同的文档
     *
     * 比较不区分大小写，路径分隔符统一后比较。
     */
    std::vector<DocumentMatch> findDocuments(const std::string& identifier) const;

    /**
     * @brief 只在一个实例内查找
     */
    std::vector<DocumentMatch> findDocuments(const host::ApplicationInstance& instance,
                                             const std::string& identifier) const;

    host::IAutomation& automation() const { return automation_; }

private:
    bool matches(const host::DocumentHandle& document, const std::string& folded_name,
                 const std::string& path_key) const;

    host::IAutomation& automation_;
};

}} // namespace xlbind::core
