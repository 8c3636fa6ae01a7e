#pragma once

#include "xlbind/core/InstanceRegistry.hpp"
#include "xlbind/core/BindingOptions.hpp"
#include "xlbind/core/Expected.hpp"
#include "xlbind/host/HostTypes.hpp"
#include <string>

namespace xlbind {
namespace core {

/**
 * @brief 文档标识符：显示名/完整路径，或“新建”“活动文档”两个特殊值
 */
class DocumentIdentifier {
public:
    enum class Kind {
        Named,
        NewDocument,
        ActiveDocument
    };

    static DocumentIdentifier named(const std::string& name_or_path) {
        return DocumentIdentifier(Kind::Named, name_or_path);
    }
    static DocumentIdentifier newDocument() { return DocumentIdentifier(Kind::NewDocument, ""); }
    static DocumentIdentifier active() { return DocumentIdentifier(Kind::ActiveDocument, ""); }

    /**
     * @brief 识别特殊值："new" 和 "active" 必须完全一致（区分大小写），其余都当作名字/路径
     */
    static DocumentIdentifier parse(const std::string& text);

    Kind kind() const { return kind_; }
    const std::string& text() const { return text_; }

private:
    DocumentIdentifier(Kind kind, const std::string& text) : kind_(kind), text_(text) {}

    Kind kind_;
    std::string text_;
};

/**
 * @brief 把文档标识符解析为唯一的文档句柄
 *
 * 解析规则：
 * 1. 在所有实例的所有文档中，按显示名或完整路径（不区分大小写）查找；
 * 2. 没有命中时，如果标识符是磁盘上的文件，就在活动实例中打开它（必要时先启动实例）；
 *    否则抛 NotFoundException；
 * 3. 恰好一个命中时返回它；
 * 4. 多个实例中都有命中时抛 AmbiguousReferenceException，不做猜测。
 *
 * 每次调用都重新扫描，不缓存结果。
 */
class DocumentResolver {
public:
    explicit DocumentResolver(InstanceRegistry& registry,
                              const BindingOptions& options = BindingOptions());

    host::DocumentHandle resolve(const std::string& identifier);
    host::DocumentHandle resolve(const DocumentIdentifier& identifier);

    /**
     * @brief 不抛异常的版本，失败时返回Error
     */
    Expected<host::DocumentHandle> tryResolve(const std::string& identifier);
    Expected<host::DocumentHandle> tryResolve(const DocumentIdentifier& identifier);

    /**
     * @brief 活动实例的活动文档
     * @throws NotFoundException 没有打开的文档
     */
    host::DocumentHandle resolveActive();

    /**
     * @brief 在活动实例中新建空白文档（必要时先启动实例）
     */
    host::DocumentHandle createNew();

    /**
     * @brief 只在指定实例中查找；identifier为空时在该实例中新建文档
     */
    host::DocumentHandle resolveInInstance(const host::ApplicationInstance& instance,
                                           const std::string& identifier);

    const BindingOptions& options() const { return options_; }

private:
    host::DocumentHandle resolveNamed(const std::string& identifier);
    host::DocumentHandle openFromDisk(const host::ApplicationInstance& instance,
                                      const std::string& identifier);

    InstanceRegistry& registry_;
    BindingOptions options_;
};

}} // namespace xlbind::core
