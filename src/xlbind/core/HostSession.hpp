#pragma once

#include "xlbind/core/BindingOptions.hpp"
#include "xlbind/core/InstanceRegistry.hpp"
#include "xlbind/core/DocumentResolver.hpp"
#include "xlbind/convert/ValueConverter.hpp"
#include "xlbind/host/IAutomation.hpp"
#include <string>
#include <vector>
#include <optional>

namespace xlbind {
namespace core {

/**
 * @brief 一次绑定会话：宿主接口 + 实例注册表 + 文档解析器 + 转换器注册表
 *
 * “活动应用/活动文档/活动工作表”都是显式的函数调用，每次都向宿主重新查询。
 * 会话不拥有宿主接口，调用方保证automation比会话及其创建的Range活得久。
 */
class HostSession {
public:
    explicit HostSession(host::IAutomation& automation,
                         const BindingOptions& options = BindingOptions());

    HostSession(const HostSession&) = delete;
    HostSession& operator=(const HostSession&) = delete;

    host::IAutomation& automation() const { return automation_; }
    InstanceRegistry& registry() { return registry_; }
    DocumentResolver& resolver() { return resolver_; }
    const BindingOptions& options() const { return options_; }
    convert::ConverterRegistry& converters() { return converters_; }
    const convert::ConverterRegistry& converters() const { return converters_; }

    // ========== 活动对象 ==========

    host::ApplicationInstance activeApplication();
    host::DocumentHandle activeDocument();
    host::SheetRef activeSheet();

    /**
     * @brief 按标识符解析文档（见 DocumentResolver）
     */
    host::DocumentHandle document(const std::string& identifier);

    /**
     * @brief 实例中第index个文档，0基，负数从末尾数
     * @throws IndexOutOfRangeException 信息中包含文档数
     */
    host::DocumentHandle documentAt(const host::ApplicationInstance& instance, long long index) const;

    // ========== 工作表 ==========

    std::vector<host::SheetRef> sheets(const host::DocumentHandle& document) const;

    /**
     * @brief 按名字查找，不区分大小写
     */
    host::SheetRef sheet(const host::DocumentHandle& document, const std::string& name) const;

    /**
     * @brief 按1基位置查找
     */
    host::SheetRef sheet(const host::DocumentHandle& document, int32_t index) const;

    /**
     * @brief 第index个工作表，0基，负数从末尾数
     * @throws IndexOutOfRangeException 信息中包含工作表数
     */
    host::SheetRef sheetAt(const host::DocumentHandle& document, long long index) const;

    /**
     * @brief 添加工作表
     * @param name 为空时由宿主命名
     * @throws DuplicateNameException 已有同名工作表（不区分大小写）
     */
    host::SheetRef addSheet(const host::DocumentHandle& document, const std::string& name = "",
                            const host::SheetPlacement& placement = host::SheetPlacement());

    // ========== 图形 ==========

    std::vector<host::ShapeRef> shapes(const host::SheetRef& sheet,
                                       std::optional<host::ShapeKind> kind = std::nullopt) const;

    /**
     * @brief 按名字查找图形（不区分大小写），找不到抛 NotFoundException
     */
    host::ShapeRef shape(const host::SheetRef& sheet, const std::string& name) const;

private:
    host::IAutomation& automation_;
    BindingOptions options_;
    InstanceRegistry registry_;
    DocumentResolver resolver_;
    convert::ConverterRegistry converters_;
};

}} // namespace xlbind::core
