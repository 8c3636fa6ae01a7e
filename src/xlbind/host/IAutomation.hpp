#pragma once

#include "xlbind/host/HostTypes.hpp"
#include "xlbind/core/CellValue.hpp"
#include "xlbind/core/Region.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace xlbind {
namespace host {

/**
 * @brief 宿主自动化接口
 *
 * 核心只通过这个接口访问宿主：枚举实例和文档、读写单个单元格、查询已用区域。
 * 每次调用都直接反映宿主当前状态，实现方不得缓存。
 * 对已关闭文档/工作表的句柄调用任何操作都应抛 core::StaleHandleException。
 */
class IAutomation {
public:
    virtual ~IAutomation() = default;

    // ========== 实例与文档 ==========

    virtual std::vector<ApplicationInstance> listInstances() const = 0;
    virtual std::vector<DocumentHandle> listDocuments(const ApplicationInstance& instance) const = 0;

    /**
     * @brief 最近获得焦点的实例；没有运行中的实例时为空
     */
    virtual std::optional<ApplicationInstance> activeInstance() const = 0;

    /**
     * @brief 该实例中最近获得焦点的文档；实例没有打开的文档时为空
     */
    virtual std::optional<DocumentHandle> activeDocument(const ApplicationInstance& instance) const = 0;

    /**
     * @brief 启动一个新实例，新实例成为活动实例
     */
    virtual ApplicationInstance startInstance() = 0;

    /**
     * @brief 在指定实例中打开磁盘上的文件，新文档成为活动文档
     */
    virtual DocumentHandle open(const ApplicationInstance& instance, const std::string& path) = 0;

    /**
     * @brief 在指定实例中新建空白文档，新文档成为活动文档
     */
    virtual DocumentHandle create(const ApplicationInstance& instance) = 0;

    virtual bool isAlive(const DocumentHandle& document) const = 0;

    // ========== 工作表 ==========

    /**
     * @brief 按位置顺序列出工作表（index从1开始）
     */
    virtual std::vector<SheetRef> listSheets(const DocumentHandle& document) const = 0;
    virtual SheetRef activeSheet(const DocumentHandle& document) const = 0;

    /**
     * @brief 插入新工作表；placement为空时放在活动工作表之前
     */
    virtual SheetRef addSheet(const DocumentHandle& document, const std::string& name,
                              const SheetPlacement& placement) = 0;

    virtual bool isAlive(const SheetRef& sheet) const = 0;

    /**
     * @brief 按名字（不区分大小写）查找工作表，找不到抛 NotFoundException
     */
    virtual SheetRef sheet(const DocumentHandle& document, const std::string& name) const;

    /**
     * @brief 按1基位置查找工作表，越界抛 IndexOutOfRangeException
     */
    virtual SheetRef sheet(const DocumentHandle& document, int32_t index) const;

    // ========== 单元格 ==========

    /**
     * @brief 单元格的值（有公式时为计算结果）
     */
    virtual core::CellValue cellValue(const SheetRef& sheet, int32_t row, int32_t column) const = 0;

    /**
     * @brief 单元格的公式，没有公式时为空串
     */
    virtual std::string cellFormula(const SheetRef& sheet, int32_t row, int32_t column) const = 0;

    virtual void setCellValue(const SheetRef& sheet, int32_t row, int32_t column,
                              const core::CellValue& value) = 0;

    /**
     * @brief 已用区域的最后一行 / 最后一列；空表为0
     */
    virtual int32_t rowCount(const SheetRef& sheet) const = 0;
    virtual int32_t columnCount(const SheetRef& sheet) const = 0;

    // ========== 名称与图形 ==========

    /**
     * @brief 查找定义名称
     * @param scope 为空时只查文档级名称，否则只查该工作表级名称
     */
    virtual std::optional<NamedReference> definedName(const DocumentHandle& document,
                                                      const std::optional<SheetRef>& scope,
                                                      const std::string& name) const = 0;

    virtual std::vector<ShapeRef> listShapes(const SheetRef& sheet) const = 0;

    // ========== 有默认实现的操作 ==========

    void requireAlive(const DocumentHandle& document) const;
    void requireAlive(const SheetRef& sheet) const;

    /**
     * @brief “跳到连续区域末端”
     *
     * 当前格和下一格都非空时，停在这段连续非空区域的最后一格；
     * 否则跳过空格停在下一个非空格，一直没有则停在工作表边界。
     * 空 = 没有公式且值为空白或空串。默认实现逐格探测，探测范围不超过已用区域；
     * 有原生跳转的宿主应当重写。
     */
    virtual core::CellCoordinate endOf(const SheetRef& sheet, const core::CellCoordinate& from,
                                       Direction direction) const;

    /**
     * @brief 区域地址
     * @param external 为true时输出 "[Book]Sheet!A1"，此时忽略include_sheet
     * @throws StaleHandleException 工作表或其文档已关闭
     */
    virtual std::string address(const SheetRef& sheet, const core::Region& region,
                                bool row_absolute, bool column_absolute,
                                bool include_sheet, bool external) const;

protected:
    /**
     * @brief 非严格意义上的空单元格
     */
    bool probeEmpty(const SheetRef& sheet, int32_t row, int32_t column) const;
};

}} // namespace xlbind::host
