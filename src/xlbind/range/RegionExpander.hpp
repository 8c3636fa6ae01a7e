#pragma once

#include "xlbind/host/IAutomation.hpp"
#include "xlbind/core/Region.hpp"
#include <cstdint>

namespace xlbind {
namespace range {

/**
 * @brief 从锚点出发查找连续非空区域
 *
 * 每个方向先看相邻一格：为空则长度为1；再看隔一格：为空则长度为2；
 * 连续三格非空后才做一次整段跳转（非严格模式用 IAutomation::endOf，严格模式逐格探测）。
 *
 * 非严格模式下空 = 没有公式且值为空白或空串；
 * 严格模式只看计算结果，公式算出空白也算空。
 * 全空的工作表上不会抛异常，结果退化为锚点单元格。
 */
class RegionExpander {
public:
    explicit RegionExpander(const host::IAutomation& automation);

    /**
     * @brief 以左上角为锚点，向下和向右扩展，返回两者张成的矩形（不做对角扫描）
     */
    core::Region table(const host::SheetRef& sheet, const core::Region& region, bool strict) const;

    /**
     * @brief 只向下扩展，保持区域原有的列宽
     */
    core::Region vertical(const host::SheetRef& sheet, const core::Region& region, bool strict) const;

    /**
     * @brief 只向右扩展，保持区域原有的行高
     */
    core::Region horizontal(const host::SheetRef& sheet, const core::Region& region, bool strict) const;

    bool isEmpty(const host::SheetRef& sheet, int32_t row, int32_t column, bool strict) const;

private:
    /**
     * @brief 沿direction（Down或Right）的连续区域末端所在的行号或列号
     */
    int32_t extent(const host::SheetRef& sheet, const core::CellCoordinate& anchor,
                   host::Direction direction, bool strict) const;

    int32_t strictScan(const host::SheetRef& sheet, const core::CellCoordinate& from,
                       host::Direction direction) const;

    const host::IAutomation& automation_;
};

}} // namespace xlbind::range
