#pragma once

#include "xlbind/range/Range.hpp"
#include "xlbind/host/HostTypes.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <cstdint>

namespace xlbind {
namespace core {
class HostSession;
}

namespace range {

/**
 * @brief 1基 (行, 列)
 */
using CellTuple = std::pair<int64_t, int64_t>;

/**
 * @brief 工作表：名字、1基位置或已解析的引用
 */
using SheetSelector = std::variant<std::string, long long, host::SheetRef>;

/**
 * @brief build() 接受的单个参数
 */
using RangeArg = std::variant<std::string, long long, CellTuple, host::SheetRef, Range>;

/**
 * @brief 由各种参数形式构造Range
 *
 * 支持的形式（前面都可以再加一个工作表参数）：
 * - 地址或名称："A1"、"A1:C3"、"Sheet1!A1"、"[Book1]Sheet1!A1"、"MyName"、"Sheet1!MyName"
 * - 一个或两个 (行, 列)，两个时为对角
 * - 同一工作表上的两个Range，结果为覆盖二者的矩形
 *
 * 没有给出工作表时使用活动文档的活动工作表，只在构造时解析一次。
 * 不论哪种形式，描述同一块区域的结果都相等。
 */
class RangeBuilder {
public:
    explicit RangeBuilder(core::HostSession& session);

    Range fromAddress(const std::string& address) const;
    Range fromAddress(const SheetSelector& sheet, const std::string& address) const;

    /**
     * @throws ZeroBasedAccessError 行或列为0
     */
    Range fromCell(const CellTuple& cell) const;
    Range fromCell(const SheetSelector& sheet, const CellTuple& cell) const;

    Range fromCells(const CellTuple& first, const CellTuple& second) const;
    Range fromCells(const SheetSelector& sheet, const CellTuple& first, const CellTuple& second) const;

    /**
     * @brief 覆盖两个Range的最小矩形，保留第一个Range的选项
     * @throws InvalidArgumentsException 不在同一工作表
     */
    Range spanning(const Range& first, const Range& second) const;

    /**
     * @brief 动态参数形式
     *
     * 最后一个参数（或最后两个 (行, 列)）决定区域，剩下的至多一个参数是工作表；
     * 只有一个字符串时按活动工作表上的地址处理；两个Range时取覆盖矩形。
     * @throws InvalidArgumentsException 参数组合不符合以上任何形式
     */
    Range build(const std::vector<RangeArg>& args, const RangeOptions& options = RangeOptions()) const;

    host::SheetRef resolveSheet(const SheetSelector& sheet) const;

private:
    /**
     * @brief 在context所在文档中解析地址或名称；带前缀时可能落在其它工作表甚至其它文档
     */
    Range resolveToken(const host::SheetRef& context, const std::string& token) const;
    Range resolveName(const host::SheetRef& context, const std::string& prefix,
                      const std::string& name) const;
    host::SheetRef resolvePrefix(const host::SheetRef& context, const std::string& book,
                                 const std::string& sheet) const;

    static core::CellCoordinate toCoordinate(const CellTuple& cell);

    core::HostSession& session_;
};

}} // namespace xlbind::range
