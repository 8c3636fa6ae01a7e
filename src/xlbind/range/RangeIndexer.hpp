#pragma once

#include "xlbind/range/Range.hpp"
#include "xlbind/range/Slice.hpp"
#include <optional>
#include <utility>
#include <cstddef>

namespace xlbind {
namespace range {

/**
 * @brief 切片结果，可能为空
 */
class RangeSelection {
public:
    RangeSelection() = default;
    explicit RangeSelection(const Range& range) : range_(range) {}

    bool empty() const { return !range_.has_value(); }
    size_t size() const { return range_ ? range_->size() : 0; }

    /**
     * @throws IndexOutOfRangeException 空选择
     */
    const Range& range() const;

private:
    std::optional<Range> range_;
};

/**
 * @brief 0基元素访问
 *
 * 公开的索引是0基的，负数从末尾数（-1为最后一个）；
 * 内部换算成1基的单元格坐标。结果保留原Range的选项。
 */
class RangeIndexer {
public:
    explicit RangeIndexer(const Range& range);

    size_t count() const { return range_.size(); }

    /**
     * @brief 行优先的第index个单元格
     * @throws IndexOutOfRangeException
     */
    Range at(long long index) const;

    /**
     * @brief 二维访问，每个轴各自支持负数
     */
    Range at(long long row_index, long long column_index) const;

    /**
     * @brief 线性切片：覆盖第start个和第stop-1个元素的矩形
     */
    RangeSelection slice(const Slice& slice) const;

    /**
     * @brief 按轴切片，两个轴都是单个位置时得到单个单元格
     */
    RangeSelection slice(const AxisIndex& rows, const AxisIndex& columns) const;

    /**
     * @brief 负数换算并检查边界
     * @return [0, count) 中的位置
     */
    static size_t normalizeIndex(long long index, size_t count);

    /**
     * @brief 换算切片的起止位置，返回半开区间 [start, stop)；stop <= start 表示空
     * @throws UnsupportedSliceStepException step不为1
     * @throws IndexOutOfRangeException 起点或终点越界
     */
    static std::pair<size_t, size_t> normalizeSlice(const Slice& slice, size_t count);

private:
    std::pair<size_t, size_t> normalizeAxis(const AxisIndex& index, size_t count) const;
    Range fromOffsets(size_t first_row, size_t first_column,
                      size_t last_row, size_t last_column) const;

    Range range_;
};

}} // namespace xlbind::range
