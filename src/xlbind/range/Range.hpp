#pragma once

#include "xlbind/core/Region.hpp"
#include "xlbind/core/CellValue.hpp"
#include "xlbind/host/HostTypes.hpp"
#include "xlbind/range/RangeOptions.hpp"
#include "xlbind/range/Slice.hpp"
#include "xlbind/convert/ConvertedValue.hpp"
#include <string>
#include <optional>
#include <utility>
#include <cstdint>
#include <cstddef>

namespace xlbind {
namespace core {
class HostSession;
}

namespace range {

class RangeSelection;

/**
 * @brief 绑定到某个工作表的单元格区域
 *
 * 只是视图：只保存工作表引用、区域坐标和读写选项，不缓存任何单元格数据。
 * 每次读写都直接访问宿主，所以指向同一区域的多个Range彼此立即可见。
 * 构造时工作表就已确定，之后活动工作表变化不影响已构造的Range。
 */
class Range {
public:
    Range(core::HostSession& session, const host::SheetRef& sheet, const core::Region& region,
          const RangeOptions& options = RangeOptions());

    core::HostSession& session() const { return *session_; }
    const host::SheetRef& sheet() const { return sheet_; }
    const core::Region& region() const { return region_; }
    const RangeOptions& options() const { return options_; }

    /**
     * @brief 同一区域、换一套选项的新Range
     */
    Range withOptions(const RangeOptions& options) const;

    // ========== 几何信息 ==========

    int32_t row() const { return region_.firstRow(); }
    int32_t column() const { return region_.firstColumn(); }
    int32_t rowCount() const { return region_.rowCount(); }
    int32_t columnCount() const { return region_.columnCount(); }
    std::pair<int32_t, int32_t> shape() const { return {rowCount(), columnCount()}; }
    size_t size() const { return region_.size(); }

    /**
     * @brief 相对于左上角的单元格，1基（cell(1, 1) 即左上角），可以超出当前区域
     * @throws IndexOutOfRangeException 落到工作表之外
     */
    Range cell(int64_t row, int64_t column) const;

    // ========== 值 ==========

    /**
     * @brief 通过选项指定的转换器读取；选项中设置了expand时先扩展再读取
     */
    convert::ConvertedValue value() const;

    /**
     * @brief 通过选项指定的转换器写入，从左上角开始
     */
    void setValue(const convert::ConvertedValue& value) const;

    /**
     * @brief 左上角单元格的原始值
     */
    core::CellValue rawValue() const;

    /**
     * @brief 左上角单元格的公式
     */
    std::string formula() const;

    // ========== 连续区域扩展 ==========
    // strict未指定时使用会话配置中的 strict_expand

    Range table(std::optional<bool> strict = std::nullopt) const;
    Range vertical(std::optional<bool> strict = std::nullopt) const;
    Range horizontal(std::optional<bool> strict = std::nullopt) const;

    // ========== 派生区域（保留选项） ==========

    /**
     * @brief 整体平移
     * @throws IndexOutOfRangeException 移出工作表
     */
    Range offset(int64_t row_offset = 0, int64_t column_offset = 0) const;

    /**
     * @brief 保持左上角，改变尺寸；未指定的维度保持不变
     * @throws InvalidArgumentsException 尺寸不为正
     */
    Range resize(std::optional<int64_t> row_size = std::nullopt,
                 std::optional<int64_t> column_size = std::nullopt) const;

    /**
     * @brief 右下角单元格
     */
    Range lastCell() const;

    // ========== 地址 ==========

    /**
     * @brief 区域地址
     * @param include_sheet 带工作表名；external为true时忽略
     * @param external 外部引用 "[Book]Sheet!A1"
     */
    std::string getAddress(bool row_absolute = true, bool column_absolute = true,
                           bool include_sheet = false, bool external = false) const;

    /**
     * @brief "<Range [Book1]Sheet1!$A$1:$B$2>"
     */
    std::string toString() const;

    // ========== 索引 ==========

    /**
     * @brief 线性索引，0基，负数从末尾数（见 RangeIndexer）
     */
    Range operator[](long long index) const;

    /**
     * @brief 二维访问，0基，每个轴各自支持负数
     */
    Range at(long long row_index, long long column_index) const;

    /**
     * @brief 线性切片和按轴切片，结果类型见 RangeIndexer.hpp
     */
    RangeSelection slice(const Slice& slice) const;
    RangeSelection slice(const AxisIndex& rows, const AxisIndex& columns) const;

    /**
     * @brief 按行优先依次给出单个单元格
     */
    class Iterator {
    private:
        const Range* range_;
        size_t index_;

    public:
        Iterator(const Range* range, size_t index) : range_(range), index_(index) {}

        bool operator!=(const Iterator& other) const { return index_ != other.index_; }
        bool operator==(const Iterator& other) const { return index_ == other.index_; }

        Iterator& operator++() {
            ++index_;
            return *this;
        }

        Range operator*() const;
    };

    Iterator begin() const { return Iterator(this, 0); }
    Iterator end() const { return Iterator(this, size()); }

    /**
     * @brief 同一工作表上的同一区域（不比较选项）
     */
    bool operator==(const Range& other) const {
        return sheet_ == other.sheet_ && region_ == other.region_;
    }
    bool operator!=(const Range& other) const { return !(*this == other); }

private:
    bool resolveStrict(std::optional<bool> strict) const;

    core::HostSession* session_;
    host::SheetRef sheet_;
    core::Region region_;
    RangeOptions options_;
};

}} // namespace xlbind::range
