#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace xlbind {
namespace core {

/**
 * @brief 单元格坐标（行、列均为1基）
 *
 * 构造时校验：0抛ZeroBasedAccessError，负数或超过工作表尺寸抛IndexOutOfRangeException。
 */
class CellCoordinate {
public:
    CellCoordinate(int64_t row, int64_t column);

    int32_t row() const { return row_; }
    int32_t column() const { return column_; }

    /**
     * @brief 相对地址，例如 "B3"
     */
    std::string toString() const;

    bool operator==(const CellCoordinate& other) const {
        return row_ == other.row_ && column_ == other.column_;
    }
    bool operator!=(const CellCoordinate& other) const { return !(*this == other); }

private:
    int32_t row_;
    int32_t column_;
};

/**
 * @brief 工作表上的矩形区域
 *
 * 始终是规范化的：topLeft的行列都不大于bottomRight。
 * 单元格的线性顺序按行优先：第0个是左上角，接着同一行向右，然后下一行。
 */
class Region {
public:
    explicit Region(const CellCoordinate& cell);

    /**
     * @brief 由任意两个对角构造，自动规范化
     */
    Region(const CellCoordinate& a, const CellCoordinate& b);

    /**
     * @brief 由局部地址（不带工作表前缀）构造，例如 "A1:C3"
     */
    static Region fromAddress(const std::string& address);

    const CellCoordinate& topLeft() const { return top_left_; }
    const CellCoordinate& bottomRight() const { return bottom_right_; }

    int32_t firstRow() const { return top_left_.row(); }
    int32_t firstColumn() const { return top_left_.column(); }
    int32_t lastRow() const { return bottom_right_.row(); }
    int32_t lastColumn() const { return bottom_right_.column(); }

    int32_t rowCount() const { return lastRow() - firstRow() + 1; }
    int32_t columnCount() const { return lastColumn() - firstColumn() + 1; }
    size_t size() const {
        return static_cast<size_t>(rowCount()) * static_cast<size_t>(columnCount());
    }

    bool isSingleCell() const { return top_left_ == bottom_right_; }
    bool contains(const CellCoordinate& cell) const;

    /**
     * @brief 行优先的第index个单元格（0基）
     */
    CellCoordinate cellAt(size_t index) const;

    /**
     * @brief 相对当前区域偏移；移出工作表时抛IndexOutOfRangeException
     */
    Region offset(int64_t row_offset, int64_t column_offset) const;

    /**
     * @brief 保持左上角不变，改变行数和列数（必须为正）
     */
    Region resized(int64_t rows, int64_t columns) const;

    /**
     * @brief 同时包含两个区域的最小矩形
     */
    Region spanning(const Region& other) const;

    /**
     * @brief 局部地址，单个单元格没有冒号
     */
    std::string toString(bool row_absolute = false, bool column_absolute = false) const;

    bool operator==(const Region& other) const {
        return top_left_ == other.top_left_ && bottom_right_ == other.bottom_right_;
    }
    bool operator!=(const Region& other) const { return !(*this == other); }

private:
    CellCoordinate top_left_;
    CellCoordinate bottom_right_;
};

}} // namespace xlbind::core
