#include <gtest/gtest.h>
#include <limits>
#include "xlbind/core/Region.hpp"
#include "xlbind/core/CellValue.hpp"
#include "xlbind/core/Constants.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/utils/TimeUtils.hpp"

using namespace xlbind::core;
using xlbind::utils::TimeUtils;

// 0 在每个轴上都单独报告
TEST(CellCoordinateTest, ZeroIsRejectedPerAxis) {
    try {
        CellCoordinate(0, 5);
        FAIL() << "expected ZeroBasedAccessError";
    } catch (const ZeroBasedAccessError& e) {
        EXPECT_EQ(e.getAxis(), "row");
        EXPECT_EQ(e.getErrorCode(), xlbind::core::ErrorCode::ZeroBasedAccess);
    }
    try {
        CellCoordinate(5, 0);
        FAIL() << "expected ZeroBasedAccessError";
    } catch (const ZeroBasedAccessError& e) {
        EXPECT_EQ(e.getAxis(), "column");
    }
}

TEST(CellCoordinateTest, OutsideSheet) {
    EXPECT_THROW(CellCoordinate(-1, 1), IndexOutOfRangeException);
    EXPECT_THROW(CellCoordinate(Constants::kMaxRows + 1, 1), IndexOutOfRangeException);
    EXPECT_THROW(CellCoordinate(1, Constants::kMaxColumns + 1), IndexOutOfRangeException);
    EXPECT_NO_THROW(CellCoordinate(Constants::kMaxRows, Constants::kMaxColumns));
    EXPECT_EQ(CellCoordinate(3, 2).toString(), "B3");
}

// 不论先给哪个角，规范化结果相同
TEST(RegionTest, NormalizesCorners) {
    Region a(CellCoordinate(1, 1), CellCoordinate(3, 3));
    Region b(CellCoordinate(3, 3), CellCoordinate(1, 1));
    Region c(CellCoordinate(1, 3), CellCoordinate(3, 1));
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
    EXPECT_EQ(a, Region::fromAddress("A1:C3"));
    EXPECT_EQ(a.topLeft(), CellCoordinate(1, 1));
    EXPECT_EQ(a.bottomRight(), CellCoordinate(3, 3));
}

TEST(RegionTest, Geometry) {
    Region region = Region::fromAddress("B2:D5");
    EXPECT_EQ(region.rowCount(), 4);
    EXPECT_EQ(region.columnCount(), 3);
    EXPECT_EQ(region.size(), 12u);
    EXPECT_FALSE(region.isSingleCell());
    EXPECT_TRUE(region.contains(CellCoordinate(5, 4)));
    EXPECT_FALSE(region.contains(CellCoordinate(1, 2)));
    EXPECT_EQ(region.toString(), "B2:D5");
    EXPECT_EQ(region.toString(true, true), "$B$2:$D$5");
}

// 行优先
TEST(RegionTest, CellAtIsRowMajor) {
    Region region = Region::fromAddress("A1:C2");
    EXPECT_EQ(region.cellAt(0), CellCoordinate(1, 1));
    EXPECT_EQ(region.cellAt(2), CellCoordinate(1, 3));
    EXPECT_EQ(region.cellAt(3), CellCoordinate(2, 1));
    EXPECT_EQ(region.cellAt(5), CellCoordinate(2, 3));
    EXPECT_THROW(region.cellAt(6), IndexOutOfRangeException);
}

TEST(RegionTest, OffsetAndResize) {
    Region region = Region::fromAddress("B2:C3");
    EXPECT_EQ(region.offset(1, 2), Region::fromAddress("D3:E4"));
    EXPECT_EQ(region.offset(-1, -1), Region::fromAddress("A1:B2"));
    EXPECT_THROW(region.offset(-2, 0), IndexOutOfRangeException);
    EXPECT_THROW(region.offset(0, Constants::kMaxColumns), IndexOutOfRangeException);

    EXPECT_EQ(region.resized(1, 1), Region::fromAddress("B2"));
    EXPECT_EQ(region.resized(3, 4), Region::fromAddress("B2:E4"));
    EXPECT_THROW(region.resized(0, 1), InvalidArgumentsException);
    EXPECT_THROW(region.resized(1, -2), InvalidArgumentsException);
}

// 极端的偏移量和尺寸报告越界，不会在计算时溢出
TEST(RegionTest, ExtremeOffsetAndSize) {
    const int64_t huge = std::numeric_limits<int64_t>::max();
    const int64_t tiny = std::numeric_limits<int64_t>::min();
    Region region = Region::fromAddress("B2:C3");

    EXPECT_THROW(region.offset(huge, 0), IndexOutOfRangeException);
    EXPECT_THROW(region.offset(tiny, 0), IndexOutOfRangeException);
    EXPECT_THROW(region.offset(0, huge), IndexOutOfRangeException);
    EXPECT_THROW(region.offset(0, tiny), IndexOutOfRangeException);
    EXPECT_THROW(region.resized(huge, 1), IndexOutOfRangeException);
    EXPECT_THROW(region.resized(1, huge), IndexOutOfRangeException);

    try {
        region.offset(huge, 0);
        FAIL() << "expected IndexOutOfRangeException";
    } catch (const IndexOutOfRangeException& e) {
        EXPECT_EQ(e.getIndex(), huge);
    }

    // 恰好贴边仍然有效
    EXPECT_EQ(region.offset(Constants::kMaxRows - 3, 0).lastRow(), Constants::kMaxRows);
    EXPECT_EQ(region.resized(Constants::kMaxRows - 1, 1).lastRow(), Constants::kMaxRows);
    EXPECT_THROW(region.resized(Constants::kMaxRows, 1), IndexOutOfRangeException);
}

TEST(RegionTest, Spanning) {
    Region a = Region::fromAddress("B5");
    Region b = Region::fromAddress("D2:E3");
    EXPECT_EQ(a.spanning(b), Region::fromAddress("B2:E5"));
    EXPECT_EQ(b.spanning(a), a.spanning(b));
}

TEST(CellValueTest, Blankness) {
    EXPECT_TRUE(isBlank(CellValue{}));
    EXPECT_TRUE(isBlank(CellValue{std::string()}));
    EXPECT_FALSE(isBlank(CellValue{std::string(" ")}));
    EXPECT_FALSE(isBlank(CellValue{0.0}));
    EXPECT_FALSE(isBlank(CellValue{false}));
    EXPECT_EQ(describe(CellValue{true}), "TRUE");
    EXPECT_EQ(describe(CellValue{std::string("x")}), "'x'");
}

// 宿主日期序列号，含1900闰年问题
TEST(TimeUtilsTest, SerialNumbers) {
    EXPECT_DOUBLE_EQ(TimeUtils::toSerialNumber(1900, 1, 1), 1.0);
    EXPECT_DOUBLE_EQ(TimeUtils::toSerialNumber(1900, 3, 1), 61.0);
    EXPECT_DOUBLE_EQ(TimeUtils::toSerialNumber(2023, 3, 15), 45000.0);
    EXPECT_DOUBLE_EQ(TimeUtils::toSerialNumber(2023, 3, 15, 12), 45000.5);

    TimeUtils::DateTime dt = TimeUtils::fromSerialNumber(45000.75);
    EXPECT_EQ(dt.year, 2023);
    EXPECT_EQ(dt.month, 3);
    EXPECT_EQ(dt.day, 15);
    EXPECT_EQ(dt.hour, 18);

    EXPECT_EQ(TimeUtils::formatSerialISO8601(45000), "2023-03-15");
    EXPECT_EQ(TimeUtils::formatSerialISO8601(45000.5), "2023-03-15T12:00:00");
    EXPECT_EQ(TimeUtils::formatSerialISO8601(1), "1900-01-01");
}
