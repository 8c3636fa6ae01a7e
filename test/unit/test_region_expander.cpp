#include <gtest/gtest.h>
#include "xlbind/range/RegionExpander.hpp"
#include "xlbind/range/RangeBuilder.hpp"
#include "xlbind/core/HostSession.hpp"
#include "xlbind/core/Constants.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/host/MemoryAutomation.hpp"

using namespace xlbind;
using core::Region;
using range::Range;
using range::RegionExpander;

class RegionExpanderTest : public ::testing::Test {
protected:
    void SetUp() override {
        session_.document("new");
        sheet_ = session_.activeSheet();
    }

    void put(const std::string& address, double value) {
        Region region = Region::fromAddress(address);
        automation_.setCellValue(sheet_, region.firstRow(), region.firstColumn(), core::CellValue{value});
    }

    void fill(const std::string& address) {
        Region region = Region::fromAddress(address);
        for (size_t i = 0; i < region.size(); ++i) {
            core::CellCoordinate cell = region.cellAt(i);
            automation_.setCellValue(sheet_, cell.row(), cell.column(),
                                     core::CellValue{static_cast<double>(i + 1)});
        }
    }

    Range at(const std::string& address) { return range::RangeBuilder(session_).fromAddress(address); }

    host::MemoryAutomation automation_;
    core::HostSession session_{automation_};
    host::SheetRef sheet_;
};

// 右侧和下方都为空时只返回锚点
TEST_F(RegionExpanderTest, IsolatedAnchor) {
    put("B2", 1);
    EXPECT_EQ(at("B2").table(), at("B2"));
    EXPECT_EQ(at("B2").vertical(), at("B2"));
    EXPECT_EQ(at("B2").horizontal(), at("B2"));
}

// 全空工作表不抛异常，退化为锚点
TEST_F(RegionExpanderTest, EmptySheetDegeneratesToAnchor) {
    EXPECT_NO_THROW(at("C3").table());
    EXPECT_EQ(at("C3").table(), at("C3"));
    EXPECT_EQ(at("C3").table(true), at("C3"));
}

// 3x3 块被空格包围，外面还有别的数据
TEST_F(RegionExpanderTest, BlockSurroundedByEmptyBorder) {
    fill("B2:D4");
    put("F2", 9);
    put("B6", 9);
    put("F6", 9);
    put("B8", 9);
    EXPECT_EQ(at("B2").table(), at("B2:D4"));
    EXPECT_EQ(at("B2").table(true), at("B2:D4"));
}

TEST_F(RegionExpanderTest, TwoCellNeighborhoodSkipsScan) {
    fill("A1:B2");
    automation_.resetCounters();
    EXPECT_EQ(at("A1").table(), at("A1:B2"));
    EXPECT_EQ(automation_.endOfCallCount(), 0u);
    // 每个方向各探测两格
    EXPECT_EQ(automation_.cellReadCount(), 4u);
}

TEST_F(RegionExpanderTest, LongRunUsesOneJumpPerDirection) {
    fill("A1:A50");
    fill("B1:F1");
    automation_.resetCounters();
    EXPECT_EQ(at("A1").table(), at("A1:F50"));
    EXPECT_EQ(automation_.endOfCallCount(), 2u);
}

// table 不做对角扫描：只看锚点所在的行和列
TEST_F(RegionExpanderTest, TableIsNotDiagonal) {
    fill("A1:A3");
    fill("A1:C1");
    put("C3", 1);
    put("D4", 1);
    EXPECT_EQ(at("A1").table(), at("A1:C3"));

    // 锚点右侧为空时只向下
    put("E1", 1);
    EXPECT_EQ(at("E1").table(), at("E1"));
}

// vertical 保持列宽，horizontal 保持行高
TEST_F(RegionExpanderTest, VerticalAndHorizontalKeepOtherAxis) {
    fill("A1:A4");
    fill("A1:D1");
    EXPECT_EQ(at("A1:C1").vertical(), at("A1:C4"));
    EXPECT_EQ(at("A1:A2").horizontal(), at("A1:D2"));
    EXPECT_EQ(at("A1").vertical(), at("A1:A4"));
    EXPECT_EQ(at("A1").horizontal(), at("A1:D1"));
}

TEST_F(RegionExpanderTest, EmptyStringCountsAsEmpty) {
    put("A1", 1);
    automation_.setCellValue(sheet_, 2, 1, core::CellValue{std::string()});
    put("A3", 1);
    EXPECT_EQ(at("A1").vertical(), at("A1"));
}

// 公式算出空白：默认不算空，严格模式算空
TEST_F(RegionExpanderTest, StrictModeStopsAtBlankFormulas) {
    fill("A1:A5");
    automation_.setCellFormula(sheet_, 3, 1, "=IF(FALSE,1,\"\")", core::CellValue{std::string()});

    EXPECT_EQ(at("A1").vertical(), at("A1:A5"));
    EXPECT_EQ(at("A1").vertical(false), at("A1:A5"));
    EXPECT_EQ(at("A1").vertical(true), at("A1:A2"));

    automation_.setCellFormula(sheet_, 5, 1, "=\"\"", core::CellValue{std::string()});
    EXPECT_EQ(at("A1").vertical(false), at("A1:A5"));
    EXPECT_EQ(at("A4").vertical(true), at("A4"));
}

TEST_F(RegionExpanderTest, StrictDefaultComesFromSessionOptions) {
    core::BindingOptions options;
    options.strict_expand = true;
    core::HostSession strict_session(automation_, options);

    fill("A1:A4");
    automation_.setCellFormula(sheet_, 2, 1, "=\"\"", core::CellValue{std::string()});
    Range anchor = range::RangeBuilder(strict_session).fromAddress("A1");
    EXPECT_EQ(anchor.vertical().region(), Region::fromAddress("A1"));
    EXPECT_EQ(anchor.vertical(false).region(), Region::fromAddress("A1:A4"));
}

TEST_F(RegionExpanderTest, GrowthStopsAtSheetEdge) {
    const int32_t last_row = core::Constants::kMaxRows;
    for (int32_t r = last_row - 3; r <= last_row; ++r) {
        automation_.setCellValue(sheet_, r, 1, core::CellValue{1.0});
    }
    Region expected(core::CellCoordinate(last_row - 3, 1), core::CellCoordinate(last_row, 1));
    Range anchor(session_, sheet_, Region(core::CellCoordinate(last_row - 3, 1)));
    EXPECT_EQ(anchor.vertical().region(), expected);
    EXPECT_EQ(anchor.vertical(true).region(), expected);

    Range bottom(session_, sheet_, Region(core::CellCoordinate(last_row, 1)));
    EXPECT_EQ(bottom.vertical().region(), bottom.region());
}

TEST_F(RegionExpanderTest, ExpanderDirect) {
    fill("C3:E3");
    RegionExpander expander(automation_);
    EXPECT_EQ(expander.horizontal(sheet_, Region::fromAddress("C3"), false), Region::fromAddress("C3:E3"));
    EXPECT_TRUE(expander.isEmpty(sheet_, 3, 6, false));
    EXPECT_FALSE(expander.isEmpty(sheet_, 3, 5, true));
}

TEST_F(RegionExpanderTest, ExpansionKeepsOptions) {
    fill("A1:B3");
    range::RangeOptions options;
    options.ndim = 2;
    Range expanded = at("A1").withOptions(options).table();
    EXPECT_EQ(expanded.options().ndim, 2);
}

TEST_F(RegionExpanderTest, StaleSheet) {
    host::SheetRef other = session_.addSheet(session_.activeDocument(), "Other");
    Range range(session_, other, Region::fromAddress("A1"));
    automation_.deleteSheet(other);
    EXPECT_THROW(range.table(), core::StaleHandleException);
}
