#include <gtest/gtest.h>
#include "xlbind/XlBind.hpp"
#include "xlbind/host/MemoryAutomation.hpp"

using namespace xlbind;
using convert::ConvertedValue;
using convert::Matrix;
using convert::Row;
using core::CellValue;
using range::CellTuple;
using range::Range;
using range::RangeBuilder;

namespace {
CellValue num(double value) { return CellValue{value}; }
}

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::BindingOptions options;
        options.log_file_path = "logs/xlbind_integration_tests.log";
        options.log_to_console = false;
        xlbind::initialize(options);
    }

    void TearDown() override {
        xlbind::cleanup();
    }

    host::MemoryAutomation automation_;
    core::HostSession session_{automation_};
};

// 从创建文档到读写、扩展、索引的完整流程
TEST_F(IntegrationTest, CompleteWorkflow) {
    host::DocumentHandle book = session_.document("new");
    host::SheetRef sheet = session_.activeSheet();
    RangeBuilder builder(session_);

    // A1:B2 = [[1, 2], [3, 4]]，C1和A3为空
    builder.fromAddress("A1").setValue(Matrix{{num(1), num(2)}, {num(3), num(4)}});
    automation_.setCellValue(sheet, 1, 4, num(99));
    automation_.setCellValue(sheet, 4, 1, num(99));

    Range anchor = builder.fromAddress("A1");
    EXPECT_EQ(anchor.table().getAddress(false, false), "A1:B2");
    EXPECT_EQ(anchor.vertical().getAddress(false, false), "A1:A2");
    EXPECT_EQ(anchor.horizontal().getAddress(false, false), "A1:B1");
    EXPECT_EQ(anchor.table().value(), (ConvertedValue{Matrix{{num(1), num(2)}, {num(3), num(4)}}}));

    Range table = anchor.table();
    EXPECT_EQ(table[-1].rawValue(), num(4));
    EXPECT_EQ(range::RangeIndexer(table).slice(range::Slice{1, 3}).range().getAddress(false, false), "A1:B2");
    EXPECT_EQ(table.toString(), "<Range [" + book.name + "]Sheet1!$A$1:$B$2>");
}

TEST_F(IntegrationTest, TupleCornersMatchAddress) {
    session_.document("new");
    RangeBuilder builder(session_);
    Range by_tuples = builder.build({CellTuple{1, 1}, CellTuple{3, 3}});
    Range by_address = builder.build({std::string("A1:C3")});
    EXPECT_EQ(by_tuples, by_address);
    EXPECT_EQ(by_tuples.region(), core::Region::fromAddress("A1:C3"));
    EXPECT_EQ(by_tuples.size(), 9u);
}

TEST_F(IntegrationTest, AmbiguityAcrossInstances) {
    host::ApplicationInstance first = automation_.startInstance();
    host::DocumentHandle budget = automation_.open(first, "/reports/Budget.xlsx");
    EXPECT_EQ(session_.document("Budget.xlsx"), budget);

    host::ApplicationInstance second = automation_.startInstance();
    automation_.open(second, "/archive/Budget.xlsx");
    EXPECT_THROW(session_.document("Budget.xlsx"), core::AmbiguousReferenceException);

    core::Expected<host::DocumentHandle> attempt = session_.resolver().tryResolve("Budget.xlsx");
    ASSERT_TRUE(attempt.hasError());
    EXPECT_EQ(attempt.error().code, core::ErrorCode::AmbiguousReference);

    // 关闭其中一个之后不再歧义
    automation_.quit(second);
    EXPECT_EQ(session_.document("Budget.xlsx"), budget);
}

// 文档关闭后，已经构造的Range报告失效而不是访问别的文档
TEST_F(IntegrationTest, ClosedDocumentInvalidatesRanges) {
    host::DocumentHandle book = session_.document("new");
    Range range = RangeBuilder(session_).fromAddress("A1:B2");
    automation_.close(book);
    EXPECT_THROW(range.value(), core::StaleHandleException);
    EXPECT_THROW(range.table(), core::StaleHandleException);
    EXPECT_THROW(range.getAddress(), core::StaleHandleException);
    EXPECT_THROW(range.toString(), core::StaleHandleException);
}
