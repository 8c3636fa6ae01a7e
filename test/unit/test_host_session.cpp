#include <gtest/gtest.h>
#include "xlbind/core/HostSession.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/host/MemoryAutomation.hpp"

using namespace xlbind;

class HostSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        book_ = session_.document("new");
    }

    host::MemoryAutomation automation_;
    core::HostSession session_{automation_};
    host::DocumentHandle book_;
};

TEST_F(HostSessionTest, ActiveObjects) {
    EXPECT_EQ(session_.activeDocument(), book_);
    EXPECT_EQ(session_.activeApplication(), book_.instance);
    EXPECT_EQ(session_.activeSheet().name, "Sheet1");
}

// 0基位置访问，负数从末尾数
TEST_F(HostSessionTest, SheetAtWrapsNegativeIndices) {
    session_.addSheet(book_, "Second", host::SheetPlacement{std::nullopt, session_.sheet(book_, 1)});
    session_.addSheet(book_, "Third", host::SheetPlacement{std::nullopt, session_.sheet(book_, 2)});

    EXPECT_EQ(session_.sheetAt(book_, 0).name, "Sheet1");
    EXPECT_EQ(session_.sheetAt(book_, -1).name, "Third");
    EXPECT_EQ(session_.sheetAt(book_, -3).name, "Sheet1");

    try {
        session_.sheetAt(book_, 3);
        FAIL() << "expected IndexOutOfRangeException";
    } catch (const core::IndexOutOfRangeException& e) {
        EXPECT_EQ(e.getElementCount(), 3u);
        EXPECT_NE(std::string(e.what()).find("3 sheets"), std::string::npos);
    }
    EXPECT_THROW(session_.sheetAt(book_, -4), core::IndexOutOfRangeException);
}

TEST_F(HostSessionTest, DocumentAt) {
    host::DocumentHandle second = session_.document("new");
    EXPECT_EQ(session_.documentAt(book_.instance, 0), book_);
    EXPECT_EQ(session_.documentAt(book_.instance, -1), second);
    EXPECT_THROW(session_.documentAt(book_.instance, 2), core::IndexOutOfRangeException);
}

TEST_F(HostSessionTest, AddSheetRejectsDuplicateName) {
    session_.addSheet(book_, "Data");
    try {
        session_.addSheet(book_, "data");
        FAIL() << "expected DuplicateNameException";
    } catch (const core::DuplicateNameException& e) {
        EXPECT_EQ(e.getName(), "data");
    }
    EXPECT_EQ(session_.sheets(book_).size(), 2u);
}

TEST_F(HostSessionTest, SheetLookupByNameAndIndex) {
    host::SheetRef data = session_.addSheet(book_, "Data");
    EXPECT_EQ(session_.sheet(book_, std::string("DATA")), data);
    EXPECT_EQ(session_.sheet(book_, 1), data);
    EXPECT_THROW(session_.sheet(book_, std::string("Nope")), core::NotFoundException);
}

TEST_F(HostSessionTest, ShapesByKind) {
    host::SheetRef sheet = session_.activeSheet();
    automation_.addShape(sheet, host::ShapeKind::Chart, "Revenue");
    automation_.addShape(sheet, host::ShapeKind::Picture, "Logo");
    automation_.addShape(sheet, host::ShapeKind::Chart, "Costs");

    EXPECT_EQ(session_.shapes(sheet).size(), 3u);
    EXPECT_EQ(session_.shapes(sheet, host::ShapeKind::Chart).size(), 2u);
    EXPECT_EQ(session_.shape(sheet, "logo").kind, host::ShapeKind::Picture);
    EXPECT_THROW(session_.shape(sheet, "Missing"), core::NotFoundException);
}

TEST_F(HostSessionTest, ConvertersRegistry) {
    EXPECT_TRUE(session_.converters().contains("default"));
    EXPECT_THROW(session_.converters().get("numpy"), core::NotFoundException);
    EXPECT_THROW(session_.converters().add("", nullptr), core::InvalidArgumentsException);
    EXPECT_THROW(session_.converters().add("custom", nullptr), core::InvalidArgumentsException);
}

TEST_F(HostSessionTest, StaleDocument) {
    automation_.close(book_);
    EXPECT_THROW(session_.sheets(book_), core::StaleHandleException);
    EXPECT_THROW(session_.activeDocument(), core::NotFoundException);
}
