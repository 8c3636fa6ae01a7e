#include <gtest/gtest.h>
#include "xlbind/utils/AddressParser.hpp"
#include "xlbind/utils/ColumnReferenceUtils.hpp"
#include "xlbind/core/Constants.hpp"
#include "xlbind/core/Exception.hpp"

using namespace xlbind;
using utils::AddressParser;
using utils::ParsedReference;

// 列字母与列号互转
TEST(ColumnReferenceUtilsTest, LettersRoundTrip) {
    EXPECT_EQ(utils::ColumnReferenceUtils::parseColumnOnly("A"), 1u);
    EXPECT_EQ(utils::ColumnReferenceUtils::parseColumnOnly("z"), 26u);
    EXPECT_EQ(utils::ColumnReferenceUtils::parseColumnOnly("AA"), 27u);
    EXPECT_EQ(utils::ColumnReferenceUtils::parseColumnOnly("XFD"), 16384u);
    EXPECT_EQ(utils::ColumnReferenceUtils::parseColumnOnly("XFE"), 0u);
    EXPECT_EQ(utils::ColumnReferenceUtils::columnToLetters(28), "AB");
    EXPECT_EQ(utils::ColumnReferenceUtils::columnToLetters(16384), "XFD");
}

TEST(AddressParserTest, SingleCell) {
    ParsedReference ref = AddressParser::parse("B3");
    EXPECT_FALSE(ref.hasSheet());
    EXPECT_TRUE(ref.isSingleCell());
    EXPECT_EQ(ref.first_row, 3);
    EXPECT_EQ(ref.first_column, 2);
}

// 绝对标记和小写列字母都接受
TEST(AddressParserTest, AbsoluteAndLowercase) {
    ParsedReference ref = AddressParser::parse("$c$10:a1");
    EXPECT_EQ(ref.first_row, 1);
    EXPECT_EQ(ref.first_column, 1);
    EXPECT_EQ(ref.last_row, 10);
    EXPECT_EQ(ref.last_column, 3);
}

TEST(AddressParserTest, SheetQualified) {
    ParsedReference ref = AddressParser::parse("Sheet1!A1:B2");
    EXPECT_EQ(ref.sheet, "Sheet1");
    EXPECT_TRUE(ref.book.empty());
    EXPECT_EQ(ref.last_row, 2);
    EXPECT_EQ(ref.last_column, 2);
}

TEST(AddressParserTest, QuotedSheetWithEscapedQuote) {
    ParsedReference ref = AddressParser::parse("'Bob''s Data'!C4");
    EXPECT_EQ(ref.sheet, "Bob's Data");
    EXPECT_EQ(ref.first_row, 4);
    EXPECT_EQ(ref.first_column, 3);
}

TEST(AddressParserTest, ExternalReference) {
    ParsedReference ref = AddressParser::parse("[Book1.xlsx]Sheet1!A1");
    EXPECT_EQ(ref.book, "Book1.xlsx");
    EXPECT_EQ(ref.sheet, "Sheet1");

    ParsedReference quoted = AddressParser::parse("'[My Book.xlsx]My Sheet'!B2");
    EXPECT_EQ(quoted.book, "My Book.xlsx");
    EXPECT_EQ(quoted.sheet, "My Sheet");
}

// 整列与整行
TEST(AddressParserTest, WholeColumnsAndRows) {
    ParsedReference columns = AddressParser::parse("A:C");
    EXPECT_EQ(columns.first_row, 1);
    EXPECT_EQ(columns.last_row, core::Constants::kMaxRows);
    EXPECT_EQ(columns.first_column, 1);
    EXPECT_EQ(columns.last_column, 3);

    ParsedReference rows = AddressParser::parse("2:4");
    EXPECT_EQ(rows.first_row, 2);
    EXPECT_EQ(rows.last_row, 4);
    EXPECT_EQ(rows.first_column, 1);
    EXPECT_EQ(rows.last_column, core::Constants::kMaxColumns);
}

TEST(AddressParserTest, RowZeroIsZeroBased) {
    try {
        AddressParser::parse("A0");
        FAIL() << "expected ZeroBasedAccessError";
    } catch (const core::ZeroBasedAccessError& e) {
        EXPECT_EQ(e.getAxis(), "row");
    }
    EXPECT_THROW(AddressParser::parse("A1:B0"), core::ZeroBasedAccessError);
}

TEST(AddressParserTest, OutOfSheet) {
    EXPECT_THROW(AddressParser::parse("XFE1"), core::IndexOutOfRangeException);
    EXPECT_THROW(AddressParser::parse("A1048577"), core::IndexOutOfRangeException);
    EXPECT_THROW(AddressParser::parse("A99999999999"), core::IndexOutOfRangeException);
}

TEST(AddressParserTest, InvalidSyntax) {
    EXPECT_THROW(AddressParser::parse(""), core::AddressSyntaxException);
    EXPECT_THROW(AddressParser::parse("A1:B"), core::AddressSyntaxException);
    EXPECT_THROW(AddressParser::parse("A1:B2:C3"), core::AddressSyntaxException);
    EXPECT_THROW(AddressParser::parse("!A1"), core::AddressSyntaxException);
    EXPECT_THROW(AddressParser::parse("'Open!A1"), core::AddressSyntaxException);
    EXPECT_THROW(AddressParser::parse("A"), core::AddressSyntaxException);
}

TEST(AddressParserTest, LooksLikeAddress) {
    EXPECT_TRUE(AddressParser::looksLikeAddress("A1"));
    EXPECT_TRUE(AddressParser::looksLikeAddress("Sheet1!B2:C3"));
    EXPECT_TRUE(AddressParser::looksLikeAddress("A:A"));
    EXPECT_FALSE(AddressParser::looksLikeAddress("Totals"));
    EXPECT_FALSE(AddressParser::looksLikeAddress("Sheet1!Totals"));
    EXPECT_FALSE(AddressParser::looksLikeAddress("A1:2"));
}

TEST(AddressParserTest, Format) {
    EXPECT_EQ(AddressParser::formatCell(1, 1), "A1");
    EXPECT_EQ(AddressParser::formatCell(1, 1, true, true), "$A$1");
    EXPECT_EQ(AddressParser::formatRegion(1, 1, 3, 3, true, false), "A$1:C$3");
    EXPECT_EQ(AddressParser::formatRegion(2, 2, 2, 2, false, false), "B2");
    EXPECT_EQ(AddressParser::formatRegion(1, 1, core::Constants::kMaxRows, 3, true, true), "$A:$C");
    EXPECT_EQ(AddressParser::formatRegion(1, 1, 3, core::Constants::kMaxColumns, true, true), "$1:$3");
}

// 需要时加引号，内部引号加倍
TEST(AddressParserTest, Qualify) {
    EXPECT_EQ(AddressParser::qualify("A1", "Sheet1"), "Sheet1!A1");
    EXPECT_EQ(AddressParser::qualify("A1", "My Sheet"), "'My Sheet'!A1");
    EXPECT_EQ(AddressParser::qualify("A1", "Bob's"), "'Bob''s'!A1");
    EXPECT_EQ(AddressParser::qualify("A1", "Sheet1", "Book1"), "[Book1]Sheet1!A1");
    EXPECT_EQ(AddressParser::qualify("A1", "Sheet1", "My Book.xlsx"), "'[My Book.xlsx]Sheet1'!A1");
    EXPECT_TRUE(AddressParser::needsQuoting("AB12"));
    EXPECT_TRUE(AddressParser::needsQuoting("2024"));
    EXPECT_FALSE(AddressParser::needsQuoting("Data_2024"));
}
