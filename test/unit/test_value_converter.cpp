#include <gtest/gtest.h>
#include "xlbind/convert/ValueConverter.hpp"
#include "xlbind/range/RangeBuilder.hpp"
#include "xlbind/core/HostSession.hpp"
#include "xlbind/core/Constants.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/host/MemoryAutomation.hpp"

using namespace xlbind;
using convert::ConvertedValue;
using convert::Matrix;
using convert::Row;
using core::CellValue;
using range::Range;
using range::RangeOptions;

namespace {

CellValue num(double value) { return CellValue{value}; }
CellValue text(const std::string& value) { return CellValue{value}; }

// 把每个数字乘以10后写回，用来检查转换器按名字选择
class TimesTenConverter : public convert::IValueConverter {
public:
    ConvertedValue read(const Range& range, const RangeOptions&) const override {
        CellValue raw = range.rawValue();
        if (const double* number = std::get_if<double>(&raw)) {
            return CellValue{*number * 10};
        }
        return raw;
    }

    void write(const ConvertedValue& value, const Range& range, const RangeOptions& options) const override {
        convert::DefaultConverter().write(value, range, options);
    }
};

} // namespace

class ValueConverterTest : public ::testing::Test {
protected:
    void SetUp() override {
        session_.document("new");
        // A1:C2 = [[1, 2, 3], [4, 5, 6]]
        at("A1").setValue(Matrix{{num(1), num(2), num(3)}, {num(4), num(5), num(6)}});
    }

    Range at(const std::string& address, const RangeOptions& options = RangeOptions()) {
        return range::RangeBuilder(session_).fromAddress(address).withOptions(options);
    }

    host::MemoryAutomation automation_;
    core::HostSession session_{automation_};
};

// ndim=0 按形状自动选择标量/行/矩阵
TEST_F(ValueConverterTest, AutomaticShape) {
    EXPECT_EQ(at("B1").value(), ConvertedValue{num(2)});
    EXPECT_EQ(at("A1:C1").value(), (ConvertedValue{Row{num(1), num(2), num(3)}}));
    EXPECT_EQ(at("B1:B2").value(), (ConvertedValue{Row{num(2), num(5)}}));
    EXPECT_EQ(at("A1:B2").value(), (ConvertedValue{Matrix{{num(1), num(2)}, {num(4), num(5)}}}));
}

TEST_F(ValueConverterTest, ForcedDimensions) {
    RangeOptions one;
    one.ndim = 1;
    EXPECT_EQ(at("A1", one).value(), (ConvertedValue{Row{num(1)}}));
    EXPECT_EQ(at("C1:C2", one).value(), (ConvertedValue{Row{num(3), num(6)}}));

    try {
        at("A1:B2", one).value();
        FAIL() << "expected InvalidArgumentsException";
    } catch (const core::InvalidArgumentsException& e) {
        EXPECT_EQ(e.getParameterName(), "ndim");
    }

    RangeOptions two;
    two.ndim = 2;
    EXPECT_EQ(at("A1", two).value(), (ConvertedValue{Matrix{{num(1)}}}));
    EXPECT_EQ(at("A1:C1", two).value(), (ConvertedValue{Matrix{{num(1), num(2), num(3)}}}));
}

TEST_F(ValueConverterTest, TransposeOnRead) {
    RangeOptions options;
    options.transpose = true;
    EXPECT_EQ(at("A1:C2", options).value(),
              (ConvertedValue{Matrix{{num(1), num(4)}, {num(2), num(5)}, {num(3), num(6)}}}));
}

TEST_F(ValueConverterTest, NumberAndEmptyOptions) {
    at("D1").setValue(CellValue{2.75});
    at("E1").setValue(CellValue{-2.75});

    RangeOptions integers;
    integers.number_type = range::NumberType::Integer;
    EXPECT_EQ(at("D1:F1", integers).value(), (ConvertedValue{Row{num(2), num(-2), CellValue{}}}));

    RangeOptions filled;
    filled.empty_value = text("NA");
    EXPECT_EQ(at("F1:G1", filled).value(), (ConvertedValue{Row{text("NA"), text("NA")}}));
    EXPECT_EQ(at("D1", filled).value(), ConvertedValue{num(2.75)});
}

// 45000 = 2023-03-15
TEST_F(ValueConverterTest, DateOptions) {
    at("A5").setValue(CellValue{core::DateValue{45000.5}});

    EXPECT_EQ(at("A5").value(), ConvertedValue{CellValue{core::DateValue{45000.5}}});

    RangeOptions serial;
    serial.date_type = range::DateType::Serial;
    EXPECT_EQ(at("A5", serial).value(), ConvertedValue{num(45000.5)});

    RangeOptions iso;
    iso.date_type = range::DateType::Iso;
    EXPECT_EQ(at("A5", iso).value(), ConvertedValue{text("2023-03-15T12:00:00")});
}

TEST_F(ValueConverterTest, ScalarFillsWholeRange) {
    at("A10:B11").setValue(text("x"));
    EXPECT_EQ(at("A10:B11").value(), (ConvertedValue{Matrix{{text("x"), text("x")}, {text("x"), text("x")}}}));
    EXPECT_EQ(at("C10").rawValue(), CellValue{});
}

// 从左上角开始写，与区域大小无关
TEST_F(ValueConverterTest, RowAndMatrixWrites) {
    at("A10").setValue(Row{num(7), num(8), num(9)});
    EXPECT_EQ(at("A10:C10").value(), (ConvertedValue{Row{num(7), num(8), num(9)}}));

    RangeOptions transposed;
    transposed.transpose = true;
    at("E10", transposed).setValue(Row{num(1), num(2)});
    EXPECT_EQ(at("E10:E11").value(), (ConvertedValue{Row{num(1), num(2)}}));
    EXPECT_EQ(at("F10").rawValue(), CellValue{});

    at("H10", transposed).setValue(Matrix{{num(1), num(2), num(3)}});
    EXPECT_EQ(at("H10:H12").value(), (ConvertedValue{Row{num(1), num(2), num(3)}}));
}

TEST_F(ValueConverterTest, RaggedMatrixIsRejected) {
    try {
        at("A10").setValue(Matrix{{num(1), num(2)}, {num(3)}});
        FAIL() << "expected InvalidArgumentsException";
    } catch (const core::InvalidArgumentsException& e) {
        EXPECT_EQ(e.getParameterName(), "value");
    }
    // 校验在写入前完成
    EXPECT_EQ(at("A10").rawValue(), CellValue{});
}

TEST_F(ValueConverterTest, WriteBeyondSheetEdge) {
    Range corner = at("A1").offset(core::Constants::kMaxRows - 1, 0);
    EXPECT_NO_THROW(corner.setValue(num(1)));
    EXPECT_NO_THROW(corner.setValue(Row{num(1), num(2)}));
    EXPECT_THROW(corner.setValue(Matrix{{num(1)}, {num(2)}}), core::IndexOutOfRangeException);
}

TEST_F(ValueConverterTest, CustomConverterByName) {
    session_.converters().add("times10", std::make_unique<TimesTenConverter>());
    RangeOptions options;
    options.convert = "times10";
    EXPECT_EQ(at("B2", options).value(), ConvertedValue{num(50)});

    options.convert = "missing";
    EXPECT_THROW(at("B2", options).value(), core::NotFoundException);
}

// expand 选项在读取前扩展区域
TEST_F(ValueConverterTest, ExpandOptionAppliedOnRead) {
    RangeOptions options;
    options.expand = range::ExpandMode::Table;
    EXPECT_EQ(at("A1", options).value(),
              (ConvertedValue{Matrix{{num(1), num(2), num(3)}, {num(4), num(5), num(6)}}}));

    options.expand = range::ExpandMode::Vertical;
    EXPECT_EQ(at("B1", options).value(), (ConvertedValue{Row{num(2), num(5)}}));

    options.expand = range::ExpandMode::Horizontal;
    EXPECT_EQ(at("A2", options).value(), (ConvertedValue{Row{num(4), num(5), num(6)}}));
}

TEST_F(ValueConverterTest, RawValueAndFormula) {
    automation_.setCellFormula(session_.activeSheet(), 3, 1, "=SUM(A1:A2)", num(5));
    EXPECT_EQ(at("A3").rawValue(), num(5));
    EXPECT_EQ(at("A3").formula(), "=SUM(A1:A2)");
    EXPECT_EQ(at("A1:A3").formula(), "");
}
