#include <gtest/gtest.h>
#include "xlbind/core/BindingOptions.hpp"
#include "xlbind/core/Exception.hpp"
#include "xlbind/range/RangeOptions.hpp"
#include "xlbind/utils/Logger.hpp"
#include "xlbind/utils/CommonUtils.hpp"
#include <cstdlib>
#include <map>
#include <string>

using namespace xlbind;

namespace {

void setVariable(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void clearVariable(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

} // namespace

class BindingOptionsTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"XLBIND_LOG_LEVEL", "XLBIND_LOG_FILE", "XLBIND_LOG_CONSOLE",
                                 "XLBIND_STRICT_EXPAND", "XLBIND_AUTOSTART"}) {
            clearVariable(name);
        }
    }
};

TEST_F(BindingOptionsTest, Defaults) {
    core::BindingOptions options;
    EXPECT_EQ(options.log_level, Logger::Level::INFO);
    EXPECT_FALSE(options.strict_expand);
    EXPECT_TRUE(options.auto_start_instance);
    EXPECT_TRUE(options.open_missing_from_disk);
}

// 环境变量覆盖默认值
TEST_F(BindingOptionsTest, EnvironmentOverlay) {
    setVariable("XLBIND_LOG_LEVEL", "debug");
    setVariable("XLBIND_LOG_FILE", "custom.log");
    setVariable("XLBIND_STRICT_EXPAND", "yes");
    setVariable("XLBIND_AUTOSTART", "off");

    core::BindingOptions options = core::BindingOptions::fromEnvironment();
    EXPECT_EQ(options.log_level, Logger::Level::DEBUG);
    EXPECT_EQ(options.log_file_path, "custom.log");
    EXPECT_TRUE(options.strict_expand);
    EXPECT_FALSE(options.auto_start_instance);
}

// 给定base时只覆盖设置了的变量，不带参数时以默认值为base
TEST_F(BindingOptionsTest, EnvironmentOverlaysGivenBase) {
    core::BindingOptions base;
    base.log_file_path = "base.log";
    base.strict_expand = true;
    base.open_missing_from_disk = false;

    setVariable("XLBIND_LOG_FILE", "override.log");
    core::BindingOptions options = core::BindingOptions::fromEnvironment(base);
    EXPECT_EQ(options.log_file_path, "override.log");
    EXPECT_TRUE(options.strict_expand);
    EXPECT_FALSE(options.open_missing_from_disk);

    core::BindingOptions defaults = core::BindingOptions::fromEnvironment();
    EXPECT_EQ(defaults.log_file_path, "override.log");
    EXPECT_FALSE(defaults.strict_expand);
    EXPECT_TRUE(defaults.open_missing_from_disk);
}

TEST_F(BindingOptionsTest, InvalidEnvironmentValueNamesVariable) {
    setVariable("XLBIND_STRICT_EXPAND", "maybe");
    try {
        core::BindingOptions::fromEnvironment();
        FAIL() << "expected InvalidArgumentsException";
    } catch (const core::InvalidArgumentsException& e) {
        EXPECT_EQ(e.getParameterName(), "XLBIND_STRICT_EXPAND");
    }

    clearVariable("XLBIND_STRICT_EXPAND");
    setVariable("XLBIND_LOG_LEVEL", "chatty");
    EXPECT_THROW(core::BindingOptions::fromEnvironment(), core::InvalidArgumentsException);
}

TEST(LoggerTest, ParseLevel) {
    Logger::Level level = Logger::Level::INFO;
    EXPECT_TRUE(Logger::parseLevel("WARNING", level));
    EXPECT_EQ(level, Logger::Level::WARN);
    EXPECT_TRUE(Logger::parseLevel("off", level));
    EXPECT_EQ(level, Logger::Level::OFF);
    EXPECT_FALSE(Logger::parseLevel("verbose", level));
    EXPECT_EQ(level, Logger::Level::OFF);
}

TEST(CommonUtilsTest, CaseFolding) {
    EXPECT_TRUE(utils::CommonUtils::equalsIgnoreCase("Book1.XLSX", "book1.xlsx"));
    EXPECT_TRUE(utils::CommonUtils::equalsIgnoreCase("ÄRGER", "ärger"));
    EXPECT_FALSE(utils::CommonUtils::equalsIgnoreCase("Book1", "Book2"));
    EXPECT_EQ(utils::CommonUtils::trim("  x y \t"), "x y");
}

TEST(RangeOptionsTest, Defaults) {
    range::RangeOptions options;
    EXPECT_EQ(options.convert, "default");
    EXPECT_EQ(options.ndim, 0);
    EXPECT_EQ(options.number_type, range::NumberType::Float);
    EXPECT_EQ(options.date_type, range::DateType::Date);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(options.empty_value));
    EXPECT_FALSE(options.transpose);
    EXPECT_EQ(options.expand, range::ExpandMode::None);
}

TEST(RangeOptionsTest, ParseRecognizedKeys) {
    range::RangeOptions options = range::RangeOptions::parse({
        {"ndim", "2"},
        {"numberType", "int"},
        {"dateType", "iso"},
        {"emptyValue", "NA"},
        {"transpose", "true"},
        {"expand", "Table"},
    });
    EXPECT_EQ(options.ndim, 2);
    EXPECT_EQ(options.number_type, range::NumberType::Integer);
    EXPECT_EQ(options.date_type, range::DateType::Iso);
    EXPECT_EQ(options.empty_value, core::CellValue{std::string("NA")});
    EXPECT_TRUE(options.transpose);
    EXPECT_EQ(options.expand, range::ExpandMode::Table);
    EXPECT_STREQ(range::toString(options.expand), "table");
}

// 未知键和非法取值都在构造时拒绝
TEST(RangeOptionsTest, RejectsUnknownKeysAndBadValues) {
    try {
        range::RangeOptions::parse({{"asarray", "true"}});
        FAIL() << "expected InvalidArgumentsException";
    } catch (const core::InvalidArgumentsException& e) {
        EXPECT_EQ(e.getParameterName(), "asarray");
    }
    EXPECT_THROW(range::RangeOptions::parse({{"ndim", "3"}}), core::InvalidArgumentsException);
    EXPECT_THROW(range::RangeOptions::parse({{"expand", "diagonal"}}), core::InvalidArgumentsException);
    EXPECT_THROW(range::RangeOptions::parse({{"transpose", "sometimes"}}), core::InvalidArgumentsException);
    EXPECT_THROW(range::RangeOptions::parse({{"convert", ""}}), core::InvalidArgumentsException);
}
