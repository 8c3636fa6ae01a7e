#include "xlbind/utils/ModuleLoggers.hpp"
/**
 * @file 01_basic_usage.cpp
 * @brief xlbind 基本用法示例
 *
 * 这个示例展示了xlbind的基本用法，包括：
 * - 解析文档和活动工作表
 * - 用地址、坐标元组构造区域
 * - 读写值
 * - 自动扩展连续区域
 * - 索引和切片
 *
 * 宿主使用进程内的 MemoryAutomation，不需要安装电子表格程序。
 */

#include <iostream>
#include <string>
#include "xlbind/XlBind.hpp"
#include "xlbind/host/MemoryAutomation.hpp"

using namespace xlbind;

namespace {

std::string describe(const convert::ConvertedValue& value) {
    if (const core::CellValue* scalar = std::get_if<core::CellValue>(&value)) {
        return core::describe(*scalar);
    }
    if (const convert::Row* row = std::get_if<convert::Row>(&value)) {
        std::string text = "[";
        for (size_t i = 0; i < row->size(); ++i) {
            text += (i ? ", " : "") + core::describe((*row)[i]);
        }
        return text + "]";
    }
    std::string text = "[";
    const convert::Matrix& matrix = std::get<convert::Matrix>(value);
    for (size_t r = 0; r < matrix.size(); ++r) {
        text += r ? ", " : "";
        text += describe(convert::ConvertedValue{matrix[r]});
    }
    return text + "]";
}

} // namespace

int main() {
    core::BindingOptions options = core::BindingOptions::fromEnvironment();
    if (!xlbind::initialize(options)) {
        std::cerr << "Failed to initialize xlbind" << std::endl;
        return 1;
    }

    DEMO_INFO("xlbind {} 基本用法示例", getVersion());
    DEMO_INFO("===========================");

    try {
        host::MemoryAutomation automation;
        core::HostSession session(automation, options);

        // 1. 新建文档（没有实例时自动启动）
        host::DocumentHandle book = session.document("new");
        DEMO_INFO("1. 新建文档 '{}'，活动工作表 '{}'", book.name, session.activeSheet().name);

        // 2. 写入一个带表头的小表格
        range::RangeBuilder builder(session);
        builder.fromAddress("A1").setValue(convert::Matrix{
            {core::CellValue{std::string("Month")}, core::CellValue{std::string("Sales")}},
            {core::CellValue{std::string("Jan")}, core::CellValue{120.0}},
            {core::CellValue{std::string("Feb")}, core::CellValue{135.5}},
            {core::CellValue{std::string("Mar")}, core::CellValue{98.25}}});
        DEMO_INFO("2. 写入 A1:B4");

        // 3. 不同的构造形式得到同一块区域
        range::Range by_address = builder.fromAddress("A1:B4");
        range::Range by_tuples = builder.fromCells(range::CellTuple{1, 1}, range::CellTuple{4, 2});
        DEMO_INFO("3. {} == {} : {}", by_address.toString(), by_tuples.toString(), by_address == by_tuples);

        // 4. 从左上角扩展
        range::Range table = builder.fromAddress("A1").table();
        DEMO_INFO("4. table() -> {}", table.getAddress());
        DEMO_INFO("   值: {}", describe(table.value()));

        range::Range sales = builder.fromAddress("B2").vertical();
        DEMO_INFO("   vertical() from B2 -> {} = {}", sales.getAddress(false, false), describe(sales.value()));

        // 5. 索引和切片
        DEMO_INFO("5. table[-1] = {}", core::describe(table[-1].rawValue()));
        DEMO_INFO("   table.at(1, 1) = {}", core::describe(table.at(1, 1).rawValue()));
        range::RangeSelection months = table.slice(range::AxisIndex{range::Slice{1, std::nullopt}},
                                                   range::AxisIndex{0LL});
        DEMO_INFO("   rows 1.., column 0 -> {}", months.range().getAddress(false, false));

        // 6. 读取选项
        range::RangeOptions two_d;
        two_d.ndim = 2;
        DEMO_INFO("6. ndim=2 读取 B2 -> {}", describe(builder.fromAddress("B2").withOptions(two_d).value()));

        // 7. 新工作表和定义名称
        host::SheetRef summary = session.addSheet(book, "Summary");
        automation.defineName(book, "SalesData", sales.sheet(), sales.region());
        range::Range named = builder.fromAddress("SalesData");
        DEMO_INFO("7. 新工作表 '{}'，名称 SalesData -> {}", summary.name, named.toString());

        DEMO_INFO("示例完成");
    } catch (const core::XlBindException& e) {
        DEMO_ERROR("示例失败: {}", e.getDetailedMessage());
        xlbind::cleanup();
        return 1;
    }

    xlbind::cleanup();
    return 0;
}
