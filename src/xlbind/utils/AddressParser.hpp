#pragma once

#include <string>
#include <cstdint>

namespace xlbind {
namespace utils {

/**
 * @brief 地址解析结果（坐标1基，已规范化为左上/右下）
 */
struct ParsedReference {
    std::string book;         ///< 外部引用中的工作簿名（"[Book1.xlsx]Sheet1!A1"），否则为空
    std::string sheet;        ///< 工作表名，未指定时为空
    int32_t first_row = 1;
    int32_t first_column = 1;
    int32_t last_row = 1;
    int32_t last_column = 1;

    bool hasSheet() const { return !sheet.empty(); }
    bool isSingleCell() const { return first_row == last_row && first_column == last_column; }
};

/**
 * @brief 宿主地址语法的解析与格式化
 *
 * 支持的写法：
 * - 单个单元格：A1, $B$2, xfd1048576（列字母不区分大小写）
 * - 矩形区域：A1:C3, $A$1:C$3（两个角可以任意顺序）
 * - 整列 / 整行：A:C, 1:3
 * - 带工作表：Sheet1!A1, 'My Sheet'!A1:B2（引号内的 '' 表示一个单引号）
 * - 外部引用：[Book1.xlsx]Sheet1!A1, '[My Book.xlsx]My Sheet'!A1
 *
 * 行号为0时抛 ZeroBasedAccessError（地址是1基的），其它语法错误抛 AddressSyntaxException。
 */
class AddressParser {
public:
    /**
     * @brief 解析完整地址（可带工作表/工作簿前缀）
     */
    static ParsedReference parse(const std::string& address);

    /**
     * @brief 判断一个记号是否“长得像”地址（而不是定义名称）
     *
     * 只做语法判断：A0 这类写法也返回true，以便后续解析报出ZeroBasedAccessError。
     */
    static bool looksLikeAddress(const std::string& token);

    /**
     * @brief 单元格地址，例如 (1, 1, true, true) -> "$A$1"
     */
    static std::string formatCell(int32_t row, int32_t column,
                                  bool row_absolute = false, bool column_absolute = false);

    /**
     * @brief 区域地址；单个单元格不带冒号，整列写作 "$A:$C"，整行写作 "$1:$3"
     */
    static std::string formatRegion(int32_t first_row, int32_t first_column,
                                    int32_t last_row, int32_t last_column,
                                    bool row_absolute = false, bool column_absolute = false);

    /**
     * @brief 为局部地址加上工作表（及工作簿）前缀，必要时加引号
     * @param local 不带前缀的地址，例如 "$A$1:$B$2"
     * @param sheet 工作表名；为空时直接返回local
     * @param book 工作簿名；非空时生成外部引用 "[book]sheet!local"
     */
    static std::string qualify(const std::string& local, const std::string& sheet,
                               const std::string& book = "");

    /**
     * @brief 判断工作表/工作簿名在地址中是否需要单引号
     */
    static bool needsQuoting(const std::string& name);

private:
    static void splitPrefix(const std::string& address, std::string& book,
                            std::string& sheet, std::string& body);
    static void parseBody(const std::string& original, const std::string& body,
                          ParsedReference& result);
};

}} // namespace xlbind::utils
