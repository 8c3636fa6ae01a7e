#pragma once

#include <string>
#include <ostream>

namespace xlbind {
namespace core {

/**
 * @brief UTF-8路径，供文档解析时与宿主报告的完整路径做比较
 *
 * 宿主报告的路径和调用方给的标识符可能分隔符不同（'\\' 与 '/'）、大小写不同，
 * comparisonKey() 给出统一后的比较键。
 */
class Path {
private:
    std::string utf8_path_;

public:
    explicit Path(const std::string& path);
    explicit Path(const char* path);
    Path() = default;

    const std::string& string() const { return utf8_path_; }
    bool empty() const { return utf8_path_.empty(); }

    /**
     * @brief 分隔符统一为 '/'，合并重复分隔符
     */
    std::string normalized() const;

    /**
     * @brief normalized() 再做大小写折叠
     */
    std::string comparisonKey() const;

    /**
     * @brief 最后一个分隔符之后的部分（"C:\\data\\Book1.xlsx" -> "Book1.xlsx"）
     */
    std::string filename() const;

    /**
     * @brief 是否看起来像路径（包含分隔符）
     */
    bool hasSeparator() const;

    // 文件操作
    bool exists() const;
    bool isFile() const;

    /**
     * @brief 两个路径是否指向同一位置（按comparisonKey比较）
     */
    bool equivalentTo(const Path& other) const;

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

}} // namespace xlbind::core
