#include "AddressParser.hpp"
#include "ColumnReferenceUtils.hpp"
#include "xlbind/core/Constants.hpp"
#include "xlbind/core/Exception.hpp"
#include <regex>
#include <algorithm>
#include <utility>
#include <cctype>
#include <fmt/format.h>

namespace xlbind {
namespace utils {

using core::Constants;

namespace {

// 单元格 / 整列 / 整行 三种端点
const std::regex& cellRegex() {
    static const std::regex re(R"(^\$?([A-Za-z]{1,3})\$?(\d+)$)");
    return re;
}

const std::regex& columnRegex() {
    static const std::regex re(R"(^\$?([A-Za-z]{1,3})$)");
    return re;
}

const std::regex& rowRegex() {
    static const std::regex re(R"(^\$?(\d+)$)");
    return re;
}

enum class EndpointKind { Cell, Column, Row };

struct Endpoint {
    EndpointKind kind;
    int32_t row = 0;
    int32_t column = 0;
};

int32_t parseRowNumber(const std::string& original, const std::string& digits) {
    // 超过7位必然越界，先挡住避免stoll溢出
    if (digits.size() > 7) {
        XLBIND_THROW(core::IndexOutOfRangeException,
                     fmt::format("Row out of range in address '{}'", original),
                     -1, static_cast<size_t>(Constants::kMaxRows));
    }
    long long row = std::stoll(digits);
    if (row == 0) {
        XLBIND_THROW(core::ZeroBasedAccessError,
                     fmt::format("Attempted to access 0-based Range in address '{}'. "
                                 "Rows and columns are 1-based.", original),
                     "row");
    }
    if (row > Constants::kMaxRows) {
        XLBIND_THROW(core::IndexOutOfRangeException,
                     fmt::format("Row out of range in address '{}'", original),
                     row, static_cast<size_t>(Constants::kMaxRows));
    }
    return static_cast<int32_t>(row);
}

int32_t parseColumnLetters(const std::string& original, const std::string& letters) {
    uint32_t column = ColumnReferenceUtils::parseColumnOnly(letters);
    if (column == 0) {
        XLBIND_THROW(core::IndexOutOfRangeException,
                     fmt::format("Column '{}' out of range in address '{}'", letters, original),
                     -1, static_cast<size_t>(Constants::kMaxColumns));
    }
    return static_cast<int32_t>(column);
}

Endpoint parseEndpoint(const std::string& original, const std::string& text) {
    std::smatch m;
    Endpoint ep{EndpointKind::Cell};
    if (std::regex_match(text, m, cellRegex())) {
        ep.kind = EndpointKind::Cell;
        ep.column = parseColumnLetters(original, m[1].str());
        ep.row = parseRowNumber(original, m[2].str());
    } else if (std::regex_match(text, m, columnRegex())) {
        ep.kind = EndpointKind::Column;
        ep.column = parseColumnLetters(original, m[1].str());
    } else if (std::regex_match(text, m, rowRegex())) {
        ep.kind = EndpointKind::Row;
        ep.row = parseRowNumber(original, m[1].str());
    } else {
        XLBIND_THROW(core::AddressSyntaxException, "Invalid address", original);
    }
    return ep;
}

bool isNameChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '.';
}

} // namespace

void AddressParser::splitPrefix(const std::string& address, std::string& book,
                                std::string& sheet, std::string& body) {
    std::string prefix;
    if (!address.empty() && address.front() == '\'') {
        // 引号形式：'...'!body，引号内 '' 表示一个 '
        size_t i = 1;
        bool closed = false;
        while (i < address.size()) {
            if (address[i] == '\'') {
                if (i + 1 < address.size() && address[i + 1] == '\'') {
                    prefix.push_back('\'');
                    i += 2;
                    continue;
                }
                closed = true;
                ++i;
                break;
            }
            prefix.push_back(address[i]);
            ++i;
        }
        if (!closed || i >= address.size() || address[i] != '!' || prefix.empty()) {
            XLBIND_THROW(core::AddressSyntaxException, "Invalid sheet qualifier", address);
        }
        body = address.substr(i + 1);
    } else {
        size_t bang = address.find('!');
        if (bang == std::string::npos) {
            body = address;
            return;
        }
        prefix = address.substr(0, bang);
        body = address.substr(bang + 1);
        if (prefix.empty()) {
            XLBIND_THROW(core::AddressSyntaxException, "Invalid sheet qualifier", address);
        }
    }

    if (prefix.front() == '[') {
        size_t close = prefix.find(']');
        if (close == std::string::npos || close == 1 || close + 1 >= prefix.size()) {
            XLBIND_THROW(core::AddressSyntaxException, "Invalid external reference", address);
        }
        book = prefix.substr(1, close - 1);
        sheet = prefix.substr(close + 1);
    } else {
        sheet = prefix;
    }
}

void AddressParser::parseBody(const std::string& original, const std::string& body,
                              ParsedReference& result) {
    if (body.empty()) {
        XLBIND_THROW(core::AddressSyntaxException, "Empty address", original);
    }

    size_t colon = body.find(':');
    if (colon == std::string::npos) {
        Endpoint ep = parseEndpoint(original, body);
        if (ep.kind != EndpointKind::Cell) {
            XLBIND_THROW(core::AddressSyntaxException, "Invalid address", original);
        }
        result.first_row = result.last_row = ep.row;
        result.first_column = result.last_column = ep.column;
        return;
    }

    if (body.find(':', colon + 1) != std::string::npos) {
        XLBIND_THROW(core::AddressSyntaxException, "Invalid address", original);
    }

    Endpoint a = parseEndpoint(original, body.substr(0, colon));
    Endpoint b = parseEndpoint(original, body.substr(colon + 1));
    if (a.kind != b.kind) {
        XLBIND_THROW(core::AddressSyntaxException, "Mixed range endpoints", original);
    }

    switch (a.kind) {
        case EndpointKind::Column:
            a.row = 1;
            b.row = Constants::kMaxRows;
            break;
        case EndpointKind::Row:
            a.column = 1;
            b.column = Constants::kMaxColumns;
            break;
        case EndpointKind::Cell:
            break;
    }

    result.first_row = std::min(a.row, b.row);
    result.last_row = std::max(a.row, b.row);
    result.first_column = std::min(a.column, b.column);
    result.last_column = std::max(a.column, b.column);
}

ParsedReference AddressParser::parse(const std::string& address) {
    ParsedReference result;
    std::string body;
    splitPrefix(address, result.book, result.sheet, body);
    parseBody(address, body, result);
    return result;
}

bool AddressParser::looksLikeAddress(const std::string& token) {
    std::string body = token;
    size_t bang = token.rfind('!');
    if (bang != std::string::npos) {
        body = token.substr(bang + 1);
    }
    if (body.empty()) {
        return false;
    }

    auto endpointLike = [](const std::string& text, EndpointKind& kind) {
        if (std::regex_match(text, cellRegex())) { kind = EndpointKind::Cell; return true; }
        if (std::regex_match(text, columnRegex())) { kind = EndpointKind::Column; return true; }
        if (std::regex_match(text, rowRegex())) { kind = EndpointKind::Row; return true; }
        return false;
    };

    size_t colon = body.find(':');
    EndpointKind first;
    if (colon == std::string::npos) {
        return endpointLike(body, first) && first == EndpointKind::Cell;
    }
    EndpointKind second;
    return endpointLike(body.substr(0, colon), first) &&
           endpointLike(body.substr(colon + 1), second) &&
           first == second;
}

std::string AddressParser::formatCell(int32_t row, int32_t column,
                                      bool row_absolute, bool column_absolute) {
    return fmt::format("{}{}{}{}",
                       column_absolute ? "$" : "",
                       ColumnReferenceUtils::columnToLetters(static_cast<uint32_t>(column)),
                       row_absolute ? "$" : "",
                       row);
}

std::string AddressParser::formatRegion(int32_t first_row, int32_t first_column,
                                        int32_t last_row, int32_t last_column,
                                        bool row_absolute, bool column_absolute) {
    if (first_row == last_row && first_column == last_column) {
        return formatCell(first_row, first_column, row_absolute, column_absolute);
    }

    const char* col_mark = column_absolute ? "$" : "";
    const char* row_mark = row_absolute ? "$" : "";

    if (first_row == 1 && last_row == Constants::kMaxRows) {
        return fmt::format("{}{}:{}{}",
            col_mark, ColumnReferenceUtils::columnToLetters(static_cast<uint32_t>(first_column)),
            col_mark, ColumnReferenceUtils::columnToLetters(static_cast<uint32_t>(last_column)));
    }
    if (first_column == 1 && last_column == Constants::kMaxColumns) {
        return fmt::format("{}{}:{}{}", row_mark, first_row, row_mark, last_row);
    }

    return formatCell(first_row, first_column, row_absolute, column_absolute) + ":" +
           formatCell(last_row, last_column, row_absolute, column_absolute);
}

bool AddressParser::needsQuoting(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    if (std::isdigit(static_cast<unsigned char>(name.front()))) {
        return true;
    }
    for (char c : name) {
        // 非ASCII字节一律加引号
        if (!isNameChar(static_cast<unsigned char>(c))) {
            return true;
        }
    }
    // 形如单元格地址的名字（例如 "AB12"）必须加引号，否则会被当成地址
    return std::regex_match(name, cellRegex());
}

std::string AddressParser::qualify(const std::string& local, const std::string& sheet,
                                   const std::string& book) {
    if (sheet.empty()) {
        return local;
    }

    std::string prefix = book.empty() ? sheet : fmt::format("[{}]{}", book, sheet);
    bool quote = needsQuoting(sheet) || (!book.empty() && needsQuoting(book));
    if (!quote) {
        return fmt::format("{}!{}", prefix, local);
    }

    std::string escaped;
    escaped.reserve(prefix.size() + 2);
    for (char c : prefix) {
        escaped.push_back(c);
        if (c == '\'') {
            escaped.push_back('\'');
        }
    }
    return fmt::format("'{}'!{}", escaped, local);
}

}} // namespace xlbind::utils
