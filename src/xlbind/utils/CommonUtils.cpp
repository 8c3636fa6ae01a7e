#include "xlbind/utils/CommonUtils.hpp"
#include <utf8.h>
#include <iterator>
#include <cctype>

namespace xlbind {
namespace utils {

char32_t CommonUtils::foldCodePoint(char32_t cp) {
    // ASCII
    if (cp >= U'A' && cp <= U'Z') {
        return cp + 32;
    }
    if (cp < 0x80) {
        return cp;
    }
    // Latin-1补充：À..Þ（跳过乘号×）
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) {
        return cp + 32;
    }
    // Latin扩展A：大小写成对排列（Ā/ā ...），0x0130..0x0131 与 0x0138 除外
    if (cp >= 0x0100 && cp <= 0x017F) {
        if (cp == 0x0130 || cp == 0x0131 || cp == 0x0138 || cp == 0x0149 || cp == 0x017F) {
            return cp;
        }
        if (cp == 0x0178) {
            return 0x00FF; // Ÿ -> ÿ
        }
        bool even_is_upper = (cp < 0x0138) || (cp > 0x0149 && cp < 0x0178);
        if (even_is_upper) {
            return (cp % 2 == 0) ? cp + 1 : cp;
        }
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    // 希腊字母 Α..Ω（跳过0x03A2空位）
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) {
        return cp + 32;
    }
    // 西里尔字母 Ѐ..Џ 与 А..Я
    if (cp >= 0x0400 && cp <= 0x040F) {
        return cp + 80;
    }
    if (cp >= 0x0410 && cp <= 0x042F) {
        return cp + 32;
    }
    return cp;
}

std::string CommonUtils::foldCase(const std::string& text) {
    std::string valid;
    const std::string* source = &text;
    if (!utf8::is_valid(text.begin(), text.end())) {
        utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));
        source = &valid;
    }

    std::u32string code_points;
    code_points.reserve(source->size());
    utf8::utf8to32(source->begin(), source->end(), std::back_inserter(code_points));

    for (auto& cp : code_points) {
        cp = foldCodePoint(cp);
    }

    std::string folded;
    folded.reserve(source->size());
    utf8::utf32to8(code_points.begin(), code_points.end(), std::back_inserter(folded));
    return folded;
}

bool CommonUtils::equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() == b.size() && a == b) {
        return true;
    }
    return foldCase(a) == foldCase(b);
}

std::string CommonUtils::trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

}} // namespace xlbind::utils
