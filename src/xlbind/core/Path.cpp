#include "xlbind/core/Path.hpp"
#include "xlbind/utils/CommonUtils.hpp"
#include "xlbind/utils/Logger.hpp"
#include <filesystem>
#include <system_error>

namespace xlbind {
namespace core {

Path::Path(const std::string& path) : utf8_path_(path) {}

Path::Path(const char* path) : Path(std::string(path ? path : "")) {}

std::string Path::normalized() const {
    std::string result;
    result.reserve(utf8_path_.size());
    bool last_was_separator = false;
    for (size_t i = 0; i < utf8_path_.size(); ++i) {
        char c = utf8_path_[i];
        bool separator = (c == '/' || c == '\\');
        if (separator) {
            // UNC前缀 "\\server" 保留两个分隔符
            if (last_was_separator && i != 1) {
                continue;
            }
            result.push_back('/');
        } else {
            result.push_back(c);
        }
        last_was_separator = separator;
    }
    return result;
}

std::string Path::comparisonKey() const {
    return utils::CommonUtils::foldCase(normalized());
}

std::string Path::filename() const {
    size_t pos = utf8_path_.find_last_of("/\\");
    if (pos == std::string::npos) {
        return utf8_path_;
    }
    return utf8_path_.substr(pos + 1);
}

bool Path::hasSeparator() const {
    return utf8_path_.find_first_of("/\\") != std::string::npos;
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;

    std::error_code ec;
    bool result = std::filesystem::exists(std::filesystem::u8path(utf8_path_), ec);
    if (ec) {
        XLBIND_LOG_DEBUG("Filesystem error checking '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return result;
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;

    std::error_code ec;
    bool result = std::filesystem::is_regular_file(std::filesystem::u8path(utf8_path_), ec);
    if (ec) {
        XLBIND_LOG_DEBUG("Filesystem error checking '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return result;
}

bool Path::equivalentTo(const Path& other) const {
    return comparisonKey() == other.comparisonKey();
}

}} // namespace xlbind::core
