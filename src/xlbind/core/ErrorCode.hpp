#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace xlbind {
namespace core {

/**
 * @brief xlbind统一错误码
 *
 * 异常（Exception.hpp）和非抛出接口（Expected）共用同一套错误码。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArguments = 1,
    InternalError = 2,
    NotImplemented = 3,

    // 对象解析错误 (20-39)
    NotFound = 20,
    AmbiguousReference = 21,
    StaleHandle = 22,
    DuplicateName = 23,

    // 地址与索引错误 (40-59)
    ZeroBasedAccess = 40,
    IndexOutOfRange = 41,
    UnsupportedSliceStep = 42,
    InvalidAddress = 43,

    // 宿主错误 (60-79)
    HostFailure = 60
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码的可读描述
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码的枚举名，例如 "AmbiguousReference"
 */
const char* codeName(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

}} // namespace xlbind::core
