/**
 * @file Exception.hpp
 * @brief xlbind异常类定义
 */

#ifndef XLBIND_EXCEPTION_HPP
#define XLBIND_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <cstddef>
#include "ErrorCode.hpp"

namespace xlbind {
namespace core {

/**
 * @brief xlbind基础异常类
 */
class XlBindException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    XlBindException(const std::string& message,
                    ErrorCode code = ErrorCode::InternalError,
                    const char* file = nullptr,
                    int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 错误码的枚举名，例如 "NotFound"
     */
    std::string getErrorCodeString() const;

    /**
     * @brief 带错误码、抛出位置和上下文的完整描述
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

    /**
     * @brief 转换为非抛出通道使用的Error
     */
    Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 标识符既不匹配任何已打开文档，也不是磁盘上的文件
 */
class NotFoundException : public XlBindException {
public:
    NotFoundException(const std::string& message, const std::string& identifier,
                      const char* file = nullptr, int line = 0);

    const std::string& getIdentifier() const { return identifier_; }

private:
    std::string identifier_;
};

/**
 * @brief 同一个标识符在多个应用实例中都有匹配
 */
class AmbiguousReferenceException : public XlBindException {
public:
    AmbiguousReferenceException(const std::string& message, const std::string& identifier,
                                size_t match_count,
                                const char* file = nullptr, int line = 0);

    const std::string& getIdentifier() const { return identifier_; }
    size_t getMatchCount() const { return match_count_; }

private:
    std::string identifier_;
    size_t match_count_;
};

/**
 * @brief 在要求1基坐标的地方传入了0
 */
class ZeroBasedAccessError : public XlBindException {
public:
    ZeroBasedAccessError(const std::string& message, const std::string& axis,
                         const char* file = nullptr, int line = 0);

    const std::string& getAxis() const { return axis_; }

private:
    std::string axis_;
};

/**
 * @brief 调用形式不合法（参数个数、类型组合或取值）
 */
class InvalidArgumentsException : public XlBindException {
public:
    InvalidArgumentsException(const std::string& message, const std::string& parameter_name,
                              const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 索引越界（已处理负索引之后）
 */
class IndexOutOfRangeException : public XlBindException {
public:
    IndexOutOfRangeException(const std::string& message, long long index, size_t element_count,
                             const char* file = nullptr, int line = 0);

    long long getIndex() const { return index_; }
    size_t getElementCount() const { return element_count_; }

private:
    long long index_;
    size_t element_count_;
};

/**
 * @brief 切片步长不为1
 */
class UnsupportedSliceStepException : public XlBindException {
public:
    UnsupportedSliceStepException(long long step, const char* file = nullptr, int line = 0);

    long long getStep() const { return step_; }

private:
    long long step_;
};

/**
 * @brief 对已关闭的文档或工作表进行操作
 */
class StaleHandleException : public XlBindException {
public:
    StaleHandleException(const std::string& message, const std::string& object_name,
                         const char* file = nullptr, int line = 0);

    const std::string& getObjectName() const { return object_name_; }

private:
    std::string object_name_;
};

/**
 * @brief 地址字符串无法解析
 */
class AddressSyntaxException : public XlBindException {
public:
    AddressSyntaxException(const std::string& message, const std::string& address,
                           const char* file = nullptr, int line = 0);

    const std::string& getAddress() const { return address_; }

private:
    std::string address_;
};

/**
 * @brief 名称在所属集合中已存在（比较不区分大小写）
 */
class DuplicateNameException : public XlBindException {
public:
    DuplicateNameException(const std::string& message, const std::string& name,
                           const char* file = nullptr, int line = 0);

    const std::string& getName() const { return name_; }

private:
    std::string name_;
};

/**
 * @brief 宿主自动化层报告的失败
 */
class HostException : public XlBindException {
public:
    HostException(const std::string& message, const std::string& operation,
                  const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

} // namespace core
} // namespace xlbind

// 便捷宏定义：自动附带抛出位置
#define XLBIND_THROW(ExceptionType, ...) \
    throw ExceptionType(__VA_ARGS__, __FILE__, __LINE__)

#define XLBIND_THROW_IF(condition, ExceptionType, ...) \
    do { if (condition) { XLBIND_THROW(ExceptionType, __VA_ARGS__); } } while(0)

#endif // XLBIND_EXCEPTION_HPP
