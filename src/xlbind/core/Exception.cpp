/**
 * @file Exception.cpp
 * @brief xlbind异常类实现
 */

#include "Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace xlbind {
namespace core {

XlBindException::XlBindException(const std::string& message,
                                 ErrorCode code,
                                 const char* file,
                                 int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string XlBindException::getErrorCodeString() const {
    return codeName(error_code_);
}

std::string XlBindException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void XlBindException::addContext(const std::string& context) {
    context_.push_back(context);
}

Error XlBindException::toError() const {
    std::string joined;
    for (const auto& ctx : context_) {
        if (!joined.empty()) joined += "; ";
        joined += ctx;
    }
    return Error(error_code_, what(), joined);
}

NotFoundException::NotFoundException(const std::string& message, const std::string& identifier,
                                     const char* file, int line)
    : XlBindException(message, ErrorCode::NotFound, file, line)
    , identifier_(identifier) {
}

AmbiguousReferenceException::AmbiguousReferenceException(const std::string& message,
                                                         const std::string& identifier,
                                                         size_t match_count,
                                                         const char* file, int line)
    : XlBindException(fmt::format("{} ({} matches)", message, match_count),
                      ErrorCode::AmbiguousReference, file, line)
    , identifier_(identifier)
    , match_count_(match_count) {
}

ZeroBasedAccessError::ZeroBasedAccessError(const std::string& message, const std::string& axis,
                                           const char* file, int line)
    : XlBindException(fmt::format("{} (axis: {})", message, axis),
                      ErrorCode::ZeroBasedAccess, file, line)
    , axis_(axis) {
}

InvalidArgumentsException::InvalidArgumentsException(const std::string& message,
                                                     const std::string& parameter_name,
                                                     const char* file, int line)
    : XlBindException(parameter_name.empty() ? message
                                             : fmt::format("{} (parameter: {})", message, parameter_name),
                      ErrorCode::InvalidArguments, file, line)
    , parameter_name_(parameter_name) {
}

IndexOutOfRangeException::IndexOutOfRangeException(const std::string& message, long long index,
                                                   size_t element_count,
                                                   const char* file, int line)
    : XlBindException(message, ErrorCode::IndexOutOfRange, file, line)
    , index_(index)
    , element_count_(element_count) {
}

UnsupportedSliceStepException::UnsupportedSliceStepException(long long step, const char* file, int line)
    : XlBindException(fmt::format("Slice steps not supported (step: {})", step),
                      ErrorCode::UnsupportedSliceStep, file, line)
    , step_(step) {
}

StaleHandleException::StaleHandleException(const std::string& message, const std::string& object_name,
                                           const char* file, int line)
    : XlBindException(fmt::format("{} (object: {})", message, object_name),
                      ErrorCode::StaleHandle, file, line)
    , object_name_(object_name) {
}

AddressSyntaxException::AddressSyntaxException(const std::string& message, const std::string& address,
                                               const char* file, int line)
    : XlBindException(fmt::format("{}: '{}'", message, address), ErrorCode::InvalidAddress, file, line)
    , address_(address) {
}

DuplicateNameException::DuplicateNameException(const std::string& message, const std::string& name,
                                               const char* file, int line)
    : XlBindException(message, ErrorCode::DuplicateName, file, line)
    , name_(name) {
}

HostException::HostException(const std::string& message, const std::string& operation,
                             const char* file, int line)
    : XlBindException(fmt::format("{} (operation: {})", message, operation),
                      ErrorCode::HostFailure, file, line)
    , operation_(operation) {
}

} // namespace core
} // namespace xlbind
