#include "xlbind/core/ErrorCode.hpp"

namespace xlbind {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                   return "Success";
        case ErrorCode::InvalidArguments:     return "Invalid arguments";
        case ErrorCode::InternalError:        return "Internal error";
        case ErrorCode::NotImplemented:       return "Feature not implemented";
        case ErrorCode::NotFound:             return "Object not found";
        case ErrorCode::AmbiguousReference:   return "Ambiguous reference";
        case ErrorCode::StaleHandle:          return "Stale handle";
        case ErrorCode::DuplicateName:        return "Duplicate name";
        case ErrorCode::ZeroBasedAccess:      return "Zero-based access to a 1-based coordinate";
        case ErrorCode::IndexOutOfRange:      return "Index out of range";
        case ErrorCode::UnsupportedSliceStep: return "Unsupported slice step";
        case ErrorCode::InvalidAddress:       return "Invalid address";
        case ErrorCode::HostFailure:          return "Host automation failure";
        default:                              return "Unknown error";
    }
}

const char* codeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                   return "Ok";
        case ErrorCode::InvalidArguments:     return "InvalidArguments";
        case ErrorCode::InternalError:        return "InternalError";
        case ErrorCode::NotImplemented:       return "NotImplemented";
        case ErrorCode::NotFound:             return "NotFound";
        case ErrorCode::AmbiguousReference:   return "AmbiguousReference";
        case ErrorCode::StaleHandle:          return "StaleHandle";
        case ErrorCode::DuplicateName:        return "DuplicateName";
        case ErrorCode::ZeroBasedAccess:      return "ZeroBasedAccessError";
        case ErrorCode::IndexOutOfRange:      return "IndexOutOfRange";
        case ErrorCode::UnsupportedSliceStep: return "UnsupportedSliceStep";
        case ErrorCode::InvalidAddress:       return "InvalidAddress";
        case ErrorCode::HostFailure:          return "HostFailure";
        default:                              return "Unknown";
    }
}

}} // namespace xlbind::core
