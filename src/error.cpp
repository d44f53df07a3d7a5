#include "jsonrpc/error.hpp"

namespace jsonrpc {

int error_code(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Parse:          return error::ParseError;
        case ErrorKind::InvalidRequest: return error::InvalidRequest;
        case ErrorKind::MethodNotFound: return error::MethodNotFound;
        case ErrorKind::InvalidParams:  return error::InvalidParams;
        case ErrorKind::Internal:       return error::InternalError;
    }
    return error::InternalError;
}

bool carries_data(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Parse:
        case ErrorKind::InvalidRequest:
        case ErrorKind::InvalidParams:
            return true;
        case ErrorKind::MethodNotFound:
        case ErrorKind::Internal:
            return false;
    }
    return false;
}

} // namespace jsonrpc
