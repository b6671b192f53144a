#include "types.hpp"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:             return "none";
        case ErrorCode::ClaimFailed:      return "claim_failed";
        case ErrorCode::ConnectFailed:    return "connect_failed";
        case ErrorCode::Timeout:          return "timeout";
        case ErrorCode::MalformedMessage: return "malformed_message";
        case ErrorCode::LaunchFailed:     return "launch_failed";
        case ErrorCode::ConfigLoadFailed: return "config_load_failed";
        case ErrorCode::InvalidArgument:  return "invalid_argument";
        case ErrorCode::IoError:          return "io_error";
    }
    return "unknown";
}

const char* receipt_source_name(ReceiptSource source) {
    switch (source) {
        case ReceiptSource::ColdStart:    return "cold_start";
        case ReceiptSource::PlatformOpen: return "platform_open";
        case ReceiptSource::Socket:       return "socket";
    }
    return "unknown";
}
