#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Failure categories shared by the hand-off modules.
enum class ErrorCode {
    None,
    ClaimFailed,        // another live instance owns the endpoint
    ConnectFailed,      // no listener reachable
    Timeout,
    MalformedMessage,
    LaunchFailed,
    ConfigLoadFailed,
    InvalidArgument,
    IoError,
};

const char* error_code_name(ErrorCode code);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorCode::IoError};
    }

    static Result<T> Err(ErrorCode code, const std::string& err) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorCode::IoError};
    }

    static Result<void> Err(ErrorCode code, const std::string& err) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Ordered list of absolute paths. The first entry anchors the receipt.
using FileList = std::vector<std::string>;

// One configured external application (extern_app.json entry).
struct AppEntry {
    std::string name;
    std::string path;                        // executable or bundle
    std::optional<std::string> app_id;       // hot-send target; absent = launch only

    bool has_app_id() const { return app_id.has_value() && !app_id->empty(); }
};

enum class ReceiptSource {
    ColdStart,
    PlatformOpen,
    Socket,
};

const char* receipt_source_name(ReceiptSource source);

struct ReceiptEvent {
    FileList file_list;
    ReceiptSource source = ReceiptSource::ColdStart;
};

// Handler invoked with a decoded file list
using FilesCallback = std::function<void(const FileList&)>;
