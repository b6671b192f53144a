#include "named_pipe_transport.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>
#include <utility>

namespace {

constexpr long IO_TIMEOUT = -1;
constexpr long IO_CLOSED = -2;
constexpr long IO_ERROR = -3;
constexpr DWORD PIPE_BUFFER_BYTES = 64 * 1024;

std::wstring to_wide(const std::string& utf8) {
    if (utf8.empty()) return std::wstring();
    int n = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()),
                                nullptr, 0);
    std::wstring out(static_cast<std::size_t>(n), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()),
                        out.data(), n);
    return out;
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

HANDLE create_instance(const std::wstring& name, bool first) {
    DWORD open_mode = PIPE_ACCESS_INBOUND | FILE_FLAG_OVERLAPPED;
    if (first) open_mode |= FILE_FLAG_FIRST_PIPE_INSTANCE;
    return CreateNamedPipeW(name.c_str(), open_mode,
                            PIPE_TYPE_BYTE | PIPE_READMODE_BYTE | PIPE_WAIT |
                                PIPE_REJECT_REMOTE_CLIENTS,
                            PIPE_UNLIMITED_INSTANCES, 0, PIPE_BUFFER_BYTES, 0, nullptr);
}

} // namespace

// ── NamedPipeStream ──────────────────────────────────────────

NamedPipeStream::NamedPipeStream(HANDLE pipe, bool server_side)
    : pipe_(pipe),
      event_(CreateEventW(nullptr, TRUE, FALSE, nullptr)),
      server_side_(server_side) {}

NamedPipeStream::~NamedPipeStream() {
    if (pipe_ != INVALID_HANDLE_VALUE) {
        if (server_side_) DisconnectNamedPipe(pipe_);
        CloseHandle(pipe_);
    }
    if (event_) CloseHandle(event_);
}

long NamedPipeStream::overlapped_io(bool write, void* buf, DWORD len, int timeout_ms) {
    OVERLAPPED ov = {};
    ov.hEvent = event_;
    ResetEvent(event_);

    BOOL ok = write ? WriteFile(pipe_, buf, len, nullptr, &ov)
                    : ReadFile(pipe_, buf, len, nullptr, &ov);
    if (!ok) {
        DWORD err = GetLastError();
        if (err == ERROR_BROKEN_PIPE || err == ERROR_NO_DATA) return IO_CLOSED;
        if (err != ERROR_IO_PENDING) return IO_ERROR;
        if (WaitForSingleObject(event_, static_cast<DWORD>(timeout_ms)) != WAIT_OBJECT_0) {
            DWORD ignored = 0;
            CancelIoEx(pipe_, &ov);
            GetOverlappedResult(pipe_, &ov, &ignored, TRUE);
            return IO_TIMEOUT;
        }
    }

    DWORD moved = 0;
    if (!GetOverlappedResult(pipe_, &ov, &moved, FALSE)) {
        DWORD err = GetLastError();
        return (err == ERROR_BROKEN_PIPE) ? IO_CLOSED : IO_ERROR;
    }
    return static_cast<long>(moved);
}

Result<void> NamedPipeStream::send_line(const std::string& line, int timeout_ms) {
    std::string data = line + "\n";
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::size_t sent = 0;

    while (sent < data.size()) {
        long n = overlapped_io(true, data.data() + sent,
                               static_cast<DWORD>(data.size() - sent),
                               remaining_ms(deadline));
        if (n == IO_TIMEOUT) {
            return Result<void>::Err(ErrorCode::Timeout,
                fmt::format("write timed out after {}ms", timeout_ms));
        }
        if (n <= 0) {
            return Result<void>::Err(ErrorCode::IoError,
                fmt::format("pipe write failed (error {})", GetLastError()));
        }
        sent += static_cast<std::size_t>(n);
    }
    return Result<void>::Ok();
}

Result<std::string> NamedPipeStream::receive_line(std::size_t max_bytes, int timeout_ms) {
    std::string buffer;
    char chunk[READ_BUF_SIZE];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    for (;;) {
        long n = overlapped_io(false, chunk, sizeof(chunk), remaining_ms(deadline));
        if (n > 0) {
            std::size_t scan_from = buffer.size();
            buffer.append(chunk, static_cast<std::size_t>(n));
            auto nl = buffer.find('\n', scan_from);
            if (nl != std::string::npos && nl <= max_bytes) {
                return Result<std::string>::Ok(buffer.substr(0, nl));
            }
            if (buffer.size() > max_bytes) {
                return Result<std::string>::Err(ErrorCode::MalformedMessage,
                    fmt::format("line exceeds {} bytes", max_bytes));
            }
            continue;
        }
        if (n == IO_TIMEOUT) {
            return Result<std::string>::Err(ErrorCode::Timeout,
                fmt::format("read timed out after {}ms", timeout_ms));
        }
        if (n == IO_CLOSED || n == 0) {
            if (buffer.empty()) {
                return Result<std::string>::Err(ErrorCode::IoError,
                    "connection closed before any data");
            }
            return Result<std::string>::Ok(std::move(buffer));
        }
        return Result<std::string>::Err(ErrorCode::IoError,
            fmt::format("pipe read failed (error {})", GetLastError()));
    }
}

// ── NamedPipeListener ────────────────────────────────────────

NamedPipeListener::NamedPipeListener(std::wstring wide_name, std::string name,
                                     HANDLE first_instance)
    : wide_name_(std::move(wide_name)),
      name_(std::move(name)),
      pipe_(first_instance),
      event_(CreateEventW(nullptr, TRUE, FALSE, nullptr)),
      overlapped_() {}

NamedPipeListener::~NamedPipeListener() {
    if (pipe_ != INVALID_HANDLE_VALUE) {
        if (pending_) {
            DWORD ignored = 0;
            CancelIoEx(pipe_, &overlapped_);
            GetOverlappedResult(pipe_, &overlapped_, &ignored, TRUE);
        }
        CloseHandle(pipe_);
    }
    if (event_) CloseHandle(event_);
}

void NamedPipeListener::rearm() {
    pending_ = false;
    pipe_ = create_instance(wide_name_, false);
    if (pipe_ == INVALID_HANDLE_VALUE) {
        log_error("transport", fmt::format("CreateNamedPipe({}) failed (error {})",
                                           name_, GetLastError()));
    }
}

std::unique_ptr<LocalStream> NamedPipeListener::accept(int timeout_ms) {
    if (pipe_ == INVALID_HANDLE_VALUE) {
        rearm();
        if (pipe_ == INVALID_HANDLE_VALUE) {
            Sleep(static_cast<DWORD>(timeout_ms));
            return nullptr;
        }
    }

    if (!pending_) {
        ZeroMemory(&overlapped_, sizeof(overlapped_));
        overlapped_.hEvent = event_;
        ResetEvent(event_);
        if (!ConnectNamedPipe(pipe_, &overlapped_)) {
            DWORD err = GetLastError();
            if (err == ERROR_IO_PENDING) {
                pending_ = true;
            } else if (err != ERROR_PIPE_CONNECTED) {
                // Client vanished between connect and accept
                DisconnectNamedPipe(pipe_);
                return nullptr;
            }
        }
    }

    if (pending_) {
        if (WaitForSingleObject(event_, static_cast<DWORD>(timeout_ms)) != WAIT_OBJECT_0) {
            return nullptr;
        }
        pending_ = false;
        DWORD ignored = 0;
        if (!GetOverlappedResult(pipe_, &overlapped_, &ignored, FALSE)) {
            DisconnectNamedPipe(pipe_);
            return nullptr;
        }
    }

    HANDLE client = pipe_;
    rearm();
    return std::make_unique<NamedPipeStream>(client, true);
}

// ── NamedPipeTransport ───────────────────────────────────────

NamedPipeTransport::NamedPipeTransport(TransportOptions options)
    : options_(std::move(options)) {}

std::string NamedPipeTransport::endpoint_for(const std::string& app_id) const {
    std::string name = endpoint_base_name(app_id);
    if (name.size() > MAX_PIPE_NAME_LEN) name.resize(MAX_PIPE_NAME_LEN);
    return "\\\\.\\pipe\\" + name;
}

Result<std::unique_ptr<LocalListener>> NamedPipeTransport::listen(const std::string& endpoint) {
    using R = Result<std::unique_ptr<LocalListener>>;

    std::wstring wide = to_wide(endpoint);
    HANDLE first = create_instance(wide, true);
    if (first == INVALID_HANDLE_VALUE) {
        DWORD err = GetLastError();
        if (err == ERROR_ACCESS_DENIED || err == ERROR_PIPE_BUSY) {
            return R::Err(ErrorCode::ClaimFailed,
                          fmt::format("{} is owned by a running instance", endpoint));
        }
        return R::Err(ErrorCode::IoError,
                      fmt::format("CreateNamedPipe({}) failed (error {})", endpoint, err));
    }
    return R::Ok(std::make_unique<NamedPipeListener>(std::move(wide), endpoint, first));
}

Result<std::unique_ptr<LocalStream>> NamedPipeTransport::connect(const std::string& endpoint,
                                                                 int timeout_ms) {
    using R = Result<std::unique_ptr<LocalStream>>;

    std::wstring wide = to_wide(endpoint);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    for (;;) {
        HANDLE h = CreateFileW(wide.c_str(), GENERIC_WRITE, 0, nullptr, OPEN_EXISTING,
                               FILE_FLAG_OVERLAPPED | SECURITY_SQOS_PRESENT |
                                   SECURITY_IDENTIFICATION,
                               nullptr);
        if (h != INVALID_HANDLE_VALUE) {
            return R::Ok(std::make_unique<NamedPipeStream>(h, false));
        }

        DWORD err = GetLastError();
        if (err != ERROR_PIPE_BUSY) {
            return R::Err(ErrorCode::ConnectFailed,
                          fmt::format("connect({}) failed (error {})", endpoint, err));
        }
        int left = remaining_ms(deadline);
        if (left == 0) {
            return R::Err(ErrorCode::Timeout, fmt::format("connect({}) timed out", endpoint));
        }
        WaitNamedPipeW(wide.c_str(), static_cast<DWORD>(left));
    }
}

std::unique_ptr<LocalTransport> make_local_transport(const TransportOptions& options) {
    return std::make_unique<NamedPipeTransport>(options);
}
