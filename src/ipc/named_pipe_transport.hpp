#pragma once

#include "transport.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#  define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

// Overlapped pipe handle; reads and writes wait on an event with a timeout.
class NamedPipeStream : public LocalStream {
public:
    explicit NamedPipeStream(HANDLE pipe, bool server_side);
    ~NamedPipeStream() override;

    NamedPipeStream(const NamedPipeStream&) = delete;
    NamedPipeStream& operator=(const NamedPipeStream&) = delete;

    Result<void> send_line(const std::string& line, int timeout_ms) override;
    Result<std::string> receive_line(std::size_t max_bytes, int timeout_ms) override;

private:
    HANDLE pipe_;
    HANDLE event_;
    bool server_side_;

    // Run one overlapped ReadFile/WriteFile. Returns bytes moved, -1 on
    // timeout, -2 on error / broken pipe.
    long overlapped_io(bool write, void* buf, DWORD len, int timeout_ms);
};

class NamedPipeListener : public LocalListener {
public:
    NamedPipeListener(std::wstring wide_name, std::string name, HANDLE first_instance);
    ~NamedPipeListener() override;

    NamedPipeListener(const NamedPipeListener&) = delete;
    NamedPipeListener& operator=(const NamedPipeListener&) = delete;

    std::unique_ptr<LocalStream> accept(int timeout_ms) override;
    const std::string& endpoint() const override { return name_; }

private:
    std::wstring wide_name_;
    std::string name_;
    HANDLE pipe_;          // instance waiting for the next client
    HANDLE event_;
    OVERLAPPED overlapped_;
    bool pending_ = false;

    void rearm();
};

class NamedPipeTransport : public LocalTransport {
public:
    explicit NamedPipeTransport(TransportOptions options);

    std::string endpoint_for(const std::string& app_id) const override;
    Result<std::unique_ptr<LocalListener>> listen(const std::string& endpoint) override;
    Result<std::unique_ptr<LocalStream>> connect(const std::string& endpoint,
                                                 int timeout_ms) override;

private:
    TransportOptions options_;
};
