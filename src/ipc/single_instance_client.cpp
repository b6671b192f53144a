#include "single_instance_client.hpp"
#include "wire_protocol.hpp"
#include <core/log.hpp>
#include <core/paths.hpp>
#include <fmt/format.h>

SingleInstanceClient::SingleInstanceClient(LocalTransport& transport, ClientOptions options)
    : transport_(transport), options_(options) {}

Result<void> SingleInstanceClient::send(const std::string& app_id, const FileList& files) {
    if (app_id.empty()) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "app_id is empty");
    }
    FileList normalized = normalize_file_paths(files);
    if (normalized.empty()) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "no files to send");
    }

    // Paths the wire cannot carry unchanged go through the cold launch instead
    auto line = encode_file_list(normalized);
    if (line.is_err()) {
        return Result<void>::Err(line.code, line.error);
    }

    std::string endpoint = transport_.endpoint_for(app_id);
    auto conn = transport_.connect(endpoint, options_.connect_timeout_ms);
    if (conn.is_err()) {
        return Result<void>::Err(conn.code, conn.error);
    }
    return conn.value->send_line(line.value, options_.write_timeout_ms);
}

bool SingleInstanceClient::send_file_list_to_running_app(const std::string& app_id,
                                                         const FileList& files) {
    auto r = send(app_id, files);
    if (r.is_err()) {
        log_info("client", fmt::format("hot-send to '{}' failed ({}): {}",
                                       app_id, error_code_name(r.code), r.error));
        return false;
    }
    log_info("client", fmt::format("sent {} file(s) to running '{}'", files.size(), app_id));
    return true;
}
