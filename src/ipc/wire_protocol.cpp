#include "wire_protocol.hpp"
#include <nlohmann/json.hpp>
#include <fmt/format.h>

using json = nlohmann::json;

Result<std::string> encode_file_list(const FileList& files) {
    json j;
    j["files"] = files;
    try {
        // Compact dump escapes control characters, so the line stays single
        return Result<std::string>::Ok(j.dump(-1, ' ', false, json::error_handler_t::strict));
    } catch (const json::type_error& e) {
        return Result<std::string>::Err(ErrorCode::MalformedMessage,
                                        fmt::format("file list is not valid UTF-8: {}", e.what()));
    }
}

Result<FileList> decode_file_list(const std::string& line) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        return Result<FileList>::Err(ErrorCode::MalformedMessage, "payload is not valid JSON");
    }
    if (!j.is_object()) {
        return Result<FileList>::Err(ErrorCode::MalformedMessage, "payload is not a JSON object");
    }

    auto it = j.find("files");
    if (it == j.end() || !it->is_array()) {
        return Result<FileList>::Err(ErrorCode::MalformedMessage, "payload has no \"files\" array");
    }

    FileList files;
    files.reserve(it->size());
    for (const auto& entry : *it) {
        if (!entry.is_string()) {
            return Result<FileList>::Err(ErrorCode::MalformedMessage,
                                         "\"files\" holds a non-string entry");
        }
        files.push_back(entry.get<std::string>());
    }
    return Result<FileList>::Ok(std::move(files));
}
