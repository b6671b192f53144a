#include "receipt_dispatcher.hpp"
#include <core/log.hpp>
#include <core/paths.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <utility>

ReceiptDispatcher::ReceiptDispatcher(FileListingCollaborator& listing)
    : listing_(listing) {}

void ReceiptDispatcher::on_files_received(const FileList& paths, ReceiptSource source) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(ReceiptEvent{paths, source});
    }
    cv_.notify_one();
}

FilesCallback ReceiptDispatcher::callback_for(ReceiptSource source) {
    return [this, source](const FileList& paths) { on_files_received(paths, source); };
}

std::size_t ReceiptDispatcher::drain() {
    std::deque<ReceiptEvent> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queue_);
    }

    std::size_t delivered = 0;
    for (auto& event : batch) {
        if (deliver(std::move(event))) delivered++;
    }
    // A launch repeat arrives with the launch itself, never a drain later
    cold_start_list_.reset();
    return delivered;
}

std::size_t ReceiptDispatcher::wait_and_drain(int timeout_ms) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return !queue_.empty(); });
    }
    return drain();
}

std::size_t ReceiptDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool ReceiptDispatcher::deliver(ReceiptEvent event) {
    const char* source = receipt_source_name(event.source);

    bool has_relative = std::any_of(event.file_list.begin(), event.file_list.end(),
        [](const std::string& p) { return !p.empty() && !std::filesystem::path(p).is_absolute(); });
    if (has_relative) {
        log_warn("dispatch", fmt::format("{} receipt carried relative paths; resolving against cwd",
                                         source));
    }

    FileList files = normalize_file_paths(event.file_list);
    if (files.empty()) {
        log_debug("dispatch", fmt::format("{} receipt had no usable paths", source));
        return false;
    }

    if (event.source == ReceiptSource::ColdStart) {
        cold_start_list_ = files;
    } else if (cold_start_list_) {
        bool duplicate = event.source == ReceiptSource::PlatformOpen &&
                         *cold_start_list_ == files;
        cold_start_list_.reset();
        if (duplicate) {
            log_info("dispatch", "platform_open receipt repeats the launch arguments; skipped");
            return false;
        }
    }

    std::string anchor = anchor_directory(files);
    log_info("dispatch", fmt::format("{} receipt: {} file(s) in {}", source, files.size(), anchor));
    try {
        listing_.open_directory_then_select(anchor, files);
    } catch (const std::exception& e) {
        log_error("dispatch", fmt::format("file listing rejected {} receipt: {}", source, e.what()));
    }
    return true;
}
