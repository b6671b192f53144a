#include "platform_open_adapter.hpp"
#include <core/log.hpp>
#include <core/paths.hpp>
#include <fmt/format.h>
#include <exception>
#include <utility>

void PlatformOpenAdapter::install(FilesCallback on_files_received) {
    std::unique_lock<std::mutex> lock(mutex_);
    handler_ = std::move(on_files_received);
    log_debug("open-adapter", "file-open handler installed");
    emit_locked(lock);
}

void PlatformOpenAdapter::deliver(const FileList& paths) {
    if (paths.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    pending_.insert(pending_.end(), paths.begin(), paths.end());
}

void PlatformOpenAdapter::flush_pending() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (pending_.empty()) return;

    buffered_.push_back(std::move(pending_));
    pending_.clear();
    if (!ready_ || !handler_) {
        log_debug("open-adapter", fmt::format("held file-open tick ({} pending)",
                                              buffered_.size()));
    }
    emit_locked(lock);
}

void PlatformOpenAdapter::mark_ready() {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_ = true;
    if (!pending_.empty()) {
        buffered_.push_back(std::move(pending_));
        pending_.clear();
    }
    emit_locked(lock);
}

bool PlatformOpenAdapter::ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_;
}

std::size_t PlatformOpenAdapter::buffered_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffered_.size();
}

std::size_t PlatformOpenAdapter::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void PlatformOpenAdapter::emit_locked(std::unique_lock<std::mutex>& lock) {
    if (!ready_ || !handler_ || flushing_) return;

    flushing_ = true;
    while (!buffered_.empty()) {
        // Ticks held while a receipt was going out are merged into the next one
        FileList merged;
        for (const auto& tick : buffered_) {
            merged.insert(merged.end(), tick.begin(), tick.end());
        }
        std::size_t ticks = buffered_.size();
        buffered_.clear();

        merged = normalize_file_paths(merged);
        lock.unlock();
        if (ticks > 1) {
            log_info("open-adapter", fmt::format("merged {} file-open tick(s) into {} path(s)",
                                                 ticks, merged.size()));
        }
        if (!merged.empty()) invoke(merged);
        lock.lock();
    }
    flushing_ = false;
}

void PlatformOpenAdapter::invoke(const FileList& paths) {
    FilesCallback handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    try {
        handler(paths);
    } catch (const std::exception& e) {
        log_warn("open-adapter", fmt::format("file-open dispatch failed: {}", e.what()));
    }
}
