#pragma once

#include <mutex>
#include <vector>
#include <core/types.hpp>

// Bridges OS "open these files" events (delivered by the UI toolkit, not
// argv) into the receipt path.
//
// The OS sends one event per file, so deliver() only collects: everything
// delivered until the toolkit's next flush_pending() becomes one receipt.
// Receipts produced before the receiving surface exists are held and, once
// mark_ready() is called, merged into a single ordered, de-duplicated list.
class PlatformOpenAdapter {
public:
    PlatformOpenAdapter() = default;

    PlatformOpenAdapter(const PlatformOpenAdapter&) = delete;
    PlatformOpenAdapter& operator=(const PlatformOpenAdapter&) = delete;

    // Register the receiver. Emits held receipts if the surface is ready.
    void install(FilesCallback on_files_received);

    // OS-level hook for one event. Safe to call from any thread. Empty lists
    // are ignored.
    void deliver(const FileList& paths);

    // End of the toolkit's event tick: paths delivered since the last call
    // become one receipt, or are held while the surface is not ready.
    void flush_pending();

    // The receiving surface exists: everything held or pending goes out as
    // one merged receipt, then each tick passes straight through.
    void mark_ready();

    bool ready() const;

    // Ticks held until readiness.
    std::size_t buffered_count() const;

    // Paths delivered in the current tick.
    std::size_t pending_count() const;

private:
    // Emit held ticks as one merged receipt. Called with lock held; unlocks
    // around the handler so deliver() never blocks on it.
    void emit_locked(std::unique_lock<std::mutex>& lock);
    void invoke(const FileList& paths);

    mutable std::mutex mutex_;
    FilesCallback handler_;
    std::vector<FileList> buffered_;
    FileList pending_;
    bool ready_ = false;
    bool flushing_ = false;
};
