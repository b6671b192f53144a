#pragma once

#include <string>
#include <deque>
#include <mutex>
#include <optional>
#include <condition_variable>
#include <core/types.hpp>

// The file-listing side of the application: open a directory, wait for its
// listing, multi-select the given paths. Implemented by the host UI.
class FileListingCollaborator {
public:
    virtual ~FileListingCollaborator() = default;
    virtual void open_directory_then_select(const std::string& directory,
                                            const FileList& paths_to_select) = 0;
};

// Single funnel for cold-start, platform-open and socket receipts.
//
// Producers call on_files_received() from any thread; it only enqueues.
// The thread that owns application state calls drain() / wait_and_drain(),
// which delivers each queued ReceiptEvent exactly once, in queue order.
class ReceiptDispatcher {
public:
    explicit ReceiptDispatcher(FileListingCollaborator& listing);

    ReceiptDispatcher(const ReceiptDispatcher&) = delete;
    ReceiptDispatcher& operator=(const ReceiptDispatcher&) = delete;

    void on_files_received(const FileList& paths, ReceiptSource source);

    // Producer-side callback bound to one source.
    FilesCallback callback_for(ReceiptSource source);

    // Deliver everything queued. Returns the number of events delivered.
    std::size_t drain();

    // Block up to timeout_ms for at least one event, then drain.
    std::size_t wait_and_drain(int timeout_ms);

    std::size_t pending() const;

private:
    // Normalize and hand one event to the collaborator. false if dropped.
    bool deliver(ReceiptEvent event);

    FileListingCollaborator& listing_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ReceiptEvent> queue_;

    // Shells that pass files both in argv and as an open event at launch
    // would otherwise produce the same receipt twice. Lives until the next
    // non-cold-start receipt or the end of the drain that delivered it.
    std::optional<FileList> cold_start_list_;
};
