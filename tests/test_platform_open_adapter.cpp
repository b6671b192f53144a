#include <gtest/gtest.h>
#include <receive/platform_open_adapter.hpp>
#include <stdexcept>
#include <thread>

class PlatformOpenAdapterTest : public ::testing::Test {
protected:
    PlatformOpenAdapter adapter;
    std::vector<FileList> received;

    FilesCallback recorder() {
        return [this](const FileList& files) { received.push_back(files); };
    }
};

#ifndef _WIN32

TEST_F(PlatformOpenAdapterTest, BuffersUntilReadyThenMerges) {
    adapter.install(recorder());
    adapter.deliver({"/a/1.jpg"});
    adapter.flush_pending();
    adapter.deliver({"/b/2.jpg", "/b/3.jpg"});
    adapter.flush_pending();

    EXPECT_TRUE(received.empty());
    EXPECT_EQ(adapter.buffered_count(), 2u);
    EXPECT_FALSE(adapter.ready());

    adapter.mark_ready();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], (FileList{"/a/1.jpg", "/b/2.jpg", "/b/3.jpg"}));
    EXPECT_EQ(adapter.buffered_count(), 0u);

    adapter.deliver({"/c/4.jpg"});
    EXPECT_EQ(received.size(), 1u);
    adapter.flush_pending();
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[1], FileList{"/c/4.jpg"});
}

// The shell opens N files as N single-file events
TEST_F(PlatformOpenAdapterTest, PerFileEventsInOneTickBecomeOneReceipt) {
    adapter.install(recorder());
    adapter.mark_ready();

    adapter.deliver({"/shoot/1.jpg"});
    adapter.deliver({"/shoot/2.jpg"});
    adapter.deliver({"/shoot/3.jpg"});
    EXPECT_EQ(adapter.pending_count(), 3u);
    EXPECT_TRUE(received.empty());

    adapter.flush_pending();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], (FileList{"/shoot/1.jpg", "/shoot/2.jpg", "/shoot/3.jpg"}));
    EXPECT_EQ(adapter.pending_count(), 0u);
}

TEST_F(PlatformOpenAdapterTest, UnflushedTickIncludedAtReady) {
    adapter.install(recorder());
    adapter.deliver({"/shoot/1.jpg"});
    adapter.deliver({"/shoot/2.jpg"});
    adapter.mark_ready();

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], (FileList{"/shoot/1.jpg", "/shoot/2.jpg"}));
}

TEST_F(PlatformOpenAdapterTest, MergedListDeduplicatedInOrder) {
    adapter.install(recorder());
    adapter.deliver({"/x/b.jpg", "/x/a.jpg"});
    adapter.flush_pending();
    adapter.deliver({"/x/a.jpg", "/x/./b.jpg", "/x/c.jpg"});
    adapter.flush_pending();
    adapter.mark_ready();

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], (FileList{"/x/b.jpg", "/x/a.jpg", "/x/c.jpg"}));
}

TEST_F(PlatformOpenAdapterTest, EventsBeforeInstallAreKept) {
    adapter.deliver({"/early.jpg"});
    adapter.flush_pending();
    adapter.mark_ready();
    EXPECT_TRUE(received.empty());

    adapter.install(recorder());
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], FileList{"/early.jpg"});
}

TEST_F(PlatformOpenAdapterTest, EmptyEventIgnored) {
    adapter.install(recorder());
    adapter.deliver({});
    adapter.flush_pending();
    EXPECT_EQ(adapter.buffered_count(), 0u);
    adapter.mark_ready();
    adapter.deliver({});
    adapter.flush_pending();
    EXPECT_TRUE(received.empty());
}

TEST_F(PlatformOpenAdapterTest, ThrowingHandlerDoesNotBreakAdapter) {
    int calls = 0;
    adapter.install([&](const FileList& files) {
        calls++;
        if (files[0] == "/bad.jpg") throw std::runtime_error("boom");
        received.push_back(files);
    });
    adapter.mark_ready();

    adapter.deliver({"/bad.jpg"});
    adapter.flush_pending();
    adapter.deliver({"/good.jpg"});
    adapter.flush_pending();

    EXPECT_EQ(calls, 2);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], FileList{"/good.jpg"});
}

TEST_F(PlatformOpenAdapterTest, DeliverFromAnotherThread) {
    adapter.install(recorder());
    std::thread os_thread([this] { adapter.deliver({"/from/os.jpg"}); });
    os_thread.join();

    adapter.mark_ready();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], FileList{"/from/os.jpg"});
}

#endif
