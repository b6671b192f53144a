#include <gtest/gtest.h>
#include <ipc/single_instance_client.hpp>
#include <ipc/single_instance_server.hpp>
#include <ipc/transport.hpp>
#include <ipc/wire_protocol.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <condition_variable>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <stdexcept>

#ifdef _WIN32
#include <process.h>
#define getpid _getpid
#else
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>
#endif

namespace fs = std::filesystem;

// Collects file lists delivered on the server thread.
class Inbox {
public:
    FilesCallback callback() {
        return [this](const FileList& files) {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(files);
            cv_.notify_all();
        };
    }

    bool wait_for(std::size_t count, int timeout_ms = 3000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [&] { return received_.size() >= count; });
    }

    std::vector<FileList> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<FileList> received_;
};

class SingleInstanceTest : public ::testing::Test {
protected:
    fs::path runtime_dir;
    std::unique_ptr<LocalTransport> transport;

    void SetUp() override {
        static int counter = 0;
        runtime_dir = fs::temp_directory_path() /
                      ("hoff_" + std::to_string(getpid()) +
                       "_" + std::to_string(counter++));
        fs::create_directories(runtime_dir);
        set_log_file((runtime_dir / "test.log").string());

        TransportOptions opts;
        opts.runtime_dir = runtime_dir;
        opts.probe_timeout_ms = 200;
        transport = make_local_transport(opts);
    }

    void TearDown() override {
        transport.reset();
        std::error_code ec;
        fs::remove_all(runtime_dir, ec);
    }

    ServerOptions fast_server() {
        ServerOptions o;
        o.read_timeout_ms = 300;
        o.accept_poll_ms = 50;
        return o;
    }

    ClientOptions fast_client() {
        ClientOptions o;
        o.connect_timeout_ms = 500;
        o.write_timeout_ms = 500;
        return o;
    }

    // Connect and write raw text, bypassing the client's encoder.
    bool send_raw(const std::string& app_id, const std::string& text) {
        auto conn = transport->connect(transport->endpoint_for(app_id), 500);
        if (conn.is_err()) return false;
        return conn.value->send_line(text, 500).is_ok();
    }
};

TEST_F(SingleInstanceTest, EndpointNameIsSanitized) {
    std::string base = endpoint_base_name("bird stamp/1.0");
    EXPECT_EQ(base, "handoff_sendto_bird_stamp_1_0_" +
                        sanitize_identifier(platform::user_token()));

    std::string endpoint = transport->endpoint_for("birdstamp");
    EXPECT_NE(endpoint.find(endpoint_base_name("birdstamp")), std::string::npos);
}

TEST_F(SingleInstanceTest, FirstInstanceClaims) {
    Inbox inbox;
    auto server = SingleInstanceServer::create(*transport, "claim_a", inbox.callback(),
                                               fast_server());
    ASSERT_TRUE(server.is_ok()) << server.error;
    EXPECT_EQ(server.value->app_id(), "claim_a");
    EXPECT_FALSE(server.value->endpoint_name().empty());
}

TEST_F(SingleInstanceTest, SecondClaimFails) {
    Inbox inbox;
    auto first = SingleInstanceServer::create(*transport, "claim_b", inbox.callback(),
                                              fast_server());
    ASSERT_TRUE(first.is_ok()) << first.error;

    auto second = SingleInstanceServer::create(*transport, "claim_b", inbox.callback(),
                                               fast_server());
    EXPECT_TRUE(second.is_err());
    EXPECT_EQ(second.code, ErrorCode::ClaimFailed);
}

TEST_F(SingleInstanceTest, DifferentAppIdsCoexist) {
    Inbox inbox;
    auto a = SingleInstanceServer::create(*transport, "app_one", inbox.callback(), fast_server());
    auto b = SingleInstanceServer::create(*transport, "app_two", inbox.callback(), fast_server());
    EXPECT_TRUE(a.is_ok());
    EXPECT_TRUE(b.is_ok());
}

TEST_F(SingleInstanceTest, ClaimReleasedOnStop) {
    Inbox inbox;
    auto first = SingleInstanceServer::create(*transport, "claim_c", inbox.callback(),
                                              fast_server());
    ASSERT_TRUE(first.is_ok());
    first.value->stop();
    first.value->stop();  // idempotent

    auto again = SingleInstanceServer::create(*transport, "claim_c", inbox.callback(),
                                              fast_server());
    EXPECT_TRUE(again.is_ok()) << again.error;
}

TEST_F(SingleInstanceTest, DeliversOrderedList) {
    Inbox inbox;
    auto server = SingleInstanceServer::create(*transport, "deliver", inbox.callback(),
                                               fast_server());
    ASSERT_TRUE(server.is_ok());

    SingleInstanceClient client(*transport, fast_client());
    FileList files = {"/photos/c.jpg", "/photos/a b.jpg", "/other/\xc3\xa9.tif"};
    EXPECT_TRUE(client.send_file_list_to_running_app("deliver", files));

    ASSERT_TRUE(inbox.wait_for(1));
    EXPECT_EQ(inbox.received()[0], files);
    EXPECT_EQ(server.value->delivered_count(), 1u);
}

TEST_F(SingleInstanceTest, EachConnectionDeliversOnce) {
    Inbox inbox;
    auto server = SingleInstanceServer::create(*transport, "multi", inbox.callback(),
                                               fast_server());
    ASSERT_TRUE(server.is_ok());

    SingleInstanceClient client(*transport, fast_client());
    EXPECT_TRUE(client.send_file_list_to_running_app("multi", {"/a/1.jpg"}));
    EXPECT_TRUE(client.send_file_list_to_running_app("multi", {"/a/2.jpg", "/a/3.jpg"}));

    ASSERT_TRUE(inbox.wait_for(2));
    EXPECT_EQ(inbox.received().size(), 2u);
}

TEST_F(SingleInstanceTest, MalformedMessageDoesNotStopServer) {
    Inbox inbox;
    auto server = SingleInstanceServer::create(*transport, "survive", inbox.callback(),
                                               fast_server());
    ASSERT_TRUE(server.is_ok());

    EXPECT_TRUE(send_raw("survive", "this is not json"));
    EXPECT_TRUE(send_raw("survive", "{\"files\": [1, 2]}"));

    SingleInstanceClient client(*transport, fast_client());
    EXPECT_TRUE(client.send_file_list_to_running_app("survive", {"/ok/after.jpg"}));

    ASSERT_TRUE(inbox.wait_for(1));
    auto received = inbox.received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], FileList{"/ok/after.jpg"});
    EXPECT_EQ(server.value->dropped_count(), 2u);
}

TEST_F(SingleInstanceTest, SilentClientTimesOut) {
    Inbox inbox;
    auto server = SingleInstanceServer::create(*transport, "silent", inbox.callback(),
                                               fast_server());
    ASSERT_TRUE(server.is_ok());

    {
        auto idle = transport->connect(server.value->endpoint_name(), 500);
        ASSERT_TRUE(idle.is_ok());
        platform::sleep_ms(500);
    }

    SingleInstanceClient client(*transport, fast_client());
    EXPECT_TRUE(client.send_file_list_to_running_app("silent", {"/x/y.jpg"}));
    ASSERT_TRUE(inbox.wait_for(1));
    EXPECT_EQ(inbox.received().size(), 1u);
}

TEST_F(SingleInstanceTest, EmptyListIsIgnored) {
    Inbox inbox;
    auto server = SingleInstanceServer::create(*transport, "empty", inbox.callback(),
                                               fast_server());
    ASSERT_TRUE(server.is_ok());

    EXPECT_TRUE(send_raw("empty", encode_file_list({}).value));
    EXPECT_TRUE(send_raw("empty", encode_file_list({"/after/empty.jpg"}).value));

    ASSERT_TRUE(inbox.wait_for(1));
    auto received = inbox.received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0][0], "/after/empty.jpg");
}

TEST_F(SingleInstanceTest, HandlerExceptionIsContained) {
    Inbox inbox;
    bool thrown = false;
    auto handler = [&](const FileList& files) {
        if (!thrown) {
            thrown = true;
            throw std::runtime_error("listing not ready");
        }
        inbox.callback()(files);
    };
    auto server = SingleInstanceServer::create(*transport, "throws", handler, fast_server());
    ASSERT_TRUE(server.is_ok());

    SingleInstanceClient client(*transport, fast_client());
    EXPECT_TRUE(client.send_file_list_to_running_app("throws", {"/first.jpg"}));
    EXPECT_TRUE(client.send_file_list_to_running_app("throws", {"/second.jpg"}));

    ASSERT_TRUE(inbox.wait_for(1));
    EXPECT_EQ(inbox.received()[0], FileList{"/second.jpg"});
}

TEST_F(SingleInstanceTest, NonStandardThrowIsContained) {
    Inbox inbox;
    bool thrown = false;
    auto handler = [&](const FileList& files) {
        if (!thrown) {
            thrown = true;
            throw 42;
        }
        inbox.callback()(files);
    };
    auto server = SingleInstanceServer::create(*transport, "throws_int", handler, fast_server());
    ASSERT_TRUE(server.is_ok());

    SingleInstanceClient client(*transport, fast_client());
    EXPECT_TRUE(client.send_file_list_to_running_app("throws_int", {"/first.jpg"}));
    EXPECT_TRUE(client.send_file_list_to_running_app("throws_int", {"/second.jpg"}));

    ASSERT_TRUE(inbox.wait_for(1));
    EXPECT_EQ(inbox.received()[0], FileList{"/second.jpg"});
    EXPECT_EQ(server.value->dropped_count(), 1u);
}

TEST_F(SingleInstanceTest, ClientFailsWithoutListener) {
    SingleInstanceClient client(*transport, fast_client());

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.send_file_list_to_running_app("nobody_home", {"/a.jpg"}));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::seconds(2));

    auto r = client.send("nobody_home", {"/a.jpg"});
    EXPECT_TRUE(r.is_err());
    EXPECT_TRUE(r.code == ErrorCode::ConnectFailed || r.code == ErrorCode::Timeout);
}

TEST_F(SingleInstanceTest, ClientRejectsEmptyList) {
    SingleInstanceClient client(*transport, fast_client());
    auto r = client.send("anything", {});
    EXPECT_EQ(r.code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(client.send_file_list_to_running_app("anything", {"", "  "}));
}

TEST_F(SingleInstanceTest, RejectsEmptyAppId) {
    Inbox inbox;
    auto server = SingleInstanceServer::create(*transport, "", inbox.callback());
    EXPECT_EQ(server.code, ErrorCode::InvalidArgument);
}

#ifndef _WIN32

// A socket file left by a crashed instance must not lock out the next one.
TEST_F(SingleInstanceTest, StaleSocketIsReclaimed) {
    std::string endpoint = transport->endpoint_for("stale");

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);
    ASSERT_EQ(bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);
    close(fd);  // socket file stays behind, nobody listening
    ASSERT_TRUE(fs::exists(endpoint));

    Inbox inbox;
    auto server = SingleInstanceServer::create(*transport, "stale", inbox.callback(),
                                               fast_server());
    ASSERT_TRUE(server.is_ok()) << server.error;

    SingleInstanceClient client(*transport, fast_client());
    EXPECT_TRUE(client.send_file_list_to_running_app("stale", {"/after/crash.jpg"}));
    ASSERT_TRUE(inbox.wait_for(1));
}

TEST_F(SingleInstanceTest, SocketFileRemovedOnStop) {
    Inbox inbox;
    auto server = SingleInstanceServer::create(*transport, "cleanup", inbox.callback(),
                                               fast_server());
    ASSERT_TRUE(server.is_ok());
    std::string endpoint = server.value->endpoint_name();
    EXPECT_TRUE(fs::exists(endpoint));

    server.value->stop();
    EXPECT_FALSE(fs::exists(endpoint));
}

#endif

#ifdef _WIN32

// The reader never drains the pipe; the write still returns within its deadline.
TEST_F(SingleInstanceTest, WriteDoesNotWaitForReader) {
    std::string endpoint = transport->endpoint_for("hung_reader");
    auto listener = transport->listen(endpoint);
    ASSERT_TRUE(listener.is_ok()) << listener.error;

    auto conn = transport->connect(endpoint, 500);
    ASSERT_TRUE(conn.is_ok()) << conn.error;

    auto start = std::chrono::steady_clock::now();
    auto sent = conn.value->send_line(encode_file_list({"C:\\shoot\\a.jpg"}).value, 500);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(sent.is_ok()) << sent.error;
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

#endif
