#include <gtest/gtest.h>
#include <launch/launcher.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

TEST(LauncherTest, EmptyPathFails) {
    DetachedLauncher launcher;
    auto r = launcher.start_detached("", {"/a.jpg"});
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::LaunchFailed);
}

#if !defined(_WIN32) && !defined(__APPLE__)

class SpawnTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("handoff_spawn_test_" +
                    std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    // Poll for a file the detached child writes.
    std::string wait_for_file(const fs::path& path, int timeout_ms = 5000) {
        for (int waited = 0; waited < timeout_ms; waited += 50) {
            if (fs::exists(path)) {
                platform::sleep_ms(50);
                std::ifstream in(path);
                std::stringstream ss;
                ss << in.rdbuf();
                return ss.str();
            }
            platform::sleep_ms(50);
        }
        return "";
    }
};

TEST_F(SpawnTest, MissingExecutableFails) {
    DetachedLauncher launcher;
    auto r = launcher.start_detached((test_dir / "no_such_app").string(), {"/a.jpg"});
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::LaunchFailed);
}

TEST_F(SpawnTest, NonExecutableFileFails) {
    fs::path plain = test_dir / "plain.txt";
    std::ofstream(plain) << "not a program\n";
    auto r = platform::spawn_detached(plain.string(), {});
    EXPECT_EQ(r.code, ErrorCode::LaunchFailed);
}

TEST_F(SpawnTest, PassesEachFileAsArgument) {
    fs::path script = test_dir / "record.sh";
    fs::path out = test_dir / "args.txt";
    {
        std::ofstream s(script);
        s << "#!/bin/sh\n"
          << "for a in \"$@\"; do echo \"$a\" >> \"" << out.string() << ".tmp\"; done\n"
          << "mv \"" << out.string() << ".tmp\" \"" << out.string() << "\"\n";
    }
    fs::permissions(script, fs::perms::owner_all);

    DetachedLauncher launcher;
    auto r = launcher.start_detached(script.string(), {"/p/a b.jpg", "/p/c.jpg"});
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_EQ(wait_for_file(out), "/p/a b.jpg\n/p/c.jpg\n");
}

#endif
