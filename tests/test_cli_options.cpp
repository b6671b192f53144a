#include <gtest/gtest.h>
#include <cli/handoff_cli.hpp>
#include <sstream>

TEST(CliOptionsTest, FilesOnly) {
    auto r = parse_cli_options({"/a.jpg", "/b.jpg"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.files, (FileList{"/a.jpg", "/b.jpg"}));
    EXPECT_FALSE(r.value.send_to.has_value());
    EXPECT_FALSE(r.value.list_apps);
}

TEST(CliOptionsTest, FilesThenOptions) {
    auto r = parse_cli_options({"a.jpg", "--send", "BirdStamp", "--app-id", "mine",
                                "--config-dir", "/etc/handoff"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.files, FileList{"a.jpg"});
    EXPECT_EQ(*r.value.send_to, "BirdStamp");
    EXPECT_EQ(*r.value.app_id, "mine");
    EXPECT_EQ(r.value.config_dir->string(), "/etc/handoff");
}

TEST(CliOptionsTest, Flags) {
    auto r = parse_cli_options({"--apps", "--version", "--help", "--init-config"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.list_apps);
    EXPECT_TRUE(r.value.show_version);
    EXPECT_TRUE(r.value.show_help);
    EXPECT_TRUE(r.value.init_config);
    EXPECT_TRUE(r.value.files.empty());
}

TEST(CliOptionsTest, PathsAfterOptionsAreNotFiles) {
    auto r = parse_cli_options({"--apps", "late.jpg"});
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::InvalidArgument);
}

TEST(CliOptionsTest, UnknownOption) {
    auto r = parse_cli_options({"a.jpg", "--frobnicate"});
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("--frobnicate"), std::string::npos);
}

TEST(CliOptionsTest, MissingValue) {
    EXPECT_TRUE(parse_cli_options({"--send"}).is_err());
    EXPECT_TRUE(parse_cli_options({"--app-id", ""}).is_err());
}

TEST(TerminalListingTest, PrintsDirectoryAndFiles) {
    std::ostringstream out;
    TerminalListing listing(out);
    listing.open_directory_then_select("/shoot", {"/shoot/a.jpg", "/shoot/b.jpg"});

    std::string text = out.str();
    EXPECT_NE(text.find("Received 2 file(s)"), std::string::npos);
    EXPECT_NE(text.find("/shoot/a.jpg"), std::string::npos);
    EXPECT_NE(text.find("/shoot/b.jpg"), std::string::npos);
}
