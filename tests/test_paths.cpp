#include <gtest/gtest.h>
#include <core/paths.hpp>
#include <platform/platform.hpp>

#ifndef _WIN32

TEST(PathsTest, AbsolutePathUnchanged) {
    EXPECT_EQ(normalize_file_path("/photos/a.jpg"), "/photos/a.jpg");
}

TEST(PathsTest, RelativeJoinedOntoBase) {
    EXPECT_EQ(normalize_file_path("shots/a.jpg", "/work"), "/work/shots/a.jpg");
}

TEST(PathsTest, RelativeUsesCurrentDirectory) {
    auto expected = (fs::current_path() / "a.jpg").lexically_normal().string();
    EXPECT_EQ(normalize_file_path("a.jpg"), expected);
}

TEST(PathsTest, DotSegmentsCollapsed) {
    EXPECT_EQ(normalize_file_path("/work/./shots/../a.jpg"), "/work/a.jpg");
}

TEST(PathsTest, TrailingSeparatorDropped) {
    EXPECT_EQ(normalize_file_path("/work/shots/"), "/work/shots");
    EXPECT_EQ(normalize_file_path("/"), "/");
}

TEST(PathsTest, BlankInputIsEmpty) {
    EXPECT_EQ(normalize_file_path(""), "");
    EXPECT_EQ(normalize_file_path("   "), "");
}

TEST(PathsTest, WhitespaceTrimmed) {
    EXPECT_EQ(normalize_file_path("  /work/a.jpg \n"), "/work/a.jpg");
}

TEST(PathsTest, TildeExpanded) {
    auto home = platform::home_dir();
    EXPECT_EQ(expand_user("~"), home.string());
    EXPECT_EQ(expand_user("~/a.jpg"), (home / "a.jpg").string());
    EXPECT_EQ(expand_user("~other/a.jpg"), "~other/a.jpg");
    EXPECT_EQ(expand_user("/abs/~/a.jpg"), "/abs/~/a.jpg");
}

TEST(PathsTest, ListDeduplicatedInOrder) {
    FileList in = {"/b/2.jpg", "/a/1.jpg", "/a/./1.jpg", "", "/b/2.jpg", "/c/3.jpg"};
    FileList expected = {"/b/2.jpg", "/a/1.jpg", "/c/3.jpg"};
    EXPECT_EQ(normalize_file_paths(in), expected);
}

TEST(PathsTest, AnchorIsParentOfFirst) {
    EXPECT_EQ(anchor_directory({"/photos/day1/a.jpg", "/other/b.jpg"}), "/photos/day1");
    EXPECT_EQ(anchor_directory({}), "");
}

#endif
