#include <gtest/gtest.h>
#include "../src/exception.hpp"
#include "../src/utils.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(UtilsTest, JoinUrl) {
    EXPECT_EQ(join_url("https://m.example/plugins", "git/1.0/git.hpi"), "https://m.example/plugins/git/1.0/git.hpi");
    EXPECT_EQ(join_url("https://m.example/plugins/", "git/1.0/git.hpi"), "https://m.example/plugins/git/1.0/git.hpi");
    EXPECT_EQ(join_url("https://m.example/plugins//", "/git.hpi"), "https://m.example/plugins/git.hpi");
}

TEST(UtilsTest, FormatBytes) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(1023), "1023 B");
    EXPECT_EQ(format_bytes(1024), "1.0 KiB");
    EXPECT_EQ(format_bytes(1536), "1.5 KiB");
    EXPECT_EQ(format_bytes(5u * 1024 * 1024), "5.0 MiB");
}

TEST(UtilsTest, EnsureDirExists) {
    fs::path root = fs::absolute("tmp_utils_test");
    fs::remove_all(root);

    ensure_dir_exists(root / "a" / "b");
    EXPECT_TRUE(fs::is_directory(root / "a" / "b"));
    EXPECT_NO_THROW(ensure_dir_exists(root / "a" / "b"));

    std::ofstream(root / "file") << "x";
    EXPECT_THROW(ensure_dir_exists(root / "file"), HpiError);

    fs::remove_all(root);
}

TEST(UtilsTest, QuietMode) {
    set_quiet_mode(true);
    EXPECT_TRUE(get_quiet_mode());
    set_quiet_mode(false);
    EXPECT_FALSE(get_quiet_mode());
}
