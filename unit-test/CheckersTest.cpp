#include <filesystem>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "test/fake_tools.hpp"
#include "validation/checkers.hpp"

using namespace std;
using namespace std::filesystem;
using namespace difftest;

static execution_result with_output(const string &output) {
    execution_result result;
    result.output = output;
    return result;
}

TEST(CheckersTest, ShaOutputTest) {
    EXPECT_FALSE(validate_sha_output(with_output("0123456789abcdef 0123456789abcdef 0123456789abcdef 0123456789abcdef 0123456789abcdef\n")));
    // 前导零会被省略
    EXPECT_FALSE(validate_sha_output(with_output("123456789abcdef 0123456789abcdef 89abcdef 0123456789abcdef 0123456789abcdef")));
}

TEST(CheckersTest, MalformedShaOutputTest) {
    EXPECT_EQ(validate_sha_output(with_output("not hex")), "Failed to parse hex output");
    EXPECT_EQ(validate_sha_output(with_output("0123 4567 89ab")), "Failed to parse hex output");
    EXPECT_EQ(validate_sha_output(with_output(BINARY_OUTPUT)), "Failed to parse unicode output");
}

TEST(CheckersTest, FindCheckerTest) {
    result_checker checker = find_result_checker("sha-hex-output");
    ASSERT_TRUE(checker);
    EXPECT_TRUE(checker(with_output("")));
    EXPECT_THROW(find_result_checker("no-such-checker"), std::invalid_argument);
}

TEST(CheckersTest, CopySetupHookTest) {
    path root = test::make_test_dir("checkers");
    path data = root / "data", cwd = root / "cwd";
    create_directories(data / "ghostscript");
    create_directories(data / "office_data");
    create_directories(cwd);
    write_file_content(data / "ghostscript" / "gs_init.ps", "init");
    write_file_content(data / "ghostscript" / "readme.txt", "readme");
    write_file_content(data / "office_data" / "1.ps", "doc");
    write_file_content(data / "plain.txt", "plain");
    create_symlink(data / "ghostscript" / "gs_init.ps", data / "ghostscript" / "gs_link.ps");

    setup_hook hook = make_setup_hook({{"copy", {"plain.txt", {{"from", "office_data/1.ps"}, {"to", "input.ps"}}}},
                                       {"copy_suffix", {{{"directory", "ghostscript"}, {"suffix", ".ps"}}}}});
    hook(cwd, data);

    EXPECT_EQ(read_file_content(cwd / "plain.txt"), "plain");
    EXPECT_EQ(read_file_content(cwd / "input.ps"), "doc");
    EXPECT_EQ(read_file_content(cwd / "gs_init.ps"), "init");
    EXPECT_FALSE(exists(cwd / "readme.txt"));
    // 符号链接被拷贝为普通文件
    EXPECT_FALSE(is_symlink(cwd / "gs_link.ps"));
    EXPECT_EQ(read_file_content(cwd / "gs_link.ps"), "init");
}

TEST(CheckersTest, MalformedSetupHookTest) {
    EXPECT_THROW(make_setup_hook({{"unzip", "a.zip"}}), std::invalid_argument);
    EXPECT_THROW(make_setup_hook(nlohmann::json::array()), std::invalid_argument);
}
