#include <filesystem>
#include <sstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "test/fake_tools.hpp"
#include "validation/bench_runner.hpp"
#include "validation/compile.hpp"
#include "validation/execution_result.hpp"

using namespace std;
using namespace std::filesystem;
using namespace difftest;

class CompileStageTest : public ::testing::Test {
protected:
    path root, cwd;

    void SetUp() override {
        root = test::make_test_dir("compile");
        test::setup_test_environment(root);
        cwd = root / "cwd";
        create_directories(cwd);
    }

    path write_bitcode(const string &script) {
        path bitcode = cwd / "benchmark.bc";
        test::write_script(bitcode, "#!/bin/sh\n" + script);
        return bitcode;
    }
};

TEST_F(CompileStageTest, UnsanitizedRunNeverCompilesTest) {
    path bitcode = write_bitcode("echo abc\n");
    run_options opt;
    execution_result result = compile_and_run_bitcode(bitcode, "$BIN", cwd, opt);

    EXPECT_FALSE(result.error) << *result.error;
    EXPECT_EQ(result.output, "abc\n");
    EXPECT_EQ(test::count_compilations(root), 0);
}

TEST_F(CompileStageTest, SanitizedRunCompilesOnceTest) {
    path bitcode = write_bitcode("echo \"$1\"\n");
    run_options opt;
    opt.san = sanitizer::ASAN;
    opt.linkopts = {"-lm"};
    execution_result result = compile_and_run_bitcode(bitcode, "$BIN hello", cwd, opt);

    EXPECT_FALSE(result.error) << *result.error;
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_EQ(test::count_compilations(root), 1);
    // 编译出的可执行文件在运行后删除
    EXPECT_FALSE(exists(cwd / "a.out"));

    string log = read_file_content(root / "clang.log");
    EXPECT_NE(log.find("-fsanitize=address"), string::npos);
    EXPECT_NE(log.find("-lm"), string::npos);
}

TEST_F(CompileStageTest, IterationCountFileTest) {
    path bitcode = write_bitcode("read n < _finfo_dataset; echo \"runs=$n\"\n");
    run_options opt;
    opt.num_runs = 3;
    execution_result result = compile_and_run_bitcode(bitcode, "$BIN", cwd, opt);

    EXPECT_EQ(result.output, "runs=3\n");
    EXPECT_EQ(read_file_content(cwd / "_finfo_dataset"), "3\n");
}

TEST_F(CompileStageTest, CompilationFailedTest) {
    path bitcode = write_bitcode("# COMPILE_ERROR\necho abc\n");
    run_options opt;
    opt.san = sanitizer::UBSAN;
    opt.timeout = 42;
    execution_result result = compile_and_run_bitcode(bitcode, "$BIN", cwd, opt);

    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::COMPILATION_FAILED);
    EXPECT_EQ(result.walltime_seconds, 42);
    EXPECT_TRUE(result.error->data.contains("compile_cmd"));
    EXPECT_NE(result.error->data["output"].get<string>().find("invalid bitcode"), string::npos);
    EXPECT_FALSE(exists(cwd / "a.out"));
}

TEST_F(CompileStageTest, CompilationTimeoutTest) {
    path bitcode = write_bitcode("# COMPILE_HANG\necho abc\n");
    run_options opt;
    opt.san = sanitizer::TSAN;
    opt.compile_timeout = 0.5;
    execution_result result = compile_and_run_bitcode(bitcode, "$BIN", cwd, opt);

    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::COMPILATION_TIMEOUT);
    EXPECT_EQ(result.error->data["timeout"], 0.5);
}

TEST_F(CompileStageTest, BinaryMustNotExistTest) {
    path bitcode = write_bitcode("echo abc\n");
    write_file_content(cwd / "a.out", "stale");
    nlohmann::json error_data = nlohmann::json::object();
    EXPECT_THROW(compile_bitcode(bitcode, cwd / "a.out", {}, sanitizer::ASAN, 10, error_data), internal_error);
    EXPECT_EQ(test::count_compilations(root), 0);
}

TEST_F(CompileStageTest, ExecutionTimeoutTest) {
    path bitcode = write_bitcode("exec /bin/sleep 10\n");
    run_options opt;
    opt.timeout = 0.5;
    execution_result result = compile_and_run_bitcode(bitcode, "$BIN", cwd, opt);

    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::EXECUTION_TIMEOUT);
    EXPECT_EQ(result.walltime_seconds, 0.5);
}

TEST_F(CompileStageTest, SanitizerReportTest) {
    path bitcode = write_bitcode("echo '==1==ERROR: AddressSanitizer: stack-buffer-overflow'\nexit 1\n");
    run_options opt;
    opt.san = sanitizer::ASAN;
    execution_result result = compile_and_run_bitcode(bitcode, "$BIN", cwd, opt);

    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error_kind::MEMORY_ERROR);
    EXPECT_EQ(result.error->data["run_cmd"], "./a.out");
    EXPECT_TRUE(result.error->data.contains("compile_cmd"));
}

TEST_F(CompileStageTest, EnvironmentOverridesTest) {
    path bitcode = write_bitcode("echo \"$ASAN_OPTIONS\"\n");
    run_options opt;
    opt.env = {{"ASAN_OPTIONS", "detect_leaks=0"}};
    execution_result result = compile_and_run_bitcode(bitcode, "$BIN", cwd, opt);
    EXPECT_EQ(result.output, "detect_leaks=0\n");
}

TEST_F(CompileStageTest, BinaryOutputTest) {
    path bitcode = write_bitcode("printf '\\377\\376'\n");
    run_options opt;
    execution_result result = compile_and_run_bitcode(bitcode, "$BIN", cwd, opt);
    EXPECT_EQ(result.output, string(BINARY_OUTPUT));
}

TEST_F(CompileStageTest, OverlongOutputTest) {
    // C0 AF 是 '/' 的超长编码，不是合法的 UTF-8
    path bitcode = write_bitcode("printf '\\300\\257 overlong\\n'\nexit 1\n");
    run_options opt;
    execution_result result = compile_and_run_bitcode(bitcode, "$BIN", cwd, opt);

    EXPECT_EQ(result.output, string(BINARY_OUTPUT));
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->type(), "Runtime error (1)");
    EXPECT_EQ(result.error->data["output"], BINARY_OUTPUT);

    stringstream ss;
    EXPECT_NO_THROW(ss << *result.error);
    EXPECT_NO_THROW(nlohmann::json(result).dump());
}

TEST_F(CompileStageTest, StrictUtf8Test) {
    EXPECT_TRUE(utf8_check_is_valid("plain ascii\n"));
    EXPECT_TRUE(utf8_check_is_valid("\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80\xF4\x8F\xBF\xBF"));

    EXPECT_FALSE(utf8_check_is_valid("\xC0\xAF"));                  // 超长的两字节编码
    EXPECT_FALSE(utf8_check_is_valid("\xC1\xBF"));
    EXPECT_FALSE(utf8_check_is_valid("\xE0\x80\xAF"));              // 超长的三字节编码
    EXPECT_FALSE(utf8_check_is_valid("\xF0\x80\x80\xAF"));          // 超长的四字节编码
    EXPECT_FALSE(utf8_check_is_valid("\xED\xA0\x80"));              // U+D800
    EXPECT_FALSE(utf8_check_is_valid("\xF4\x90\x80\x80"));          // U+110000
    EXPECT_FALSE(utf8_check_is_valid("\xF5\x80\x80\x80"));
    EXPECT_FALSE(utf8_check_is_valid("\xF7\xBF\xBF\xBF"));
    EXPECT_FALSE(utf8_check_is_valid("\xFF"));
    EXPECT_FALSE(utf8_check_is_valid("\xE4\xB8"));                  // 截断
    EXPECT_FALSE(utf8_check_is_valid("\x80"));

    EXPECT_EQ(decode_output("\xC0\xAF overlong\n"), BINARY_OUTPUT);
}
