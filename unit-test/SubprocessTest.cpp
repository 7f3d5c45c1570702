#include <signal.h>
#include <cerrno>
#include <filesystem>
#include <stdexcept>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "common/subprocess.hpp"
#include "gtest/gtest.h"
#include "test/fake_tools.hpp"

using namespace std;
using namespace std::filesystem;
using namespace difftest;

class SubprocessTest : public ::testing::Test {
protected:
    path dir;

    void SetUp() override {
        dir = test::make_test_dir("subprocess");
    }

    /**
     * @brief 检查 pid 文件中记录的进程已经不存在
     */
    void expect_process_gone(const path &pid_file) {
        string content = read_file_content(pid_file, "");
        ASSERT_FALSE(content.empty());
        pid_t pid = stoi(content);
        EXPECT_EQ(kill(pid, 0), -1);
        EXPECT_EQ(errno, ESRCH);
    }
};

TEST_F(SubprocessTest, CapturesStdoutTest) {
    process_result result = run_process({"/bin/echo", "abc"}, dir, {}, 10, 1);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.output, "abc\n");
}

TEST_F(SubprocessTest, MergesStderrTest) {
    process_result result = run_shell("echo out; echo err 1>&2", dir, {}, 10, 1);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_NE(result.output.find("out"), string::npos);
    EXPECT_NE(result.output.find("err"), string::npos);
}

TEST_F(SubprocessTest, ExitCodeTest) {
    process_result result = run_shell("exit 3", dir, {}, 10, 1);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exitcode, 3);
}

TEST_F(SubprocessTest, SignalExitCodeTest) {
    process_result result = run_shell("kill -SEGV $$", dir, {}, 10, 1);
    EXPECT_EQ(result.exitcode, -SIGSEGV);
}

TEST_F(SubprocessTest, ExactEnvironmentTest) {
    process_result result = run_shell("echo \"[$FOO][$HOME]\"", dir, {{"FOO", "bar"}}, 10, 1);
    EXPECT_EQ(result.output, "[bar][]\n");
}

TEST_F(SubprocessTest, WorkingDirectoryTest) {
    write_file_content(dir / "input.txt", "content");
    process_result result = run_shell("read line < input.txt; echo \"$line\"", dir, {}, 10, 1);
    EXPECT_EQ(result.output, "content\n");
}

TEST_F(SubprocessTest, StdinIsEmptyTest) {
    process_result result = run_shell("if read line; then echo got; else echo eof; fi", dir, {}, 10, 1);
    EXPECT_EQ(result.output, "eof\n");
}

TEST_F(SubprocessTest, MissingExecutableTest) {
    process_result result = run_process({"/nonexistent/program"}, dir, {}, 10, 1);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exitcode, 127);
}

TEST_F(SubprocessTest, TimeoutKillsProcessTest) {
    process_result result = run_shell("echo $$ > pid; echo started; exec /bin/sleep 10", dir, {}, 0.5, 1);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exitcode, -1);
    EXPECT_LT(result.wall_time, 5);
    expect_process_gone(dir / "pid");
}

TEST_F(SubprocessTest, TimeoutEscalatesToKillTest) {
    // 忽略 SIGTERM 的进程只能被 SIGKILL 杀死
    process_result result = run_shell("trap '' TERM; echo $$ > pid; exec /bin/sleep 10", dir, {}, 0.5, 1);
    EXPECT_TRUE(result.timed_out);
    EXPECT_GE(result.wall_time, 1.5);
    EXPECT_LT(result.wall_time, 5);
    expect_process_gone(dir / "pid");
}

TEST_F(SubprocessTest, ClosesPipeTest) {
    auto count_fds = [] {
        return distance(directory_iterator("/proc/self/fd"), directory_iterator());
    };
    auto before = count_fds();
    for (int i = 0; i < 16; i++)
        run_process({"/bin/echo", "abc"}, dir, {}, 10, 1);
    run_shell("exec /bin/sleep 10", dir, {}, 0.2, 1);
    EXPECT_EQ(count_fds(), before);
}

TEST_F(SubprocessTest, ScopedGuardTest) {
    int runs = 0;
    {
        defer { runs++; };
    }
    EXPECT_EQ(runs, 1);

    {
        scoped_guard guard([&] { runs++; });
        guard.dismiss();
    }
    EXPECT_EQ(runs, 1);

    try {
        scoped_guard guard([&] { runs++; });
        throw runtime_error("failed");
    } catch (runtime_error &) {
    }
    EXPECT_EQ(runs, 2);
}
