#include "common/subprocess.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include "common/defer.hpp"
#include "common/utils.hpp"

namespace difftest {
using namespace std;
namespace fs = std::filesystem;

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

// 轮询子进程状态的间隔
const struct timespec poll_delay = {0, 10000000L};  // 0.01s

[[noreturn]] static void error(int err, const string &message) {
    throw system_error(err, system_category(), message);
}

/**
 * @brief 读取管道中当前可读的全部数据
 * @return 若管道已经关闭（读到 EOF）返回 true
 */
static bool pump_pipe(int fd, string &output) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            output.append(buf, nread);
            continue;
        }
        if (nread == 0) return true;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return false;
        error(errno, "reading child output");
    }
}

static int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        return -WTERMSIG(status);
    else
        return -1;
}

/**
 * @brief 在 seconds 秒内等待子进程退出，同时读走（并丢弃）管道中剩余的输出，避免子进程阻塞在写管道上
 * @return 子进程是否已经被回收
 */
static bool reap_within(pid_t pid, int fd, double seconds, int &status) {
    elapsed_time timer;
    string discarded;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) return true;
        if (r < 0 && errno != EINTR) {
            if (errno == ECHILD) return true;
            error(errno, "waiting on child");
        }
        if (fd >= 0) {
            discarded.clear();
            pump_pipe(fd, discarded);
        }
        if (timer.seconds() >= seconds) return false;
        nanosleep(&poll_delay, nullptr);
    }
}

process_result run_process(const vector<string> &argv,
                           const fs::path &workdir,
                           const map<string, string> &env,
                           double timeout,
                           double grace) {
    if (argv.empty()) throw invalid_argument("empty command");

    LOG(INFO) << "exec: " << boost::algorithm::join(argv, " ");

    // fork 之后子进程不能再申请内存，因此参数和环境变量要提前准备好
    vector<char *> args;
    for (auto &arg : argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    vector<string> env_strings;
    for (auto &[key, value] : env) env_strings.push_back(key + "=" + value);
    vector<char *> envp;
    for (auto &s : env_strings) envp.push_back(const_cast<char *>(s.c_str()));
    envp.push_back(nullptr);

    string cwd = workdir.string();
    bool search_path = argv[0].find('/') == string::npos;

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0) error(errno, "creating pipe");

    process_result result;
    elapsed_time timer;

    pid_t pid = fork();
    switch (pid) {
        case -1: {
            int err = errno;
            close(pipefd[PIPE_IN]);
            close(pipefd[PIPE_OUT]);
            error(err, "unable to fork");
        }
        case 0: {  // 子进程
            // 将子进程分离到一个独立的进程组，以便我们通过 kill(-pid) 杀死进程组内所有进程
            setpgid(0, 0);
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
            dup2(pipefd[PIPE_IN], STDOUT_FILENO);
            dup2(pipefd[PIPE_IN], STDERR_FILENO);
            if (chdir(cwd.c_str()) != 0) {
                const char msg[] = "unable to change working directory\n";
                (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
                _exit(127);
            }
            if (search_path)
                execvpe(args[0], args.data(), envp.data());
            else
                execve(args[0], args.data(), envp.data());
            const char msg[] = "unable to start command\n";
            (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
            _exit(127);
        }
        default:
            break;
    }

    // 父进程也设置一次进程组，避免子进程还没来得及调用 setpgid 时就要发送信号
    setpgid(pid, pid);
    close(pipefd[PIPE_IN]);
    int fd = pipefd[PIPE_OUT];
    defer { close(fd); };

    // 子进程被回收之前出错时，杀死整个进程组并回收子进程
    scoped_guard reaper([&] {
        kill(-pid, SIGKILL);
        waitpid(pid, nullptr, 0);
    });

    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        error(errno, "setting pipe to non-blocking mode");

    int status = 0;
    bool eof = false, exited = false;
    while (!exited) {
        double remaining = timeout - timer.seconds();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        if (!eof) {
            struct pollfd pfd = {fd, POLLIN, 0};
            int wait_ms = max(1, (int)min(remaining * 1000, 100.0));
            int r = poll(&pfd, 1, wait_ms);
            if (r == -1 && errno != EINTR) error(errno, "waiting for child output");
            if (r > 0) eof = pump_pipe(fd, result.output);
        } else {
            nanosleep(&poll_delay, nullptr);
        }

        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            exited = true;
        } else if (r < 0 && errno != EINTR) {
            error(errno, "waiting on child");
        }
    }

    if (result.timed_out) {
        LOG(WARNING) << "timelimit exceeded (" << timeout << "s): aborting command";

        /* First try to kill graciously, then hard.
           Don't report an already exited process as error. */
        LOG(INFO) << "sending SIGTERM";
        if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to send SIGTERM: " << strerror(errno);

        if (!reap_within(pid, fd, grace, status)) {
            LOG(INFO) << "sending SIGKILL";
            if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(ERROR) << "unable to send SIGKILL: " << strerror(errno);
            if (!reap_within(pid, fd, grace, status))
                LOG(ERROR) << "child process " << pid << " could not be reaped after SIGKILL";
        }
        reaper.dismiss();
        result.exitcode = -1;
    } else {
        reaper.dismiss();
        // 子进程已经退出，读走管道中剩余的数据。
        // 子进程 fork 出来的后台进程可能仍持有管道，因此这里不阻塞等待 EOF
        if (!eof) pump_pipe(fd, result.output);
        result.exitcode = decode_status(status);
    }

    result.wall_time = timer.seconds();
    return result;
}

process_result run_shell(const string &command,
                         const fs::path &workdir,
                         const map<string, string> &env,
                         double timeout,
                         double grace) {
    return run_process({"/bin/sh", "-c", command}, workdir, env, timeout, grace);
}

}  // namespace difftest
