#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace difftest {

/**
 * @brief 一次子进程运行的原始结果
 */
struct process_result {
    /**
     * @brief 时钟时间，单位为秒
     * 若超时，这里是实际等待的时间，调用方应当自行替换为时间限制
     */
    double wall_time = 0;

    /**
     * @brief 子进程是否因为超时被终止
     */
    bool timed_out = false;

    /**
     * @brief 子进程的返回值
     * 若子进程因为信号终止，则为负的信号编号（比如 SIGSEGV 终止时为 -11）
     * 若超时，则为 -1
     */
    int exitcode = -1;

    /**
     * @brief 子进程的 stdout 和 stderr 输出（合并在一起，未解码）
     */
    std::string output;
};

/**
 * @brief 运行外部程序，并收集其输出
 * 1. 创建管道，将子进程的 stdout、stderr 都重定向到管道中，stdin 重定向到 /dev/null
 * 2. 子进程进入独立的进程组，以便超时时通过进程组杀死所有子孙进程
 * 3. 子进程只能看到 env 中的环境变量
 * 4. 父进程读取管道直到子进程退出或者超时
 * 5. 若超时，向进程组发送 SIGTERM，在 grace 秒内读取剩余输出并等待子进程退出；
 *    若子进程仍未退出，发送 SIGKILL 再等待 grace 秒，之后不再等待
 *
 * @param argv 外部程序的路径 (argv[0]) 和参数，argv[0] 不含 '/' 时从 PATH 中查找
 * @param workdir 子进程的工作目录
 * @param env 子进程的全部环境变量
 * @param timeout 时间限制，单位为秒
 * @param grace 超时后等待子进程退出的时间，单位为秒
 * @return 子进程的运行结果
 */
process_result run_process(const std::vector<std::string> &argv,
                           const std::filesystem::path &workdir,
                           const std::map<std::string, std::string> &env,
                           double timeout,
                           double grace);

/**
 * @brief 通过 /bin/sh -c 运行一条 shell 命令
 * @see run_process
 */
process_result run_shell(const std::string &command,
                         const std::filesystem::path &workdir,
                         const std::map<std::string, std::string> &env,
                         double timeout,
                         double grace);

}  // namespace difftest
