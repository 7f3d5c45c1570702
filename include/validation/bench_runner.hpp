#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "config.hpp"
#include "validation/execution_result.hpp"
#include "validation/sanitizer.hpp"

namespace difftest {

/**
 * @brief 编译运行一个 bitcode 的参数
 */
struct run_options {
    /**
     * @brief 链接参数，比如 -lm
     */
    std::vector<std::string> linkopts;

    /**
     * @brief 额外的环境变量，会覆盖默认的 TMPDIR、HOME、USER
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 程序的迭代次数，写入 _finfo_dataset 文件
     */
    int num_runs = 1;

    sanitizer san = sanitizer::NONE;

    /**
     * @brief 运行时间限制，单位为秒
     */
    double timeout = RUN_TIMEOUT;

    /**
     * @brief 编译时间限制，单位为秒
     */
    double compile_timeout = COMPILE_TIMEOUT;
};

/**
 * @brief 运行一条 shell 命令并分类结果
 * @param command 要运行的命令
 * @param cwd 工作目录
 * @param env 子进程的全部环境变量
 * @param timeout 时间限制，单位为秒
 * @param san 开启的 sanitizer，用于分类运行时错误
 * @param error_data 诊断信息的初始值
 * @return 运行结果。超时时 walltime_seconds 为 timeout，错误为 EXECUTION_TIMEOUT；
 * 返回值非零时错误由 classify_runtime_error 决定
 */
execution_result run_command(const std::string &command,
                             const std::filesystem::path &cwd,
                             const std::map<std::string, std::string> &env,
                             double timeout,
                             sanitizer san,
                             nlohmann::json error_data = nlohmann::json::object());

/**
 * @brief 编译（若开启 sanitizer）并运行 bitcode
 * 1. 向 cwd 写入 _finfo_dataset，内容为迭代次数
 * 2. 若开启 sanitizer，将 bitcode 编译为 cwd/a.out，命令中的 $BIN 替换为 ./a.out；
 *    否则 $BIN 替换为 "lli <bitcode>"，PATH 只包含 LLI_PATH 所在的目录
 * 3. 运行命令，结束后删除编译出的可执行文件
 *
 * @param bitcode bitcode 文件
 * @param cmd 命令模板，$D 必须已经被替换
 * @param cwd 工作目录
 * @param opt 编译运行参数
 */
execution_result compile_and_run_bitcode(const std::filesystem::path &bitcode,
                                         const std::string &cmd,
                                         const std::filesystem::path &cwd,
                                         const run_options &opt);

}  // namespace difftest
