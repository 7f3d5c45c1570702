#pragma once

#include <filesystem>
#include <string>
#include "validation/bench_runner.hpp"
#include "validation/environment.hpp"
#include "validation/execution_result.hpp"

namespace difftest {

/**
 * @brief 生成标准输出：运行未经变换的原始测试程序
 * 1. fork 出一个独立的环境副本，并 reset 到原始测试程序
 * 2. 将副本的 bitcode 写入 cwd/benchmark.bc，使用 -O2、不开启 sanitizer、迭代 1 次运行
 * 3. 无论是否出错，都会关闭环境副本
 * 标准程序总是认为是安全的，因此不会开启 sanitizer，避免插桩本身导致输出不一致。
 *
 * @param env 当前验证的环境，不会被修改
 * @param cmd 已经展开 $D 的命令模板
 * @param cwd 临时工作目录
 * @param opt 被测程序的运行参数，标准程序沿用其中的链接参数、环境变量和时间限制
 * @return 标准程序的运行结果。若出错，错误已经标记为 gold standard
 */
execution_result reference_run(environment &env,
                               const std::string &cmd,
                               const std::filesystem::path &cwd,
                               const run_options &opt);

}  // namespace difftest
