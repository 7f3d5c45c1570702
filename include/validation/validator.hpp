#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "config.hpp"
#include "validation/environment.hpp"
#include "validation/error.hpp"
#include "validation/execution_result.hpp"
#include "validation/runtime_data.hpp"
#include "validation/sanitizer.hpp"

namespace difftest {

/**
 * @brief 对被测程序的输出进行额外检查
 * @return 若检查不通过，返回诊断信息；通过返回 nullopt
 */
using result_checker = std::function<std::optional<std::string>(const execution_result &result)>;

/**
 * @brief 在运行程序之前准备临时工作目录，比如拷贝程序需要的库文件
 * @param cwd 临时工作目录
 * @param data_root 运行时数据目录
 */
using setup_hook = std::function<void(const std::filesystem::path &cwd, const std::filesystem::path &data_root)>;

/**
 * @brief 一个测试程序在一种 sanitizer 下的验证配置
 * 配置在注册后不再修改，每个 (benchmark, sanitizer) 对应一个配置
 */
struct validator_config {
    /**
     * @brief 测试程序的标识，比如 benchmark://cbench-v1/crc32
     */
    std::string benchmark;

    /**
     * @brief 运行命令模板
     * $BIN 表示被测程序，$D 表示运行时数据目录
     */
    std::string cmd;

    std::vector<std::string> linkopts;

    /**
     * @brief 额外的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 相对于运行时数据目录的输入文件，验证前检查是否存在
     */
    std::vector<std::string> input_files;

    /**
     * @brief 相对于临时工作目录的输出文件，需要和标准程序的输出文件一致
     */
    std::vector<std::string> output_files;

    /**
     * @brief 是否比较标准输出
     */
    bool compare_output = true;

    result_checker validate_result;

    setup_hook pre_execution;

    sanitizer san = sanitizer::NONE;

    /**
     * @brief 最多尝试的次数
     */
    int flakiness = DEFAULT_FLAKINESS;

    /**
     * @brief 程序的迭代次数
     */
    int num_runs = 1;

    double timeout = RUN_TIMEOUT;

    double compile_timeout = COMPILE_TIMEOUT;

    /**
     * @brief 允许重试的错误类型，为空表示所有错误都可以重试
     */
    std::set<error_kind> retriable;
};

/**
 * @brief 对当前环境中的程序进行一次差分验证
 * 1. 准备运行时数据，检查输入文件，创建临时工作目录并执行 pre_execution
 * 2. 若需要比较输出，运行标准程序，并将输出文件重命名为 <name>.gold_standard
 * 3. 运行被测程序
 * 4. 执行 validate_result 检查
 * 5. 比较标准输出
 * 6. 使用 diff 比较输出文件
 * 临时工作目录在返回前删除，除非开启了 DEBUG。
 *
 * @param config 验证配置
 * @param env 被测程序所在的环境
 * @param data 运行时数据
 * @return 若验证通过，返回 nullopt；否则返回第一个发现的错误
 * @throw file_not_found_error 若输入文件不存在，或者标准程序没有生成输出文件
 */
std::optional<validation_error> validate_once(const validator_config &config, environment &env, runtime_data &data);

/**
 * @brief 差分验证，对不稳定的错误进行重试
 * @see validate_once
 * @see retry_flaky
 */
std::optional<validation_error> validate(const validator_config &config, environment &env, runtime_data &data);

}  // namespace difftest
