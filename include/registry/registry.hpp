#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/utils.hpp"
#include "config.hpp"
#include "registry/dynamic_config.hpp"
#include "validation/environment.hpp"
#include "validation/runtime_data.hpp"
#include "validation/sanitizer.hpp"
#include "validation/validator.hpp"

namespace difftest {

/**
 * @brief 一条验证器声明，对应配置文件中 validators 数组的一个元素
 *
 * {
 *     "benchmark": "benchmark://cbench-v1/qsort",
 *     "cmd": "$BIN $D/automotive_qsort_data/{i}.dat",
 *     "data": ["automotive_qsort_data/{i}.dat"],
 *     "outs": ["sorted_output.dat"],
 *     "linkopts": ["-lm"],
 *     "range": [1, 20]
 * }
 */
struct validator_spec {
    std::string benchmark;

    std::string cmd;

    /**
     * @brief 输入文件，相对于运行时数据目录
     */
    std::vector<std::string> data;

    /**
     * @brief 输出文件，相对于临时工作目录
     */
    std::vector<std::string> outs;

    /**
     * @brief 支持的平台，linux 或 macos
     */
    std::vector<std::string> platforms = {"linux", "macos"};

    bool compare_output = true;

    /**
     * @brief 内置结果检查函数的名称，为空表示不检查
     */
    std::string validate_result;

    std::vector<std::string> linkopts;

    std::map<std::string, std::string> env;

    /**
     * @brief 临时工作目录的准备方式，null 表示不需要准备
     * @see make_setup_hook
     */
    nlohmann::json setup;

    /**
     * @brief 额外注册的 sanitizer 验证器，不存在时使用全部 sanitizer
     */
    std::optional<std::vector<sanitizer>> sanitizers;

    int flakiness = DEFAULT_FLAKINESS;

    int num_runs = 1;

    std::vector<error_kind> retriable;
};

void from_json(const nlohmann::json &j, validator_spec &spec);

/**
 * @brief 一个验证器的验证结果
 */
struct validator_result {
    sanitizer san = sanitizer::NONE;

    std::optional<validation_error> error;
};

void to_json(nlohmann::json &j, const validator_result &result);

/**
 * @brief 测试程序到验证器的映射
 * 注册完成后只读，并发读取不需要加锁
 */
struct validator_registry {
    /**
     * @param data_root 运行时数据目录，用于替换命令中的 $D
     * @param platform 当前平台，linux 或 macos
     */
    explicit validator_registry(const std::filesystem::path &data_root, const std::string &platform = current_platform());

    /**
     * @brief 注册一条验证器声明
     * 若当前平台不在 spec.platforms 中，不注册任何验证器；否则注册一个不开启 sanitizer 的验证器，
     * 在 Linux 下还会为每个 sanitizer 注册一个验证器。同时生成该测试程序的 dynamic_config，
     * 后注册的声明会覆盖之前的 dynamic_config。
     * @return 是否注册了验证器
     */
    bool register_validator(const validator_spec &spec);

    /**
     * @brief 从 JSON 文档中注册验证器
     * 声明中的 range 字段为 [first, last]，声明会对每个整数 i 实例化一次，所有字符串中的 {i} 替换为 i
     * @param document 格式为 {"validators": [...]}
     * @return 注册成功的声明数
     */
    int load(const nlohmann::json &document);

    /**
     * @brief 从文件注册验证器，若 path 是文件夹，按文件名顺序加载其中所有 .json 文件
     * @return 注册成功的声明数
     */
    int load_file(const std::filesystem::path &path);

    /**
     * @brief 测试程序的所有验证器，按注册顺序排列
     */
    const std::vector<validator_config> &validators(const std::string &benchmark) const;

    std::optional<dynamic_config> get_dynamic_config(const std::string &benchmark) const;

    /**
     * @brief 依次运行测试程序的所有验证器
     * @param benchmark 测试程序，没有注册验证器时返回空列表
     * @param env 被测程序所在的环境
     * @param data 运行时数据
     * @return 每个验证器的结果，顺序与 validators(benchmark) 相同。
     * 验证器抛出的 file_not_found_error 记为 FILE_NOT_FOUND 错误，不中断其余验证器
     */
    std::vector<validator_result> validate(const std::string &benchmark, environment &env, runtime_data &data) const;

    std::vector<std::string> benchmarks() const;

private:
    std::filesystem::path data_root;
    std::string platform;
    std::map<std::string, std::vector<validator_config>> registered;
    std::map<std::string, dynamic_config> dynamic_configs;
};

}  // namespace difftest
