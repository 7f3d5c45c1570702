#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "validation/execution_result.hpp"
#include "validation/validator.hpp"

namespace difftest {

/**
 * @brief sha 测试程序输出 5 个随机的十六进制串，一般是 16 个字符，
 * 但前导零会被省略，因此每个串为 0 到 16 个字符
 * @return 输出格式不正确时返回诊断信息
 */
std::optional<std::string> validate_sha_output(const execution_result &result);

/**
 * @brief 根据名称查找内置的结果检查函数
 * 目前支持 sha-hex-output
 * @throw std::invalid_argument 名称不存在
 */
result_checker find_result_checker(const std::string &name);

/**
 * @brief 从运行时数据目录拷贝到临时工作目录的一个文件
 */
struct copy_file {
    /**
     * @brief 相对于运行时数据目录的路径
     */
    std::string from;

    /**
     * @brief 相对于临时工作目录的路径，为空时使用 from 的文件名
     */
    std::string to;
};

/**
 * @brief 拷贝运行时数据目录中某个文件夹下具有指定后缀的所有文件
 * 比如 ghostscript 要求库文件是普通文件而不是符号链接
 */
struct copy_suffix {
    std::string directory;
    std::string suffix;
};

/**
 * @brief 准备临时工作目录：拷贝指定的文件
 * 符号链接会被解析，拷贝得到的总是普通文件
 */
setup_hook copy_setup_hook(std::vector<copy_file> files, std::vector<copy_suffix> suffixes);

/**
 * @brief 从配置中构造准备函数
 * 格式为
 * {
 *     "copy": ["a.txt", {"from": "office_data/1.ps", "to": "input.ps"}],
 *     "copy_suffix": [{"directory": "ghostscript", "suffix": ".ps"}]
 * }
 * @throw std::invalid_argument 配置格式不正确
 */
setup_hook make_setup_hook(const nlohmann::json &spec);

void from_json(const nlohmann::json &j, copy_file &file);

void from_json(const nlohmann::json &j, copy_suffix &suffix);

}  // namespace difftest
