#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace difftest {

/**
 * @brief 外部构建系统执行的一条命令
 */
struct command {
    std::vector<std::string> argument;

    double timeout_seconds = 0;

    /**
     * @brief 命令执行前需要存在的文件
     */
    std::vector<std::string> infile;

    /**
     * @brief 命令执行后生成的文件
     */
    std::vector<std::string> outfile;
};

/**
 * @brief 描述如何在验证器之外构建并运行一个测试程序
 * 供外部的构建系统使用：
 * 1. 执行 build_cmd，$CC 为编译器，$IN 为 bitcode
 * 2. 依次执行 pre_run_cmd
 * 3. 执行 run_cmd
 */
struct dynamic_config {
    command build_cmd;
    command run_cmd;
    std::vector<command> pre_run_cmd;
};

void to_json(nlohmann::json &j, const command &cmd);

void from_json(const nlohmann::json &j, command &cmd);

void to_json(nlohmann::json &j, const dynamic_config &config);

void from_json(const nlohmann::json &j, dynamic_config &config);

}  // namespace difftest
