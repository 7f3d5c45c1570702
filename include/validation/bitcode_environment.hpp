#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "validation/environment.hpp"

namespace difftest {

/**
 * @brief 基于磁盘上的 bitcode 文件的环境
 * 用于命令行验证：原始测试程序和被测程序都以 bitcode 文件给出。
 * reset 后当前状态为原始 bitcode，write_bitcode 复制当前状态对应的文件。
 */
struct bitcode_environment : public environment {
    /**
     * @param benchmark 测试程序的名称
     * @param original 原始（未优化）的 bitcode 文件
     * @param current 当前（被测）的 bitcode 文件
     * @param workdir 工作目录
     */
    bitcode_environment(const std::string &benchmark,
                        const std::filesystem::path &original,
                        const std::filesystem::path &current,
                        const std::filesystem::path &workdir);

    std::string benchmark() const override;
    void reset(const std::string &benchmark) override;
    void write_bitcode(const std::filesystem::path &path) override;
    std::unique_ptr<environment> fork() override;
    void close() override;
    std::filesystem::path working_dir() const override;

private:
    std::string benchmark_name;
    std::filesystem::path original;
    std::filesystem::path current;
    std::filesystem::path workdir;
    bool closed = false;

    void assert_open() const;
};

}  // namespace difftest
