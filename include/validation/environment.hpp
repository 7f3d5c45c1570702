#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace difftest {

/**
 * @brief 表示一个编译器环境，持有某个测试程序当前（可能已经被优化变换过）的状态
 * 验证器只通过这个接口访问环境：
 * 1. 通过 write_bitcode 序列化当前状态，作为被测程序
 * 2. 通过 fork 得到一个独立的副本，reset 到原始的测试程序，作为标准程序
 *
 * 环境的方法在响应过慢时可以抛出 environment_timeout，验证器会重试整个验证过程。
 */
struct environment {
    virtual ~environment() = default;

    /**
     * @brief 当前环境对应的测试程序，比如 benchmark://cbench-v1/crc32
     */
    virtual std::string benchmark() const = 0;

    /**
     * @brief 将环境重置为原始的、没有经过任何变换的测试程序
     * @param benchmark 要重置到的测试程序
     */
    virtual void reset(const std::string &benchmark) = 0;

    /**
     * @brief 将当前状态序列化为 bitcode 文件
     * @param path bitcode 文件的保存路径
     */
    virtual void write_bitcode(const std::filesystem::path &path) = 0;

    /**
     * @brief 创建一个独立的环境副本，副本的修改不会影响当前环境
     * 调用方负责在用完后调用副本的 close
     */
    virtual std::unique_ptr<environment> fork() = 0;

    /**
     * @brief 释放环境占用的资源
     */
    virtual void close() = 0;

    /**
     * @brief 环境的工作目录，验证器会在其中创建临时目录
     */
    virtual std::filesystem::path working_dir() const = 0;
};

}  // namespace difftest
