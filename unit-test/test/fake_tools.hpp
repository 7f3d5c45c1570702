#pragma once

#include <filesystem>
#include <string>

/**
 * 测试用的编译器和解释器
 * 测试中的 "bitcode" 实际上是 shell 脚本：
 * 1. 假的 lli 使用 /bin/sh 执行 bitcode
 * 2. 假的 clang 将 bitcode 拷贝为可执行文件，每次调用都会在计数文件中追加一行
 *    若 bitcode 中包含 COMPILE_ERROR，编译失败；包含 COMPILE_HANG，编译卡住
 * 被测程序运行时 PATH 只包含 lli 所在目录，因此脚本只能使用 shell 内置命令或者绝对路径。
 */
namespace difftest::test {

/**
 * @brief 创建一个空的测试目录 /tmp/difftest-test/<name>
 */
std::filesystem::path make_test_dir(const std::string &name);

/**
 * @brief 写入一个可执行的脚本
 */
void write_script(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 在 root 下安装假的 clang 和 lli，并修改 CLANG_PATH、LLI_PATH 等全局配置
 */
void setup_test_environment(const std::filesystem::path &root);

/**
 * @brief 假的 clang 被调用的次数
 */
int count_compilations(const std::filesystem::path &root);

}  // namespace difftest::test
