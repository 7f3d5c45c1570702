#pragma once

#include <string>
#include <vector>

namespace difftest {

/**
 * @brief LLVM 的运行时检查工具
 * 开启 sanitizer 时，bitcode 必须先编译为可执行文件，因为插桩是在编译期完成的。
 */
enum class sanitizer {
    NONE = 0,
    ASAN = 1,
    TSAN = 2,
    MSAN = 3,
    UBSAN = 4
};

/**
 * @brief 所有的 sanitizer（不包含 NONE），按注册顺序排列
 */
const std::vector<sanitizer> &all_sanitizers();

/**
 * @brief 开启 sanitizer 需要传给编译器的参数
 * 比如 ASAN 为 -O1 -g -fsanitize=address -fno-omit-frame-pointer
 */
const std::vector<std::string> &sanitizer_flags(sanitizer san);

/**
 * @brief sanitizer 的名称，为 none、asan、tsan、msan、ubsan 之一
 */
std::string to_string(sanitizer san);

/**
 * @brief 从名称解析 sanitizer，名称不区分大小写
 * @throw std::invalid_argument 若名称无法识别
 */
sanitizer parse_sanitizer(const std::string &name);

}  // namespace difftest
