#pragma once

#include <string>
#include "validation/error.hpp"
#include "validation/sanitizer.hpp"

namespace difftest {

/**
 * @brief 根据返回值和程序输出判断运行时错误的类型
 * 按以下顺序匹配，先匹配到的优先：
 * 1. ASAN 且输出包含 LeakSanitizer：MEMORY_LEAK
 * 2. ASAN 且输出包含 AddressSanitizer：MEMORY_ERROR
 * 3. MSAN 且输出包含 MemorySanitizer：MEMORY_ERROR
 * 4. 输出包含 Segmentation fault：SEGMENTATION_FAULT
 * 5. 输出包含 Illegal Instruction：ILLEGAL_INSTRUCTION
 * 6. 其他情况：RUNTIME_ERROR
 * sanitizer 报告的错误中也可能包含段错误的信息，因此 sanitizer 的规则要先于信号的规则匹配。
 *
 * @param exitcode 程序的返回值，必须非零
 * @param san 程序运行时开启的 sanitizer
 * @param output 程序的输出
 * @param data 错误的诊断信息，会额外加入 return_code 和 output
 */
validation_error classify_runtime_error(int exitcode, sanitizer san, const std::string &output, nlohmann::json data = nlohmann::json::object());

}  // namespace difftest
