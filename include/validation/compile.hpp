#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>
#include "validation/error.hpp"
#include "validation/sanitizer.hpp"

namespace difftest {

/**
 * @brief 编译结果：成功时为生成的可执行文件路径，失败时为编译错误
 */
using compile_result = std::variant<std::filesystem::path, validation_error>;

/**
 * @brief 当前平台编译时必须添加的参数
 * macOS 下需要指定 SDK 的库目录，Linux 下为空
 */
const std::vector<std::string> &platform_compile_args();

/**
 * @brief 调用 CLANG_PATH 将 bitcode 编译为带 sanitizer 插桩的可执行文件
 * 编译命令为 clang <bitcode> -o <binary> <平台参数> <linkopts> <sanitizer 参数>
 *
 * @param bitcode 要编译的 bitcode 文件
 * @param binary 生成的可执行文件路径，编译前必须不存在
 * @param linkopts 链接参数，比如 -lm
 * @param san 开启的 sanitizer
 * @param timeout 编译时间限制，单位为秒
 * @param error_data 诊断信息，会加入 compile_cmd，编译失败时会加入 timeout 或 output
 * @return 可执行文件路径，或者 COMPILATION_TIMEOUT、COMPILATION_FAILED 错误
 * @throw internal_error 若编译前 binary 已经存在，或者编译成功后 binary 不存在
 */
compile_result compile_bitcode(const std::filesystem::path &bitcode,
                               const std::filesystem::path &binary,
                               const std::vector<std::string> &linkopts,
                               sanitizer san,
                               double timeout,
                               nlohmann::json &error_data);

}  // namespace difftest
