#pragma once

#include <filesystem>

namespace difftest {

/**
 * @brief 编译器路径，开启 sanitizer 时用于将 bitcode 编译为可执行文件
 * 调用编译器时，编译器所在目录会加到 PATH 的最前面
 */
extern std::filesystem::path CLANG_PATH;

/**
 * @brief LLVM 解释器路径
 * 不开启 sanitizer 时，直接通过解释器运行 bitcode，避免编译
 */
extern std::filesystem::path LLI_PATH;

/**
 * @brief diff 工具的路径，用于比较输出文件
 */
extern std::filesystem::path DIFF_PATH;

/**
 * @brief 存放运行时数据的根目录，命令模板中的 $D 会被替换为这个目录
 *
 * RUNTIME_DATA_DIR
 * ├── unpacked // 标记文件，表示数据已经完整解压
 * ├── office_data
 * │   ├── 1.txt
 * │   └── ...
 * ├── telecom_data
 * └── ...
 */
extern std::filesystem::path RUNTIME_DATA_DIR;

/**
 * @brief 缓存目录，存放跨进程的锁文件
 */
extern std::filesystem::path CACHE_DIR;

/**
 * @brief 临时工作目录的根目录
 * 每次验证都会在该目录下创建一个随机命名的临时文件夹
 *
 * WORK_DIR
 * ├── difftest-6f1c... // 一次验证的临时目录
 * │   ├── _finfo_dataset // 测试程序的迭代次数
 * │   ├── benchmark.bc // 序列化的 bitcode
 * │   ├── a.out // 开启 sanitizer 时编译出来的可执行文件
 * │   ├── output.txt // 被测程序的输出文件
 * │   └── output.txt.gold_standard // 标准程序的输出文件
 * └── ...
 */
extern std::filesystem::path WORK_DIR;

/**
 * @brief 编译时间限制，单位为秒
 */
extern double COMPILE_TIMEOUT;

/**
 * @brief 运行时间限制，单位为秒
 */
extern double RUN_TIMEOUT;

/**
 * @brief 超时后等待进程退出的时间，单位为秒
 */
extern double KILL_GRACE_PERIOD;

/**
 * @brief 默认的重试次数
 */
extern int DEFAULT_FLAKINESS;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，验证结束后不会删除临时目录，以便手动检查生成的文件
 */
extern bool DEBUG;

}  // namespace difftest
