#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace difftest {

/**
 * @brief 表示一次验证失败的类型
 */
enum class error_kind {
    /**
     * @brief 编译 bitcode 超出编译时间限制
     */
    COMPILATION_TIMEOUT = 0,

    /**
     * @brief 编译器返回了非零值
     */
    COMPILATION_FAILED = 1,

    /**
     * @brief 程序运行超出时间限制
     */
    EXECUTION_TIMEOUT = 2,

    /**
     * @brief AddressSanitizer 的 LeakSanitizer 报告了内存泄漏
     */
    MEMORY_LEAK = 3,

    /**
     * @brief AddressSanitizer 或 MemorySanitizer 报告了内存错误
     */
    MEMORY_ERROR = 4,

    /**
     * @brief 程序输出中包含段错误信息
     */
    SEGMENTATION_FAULT = 5,

    /**
     * @brief 程序输出中包含非法指令信息
     */
    ILLEGAL_INSTRUCTION = 6,

    /**
     * @brief 其他的运行时错误，返回值保存在 validation_error::return_code 中
     */
    RUNTIME_ERROR = 7,

    /**
     * @brief 程序的标准输出和标准程序的标准输出不一致
     */
    WRONG_OUTPUT = 8,

    /**
     * @brief 程序生成的输出文件和标准程序生成的输出文件不一致
     */
    WRONG_OUTPUT_FILE = 9,

    /**
     * @brief 程序没有生成期望的输出文件
     */
    OUTPUT_NOT_GENERATED = 10,

    /**
     * @brief 验证需要的文件不存在
     */
    FILE_NOT_FOUND = 11,

    /**
     * @brief 结果检查函数认为程序输出不合法
     */
    INVALID_RESULT = 12
};

const char *get_display_message(error_kind kind);

/**
 * @brief 根据显示名称查找错误类型，名称不区分大小写
 * @throw std::invalid_argument 若名称无法识别
 */
error_kind parse_error_kind(const std::string &name);

/**
 * @brief 表示一次验证失败
 * 在发现错误的位置创建，之后不再修改。
 * 若错误来自标准程序而不是被测程序，通过 as_gold_standard 生成一个带有 "Gold standard: " 前缀的新错误。
 */
struct validation_error {
    error_kind kind;

    /**
     * @brief 运行时错误的返回值，仅在 kind 为 RUNTIME_ERROR 时有意义
     */
    int return_code = 0;

    /**
     * @brief 错误是否来自标准程序的运行
     */
    bool gold_standard = false;

    /**
     * @brief 诊断信息，比如运行的命令、程序输出、diff 结果
     * @code{.json}
     * {"run_cmd": "lli benchmark.bc 512", "return_code": 1, "output": "..."}
     * @endcode
     */
    nlohmann::json data;

    explicit validation_error(error_kind kind, nlohmann::json data = nlohmann::json::object(), int return_code = 0);

    /**
     * @brief 错误类型的描述，比如 "Runtime error (1)"、"Gold standard: Wrong output"
     */
    std::string type() const;

    validation_error as_gold_standard() const;
};

std::ostream &operator<<(std::ostream &os, const validation_error &error);

void to_json(nlohmann::json &j, const validation_error &error);

}  // namespace difftest
