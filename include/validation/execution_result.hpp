#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "validation/error.hpp"

namespace difftest {

/**
 * @brief 一次程序运行的结果
 * 若 error 为空，表示程序正常结束；无论是否出错，output 都可能有值
 */
struct execution_result {
    /**
     * @brief 运行时间，单位为秒
     * 若超时，为设定的时间限制，而不是实际等待的时间
     */
    double walltime_seconds = 0;

    std::optional<validation_error> error;

    /**
     * @brief 程序的 stdout 和 stderr 输出
     * 若输出不是合法的 UTF-8 文本，为 "<binary>"
     */
    std::optional<std::string> output;
};

void to_json(nlohmann::json &j, const execution_result &result);

}  // namespace difftest
