#pragma once

#include <functional>
#include <optional>
#include <set>
#include "validation/error.hpp"

namespace difftest {

/**
 * @brief 一次验证尝试
 * @return 验证通过返回 nullopt，否则返回错误
 * @throw environment_timeout 环境没有及时响应，可以重试
 */
using validation_attempt = std::function<std::optional<validation_error>()>;

/**
 * @brief 重试不稳定的验证
 * 最多调用 attempt max(flakiness, 1) 次，一旦验证通过立即返回。
 * 环境超时（environment_timeout）总是会重试，其他异常直接抛出。
 *
 * @param attempt 验证函数
 * @param flakiness 最多尝试的次数
 * @param retriable 可以重试的错误类型，为空表示所有错误都可以重试
 * @return 验证通过返回 nullopt，否则返回最后一次尝试的错误。
 * 若每次尝试都是环境超时，返回 EXECUTION_TIMEOUT 错误
 */
std::optional<validation_error> retry_flaky(const validation_attempt &attempt,
                                            int flakiness,
                                            const std::set<error_kind> &retriable = {});

}  // namespace difftest
