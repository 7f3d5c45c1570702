#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = difftest::scoped_guard() + [&]

namespace difftest {

/**
 * @brief 作用域守卫，离开作用域时执行清理函数
 * 配合 defer 宏使用，用于在所有返回路径（包括异常）上释放临时目录、可执行文件、环境副本
 * @code{.cpp}
 *     auto fork = env.fork();
 *     defer { fork->close(); };
 * @endcode
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 取消清理函数，离开作用域时不再执行
     */
    void dismiss();
};

}  // namespace difftest
