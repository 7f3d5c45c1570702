#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace difftest {

struct difftest_exception : std::exception {
    difftest_exception();
    explicit difftest_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const difftest_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示验证器本身的内部错误
 * 一般是程序逻辑出错，比如编译前可执行文件已经存在，或者编译器返回成功但没有生成可执行文件
 */
struct internal_error : public difftest_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示验证所需的文件不存在
 * 比如运行时数据目录中缺少输入文件，或者标准程序没有生成期望的输出文件。
 * 这是环境配置问题，不会被重试。
 */
struct file_not_found_error : public difftest_exception {
    explicit file_not_found_error(const std::string &message);
};

/**
 * @brief 表示执行环境（编译器服务）响应超时
 * 与程序运行超时不同，这个异常由环境层抛出，验证循环会重试
 */
struct environment_timeout : public difftest_exception {
    environment_timeout();
    explicit environment_timeout(const std::string &message);
};

}  // namespace difftest
