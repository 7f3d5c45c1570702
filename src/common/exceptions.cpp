#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace difftest {
using namespace std;

difftest_exception::difftest_exception()
    : difftest_exception("") {}

difftest_exception::difftest_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *difftest_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const difftest_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : difftest_exception() {}

internal_error::internal_error(const string &message)
    : difftest_exception(message) {}

file_not_found_error::file_not_found_error(const string &message)
    : difftest_exception(message) {}

environment_timeout::environment_timeout()
    : difftest_exception("environment timeout") {}

environment_timeout::environment_timeout(const string &message)
    : difftest_exception(message) {}

}  // namespace difftest
