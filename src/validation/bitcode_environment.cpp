#include "validation/bitcode_environment.hpp"
#include "common/exceptions.hpp"

namespace difftest {
using namespace std;
namespace fs = std::filesystem;

bitcode_environment::bitcode_environment(const string &benchmark,
                                         const fs::path &original,
                                         const fs::path &current,
                                         const fs::path &workdir)
    : benchmark_name(benchmark), original(original), current(current), workdir(workdir) {}

string bitcode_environment::benchmark() const {
    return benchmark_name;
}

void bitcode_environment::reset(const string &benchmark) {
    assert_open();
    if (benchmark != benchmark_name)
        throw internal_error("unknown benchmark " + benchmark);
    current = original;
}

void bitcode_environment::write_bitcode(const fs::path &path) {
    assert_open();
    if (!fs::is_regular_file(current))
        throw file_not_found_error("bitcode file not found: " + current.string());
    fs::copy_file(current, path, fs::copy_options::overwrite_existing);
}

unique_ptr<environment> bitcode_environment::fork() {
    assert_open();
    return make_unique<bitcode_environment>(*this);
}

void bitcode_environment::close() {
    closed = true;
}

fs::path bitcode_environment::working_dir() const {
    return workdir;
}

void bitcode_environment::assert_open() const {
    if (closed) throw internal_error("environment has been closed");
}

}  // namespace difftest
