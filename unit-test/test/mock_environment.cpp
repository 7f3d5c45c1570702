#include "test/mock_environment.hpp"

namespace difftest::test {
using namespace std;
using ::testing::_;
using ::testing::Invoke;

mock_environment::mock_environment(const string &name,
                                   const filesystem::path &original,
                                   const filesystem::path &current,
                                   const filesystem::path &workdir)
    : real(name, original, current, workdir) {
    ON_CALL(*this, benchmark()).WillByDefault(Invoke(&real, &bitcode_environment::benchmark));
    ON_CALL(*this, reset(_)).WillByDefault(Invoke(&real, &bitcode_environment::reset));
    ON_CALL(*this, write_bitcode(_)).WillByDefault(Invoke(&real, &bitcode_environment::write_bitcode));
    ON_CALL(*this, fork()).WillByDefault(Invoke(&real, &bitcode_environment::fork));
    ON_CALL(*this, close()).WillByDefault(Invoke(&real, &bitcode_environment::close));
    ON_CALL(*this, working_dir()).WillByDefault(Invoke(&real, &bitcode_environment::working_dir));
}

}  // namespace difftest::test
