#include "validation/compile.hpp"
#include <glog/logging.h>
#include <map>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/subprocess.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace difftest {
using namespace std;
namespace fs = std::filesystem;

const vector<string> &platform_compile_args() {
#if defined(__APPLE__)
    static const vector<string> args = {"-L", "/Library/Developer/CommandLineTools/SDKs/MacOSX.sdk/usr/lib"};
#else
    static const vector<string> args;
#endif
    return args;
}

compile_result compile_bitcode(const fs::path &bitcode,
                               const fs::path &binary,
                               const vector<string> &linkopts,
                               sanitizer san,
                               double timeout,
                               nlohmann::json &error_data) {
    vector<string> compile_cmd;
    to_string_list(compile_cmd, CLANG_PATH, bitcode, "-o", binary, platform_compile_args(), linkopts, sanitizer_flags(san));
    error_data["compile_cmd"] = compile_cmd;

    if (fs::exists(binary))
        throw internal_error("binary already exists before compilation: " + binary.string());

    map<string, string> env;
    env["PATH"] = CLANG_PATH.parent_path().string() + ":" + get_env("PATH", "");

    process_result compile = run_process(compile_cmd, binary.parent_path(), env, timeout, KILL_GRACE_PERIOD);
    if (compile.timed_out) {
        error_data["timeout"] = timeout;
        return validation_error(error_kind::COMPILATION_TIMEOUT, error_data);
    }
    if (compile.exitcode != 0) {
        LOG(INFO) << "compilation failed with exitcode " << compile.exitcode;
        error_data["output"] = decode_output(compile.output);
        return validation_error(error_kind::COMPILATION_FAILED, error_data);
    }

    if (!fs::is_regular_file(binary))
        throw internal_error("compiler returned successfully but produced no binary: " + binary.string());
    return binary;
}

}  // namespace difftest
