#include "validation/bench_runner.hpp"
#include <glog/logging.h>
#include <system_error>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "common/subprocess.hpp"
#include "common/utils.hpp"
#include "validation/classifier.hpp"
#include "validation/compile.hpp"

namespace difftest {
using namespace std;
namespace fs = std::filesystem;

execution_result run_command(const string &command,
                             const fs::path &cwd,
                             const map<string, string> &env,
                             double timeout,
                             sanitizer san,
                             nlohmann::json error_data) {
    process_result proc = run_shell(command, cwd, env, timeout, KILL_GRACE_PERIOD);

    execution_result result;
    if (proc.timed_out) {
        error_data["timeout_seconds"] = timeout;
        result.walltime_seconds = timeout;
        result.error = validation_error(error_kind::EXECUTION_TIMEOUT, error_data);
        return result;
    }

    result.walltime_seconds = proc.wall_time;
    result.output = decode_output(proc.output);
    if (proc.exitcode != 0)
        result.error = classify_runtime_error(proc.exitcode, san, *result.output, error_data);
    return result;
}

/**
 * @brief 被测程序的基础环境变量，只保留临时目录和用户信息
 */
static map<string, string> make_run_env(const map<string, string> &overrides) {
    map<string, string> env = {
        {"TMPDIR", get_env("TMPDIR", "")},
        {"HOME", get_env("HOME", "")},
        {"USER", get_env("USER", "")}};
    for (auto &[key, value] : overrides)
        env[key] = value;
    return env;
}

execution_result compile_and_run_bitcode(const fs::path &bitcode,
                                         const string &cmd,
                                         const fs::path &cwd,
                                         const run_options &opt) {
    // 测试程序要求当前目录下存在 _finfo_dataset 文件，其内容为迭代次数
    write_file_content(cwd / "_finfo_dataset", std::to_string(opt.num_runs) + "\n");

    map<string, string> run_env = make_run_env(opt.env);
    nlohmann::json error_data = nlohmann::json::object();
    string run_cmd;
    fs::path binary = cwd / "a.out";

    // 编译失败时 clang 也可能留下不完整的可执行文件
    defer {
        if (opt.san == sanitizer::NONE) return;
        error_code ec;
        fs::remove(binary, ec);
        if (ec) LOG(WARNING) << "unable to remove " << binary << ": " << ec.message();
    };

    if (opt.san != sanitizer::NONE) {
        run_cmd = replace_all(cmd, "$BIN", "./a.out");
        error_data["run_cmd"] = run_cmd;
        compile_result compiled = compile_bitcode(bitcode, binary, opt.linkopts, opt.san, opt.compile_timeout, error_data);
        if (auto error = get_if<validation_error>(&compiled)) {
            execution_result result;
            result.walltime_seconds = opt.timeout;
            result.error = *error;
            return result;
        }
    } else {
        fs::path bitcode_arg = bitcode.parent_path() == cwd ? bitcode.filename() : bitcode;
        run_cmd = replace_all(cmd, "$BIN", LLI_PATH.filename().string() + " " + bitcode_arg.string());
        error_data["run_cmd"] = run_cmd;
        run_env["PATH"] = LLI_PATH.parent_path().string();
    }

    return run_command(run_cmd, cwd, run_env, opt.timeout, opt.san, error_data);
}

}  // namespace difftest
