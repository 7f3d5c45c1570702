#include "validation/validator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/subprocess.hpp"
#include "common/utils.hpp"
#include "validation/bench_runner.hpp"
#include "validation/flakiness.hpp"
#include "validation/gold_standard.hpp"

namespace difftest {
using namespace std;
namespace fs = std::filesystem;

static const char *const GOLD_STANDARD_SUFFIX = ".gold_standard";

static fs::path gold_standard_path(const fs::path &path) {
    return fs::path(path.string() + GOLD_STANDARD_SUFFIX);
}

/**
 * @brief 使用 diff 比较被测程序和标准程序生成的输出文件
 * @return 文件一致返回 nullopt，否则返回 WRONG_OUTPUT_FILE
 */
static optional<validation_error> diff_output_file(const string &name, const fs::path &cwd, const validator_config &config) {
    fs::path path = cwd / name;
    process_result diff = run_process(
        {DIFF_PATH.string(), path.string(), gold_standard_path(path).string()},
        cwd, {{"PATH", get_env("PATH", "/usr/bin:/bin")}}, config.timeout, KILL_GRACE_PERIOD);
    if (diff.timed_out) {
        return validation_error(error_kind::WRONG_OUTPUT_FILE,
                                {{"path", name}, {"diff", "diff timed out"}});
    }
    if (diff.exitcode != 0) {
        return validation_error(error_kind::WRONG_OUTPUT_FILE,
                                {{"path", name}, {"diff", decode_output(diff.output)}});
    }
    return nullopt;
}

optional<validation_error> validate_once(const validator_config &config, environment &env, runtime_data &data) {
    data.ensure_installed();
    const fs::path &data_root = data.path();

    for (auto &input : config.input_files) {
        fs::path path = data_root / assert_safe_path(input);
        if (!fs::exists(path))
            throw file_not_found_error("Required benchmark input not found: " + path.string());
    }

    fs::path cwd = create_scratch_directory(env.working_dir());
    defer {
        if (DEBUG) {
            LOG(INFO) << "Keeping scratch directory " << cwd << " of " << config.benchmark;
            return;
        }
        error_code ec;
        fs::remove_all(cwd, ec);
        if (ec) LOG(WARNING) << "unable to remove scratch directory " << cwd << ": " << ec.message();
    };

    if (config.pre_execution)
        config.pre_execution(cwd, data_root);

    string cmd = replace_all(config.cmd, "$D", data_root.string());

    run_options opt;
    opt.linkopts = config.linkopts;
    opt.env = config.env;
    opt.num_runs = config.num_runs;
    opt.san = config.san;
    opt.timeout = config.timeout;
    opt.compile_timeout = config.compile_timeout;

    optional<execution_result> gold_standard;
    if (config.compare_output || !config.output_files.empty()) {
        gold_standard = reference_run(env, cmd, cwd, opt);
        if (gold_standard->error) return gold_standard->error;

        for (auto &name : config.output_files) {
            fs::path path = cwd / assert_safe_path(name);
            if (!fs::exists(path)) {
                throw file_not_found_error(fmt::format(
                    "Expected file '{}' not generated\nBenchmark: {}\nCommand: {}\nOutput: {}",
                    name, config.benchmark, cmd, gold_standard->output.value_or("")));
            }
            fs::rename(path, gold_standard_path(path));
        }
    }

    env.write_bitcode(cwd / "benchmark.bc");
    execution_result outcome = compile_and_run_bitcode(cwd / "benchmark.bc", cmd, cwd, opt);
    if (outcome.error) return outcome.error;

    if (config.validate_result) {
        if (optional<string> diagnostic = config.validate_result(outcome)) {
            return validation_error(error_kind::INVALID_RESULT,
                                    {{"diagnostic", *diagnostic}, {"output", outcome.output.value_or("")}});
        }
    }

    if (config.compare_output && gold_standard && gold_standard->output != outcome.output) {
        return validation_error(error_kind::WRONG_OUTPUT,
                                {{"expected", gold_standard->output.value_or("")},
                                 {"actual", outcome.output.value_or("")}});
    }

    for (auto &name : config.output_files) {
        fs::path path = cwd / name;
        if (!fs::exists(path)) {
            return validation_error(error_kind::OUTPUT_NOT_GENERATED,
                                    {{"path", name}, {"command", cmd}});
        }
        if (auto error = diff_output_file(name, cwd, config))
            return error;
    }

    return nullopt;
}

optional<validation_error> validate(const validator_config &config, environment &env, runtime_data &data) {
    return retry_flaky([&]() { return validate_once(config, env, data); },
                       config.flakiness, config.retriable);
}

}  // namespace difftest
