#include "validation/gold_standard.hpp"
#include <glog/logging.h>
#include "common/defer.hpp"

namespace difftest {
using namespace std;
namespace fs = std::filesystem;

execution_result reference_run(environment &env,
                               const string &cmd,
                               const fs::path &cwd,
                               const run_options &opt) {
    unique_ptr<environment> gs_env = env.fork();
    defer { gs_env->close(); };

    gs_env->reset(env.benchmark());
    gs_env->write_bitcode(cwd / "benchmark.bc");

    run_options gs_opt = opt;
    gs_opt.linkopts.push_back("-O2");
    gs_opt.san = sanitizer::NONE;
    gs_opt.num_runs = 1;

    execution_result gold_standard = compile_and_run_bitcode(cwd / "benchmark.bc", cmd, cwd, gs_opt);
    if (gold_standard.error) {
        LOG(WARNING) << "Gold standard of " << env.benchmark() << " failed: " << gold_standard.error->type();
        gold_standard.error = gold_standard.error->as_gold_standard();
    }
    return gold_standard;
}

}  // namespace difftest
