#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "registry/registry.hpp"
#include "validation/bitcode_environment.hpp"
#include "validation/runtime_data.hpp"
using namespace std;

static const int EXIT_VALIDATION_FAILED = 1;
static const int EXIT_SETUP_ERROR = 2;

/**
 * @brief 路径参数：优先使用命令行参数，其次使用环境变量
 * @return 两者都没有设置时返回 false，不修改 target
 */
static bool path_option(const boost::program_options::variables_map &vm, const char *option, const char *env, filesystem::path &target) {
    if (vm.count(option)) {
        target = filesystem::path(vm.at(option).as<string>());
        return true;
    } else if (getenv(env)) {
        target = filesystem::path(getenv(env));
        return true;
    }
    return false;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("difftest options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>()->required(), "validator registrations, a json file or a directory of json files")
        ("benchmark", po::value<string>()->required(), "uri of the benchmark to validate, for example benchmark://cbench-v1/crc32")
        ("original", po::value<string>(), "bitcode of the unmodified benchmark, producing the gold standard")
        ("candidate", po::value<string>(), "bitcode of the transformed benchmark to validate")
        ("runtime-data", po::value<string>(), "set the runtime data directory referenced by $D. You can either pass it from environ RUNTIMEDATADIR")
        ("runtime-archive", po::value<string>(), "tar archive to extract the runtime data from when the runtime data directory is not prepared")
        ("cache-dir", po::value<string>(), "set the directory to store the runtime data lock. You can either pass it from environ CACHEDIR")
        ("work-dir", po::value<string>(), "set the directory to create scratch directories in, default to /tmp. You can either pass it from environ WORKDIR")
        ("clang", po::value<string>(), "path of clang, used to compile sanitized binaries. You can either pass it from environ CLANG")
        ("lli", po::value<string>(), "path of lli, used to interpret unsanitized bitcode. You can either pass it from environ LLI")
        ("diff", po::value<string>(), "path of diff, used to compare output files")
        ("compile-timeout", po::value<double>(), "set compilation time limit in seconds, default to 60")
        ("run-timeout", po::value<double>(), "set execution time limit in seconds, default to 300")
        ("flakiness", po::value<int>(), "set the maximum number of attempts of each validator, default to 5")
        ("dump-dynamic-config", "print the dynamic config of the benchmark and exit")
        ("debug", "turn on the debug mode to keep scratch directories for inspection. You can either pass it from environ DEBUG")
        ("help", "display this help text");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "difftest: check that a transformed benchmark behaves like the original one" << endl
                 << "Usage: " << argv[0] << " --config <path> --benchmark <uri> --original <bc> --candidate <bc> [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_SETUP_ERROR;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        difftest::DEBUG = true;
    }

    path_option(vm, "clang", "CLANG", difftest::CLANG_PATH);
    path_option(vm, "lli", "LLI", difftest::LLI_PATH);
    if (vm.count("diff"))
        difftest::DIFF_PATH = filesystem::path(vm.at("diff").as<string>());

    if (!path_option(vm, "runtime-data", "RUNTIMEDATADIR", difftest::RUNTIME_DATA_DIR)) {
        LOG(ERROR) << "Runtime data directory should be specified by --runtime-data or RUNTIMEDATADIR";
        return EXIT_SETUP_ERROR;
    }
    if (!path_option(vm, "cache-dir", "CACHEDIR", difftest::CACHE_DIR)) {
        difftest::CACHE_DIR = difftest::RUNTIME_DATA_DIR.parent_path();
    }
    path_option(vm, "work-dir", "WORKDIR", difftest::WORK_DIR);
    if (!filesystem::is_directory(difftest::WORK_DIR)) {
        LOG(ERROR) << "Work directory " << difftest::WORK_DIR << " does not exist";
        return EXIT_SETUP_ERROR;
    }

    if (vm.count("compile-timeout"))
        difftest::COMPILE_TIMEOUT = vm.at("compile-timeout").as<double>();
    if (vm.count("run-timeout"))
        difftest::RUN_TIMEOUT = vm.at("run-timeout").as<double>();
    if (vm.count("flakiness"))
        difftest::DEFAULT_FLAKINESS = vm.at("flakiness").as<int>();

    string benchmark = vm.at("benchmark").as<string>();

    try {
        // 注册的验证器会读取上面设置的默认时间限制和重试次数
        difftest::validator_registry registry(difftest::RUNTIME_DATA_DIR);
        registry.load_file(vm.at("config").as<string>());

        if (vm.count("dump-dynamic-config")) {
            auto dynamic = registry.get_dynamic_config(benchmark);
            if (!dynamic) {
                LOG(ERROR) << "No validator registered for " << benchmark;
                return EXIT_SETUP_ERROR;
            }
            cout << nlohmann::json(*dynamic).dump(4) << endl;
            return EXIT_SUCCESS;
        }

        if (!vm.count("original") || !vm.count("candidate")) {
            LOG(ERROR) << "--original and --candidate are required to validate " << benchmark;
            return EXIT_SETUP_ERROR;
        }
        if (registry.validators(benchmark).empty()) {
            LOG(ERROR) << "No validator registered for " << benchmark;
            return EXIT_SETUP_ERROR;
        }

        difftest::runtime_data::installer install;
        if (vm.count("runtime-archive"))
            install = difftest::archive_installer(vm.at("runtime-archive").as<string>());
        difftest::runtime_data data(difftest::RUNTIME_DATA_DIR, difftest::CACHE_DIR / ".runtime-data.LOCK", install);

        difftest::bitcode_environment env(benchmark,
                                          vm.at("original").as<string>(),
                                          vm.at("candidate").as<string>(),
                                          difftest::WORK_DIR);
        defer { env.close(); };
        auto results = registry.validate(benchmark, env, data);

        bool passed = true;
        for (auto &result : results)
            if (result.error) passed = false;

        nlohmann::json report = {{"benchmark", benchmark}, {"results", results}};
        cout << report.dump(4) << endl;
        return passed ? EXIT_SUCCESS : EXIT_VALIDATION_FAILED;
    } catch (difftest::difftest_exception &ex) {
        LOG(ERROR) << "Unable to validate " << benchmark << ": " << ex;
        return EXIT_SETUP_ERROR;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to validate " << benchmark << ": " << boost::diagnostic_information(ex);
        return EXIT_SETUP_ERROR;
    }
}
