#include "registry/registry.hpp"
#include <boost/algorithm/string.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "validation/checkers.hpp"

namespace difftest {
using namespace std;
namespace fs = std::filesystem;

void from_json(const nlohmann::json &j, validator_spec &spec) {
    j.at("benchmark").get_to(spec.benchmark);
    j.at("cmd").get_to(spec.cmd);
    if (j.count("data")) j.at("data").get_to(spec.data);
    if (j.count("outs")) j.at("outs").get_to(spec.outs);
    if (j.count("platforms")) j.at("platforms").get_to(spec.platforms);
    if (j.count("compare_output")) j.at("compare_output").get_to(spec.compare_output);
    if (j.count("validate_result")) j.at("validate_result").get_to(spec.validate_result);
    if (j.count("linkopts")) j.at("linkopts").get_to(spec.linkopts);
    if (j.count("env")) j.at("env").get_to(spec.env);
    if (j.count("setup")) spec.setup = j.at("setup");
    if (j.count("sanitizers")) {
        vector<sanitizer> sanitizers;
        for (auto &name : j.at("sanitizers"))
            sanitizers.push_back(parse_sanitizer(name.get<string>()));
        spec.sanitizers = sanitizers;
    }
    if (j.count("flakiness")) j.at("flakiness").get_to(spec.flakiness);
    if (j.count("num_runs")) j.at("num_runs").get_to(spec.num_runs);
    if (j.count("retriable")) {
        for (auto &name : j.at("retriable"))
            spec.retriable.push_back(parse_error_kind(name.get<string>()));
    }
}

void to_json(nlohmann::json &j, const validator_result &result) {
    j = {{"sanitizer", to_string(result.san)}};
    if (result.error)
        j["error"] = *result.error;
    else
        j["ok"] = true;
}

/**
 * @brief 将 JSON 中所有字符串里的 {i} 替换为 i
 */
static nlohmann::json substitute_index(const nlohmann::json &j, const string &i) {
    if (j.is_string())
        return replace_all(j.get<string>(), "{i}", i);
    if (j.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        for (auto &elem : j)
            result.push_back(substitute_index(elem, i));
        return result;
    }
    if (j.is_object()) {
        nlohmann::json result = nlohmann::json::object();
        for (auto &[key, value] : j.items())
            result[key] = substitute_index(value, i);
        return result;
    }
    return j;
}

validator_registry::validator_registry(const fs::path &data_root, const string &platform)
    : data_root(data_root), platform(platform) {}

bool validator_registry::register_validator(const validator_spec &spec) {
    if (find(spec.platforms.begin(), spec.platforms.end(), platform) == spec.platforms.end())
        return false;

    validator_config config;
    config.benchmark = spec.benchmark;
    config.cmd = spec.cmd;
    config.linkopts = spec.linkopts;
    config.env = spec.env;
    config.input_files = spec.data;
    config.output_files = spec.outs;
    config.compare_output = spec.compare_output;
    if (!spec.validate_result.empty())
        config.validate_result = find_result_checker(spec.validate_result);
    if (!spec.setup.is_null())
        config.pre_execution = make_setup_hook(spec.setup);
    config.flakiness = spec.flakiness;
    config.num_runs = spec.num_runs;
    config.retriable = set<error_kind>(spec.retriable.begin(), spec.retriable.end());

    vector<validator_config> &configs = registered[spec.benchmark];
    configs.push_back(config);

    // sanitizer 只在 Linux 下可用
    if (platform == "linux") {
        for (sanitizer san : spec.sanitizers.value_or(all_sanitizers())) {
            if (san == sanitizer::NONE) continue;
            validator_config sanitized = config;
            sanitized.san = san;
            configs.push_back(sanitized);
        }
    }

    difftest::dynamic_config dynamic;
    dynamic.build_cmd.argument = {"$CC", "$IN"};
    dynamic.build_cmd.argument.insert(dynamic.build_cmd.argument.end(), spec.linkopts.begin(), spec.linkopts.end());
    dynamic.build_cmd.timeout_seconds = 60;
    dynamic.build_cmd.outfile = {"a.out"};

    string run_cmd = replace_all(replace_all(spec.cmd, "$BIN", "./a.out"), "$D", data_root.string());
    dynamic.run_cmd.argument = split_command(run_cmd);
    dynamic.run_cmd.timeout_seconds = 300;
    dynamic.run_cmd.infile = {"a.out", "_finfo_dataset"};
    dynamic.run_cmd.outfile = spec.outs;

    command pre_run;
    pre_run.argument = {"echo", "1", ">_finfo_dataset"};
    pre_run.timeout_seconds = 30;
    dynamic.pre_run_cmd = {pre_run};

    dynamic_configs[spec.benchmark] = dynamic;
    return true;
}

int validator_registry::load(const nlohmann::json &document) {
    int count = 0;
    for (auto &entry : document.at("validators")) {
        if (!entry.count("range")) {
            count += register_validator(entry.get<validator_spec>());
            continue;
        }

        auto range = entry.at("range").get<vector<int>>();
        if (range.size() != 2)
            throw invalid_argument("range must be [first, last]: " + entry.at("range").dump());
        nlohmann::json templ = entry;
        templ.erase("range");
        for (int i = range[0]; i <= range[1]; ++i)
            count += register_validator(substitute_index(templ, std::to_string(i)).get<validator_spec>());
    }
    return count;
}

int validator_registry::load_file(const fs::path &path) {
    if (fs::is_directory(path)) {
        vector<fs::path> files;
        for (auto &entry : fs::directory_iterator(path))
            if (entry.path().extension() == ".json")
                files.push_back(entry.path());
        sort(files.begin(), files.end());

        int count = 0;
        for (auto &file : files)
            count += load_file(file);
        return count;
    }

    ifstream fin(path);
    if (!fin)
        throw file_not_found_error("Unable to open validator config " + path.string());

    nlohmann::json document;
    fin >> document;
    int count = load(document);
    LOG(INFO) << "Registered " << count << " validators from " << path;
    return count;
}

const vector<validator_config> &validator_registry::validators(const string &benchmark) const {
    static const vector<validator_config> empty;
    auto it = registered.find(benchmark);
    return it == registered.end() ? empty : it->second;
}

optional<dynamic_config> validator_registry::get_dynamic_config(const string &benchmark) const {
    auto it = dynamic_configs.find(benchmark);
    if (it == dynamic_configs.end()) return nullopt;
    return it->second;
}

vector<validator_result> validator_registry::validate(const string &benchmark, environment &env, runtime_data &data) const {
    vector<validator_result> results;
    for (auto &config : validators(benchmark)) {
        LOG(INFO) << fmt::format("Validating {} [sanitizer={}]: {}", benchmark, to_string(config.san), config.cmd);
        validator_result result;
        result.san = config.san;
        try {
            result.error = difftest::validate(config, env, data);
        } catch (file_not_found_error &ex) {
            // 缺少输入数据或标准程序没有生成输出文件，重试没有意义，直接记为本验证器的结果
            result.error = validation_error(error_kind::FILE_NOT_FOUND, {{"message", ex.what()}});
        }
        if (result.error)
            LOG(WARNING) << "Validation of " << benchmark << " failed: " << *result.error;
        results.push_back(result);
    }
    return results;
}

vector<string> validator_registry::benchmarks() const {
    vector<string> result;
    for (auto &[benchmark, configs] : registered)
        result.push_back(benchmark);
    return result;
}

}  // namespace difftest
