#include "validation/checkers.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <glog/logging.h>
#include <map>
#include <regex>
#include <stdexcept>
#include "common/io_utils.hpp"

namespace difftest {
using namespace std;
namespace fs = std::filesystem;

optional<string> validate_sha_output(const execution_result &result) {
    static const regex pattern("[0-9a-f]{0,16} [0-9a-f]{0,16} [0-9a-f]{0,16} [0-9a-f]{0,16} [0-9a-f]{0,16}");

    string output = result.output.value_or("");
    if (output == BINARY_OUTPUT)
        return "Failed to parse unicode output";

    boost::algorithm::trim_right(output);
    if (!regex_search(output, pattern, regex_constants::match_continuous))
        return "Failed to parse hex output";
    return nullopt;
}

static const map<string, result_checker> checkers = boost::assign::map_list_of
    ("sha-hex-output", result_checker(validate_sha_output));

result_checker find_result_checker(const string &name) {
    auto it = checkers.find(name);
    if (it == checkers.end())
        throw invalid_argument("Unrecognized result checker: " + name);
    return it->second;
}

setup_hook copy_setup_hook(vector<copy_file> files, vector<copy_suffix> suffixes) {
    return [files = move(files), suffixes = move(suffixes)](const fs::path &cwd, const fs::path &data_root) {
        for (auto &file : files) {
            fs::path from = data_root / assert_safe_path(file.from);
            fs::path to = cwd / assert_safe_path(file.to.empty() ? fs::path(file.from).filename().string() : file.to);
            fs::copy_file(from, to, fs::copy_options::overwrite_existing);
        }

        for (auto &suffix : suffixes) {
            fs::path dir = data_root / assert_safe_path(suffix.directory);
            for (auto &entry : fs::directory_iterator(dir)) {
                string name = entry.path().filename().string();
                if (!boost::algorithm::ends_with(name, suffix.suffix)) continue;
                fs::copy_file(entry.path(), cwd / name, fs::copy_options::overwrite_existing);
            }
        }
        DLOG(INFO) << "Prepared scratch directory " << cwd;
    };
}

void from_json(const nlohmann::json &j, copy_file &file) {
    if (j.is_string()) {
        file.from = j.get<string>();
        file.to.clear();
    } else {
        j.at("from").get_to(file.from);
        file.to = j.count("to") ? j.at("to").get<string>() : "";
    }
}

void from_json(const nlohmann::json &j, copy_suffix &suffix) {
    j.at("directory").get_to(suffix.directory);
    j.at("suffix").get_to(suffix.suffix);
}

setup_hook make_setup_hook(const nlohmann::json &spec) {
    if (!spec.is_object())
        throw invalid_argument("Setup hook must be an object: " + spec.dump());

    vector<copy_file> files;
    vector<copy_suffix> suffixes;
    for (auto &[key, value] : spec.items()) {
        if (key == "copy")
            value.get_to(files);
        else if (key == "copy_suffix")
            value.get_to(suffixes);
        else
            throw invalid_argument("Unrecognized setup hook: " + key);
    }
    return copy_setup_hook(move(files), move(suffixes));
}

}  // namespace difftest
