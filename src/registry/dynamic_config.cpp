#include "registry/dynamic_config.hpp"

namespace difftest {
using namespace std;

void to_json(nlohmann::json &j, const command &cmd) {
    j = {{"argument", cmd.argument},
         {"timeout_seconds", cmd.timeout_seconds},
         {"infile", cmd.infile},
         {"outfile", cmd.outfile}};
}

void from_json(const nlohmann::json &j, command &cmd) {
    j.at("argument").get_to(cmd.argument);
    j.at("timeout_seconds").get_to(cmd.timeout_seconds);
    if (j.count("infile")) j.at("infile").get_to(cmd.infile);
    if (j.count("outfile")) j.at("outfile").get_to(cmd.outfile);
}

void to_json(nlohmann::json &j, const dynamic_config &config) {
    j = {{"build_cmd", config.build_cmd},
         {"run_cmd", config.run_cmd},
         {"pre_run_cmd", config.pre_run_cmd}};
}

void from_json(const nlohmann::json &j, dynamic_config &config) {
    j.at("build_cmd").get_to(config.build_cmd);
    j.at("run_cmd").get_to(config.run_cmd);
    if (j.count("pre_run_cmd")) j.at("pre_run_cmd").get_to(config.pre_run_cmd);
}

}  // namespace difftest
