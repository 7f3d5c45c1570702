#include "validation/execution_result.hpp"

namespace difftest {
using namespace nlohmann;

void to_json(json &j, const execution_result &result) {
    j = json::object();
    j["walltime_seconds"] = result.walltime_seconds;
    j["error"] = result.error ? json(*result.error) : json(nullptr);
    j["output"] = result.output ? json(*result.output) : json(nullptr);
}

}  // namespace difftest
