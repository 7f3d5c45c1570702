#include "validation/error.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace difftest {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<error_kind, const char *> error_string = boost::assign::map_list_of
    (error_kind::COMPILATION_TIMEOUT, "Compilation timeout")
    (error_kind::COMPILATION_FAILED, "Compilation failed")
    (error_kind::EXECUTION_TIMEOUT, "Execution timeout")
    (error_kind::MEMORY_LEAK, "Memory leak")
    (error_kind::MEMORY_ERROR, "Memory error")
    (error_kind::SEGMENTATION_FAULT, "Segmentation fault")
    (error_kind::ILLEGAL_INSTRUCTION, "Illegal Instruction")
    (error_kind::RUNTIME_ERROR, "Runtime error")
    (error_kind::WRONG_OUTPUT, "Wrong output")
    (error_kind::WRONG_OUTPUT_FILE, "Wrong output (file)")
    (error_kind::OUTPUT_NOT_GENERATED, "Output not generated")
    (error_kind::FILE_NOT_FOUND, "File not found")
    (error_kind::INVALID_RESULT, "Invalid result");
// clang-format on

const char *get_display_message(error_kind kind) {
    return error_string.at(kind);
}

error_kind parse_error_kind(const string &name) {
    for (auto &[kind, display] : error_string)
        if (boost::algorithm::iequals(name, display))
            return kind;
    throw invalid_argument("unrecognized error kind " + name);
}

validation_error::validation_error(error_kind kind, json data, int return_code)
    : kind(kind), return_code(return_code), data(move(data)) {}

string validation_error::type() const {
    string message = kind == error_kind::RUNTIME_ERROR
                         ? fmt::format("{} ({})", get_display_message(kind), return_code)
                         : string(get_display_message(kind));
    return gold_standard ? "Gold standard: " + message : message;
}

validation_error validation_error::as_gold_standard() const {
    validation_error error = *this;
    error.gold_standard = true;
    return error;
}

ostream &operator<<(ostream &os, const validation_error &error) {
    return os << error.type() << ": " << error.data.dump();
}

void to_json(json &j, const validation_error &error) {
    j = {{"type", error.type()}, {"data", error.data}};
}

}  // namespace difftest
