#include "validation/classifier.hpp"

namespace difftest {
using namespace std;

static bool contains(const string &output, const char *marker) {
    return output.find(marker) != string::npos;
}

static error_kind classify(sanitizer san, const string &output) {
    if (san == sanitizer::ASAN && contains(output, "LeakSanitizer"))
        return error_kind::MEMORY_LEAK;
    if (san == sanitizer::ASAN && contains(output, "AddressSanitizer"))
        return error_kind::MEMORY_ERROR;
    if (san == sanitizer::MSAN && contains(output, "MemorySanitizer"))
        return error_kind::MEMORY_ERROR;
    if (contains(output, "Segmentation fault"))
        return error_kind::SEGMENTATION_FAULT;
    if (contains(output, "Illegal Instruction"))
        return error_kind::ILLEGAL_INSTRUCTION;
    return error_kind::RUNTIME_ERROR;
}

validation_error classify_runtime_error(int exitcode, sanitizer san, const string &output, nlohmann::json data) {
    data["return_code"] = exitcode;
    data["output"] = output;
    return validation_error(classify(san, output), move(data), exitcode);
}

}  // namespace difftest
