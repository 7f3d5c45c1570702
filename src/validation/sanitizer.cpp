#include "validation/sanitizer.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/assign/list_of.hpp>
#include <map>
#include <stdexcept>

namespace difftest {
using namespace std;

const vector<sanitizer> &all_sanitizers() {
    static const vector<sanitizer> sanitizers = {sanitizer::ASAN, sanitizer::TSAN, sanitizer::MSAN, sanitizer::UBSAN};
    return sanitizers;
}

// clang-format off
static const map<sanitizer, vector<string>> flags = boost::assign::map_list_of
    (sanitizer::NONE, vector<string>{})
    (sanitizer::ASAN, vector<string>{"-O1", "-g", "-fsanitize=address", "-fno-omit-frame-pointer"})
    (sanitizer::TSAN, vector<string>{"-O1", "-g", "-fsanitize=thread"})
    (sanitizer::MSAN, vector<string>{"-O1", "-g", "-fsanitize=memory"})
    (sanitizer::UBSAN, vector<string>{"-fsanitize=undefined"});

static const map<sanitizer, string> names = boost::assign::map_list_of
    (sanitizer::NONE, "none")
    (sanitizer::ASAN, "asan")
    (sanitizer::TSAN, "tsan")
    (sanitizer::MSAN, "msan")
    (sanitizer::UBSAN, "ubsan");
// clang-format on

const vector<string> &sanitizer_flags(sanitizer san) {
    return flags.at(san);
}

string to_string(sanitizer san) {
    return names.at(san);
}

sanitizer parse_sanitizer(const string &name) {
    string lower = boost::algorithm::to_lower_copy(name);
    for (auto &[san, san_name] : names)
        if (san_name == lower) return san;
    throw invalid_argument("unrecognized sanitizer " + name);
}

}  // namespace difftest
