#include "common/utils.hpp"
#include <boost/algorithm/string.hpp>
#include <cstdlib>

namespace difftest {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string replace_all(string text, const string &from, const string &to) {
    boost::algorithm::replace_all(text, from, to);
    return text;
}

vector<string> split_command(const string &command) {
    vector<string> tokens;
    string trimmed = boost::algorithm::trim_copy(command);
    if (trimmed.empty()) return tokens;
    boost::algorithm::split(tokens, trimmed, boost::is_any_of(" \t\n"), boost::token_compress_on);
    return tokens;
}

string current_platform() {
#if defined(__APPLE__)
    return "macos";
#else
    return "linux";
#endif
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace difftest
