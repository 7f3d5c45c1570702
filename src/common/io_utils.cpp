#include "common/io_utils.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace difftest {
using namespace std;
namespace fs = std::filesystem;

const char *const BINARY_OUTPUT = "<binary>";

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string() + " for writing");
    fout << content;
}

bool utf8_check_is_valid(const string &string) {
    size_t i = 0, ix = string.length();
    while (i < ix) {
        unsigned char c = string[i];
        size_t n;
        unsigned char lo = 0x80, hi = 0xBF;  // 第一个后续字节的取值范围
        if (c <= 0x7F) {
            n = 0;
        } else if (0xC2 <= c && c <= 0xDF) {
            n = 1;  // C0、C1 只能构成超长编码
        } else if (c == 0xE0) {
            n = 2, lo = 0xA0;  // 超长的三字节编码
        } else if (c == 0xED) {
            n = 2, hi = 0x9F;  // U+D800 到 U+DFFF
        } else if (0xE1 <= c && c <= 0xEF) {
            n = 2;
        } else if (c == 0xF0) {
            n = 3, lo = 0x90;  // 超长的四字节编码
        } else if (c == 0xF4) {
            n = 3, hi = 0x8F;  // 大于 U+10FFFF
        } else if (0xF1 <= c && c <= 0xF3) {
            n = 3;
        } else {
            return false;
        }
        if (ix - i - 1 < n) return false;
        for (size_t j = 1; j <= n; j++) {
            unsigned char next = string[i + j];
            if (j == 1 ? (next < lo || next > hi) : (next & 0xC0) != 0x80)
                return false;
        }
        i += n + 1;
    }
    return true;
}

string decode_output(const string &bytes) {
    return utf8_check_is_valid(bytes) ? bytes : string(BINARY_OUTPUT);
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath == ".." || fs::path(subpath).is_absolute())
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

fs::path create_scratch_directory(const fs::path &parent) {
    fs::create_directories(parent);
    while (true) {
        fs::path dir = parent / ("difftest-" + boost::lexical_cast<string>(boost::uuids::random_generator()()));
        // create_directory 返回 false 表示目录已存在，换一个名字重试
        if (fs::create_directory(dir)) return dir;
    }
}

}  // namespace difftest
