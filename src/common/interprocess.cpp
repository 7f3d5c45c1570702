#include "common/interprocess.hpp"
#include <fstream>

namespace difftest {
namespace fs = std::filesystem;
namespace ip = boost::interprocess;

ip::file_lock open_file_lock(const fs::path &lock_file) {
    fs::create_directories(lock_file.parent_path());
    if (fs::is_directory(lock_file))
        fs::remove_all(lock_file);
    std::ofstream create_lock_file(lock_file, std::ios::app);
    return ip::file_lock(lock_file.c_str());
}

}  // namespace difftest
