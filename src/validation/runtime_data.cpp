#include "validation/runtime_data.hpp"
#include <glog/logging.h>
#include <fstream>
#include <map>
#include <mutex>
#include "common/exceptions.hpp"
#include "common/interprocess.hpp"
#include "common/io_utils.hpp"
#include "common/subprocess.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace difftest {
using namespace std;
namespace fs = std::filesystem;
namespace ip = boost::interprocess;

// 防止同一进程内多个线程同时准备数据，与文件锁配合使用，两者缺一不可：
// 文件锁只能保证进程间互斥
static recursive_mutex install_mutex;

runtime_data::runtime_data(const fs::path &data_dir, const fs::path &lock_file, installer install)
    : data_dir(data_dir), lock_file(lock_file), install(move(install)) {}

const fs::path &runtime_data::path() const {
    return data_dir;
}

fs::path runtime_data::marker() const {
    return data_dir / "unpacked";
}

bool runtime_data::is_installed() const {
    return fs::is_regular_file(marker());
}

bool runtime_data::ensure_installed() {
    if (is_installed()) return false;

    // 没有 installer 时，数据目录由外部准备，只要求目录存在
    if (!install) {
        if (fs::is_directory(data_dir)) return false;
        throw file_not_found_error("runtime data directory not found: " + data_dir.string());
    }

    scoped_lock thread_guard(install_mutex);
    ip::file_lock file_lock = open_file_lock(lock_file);
    ip::scoped_lock<ip::file_lock> process_guard(file_lock);

    // 等待锁的过程中其他进程可能已经完成了准备
    if (is_installed()) return false;

    // 清理上次没有完成的准备
    if (fs::exists(data_dir)) {
        LOG(WARNING) << "Removing partially installed runtime data " << data_dir;
        fs::remove_all(data_dir);
    }
    fs::create_directories(data_dir.parent_path());

    LOG(INFO) << "Installing runtime data into " << data_dir;
    install(data_dir);

    if (!fs::is_directory(data_dir))
        throw internal_error("runtime data installer did not create " + data_dir.string());

    ofstream touch(marker());
    if (!touch)
        throw internal_error("unable to create marker file " + marker().string());
    return true;
}

runtime_data::installer archive_installer(const fs::path &archive) {
    return [archive](const fs::path &data_dir) {
        if (!fs::is_regular_file(archive))
            throw file_not_found_error("runtime data archive not found: " + archive.string());

        map<string, string> env = {{"PATH", get_env("PATH", "/usr/bin:/bin")}};
        process_result extract = run_process({"tar", "-xf", archive.string(), "-C", data_dir.parent_path().string()},
                                             data_dir.parent_path(), env, 3600, KILL_GRACE_PERIOD);
        if (extract.timed_out || extract.exitcode != 0)
            throw internal_error("unable to extract " + archive.string() + ": " + decode_output(extract.output));
    };
}

}  // namespace difftest
