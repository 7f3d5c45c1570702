#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/subprocess.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "test/fake_tools.hpp"
#include "validation/runtime_data.hpp"

using namespace std;
using namespace std::filesystem;
using namespace difftest;

class RuntimeDataTest : public ::testing::Test {
protected:
    path root, data_dir, lock_file;

    void SetUp() override {
        root = test::make_test_dir("runtime-data");
        data_dir = root / "site" / "runtime_data";
        lock_file = root / "cache" / ".runtime-data.LOCK";
    }
};

TEST_F(RuntimeDataTest, InstallsOnceTest) {
    int calls = 0;
    runtime_data data(data_dir, lock_file, [&](const path &dir) {
        ++calls;
        create_directories(dir);
        write_file_content(dir / "input.txt", "1");
    });

    EXPECT_FALSE(data.is_installed());
    EXPECT_TRUE(data.ensure_installed());
    EXPECT_TRUE(data.is_installed());
    EXPECT_FALSE(data.ensure_installed());
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(exists(data_dir / "input.txt"));
    EXPECT_TRUE(exists(lock_file));
}

TEST_F(RuntimeDataTest, MarkerSkipsInstallerTest) {
    create_directories(data_dir);
    write_file_content(data_dir / "unpacked", "");
    runtime_data data(data_dir, lock_file, [&](const path &) {
        ADD_FAILURE() << "installer should not be called";
    });
    EXPECT_FALSE(data.ensure_installed());
    // 标记文件存在时不会加锁
    EXPECT_FALSE(exists(lock_file));
}

TEST_F(RuntimeDataTest, RemovesPartialInstallTest) {
    create_directories(data_dir);
    write_file_content(data_dir / "partial.txt", "half");
    runtime_data data(data_dir, lock_file, [&](const path &dir) {
        EXPECT_FALSE(exists(dir));
        create_directories(dir);
        write_file_content(dir / "complete.txt", "full");
    });
    EXPECT_TRUE(data.ensure_installed());
    EXPECT_FALSE(exists(data_dir / "partial.txt"));
    EXPECT_TRUE(exists(data_dir / "complete.txt"));
}

TEST_F(RuntimeDataTest, InstallerMustCreateDirectoryTest) {
    runtime_data data(data_dir, lock_file, [&](const path &) {});
    EXPECT_THROW(data.ensure_installed(), internal_error);
    EXPECT_FALSE(data.is_installed());
}

TEST_F(RuntimeDataTest, ExternallyPreparedTest) {
    runtime_data data(data_dir, lock_file, runtime_data::installer());
    EXPECT_THROW(data.ensure_installed(), file_not_found_error);

    create_directories(data_dir);
    EXPECT_FALSE(data.ensure_installed());
}

TEST_F(RuntimeDataTest, ConcurrentInstallTest) {
    atomic<int> calls = 0;
    runtime_data data(data_dir, lock_file, [&](const path &dir) {
        ++calls;
        this_thread::sleep_for(chrono::milliseconds(200));
        create_directories(dir);
    });

    vector<thread> threads;
    for (int i = 0; i < 4; ++i)
        threads.emplace_back([&]() { data.ensure_installed(); });
    for (auto &th : threads)
        th.join();

    EXPECT_EQ(calls.load(), 1);
    EXPECT_TRUE(data.is_installed());
}

TEST_F(RuntimeDataTest, ArchiveInstallerTest) {
    path source = root / "source" / "runtime_data";
    create_directories(source / "office_data");
    write_file_content(source / "office_data" / "1.txt", "text");
    path archive = root / "runtime_data.tar";
    process_result tar = run_process({"tar", "-cf", archive.string(), "-C", source.parent_path().string(), "runtime_data"},
                                     root, {{"PATH", get_env("PATH", "/usr/bin:/bin")}}, 60, 1);
    ASSERT_EQ(tar.exitcode, 0) << tar.output;

    runtime_data data(data_dir, lock_file, archive_installer(archive));
    EXPECT_TRUE(data.ensure_installed());
    EXPECT_EQ(read_file_content(data_dir / "office_data" / "1.txt"), "text");
}

TEST_F(RuntimeDataTest, MissingArchiveTest) {
    runtime_data data(data_dir, lock_file, archive_installer(root / "missing.tar"));
    EXPECT_THROW(data.ensure_installed(), file_not_found_error);
    EXPECT_FALSE(data.is_installed());
}
