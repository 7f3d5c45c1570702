#pragma once

#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>
#include <filesystem>

/**
 * 这个类包含 boost/interprocess 的帮助函数
 */
namespace difftest {

/**
 * @brief 打开一个跨进程的文件锁
 * 若锁文件不存在则创建（同时创建父目录）
 * @param lock_file 锁文件路径
 * @return 文件锁，可以配合 ip::scoped_lock 使用
 */
boost::interprocess::file_lock open_file_lock(const std::filesystem::path &lock_file);

}  // namespace difftest
