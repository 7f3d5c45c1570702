#pragma once

#include <filesystem>
#include <functional>
#include <string>

namespace difftest {

/**
 * @brief 测试程序的运行时数据目录（输入文件等），所有验证共享
 * 数据只需要准备一次，完成后在目录下创建 unpacked 标记文件。
 * 多个进程、一个进程的多个线程可能同时准备同一个目录，因此准备过程由两层锁保护：
 * 进程内的递归互斥锁和跨进程的文件锁。
 */
struct runtime_data {
    /**
     * @brief 数据准备函数，负责生成 data_dir 目录
     * 调用时 data_dir 不存在，但其父目录已经存在
     */
    using installer = std::function<void(const std::filesystem::path &data_dir)>;

    /**
     * @param data_dir 运行时数据目录
     * @param lock_file 跨进程文件锁的路径
     * @param install 数据准备函数，为空时要求数据目录已经由外部准备好
     */
    runtime_data(const std::filesystem::path &data_dir, const std::filesystem::path &lock_file, installer install);

    /**
     * @brief 运行时数据目录
     */
    const std::filesystem::path &path() const;

    /**
     * @brief 标记文件路径，该文件存在表示数据已经完整准备好
     */
    std::filesystem::path marker() const;

    bool is_installed() const;

    /**
     * @brief 确保运行时数据已经准备好
     * 若标记文件存在，直接返回，不会加锁；否则加锁后再次检查标记文件，
     * 删除上次没有完成的目录，调用 installer，最后创建标记文件。
     * @return 若本次调用实际准备了数据，返回 true
     * @throw internal_error 若 installer 没有生成数据目录
     */
    bool ensure_installed();

private:
    std::filesystem::path data_dir, lock_file;
    installer install;
};

/**
 * @brief 从本地的 tar 压缩包解压运行时数据
 * 压缩包的根目录必须与数据目录同名
 * @param archive 压缩包路径
 */
runtime_data::installer archive_installer(const std::filesystem::path &archive);

}  // namespace difftest
