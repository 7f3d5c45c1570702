#pragma once

#include <filesystem>
#include <string>

namespace difftest {

/**
 * @brief 当程序输出不是合法的 UTF-8 文本时，用于替代输出内容的标记
 */
extern const char *const BINARY_OUTPUT;

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容（按字节读取，没有指定编码）
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 覆盖写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 严格检查 UTF-8 编码：超长编码、代理区码点、大于 U+10FFFF 的码点和截断的序列都不合法
 */
bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将程序输出的字节解码为文本
 * @return 若 bytes 是合法的 UTF-8 文本，原样返回；否则返回 BINARY_OUTPUT
 */
std::string decode_output(const std::string &bytes);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 输入文件、输出文件都是相对于运行时数据目录和临时工作目录的路径，
 * 如果配置中的文件名包含 "../"，那么验证时可能读写到工作目录之外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 在 parent 下创建一个随机命名的临时文件夹
 * @param parent 临时文件夹的父目录，不存在时自动创建
 * @return 新创建的文件夹路径
 */
std::filesystem::path create_scratch_directory(const std::filesystem::path &parent);

}  // namespace difftest
