#pragma once

#include <filesystem>
#include <string>

namespace sortbot {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 如果文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 写入文件，覆盖已有内容
 * @throw std::system_error 如果文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 原子地替换文件内容
 * 先写入同一文件夹下的临时文件，再通过 rename 替换目标文件，
 * 读者要么看到旧内容，要么看到完整的新内容
 */
void replace_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录或者进入子目录的情况
 * 这里用于确保通过提交 id 计算文件名时不会出现目录遍历攻击
 * @param subpath 被检查的文件名
 * @return subpath 本身
 * @throw std::invalid_argument 如果 subpath 不安全
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace sortbot
