#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 * @throw internal_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 覆盖写入文件
 * @throw internal_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 断言 subpath 一定不会逃逸出其父目录
 * 测试配置和学生仓库都不可信，如果拿到的相对路径是绝对路径或者包含 ".."，
 * 就有可能读写到工作区以外的文件。
 * @param subpath 被检查的相对路径
 * @return subpath 本身
 * @throw malformed_test_config 路径不安全
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 删除目录，失败时只记录日志
 */
void remove_directory_quietly(const std::filesystem::path &dir);

}  // namespace grader
