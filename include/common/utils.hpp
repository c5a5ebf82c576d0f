#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace grader {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 解析 "true"/"1"/"yes" 之类的布尔字符串，大小写不敏感
 */
bool parse_bool(const std::string &value);

/**
 * @brief 按分隔符切分字符串，丢弃空串
 */
std::vector<std::string> split_nonempty(const std::string &str, char delim);

/**
 * @brief 评测标签在数据库中以分号连接存储
 */
std::string join_tags(const std::set<std::string> &tags);

std::set<std::string> parse_tags(const std::string &joined);

/**
 * @brief 将 time_t 格式化为 "%Y-%m-%d %H:%M:%S"，0 表示空值
 */
std::string format_time(time_t time);

/**
 * @brief 解析 MySQL 返回的时间字符串，空串返回 0
 */
time_t parse_time(const std::string &str);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
