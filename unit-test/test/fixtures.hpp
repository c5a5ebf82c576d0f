#pragma once

#include <filesystem>
#include <string>
#include "config.hpp"
#include "executor/fetcher.hpp"

/**
 * 测试用的目录和源代码获取方式
 */
namespace grader::test {

/**
 * @brief 测试结束时自动删除的临时目录
 */
struct temp_directory {
    temp_directory();
    temp_directory(const temp_directory &) = delete;
    ~temp_directory();

    temp_directory &operator=(const temp_directory &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 在临时目录中创建文件，自动创建上级目录
     * @return 文件的完整路径
     */
    std::filesystem::path write(const std::string &relative, const std::string &content) const;

    /**
     * @brief 创建可执行的 shell 脚本
     */
    std::filesystem::path write_script(const std::string &relative, const std::string &body) const;

private:
    std::filesystem::path dir;
};

/**
 * @brief 从本地目录复制源代码，代替 git 拉取
 */
struct local_fetcher : public executor::source_fetcher {
    explicit local_fetcher(std::filesystem::path source);

    void fetch(const store::submission &submit, const std::filesystem::path &repo_dir) override;

    int fetched = 0;

private:
    std::filesystem::path source;
};

/**
 * @brief 总是拉取失败
 */
struct failing_fetcher : public executor::source_fetcher {
    void fetch(const store::submission &submit, const std::filesystem::path &repo_dir) override;
};

/**
 * @brief 指向 workspace 和 test_root 的 runner 配置，心跳等间隔取测试可以接受的最小值
 */
runner_settings make_runner_settings(const std::filesystem::path &workspace, const std::filesystem::path &test_root);

store::submission make_submission(const std::string &tags);

}  // namespace grader::test
