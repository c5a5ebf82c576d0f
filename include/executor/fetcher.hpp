#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "config.hpp"
#include "store/submission.hpp"

namespace grader::executor {

/**
 * @brief 获取学生仓库在某个 commit 的源代码
 */
struct source_fetcher {
    virtual ~source_fetcher();

    /**
     * @brief 将提交对应的源代码放到 repo_dir
     * @param repo_dir 目标目录，调用前不存在
     * @throw internal_error 获取失败，整个提交以 AUTOGRADER_FAILURE 结束
     */
    virtual void fetch(const store::submission &submit, const std::filesystem::path &repo_dir) = 0;
};

/**
 * @brief 通过 git 浅拉取指定的 commit
 * git init、git remote add、git fetch --depth 1、git checkout FETCH_HEAD
 */
struct git_fetcher : public source_fetcher {
    /**
     * @param timeout 每条 git 命令的时间限制，秒
     */
    explicit git_fetcher(const github_settings &settings, int timeout = 120);

    void fetch(const store::submission &submit, const std::filesystem::path &repo_dir) override;

    /**
     * @brief 仓库地址，不带凭据
     */
    std::string remote_url(const store::submission &submit) const;

    /**
     * @brief 认证请求头，没有配置 auth_token 时为空
     * 只通过 fetch 命令的 -c http.extraHeader 传给 git，不写入仓库配置，
     * 之后在仓库里运行的学生代码读不到它
     */
    std::string auth_header() const;

private:
    github_settings settings;
    int timeout;

    void git(const std::vector<std::string> &args, const std::filesystem::path &work_dir);
};

}  // namespace grader::executor
