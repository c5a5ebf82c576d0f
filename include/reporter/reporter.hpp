#pragma once

#include <string>
#include "common/status.hpp"
#include "config.hpp"
#include "store/submission.hpp"

namespace grader::reporter {

/**
 * @brief 向提交的来源（GitHub）上报评测状态
 * 上报发生在提交已经写入数据库之后，上报失败不影响已经保存的评测结果，
 * 调用方只记录日志。
 */
struct result_reporter {
    virtual ~result_reporter();

    /**
     * @brief 设置 commit status
     * @param description 简短的描述，超过 GitHub 限制的部分会被截断
     * @throw network_error 请求失败或者返回非 2xx
     */
    virtual void set_status(const store::submission &submit, commit_state state, const std::string &description) = 0;

    /**
     * @brief 在 commit 下发表评论
     * @param message markdown 格式的评论内容
     * @throw network_error 请求失败或者返回非 2xx
     */
    virtual void post_comment(const store::submission &submit, const std::string &message) = 0;
};

/**
 * @brief 通过 GitHub REST API 上报
 */
struct github_reporter : public result_reporter {
    explicit github_reporter(const github_settings &settings);

    void set_status(const store::submission &submit, commit_state state, const std::string &description) override;

    void post_comment(const store::submission &submit, const std::string &message) override;

    std::string status_url(const store::submission &submit) const;

    std::string comment_url(const store::submission &submit) const;

private:
    github_settings settings;

    void post(const std::string &url, const std::string &body);
};

/**
 * @brief 没有配置 auth_token 时使用，只把上报内容写进日志
 */
struct log_reporter : public result_reporter {
    void set_status(const store::submission &submit, commit_state state, const std::string &description) override;

    void post_comment(const store::submission &submit, const std::string &message) override;
};

}  // namespace grader::reporter
