#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include "config.hpp"
#include "reporter/reporter.hpp"
#include "store/job_store.hpp"

/**
 * Ingestion Gateway
 * 校验 GitHub Webhook 推送（签名、请求体），然后用一次插入把提交放入队列。
 * 被拒绝的请求不会修改任何状态。
 */
namespace grader::gateway {

/**
 * @brief push 事件中评测需要的字段
 * https://docs.github.com/en/enterprise-server@3.16/webhooks/webhook-events-and-payloads#push
 */
struct push_event {
    std::string ref;
    std::string repo_name;
    std::string repo_full_name;
    std::string organization;
    std::string pusher_name;
    std::string pusher_email;
    std::string commit_id;
    std::string commit_message;
};

/**
 * @throw malformed_payload 缺少字段或者字段类型错误
 */
void from_json(const nlohmann::json &j, push_event &event);

/**
 * @brief 一次 Webhook 请求
 */
struct ingest_request {
    // X-Github-Event
    std::string event;

    // X-Hub-Signature-256，形如 "sha256=<小写十六进制>"
    std::string signature;

    // 原始请求体，签名针对这些字节计算
    std::string body;
};

/**
 * @brief 返回给 Web 层的结果
 */
struct ingest_response {
    int code = 200;
    std::string message;

    // 插入的提交 id，没有插入时为 -1
    int64_t submission_id = -1;
};

void to_json(nlohmann::json &j, const ingest_response &response);

/**
 * @brief 校验签名头
 * 使用常数时间比较，避免通过响应时间猜测签名
 * @throw authentication_failed 签名头缺失、格式错误或者不匹配，以及没有配置密钥
 */
void verify_signature(const std::string &secret, const std::string &signature, const std::string &body);

/**
 * @brief 从 commit message 中提取评测标签
 * 以 '#' 或者 '%' 开头的单词是标签，去掉标记后去重、排序
 */
std::set<std::string> parse_grading_tags(const std::string &message);

/**
 * @brief 根据仓库名前后缀规则判断仓库是否需要评测
 */
bool repository_allowed(const github_settings &settings, const std::string &repo_name);

/**
 * @brief 处理一次 Webhook 请求
 * 插入成功后尽力发表评论、设置 pending 状态并唤醒 runner，这些步骤的失败只记录日志。
 * @param connect 只有请求通过校验、确实需要插入时才会调用
 * @param notify_path 通知文件，为空时不唤醒
 * @throw authentication_failed 签名错误或者组织不匹配
 * @throw malformed_payload 请求体无法解析、缺少字段、事件类型或者分支不符合
 * @throw database_error 无法连接或者无法插入
 */
ingest_response ingest(const github_settings &settings, const ingest_request &request, const store_factory &connect,
                       reporter::result_reporter &reporter, const std::filesystem::path &notify_path);

}  // namespace grader::gateway
