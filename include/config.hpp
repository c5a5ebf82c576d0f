#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 调试模式下不删除 runner 的工作区，便于检查构建产物和输入文件
 */
extern bool DEBUG;

/**
 * @brief 描述日志输出
 */
struct log_settings {
    /**
     * @brief glog 的日志目录，为空时输出到 stderr
     */
    std::string dir;

    /**
     * @brief 打开 VLOG(1) 级别的日志
     */
    bool verbose = false;
};

/**
 * @brief 描述一个 MySQL 数据库连接信息
 */
struct database_settings {
    /**
     * @brief 数据库服务器的地址
     */
    std::string host;

    unsigned int port = 3306;

    /**
     * @brief 数据库服务器的账号
     */
    std::string user;

    /**
     * @brief 数据库服务器的密码
     */
    std::string password;

    /**
     * @brief 使用连接到的数据库服务器的哪一个数据库
     */
    std::string database;
};

/**
 * @brief 唤醒 runner 的通知文件
 * Ingestion Gateway 插入提交后会改写这个文件，空闲的 runner 通过 inotify 监听
 * 修改事件。这只是优化：runner 在超时后总会主动轮询数据库。
 */
struct notify_settings {
    std::filesystem::path path;
    int poll_timeout_millisec = 5000;
};

struct github_settings {
    /**
     * @brief GitHub Enterprise 服务器的地址，不包含协议，比如 "gits-15.sys.kth.se"
     */
    std::string address;

    /**
     * @brief 学生仓库所在的组织
     */
    std::string org;

    /**
     * @brief 允许其他组织的推送（只记录警告）
     */
    bool allow_any_org = false;

    /**
     * @brief 只有推送到这个 ref 才会被评测
     */
    std::string branch = "refs/heads/master";

    std::vector<std::string> allowed_repo_prefixes;
    std::vector<std::string> allowed_repo_suffixes;
    std::vector<std::string> prohibited_repo_prefixes;
    std::vector<std::string> prohibited_repo_suffixes;

    /**
     * @brief 调用 GitHub API 的 Bearer token
     */
    std::string auth_token;

    /**
     * @brief Webhook 的共享密钥，用于 HMAC-SHA256 签名校验
     */
    std::string webhook_secret;

    /**
     * @brief Webhook 请求体的最大字节数
     */
    size_t max_payload = 1 << 20;

    /**
     * @brief 附加在每条 commit 评论末尾的签名
     */
    std::string comment_signature;
};

struct runner_settings {
    /**
     * @brief 管理进程需要启动的 runner 数量，runner id 为 [0, n_runners)
     */
    int n_runners = 1;

    /**
     * @brief 没有收到唤醒通知时轮询数据库的间隔
     */
    int database_poll_interval_seconds = 5;

    /**
     * @brief 心跳间隔
     */
    int heartbeat_interval_seconds = 2;

    /**
     * @brief 超过 heartbeat_interval_seconds * staleness_multiplier 秒没有心跳的 runner 被认为已经死亡
     */
    int staleness_multiplier = 3;

    /**
     * @brief 一个提交最多被认领多少次，超过后隔离为 QUARANTINED
     */
    int max_attempts = 3;

    /**
     * @brief 看门狗扫描间隔
     */
    int watchdog_interval_seconds = 10;

    /**
     * @brief runner 的工作区根目录，每个 runner 使用 workspace_dir/runner<id>
     */
    std::filesystem::path workspace_dir;

    /**
     * @brief 测试配置树的根目录
     */
    std::filesystem::path test_root;

    std::chrono::seconds heartbeat_interval() const;

    /**
     * @brief runner 被判定为死亡的阈值
     */
    std::chrono::seconds staleness_threshold() const;
};

struct settings {
    std::string name = "grader";
    log_settings log;
    database_settings database;
    notify_settings notify;
    github_settings github;
    runner_settings runner;
};

void from_json(const nlohmann::json &j, log_settings &log);
void from_json(const nlohmann::json &j, database_settings &db);
void from_json(const nlohmann::json &j, notify_settings &notify);
void from_json(const nlohmann::json &j, github_settings &github);
void from_json(const nlohmann::json &j, runner_settings &runner);
void from_json(const nlohmann::json &j, settings &config);

/**
 * @brief 从 JSON 配置文件中读取配置，然后应用环境变量覆盖并校验
 * @param path 配置文件路径
 * @throw internal_error 文件不存在、格式错误、缺少必要字段或者取值非法
 */
settings load_settings(const std::filesystem::path &path);

/**
 * @brief 确定配置文件路径
 * @param option 命令行 --settings 的值，为空时使用环境变量 GRADER_SETTINGS
 * @throw internal_error 两者都没有给出
 */
std::filesystem::path resolve_settings_path(const std::string &option);

/**
 * @brief 用 GRADER_* 环境变量覆盖配置项，便于在容器中注入密钥
 */
void apply_env_overrides(settings &config);

/**
 * @brief 检查配置取值是否合法
 * @throw internal_error 配置非法
 */
void validate_settings(const settings &config);

/**
 * @brief 根据配置设置 glog 的输出目录和日志级别
 * 必须在输出第一条日志之前调用
 */
void setup_logging(const settings &config);

}  // namespace grader
