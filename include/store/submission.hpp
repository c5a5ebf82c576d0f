#pragma once

#include <ctime>
#include <set>
#include <string>
#include "common/status.hpp"

namespace grader::store {

/**
 * @brief submissions 表中的一行，表示一次需要评测的推送
 *
 * 状态转移：
 * Pending (assigned_runner 为空，exec_finished = false)
 *   -> Assigned (认领后 assigned_runner = runner id)
 *   -> Running (exec_status_code = RUNNING)
 *   -> Finished (exec_finished = true)
 * 或者在 runner 死亡后被释放回 Pending。
 */
struct submission {
    /**
     * @brief 自增 id，越小越早被认领
     */
    int64_t id = 0;

    time_t date_submitted = 0;

    /**
     * @brief 认领了该提交的 runner，-1 表示没有被认领
     */
    int assigned_runner = -1;

    /**
     * @brief 评测标签，用于筛选测试树中的节点
     */
    std::set<std::string> grading_tags;

    bool exec_finished = false;

    submission_status exec_status = submission_status::NOT_STARTED;

    /**
     * @brief 人类可读的评测结果，markdown 格式，可能为空
     */
    std::string exec_status_text;

    /**
     * @brief 以下时间为 0 表示数据库中为 NULL
     */
    time_t exec_date_started = 0;
    time_t exec_date_finished = 0;

    /**
     * @brief 被认领的次数，用于隔离反复导致 runner 崩溃的提交
     */
    int exec_attempts = 0;

    std::string github_address;
    std::string github_org;
    std::string github_repo;
    std::string github_user;
    std::string github_commit;

    bool is_assigned() const;
};

/**
 * @brief runners 表中的一行
 * 主键是启动时分配的稳定 runner id，而不是进程号
 */
struct runner {
    int id = 0;

    /**
     * @brief 当前进程号，0 表示 runner 没有在运行
     */
    int64_t pid = 0;

    /**
     * @brief 最近一次心跳的时间，0 表示从未心跳
     */
    time_t last_pinged = 0;
};

/**
 * @brief 释放一个已认领的提交的结果
 */
enum class release_result {
    /**
     * @brief 提交已回到队列中
     */
    RELEASED,

    /**
     * @brief 提交的认领次数达到上限，已被终止为 QUARANTINED
     */
    QUARANTINED,

    /**
     * @brief 提交已不属于该 runner（已经完成或者被其他进程释放），什么都没做
     */
    NOT_OWNED
};

}  // namespace grader::store
