#pragma once

#include <ormpp/dbng.hpp>
#include <ormpp/mysql.hpp>
#include "config.hpp"
#include "store/job_store.hpp"

namespace grader::store {

/**
 * @brief 基于 MySQL (InnoDB) 的任务队列
 * 认领使用 UPDATE ... ORDER BY id LIMIT 1，InnoDB 的行锁保证并发的认领
 * 不会更新同一行；是否认领成功通过同一连接上的 ROW_COUNT() 判断。
 */
struct mysql_store : public job_store {
    /**
     * @brief 连接数据库
     * @throw database_error 无法连接
     */
    explicit mysql_store(const database_settings &dbcfg);

    /**
     * @brief 创建 submissions 和 runners 表（如果不存在）
     */
    void init_schema();

    int64_t insert_submission(const submission &submit) override;

    bool claim_submission(int runner_id, submission &submit) override;

    bool mark_running(int64_t submission_id, int runner_id) override;

    bool finalize_submission(int64_t submission_id, int runner_id, submission_status status, const std::string &status_text) override;

    release_result release_submission(int64_t submission_id, int runner_id, int max_attempts) override;

    bool get_submission(int64_t submission_id, submission &submit) override;

    std::vector<submission> unfinished_submissions(int runner_id) override;

    std::pair<int64_t, int64_t> count_active() override;

    void heartbeat(int runner_id, int64_t pid) override;

    void clear_runner(int runner_id) override;

    std::vector<runner> list_runners() override;

    std::vector<int> stale_runners(std::chrono::seconds threshold) override;

private:
    ormpp::dbng<ormpp::mysql> db;

    /**
     * @brief 上一条语句影响的行数
     */
    int64_t affected_rows();

    template <typename... Args>
    void execute(const char *sql, Args &&... args);

    template <typename T, typename... Args>
    std::vector<T> query(const char *sql, Args &&... args);

    std::vector<submission> query_submissions(const std::string &where, int64_t arg);
};

}  // namespace grader::store
