#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <vector>
#include "store/submission.hpp"

namespace grader::store {

/**
 * @brief 持久化的任务队列
 * 所有 runner、Ingestion Gateway、看门狗之间没有共享内存，协调完全依靠
 * 这里的条件更新。每个实现都必须保证每个操作是一条原子的条件更新：
 * 同一个提交在任意时刻最多只被一个 runner 持有。
 *
 * 一个 job_store 对象不是线程安全的，每个线程（比如心跳线程）需要自己的连接。
 */
struct job_store {
    virtual ~job_store();

    /**
     * @brief 插入一个 Pending 状态的提交
     * 只使用 submit 中的来源信息和评测标签，其余字段由存储决定
     * @return 新提交的 id
     */
    virtual int64_t insert_submission(const submission &submit) = 0;

    /**
     * @brief 原子地认领 id 最小的 Pending 提交
     * 认领是一条条件更新："assigned_runner 为空且未完成" 的行中 id 最小的一行，
     * 当且仅当恰好更新了一行时认领成功。认领失败不是错误，表示没有可做的任务。
     * @param runner_id 认领者
     * @param submit 认领成功时写入被认领的提交
     * @return 是否认领成功
     */
    virtual bool claim_submission(int runner_id, submission &submit) = 0;

    /**
     * @brief 标记提交开始执行
     * @return 该提交仍属于 runner_id 且未完成时返回 true
     */
    virtual bool mark_running(int64_t submission_id, int runner_id) = 0;

    /**
     * @brief 终止提交，唯一一次设置 exec_finished = true 的更新
     * @return 该提交仍属于 runner_id 且未完成时返回 true。返回 false 说明提交已经被
     * 看门狗释放，结果被丢弃。
     */
    virtual bool finalize_submission(int64_t submission_id, int runner_id, submission_status status, const std::string &status_text) = 0;

    /**
     * @brief 释放 runner 持有的提交，使其回到 Pending
     * 从不伪造评测结果。如果提交已经被认领了 max_attempts 次，则改为隔离。
     */
    virtual release_result release_submission(int64_t submission_id, int runner_id, int max_attempts) = 0;

    /**
     * @brief 按 id 查询提交
     * @return 提交不存在时返回 false
     */
    virtual bool get_submission(int64_t submission_id, submission &submit) = 0;

    /**
     * @brief 查询某个 runner 持有的所有未完成提交
     */
    virtual std::vector<submission> unfinished_submissions(int runner_id) = 0;

    /**
     * @brief 统计排队中和执行中的提交数量
     */
    virtual std::pair<int64_t, int64_t> count_active() = 0;

    /**
     * @brief 写入心跳，runner 行不存在时创建
     * last_pinged 使用存储一侧的时钟
     */
    virtual void heartbeat(int runner_id, int64_t pid) = 0;

    /**
     * @brief runner 正常退出时清空 pid
     */
    virtual void clear_runner(int runner_id) = 0;

    virtual std::vector<runner> list_runners() = 0;

    /**
     * @brief 找出超过 threshold 没有心跳的 runner
     * 判断同样使用存储一侧的时钟，避免各个机器时钟不一致
     */
    virtual std::vector<int> stale_runners(std::chrono::seconds threshold) = 0;
};

}  // namespace grader::store

namespace grader {

/**
 * @brief 创建一个新的存储连接
 * 主循环、心跳线程、看门狗线程各自使用独立的连接；Ingestion Gateway 只在需要插入时连接
 */
using store_factory = std::function<std::unique_ptr<store::job_store>()>;

}  // namespace grader
