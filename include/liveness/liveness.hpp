#pragma once

#include <chrono>
#include <memory>
#include <vector>
#include "common/periodic_thread.hpp"
#include "store/job_store.hpp"

/**
 * Runner 存活检测
 * 每个 runner 在独立线程中按固定间隔写心跳，和是否正在执行测试无关。
 * 看门狗定期扫描 runners 表，超过阈值没有心跳的 runner 被认为已经死亡，
 * 它持有的未完成提交会被释放回队列。这是系统唯一的崩溃恢复机制。
 */
namespace grader::liveness {

struct heartbeat {
    /**
     * @param store 心跳专用的存储连接，不能和执行任务的线程共用
     * @param runner_id 稳定的 runner id
     * @param pid 当前进程号
     * @param interval 心跳间隔
     */
    heartbeat(std::unique_ptr<store::job_store> &&store, int runner_id, int64_t pid, std::chrono::seconds interval);
    ~heartbeat();

    /**
     * @brief 同步写入第一次心跳（注册 runner 行），然后启动心跳线程
     * @throw database_error 第一次心跳失败
     */
    void start();

    /**
     * @brief 停止心跳线程并清空 runner 行的 pid
     */
    void stop();

private:
    std::unique_ptr<store::job_store> store;
    int runner_id;
    int64_t pid;
    periodic_thread thread;
    bool started = false;

    void beat();
};

/**
 * @brief 一个被释放或隔离的提交
 */
struct released_submission {
    store::submission submit;
    store::release_result result;
};

/**
 * @brief 释放某个 runner 持有的所有未完成提交
 * 用于看门狗处理死亡的 runner，以及 runner 启动时处理上一个进程遗留的提交。
 * 认领次数达到 max_attempts 的提交会被隔离而不是释放。
 */
std::vector<released_submission> release_runner_submissions(store::job_store &store, int runner_id, int max_attempts);

/**
 * @brief 执行一次存活扫描
 * @param threshold 超过多久没有心跳就认为 runner 死亡
 * @param max_attempts 提交的最大认领次数
 * @param exclude_runner 不扫描的 runner id（比如执行扫描的 runner 自身），-1 表示不排除
 * @return 本次被释放或隔离的提交
 */
std::vector<released_submission> sweep(store::job_store &store, std::chrono::seconds threshold, int max_attempts, int exclude_runner = -1);

}  // namespace grader::liveness
