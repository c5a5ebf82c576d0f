#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "config.hpp"
#include "executor/executor.hpp"
#include "liveness/liveness.hpp"
#include "reporter/reporter.hpp"
#include "store/job_store.hpp"

/**
 * Runner 主循环
 * runner 启动后先注册心跳，释放上一个同 id 进程遗留的提交，然后不断认领提交：
 * 认领成功就执行并终止它，认领失败就等待唤醒信号或者轮询超时。
 * 一个 runner 同一时间只执行一个提交，多个 runner 之间只通过数据库协调。
 */
namespace grader {

/**
 * @brief 停止 runner
 * 可以在信号处理函数中调用。runner 执行完当前提交后退出主循环。
 */
void stop_runner();

/**
 * @brief 清除停止标记，用于同一进程中重新启动 runner
 */
void reset_runner();

bool runner_stopping();

/**
 * @brief 上报被隔离的提交，被释放回队列的提交只记录日志
 */
void report_released(const std::vector<liveness::released_submission> &released, reporter::result_reporter &reporter);

/**
 * @brief 尝试认领并执行一个提交
 * @return 是否认领到了提交
 * @throw database_error 数据库不可用
 */
bool run_once(store::job_store &store, executor::job_executor &executor, int runner_id);

/**
 * @brief 把唤醒信号转发到 wake_queue，直到 listening 为 false 或者 runner 停止
 * 监听出错时记录警告并返回，runner 之后只依靠轮询
 * @param listen 等待一次唤醒信号，返回是否收到
 */
void forward_notifications(const std::function<bool()> &listen, concurrent_queue<bool> &wake_queue,
                           const std::atomic<bool> &listening);

/**
 * @brief 运行 runner 直到 stop_runner 被调用
 * @param watchdog 是否同时定期执行存活扫描
 * @throw database_error 数据库不可用，runner 需要退出，重启后会自行恢复
 */
void run_runner(const settings &config, int runner_id, bool watchdog, const store_factory &connect,
                reporter::result_reporter &reporter, executor::source_fetcher &fetcher);

}  // namespace grader
