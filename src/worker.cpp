#include "worker.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <atomic>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/periodic_thread.hpp"
#include "notify/notify.hpp"

namespace grader {
using namespace std;

// 停止 runner 的标记
static volatile sig_atomic_t stop = false;

void stop_runner() {
    stop = true;
}

void reset_runner() {
    stop = false;
}

bool runner_stopping() {
    return stop;
}

void report_released(const vector<liveness::released_submission> &released, reporter::result_reporter &reporter) {
    for (auto &item : released) {
        if (item.result == store::release_result::RELEASED) {
            LOG(INFO) << "Submission " << item.submit.id << " was released from runner " << item.submit.assigned_runner << " back to the queue";
            continue;
        }

        LOG(WARNING) << "Submission " << item.submit.id << " was quarantined after " << item.submit.exec_attempts << " attempts";
        try {
            reporter.set_status(item.submit, to_commit_state(submission_status::QUARANTINED), get_display_message(submission_status::QUARANTINED));
            reporter.post_comment(item.submit, fmt::format("## {}\n\nGrading was interrupted {} times and will not be retried. Please contact the course staff.",
                                                           get_display_message(submission_status::QUARANTINED), item.submit.exec_attempts));
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to report quarantined submission " << item.submit.id << ": " << ex.what();
        }
    }
}

void forward_notifications(const function<bool()> &listen, concurrent_queue<bool> &wake_queue, const atomic<bool> &listening) {
    try {
        while (listening && !runner_stopping()) {
            if (listen()) wake_queue.push(true);
        }
    } catch (std::exception &ex) {
        LOG(WARNING) << "Stopped listening for notifications, falling back to polling: " << ex.what();
    }
}

bool run_once(store::job_store &store, executor::job_executor &executor, int runner_id) {
    store::submission submit;
    if (!store.claim_submission(runner_id, submit))
        return false;

    LOG(INFO) << fmt::format("Runner {} claimed submission {} ({}/{}@{}, attempt {})", runner_id, submit.id,
                             submit.github_org, submit.github_repo, submit.github_commit, submit.exec_attempts);
    executor.execute(submit);
    return true;
}

void run_runner(const settings &config, int runner_id, bool watchdog, const store_factory &connect,
                reporter::result_reporter &reporter, executor::source_fetcher &fetcher) {
    auto store = connect();

    liveness::heartbeat heartbeat(connect(), runner_id, getpid(), config.runner.heartbeat_interval());
    heartbeat.start();

    // 上一个使用相同 id 的进程可能在执行中崩溃，它持有的提交不会再被完成
    report_released(liveness::release_runner_submissions(*store, runner_id, config.runner.max_attempts), reporter);

    unique_ptr<store::job_store> watchdog_store;
    unique_ptr<periodic_thread> watchdog_thread;
    if (watchdog) {
        watchdog_store = connect();
        auto threshold = config.runner.staleness_threshold();
        int max_attempts = config.runner.max_attempts;
        watchdog_thread = make_unique<periodic_thread>(
            "watchdog", chrono::seconds(config.runner.watchdog_interval_seconds), [&, threshold, max_attempts] {
                report_released(liveness::sweep(*watchdog_store, threshold, max_attempts, runner_id), reporter);
            });
        watchdog_thread->start();
        LOG(INFO) << "Runner " << runner_id << " is also running the liveness watchdog, threshold " << threshold.count() << "s";
    }

    concurrent_queue<bool> wake_queue;
    unique_ptr<notify::listener> listener;
    if (!config.notify.path.empty()) {
        try {
            notify::ensure_notify_file(config.notify.path);
            listener = make_unique<notify::listener>(config.notify.path, config.notify.poll_timeout_millisec);
        } catch (std::exception &ex) {
            LOG(WARNING) << "Unable to listen to " << config.notify.path << ", falling back to polling: " << ex.what();
        }
    }

    atomic<bool> listening(true);
    thread listen_thread;
    if (listener) {
        listen_thread = thread([&] {
            forward_notifications([&] { return listener->listen(); }, wake_queue, listening);
        });
    }
    defer {
        listening = false;
        if (listen_thread.joinable()) listen_thread.join();
        if (watchdog_thread) watchdog_thread->stop();
    };

    executor::job_executor executor(*store, reporter, fetcher, config.runner, runner_id);
    auto poll_interval = chrono::seconds(config.runner.database_poll_interval_seconds);

    LOG(INFO) << "Runner " << runner_id << " is waiting for submissions";
    while (!runner_stopping()) {
        if (run_once(*store, executor, runner_id)) {
            // 执行期间收到的唤醒信号已经没有意义，下一轮总会先尝试认领
            wake_queue.clear();
            continue;
        }

        bool woken;
        if (wake_queue.pop_for(woken, poll_interval))
            VLOG(1) << "Runner " << runner_id << " woken up by notification";
    }
    LOG(INFO) << "Runner " << runner_id << " stopped";
}

}  // namespace grader
