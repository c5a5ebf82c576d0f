#include "liveness/liveness.hpp"
#include <glog/logging.h>

namespace grader::liveness {
using namespace std;
using namespace grader::store;

heartbeat::heartbeat(unique_ptr<job_store> &&store, int runner_id, int64_t pid, chrono::seconds interval)
    : store(move(store)), runner_id(runner_id), pid(pid),
      thread("heartbeat-" + to_string(runner_id), interval, [this] { beat(); }) {}

heartbeat::~heartbeat() {
    stop();
}

void heartbeat::beat() {
    store->heartbeat(runner_id, pid);
}

void heartbeat::start() {
    beat();
    thread.start();
    started = true;
    LOG(INFO) << "Runner " << runner_id << " (pid " << pid << ") registered";
}

void heartbeat::stop() {
    if (!started) return;
    started = false;
    thread.stop();
    try {
        store->clear_runner(runner_id);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to clear pid of runner " << runner_id << ": " << ex.what();
    }
}

vector<released_submission> release_runner_submissions(job_store &store, int runner_id, int max_attempts) {
    vector<released_submission> released;
    for (auto &submit : store.unfinished_submissions(runner_id)) {
        release_result result = store.release_submission(submit.id, runner_id, max_attempts);
        if (result == release_result::NOT_OWNED) continue;  // 并发的扫描已经处理过了
        released.push_back({submit, result});
    }
    return released;
}

vector<released_submission> sweep(job_store &store, chrono::seconds threshold, int max_attempts, int exclude_runner) {
    vector<released_submission> released;
    for (int runner_id : store.stale_runners(threshold)) {
        if (runner_id == exclude_runner) continue;
        auto items = release_runner_submissions(store, runner_id, max_attempts);
        if (!items.empty())
            LOG(WARNING) << "Runner " << runner_id << " is stale, recovered " << items.size() << " submission(s)";
        released.insert(released.end(), items.begin(), items.end());
    }
    return released;
}

}  // namespace grader::liveness
