#include "common/periodic_thread.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

periodic_thread::periodic_thread(string name, chrono::milliseconds interval, function<void()> task)
    : name(move(name)), interval(interval), task(move(task)) {}

periodic_thread::~periodic_thread() {
    stop();
}

void periodic_thread::start() {
    scoped_lock guard(mut);
    if (worker.joinable()) return;
    stopping = false;
    worker = thread([this] { loop(); });
}

void periodic_thread::stop() {
    {
        scoped_lock guard(mut);
        stopping = true;
    }
    cond.notify_all();
    if (worker.joinable() && worker.get_id() != this_thread::get_id())
        worker.join();
}

void periodic_thread::loop() {
    auto next = chrono::steady_clock::now() + interval;
    while (true) {
        {
            unique_lock<mutex> lock(mut);
            if (cond.wait_until(lock, next, [this] { return stopping; }))
                break;
        }
        next += interval;

        try {
            task();
        } catch (std::exception &ex) {
            LOG(ERROR) << "Periodic task " << name << " failed: " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }

        // 任务执行时间超过间隔时不要连续补执行
        auto now = chrono::steady_clock::now();
        if (next < now) next = now;
    }
    VLOG(1) << "Periodic task " << name << " stopped";
}

}  // namespace grader
