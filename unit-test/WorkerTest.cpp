#include <atomic>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "notify/notify.hpp"
#include "test/fixtures.hpp"
#include "test/memory_store.hpp"
#include "test/mock_reporter.hpp"
#include "worker.hpp"

using namespace std;
using namespace grader;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class WorkerTest : public ::testing::Test {
protected:
    grader::test::temp_directory tests;
    grader::test::temp_directory repo;
    grader::test::temp_directory workspace;
    shared_ptr<store::mock::memory_database> db = make_shared<store::mock::memory_database>();
    store::mock::memory_store store{db};
    NiceMock<reporter::mock::mock_reporter> reporter;
    grader::test::local_fetcher fetcher{repo.path()};
    settings config;

    void SetUp() override {
        tests.write("config.toml", "[build]\ncmd = [\"true\"]\n");
        tests.write("makefile.test.toml", "[test]\nkind = \"check_file_exists\"\n[test.options]\npath = \"Makefile\"\n");
        repo.write("Makefile", "all:\n");

        config.runner = grader::test::make_runner_settings(workspace.path() / "runners", tests.path());
        config.notify.path = workspace.path() / "notify" / "submissions";
        config.notify.poll_timeout_millisec = 100;
        reset_runner();
    }

    store::submission reload(int64_t id) {
        store::submission submit;
        EXPECT_TRUE(store.get_submission(id, submit));
        return submit;
    }

    bool wait_finished(int64_t id, chrono::seconds timeout) {
        auto deadline = chrono::steady_clock::now() + timeout;
        while (chrono::steady_clock::now() < deadline) {
            if (reload(id).exec_finished) return true;
            this_thread::sleep_for(chrono::milliseconds(50));
        }
        return false;
    }

    store_factory connect() {
        auto shared = db;
        return [shared] { return make_unique<store::mock::memory_store>(shared); };
    }
};

TEST_F(WorkerTest, RunOnceWithEmptyQueue) {
    executor::job_executor executor(store, reporter, fetcher, config.runner, 0);
    EXPECT_FALSE(run_once(store, executor, 0));
    EXPECT_EQ(0, fetcher.fetched);
}

TEST_F(WorkerTest, RunOnceExecutesLowestId) {
    auto first = store.insert_submission(grader::test::make_submission("task1"));
    auto second = store.insert_submission(grader::test::make_submission("task1"));
    executor::job_executor executor(store, reporter, fetcher, config.runner, 0);

    EXPECT_TRUE(run_once(store, executor, 0));
    EXPECT_TRUE(reload(first).exec_finished);
    EXPECT_FALSE(reload(second).exec_finished);
    EXPECT_EQ(submission_status::SUCCESS, reload(first).exec_status);
}

TEST_F(WorkerTest, OnlyQuarantinedSubmissionsAreReported) {
    store::submission released = grader::test::make_submission("task1");
    released.id = 1;
    store::submission quarantined = grader::test::make_submission("task1");
    quarantined.id = 2;
    quarantined.exec_attempts = 3;

    EXPECT_CALL(reporter, set_status(::testing::Field(&store::submission::id, 1), _, _)).Times(0);
    EXPECT_CALL(reporter, set_status(::testing::Field(&store::submission::id, 2), commit_state::ERROR, "Quarantined")).Times(1);
    EXPECT_CALL(reporter, post_comment(::testing::Field(&store::submission::id, 2), HasSubstr("3 times"))).Times(1);

    report_released({{released, store::release_result::RELEASED}, {quarantined, store::release_result::QUARANTINED}}, reporter);
}

TEST_F(WorkerTest, ListenerFailureFallsBackToPolling) {
    concurrent_queue<bool> wake_queue;
    atomic<bool> listening(true);
    int calls = 0;
    forward_notifications([&]() -> bool {
        if (++calls == 1) return true;
        if (calls == 2) return false;
        throw internal_error("error while watching notification file: Bad file descriptor");
    }, wake_queue, listening);

    EXPECT_EQ(3, calls);
    bool woken = false;
    EXPECT_TRUE(wake_queue.try_pop(woken));
    EXPECT_FALSE(wake_queue.try_pop(woken));
}

TEST_F(WorkerTest, RunnerGradesNotifiedSubmission) {
    thread runner([&] {
        run_runner(config, 1, true, connect(), reporter, fetcher);
    });

    // 等待 runner 注册心跳
    auto deadline = chrono::steady_clock::now() + chrono::seconds(5);
    while (store.list_runners().empty() && chrono::steady_clock::now() < deadline)
        this_thread::sleep_for(chrono::milliseconds(20));

    auto id = store.insert_submission(grader::test::make_submission("task1"));
    notify::ping(config.notify.path);

    bool finished = wait_finished(id, chrono::seconds(10));
    stop_runner();
    runner.join();

    ASSERT_TRUE(finished);
    auto row = reload(id);
    EXPECT_EQ(1, row.assigned_runner);
    EXPECT_EQ(submission_status::SUCCESS, row.exec_status);

    auto runners = store.list_runners();
    ASSERT_EQ(1, runners.size());
    EXPECT_EQ(1, runners[0].id);
    EXPECT_EQ(0, runners[0].pid);
}

TEST_F(WorkerTest, RunnerRecoversSubmissionsOfPreviousProcess) {
    auto id = store.insert_submission(grader::test::make_submission("task1"));
    store::submission submit;
    ASSERT_TRUE(store.claim_submission(0, submit));
    ASSERT_TRUE(store.mark_running(id, 0));

    // 没有通知文件时 runner 退化为轮询
    config.notify.path.clear();
    thread runner([&] {
        run_runner(config, 0, false, connect(), reporter, fetcher);
    });

    bool finished = wait_finished(id, chrono::seconds(10));
    stop_runner();
    runner.join();

    ASSERT_TRUE(finished);
    auto row = reload(id);
    EXPECT_EQ(2, row.exec_attempts);
    EXPECT_EQ(submission_status::SUCCESS, row.exec_status);
}

TEST_F(WorkerTest, WatchdogReleasesSubmissionsOfDeadRunner) {
    store.heartbeat(5, 12345);
    auto id = store.insert_submission(grader::test::make_submission("task1"));
    store::submission submit;
    ASSERT_TRUE(store.claim_submission(5, submit));
    store.set_last_pinged(5, time(nullptr) - 60);

    thread runner([&] {
        run_runner(config, 0, true, connect(), reporter, fetcher);
    });

    bool finished = wait_finished(id, chrono::seconds(10));
    stop_runner();
    runner.join();

    ASSERT_TRUE(finished);
    auto row = reload(id);
    EXPECT_EQ(0, row.assigned_runner);
    EXPECT_EQ(2, row.exec_attempts);
}
