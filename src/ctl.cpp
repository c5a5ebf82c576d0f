#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <climits>
#include <iostream>
#include <set>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "executor/checker.hpp"
#include "liveness/liveness.hpp"
#include "plan/test_config.hpp"
#include "store/mysql_store.hpp"
using namespace std;
using namespace grader;

static void print_submission(const store::submission &submit) {
    cout << fmt::format("id:              {}\n", submit.id)
         << fmt::format("submitted:       {}\n", format_time(submit.date_submitted))
         << fmt::format("repository:      {}/{}/{}@{}\n", submit.github_address, submit.github_org, submit.github_repo, submit.github_commit)
         << fmt::format("user:            {}\n", submit.github_user)
         << fmt::format("tags:            {}\n", join_tags(submit.grading_tags))
         << fmt::format("assigned runner: {}\n", submit.is_assigned() ? to_string(submit.assigned_runner) : "-")
         << fmt::format("attempts:        {}\n", submit.exec_attempts)
         << fmt::format("status:          {} {}\n", static_cast<int>(submit.exec_status), get_display_message(submit.exec_status))
         << fmt::format("finished:        {}\n", submit.exec_finished ? "yes" : "no")
         << fmt::format("started at:      {}\n", submit.exec_date_started ? format_time(submit.exec_date_started) : "-")
         << fmt::format("finished at:     {}\n", submit.exec_date_finished ? format_time(submit.exec_date_finished) : "-");
    if (!submit.exec_status_text.empty())
        cout << endl
             << submit.exec_status_text << endl;
}

static int validate_tests(const settings &config, const string &tags, bool all) {
    executor::register_default_checkers();
    auto tokens = split_nonempty(tags, ',');
    set<string> tag_set(tokens.begin(), tokens.end());
    try {
        auto plan = plan::resolve_plan(config.runner.test_root, tag_set, !all);
        for (auto *test : plan.cases())
            executor::get_checker(test->kind);
        cout << nlohmann::json(plan).dump(4) << endl;
        cerr << fmt::format("{} test cases selected by tags [{}]", plan.root.count(), join_tags(tag_set)) << endl;
        return EXIT_SUCCESS;
    } catch (grader_exception& ex) {
        cerr << "Invalid test tree: " << ex.what() << endl;
        return EXIT_FAILURE;
    }
}

static int list_runners(store::job_store& store, const settings& config) {
    auto stale = store.stale_runners(config.runner.staleness_threshold());
    for (auto& r : store.list_runners()) {
        bool dead = find(stale.begin(), stale.end(), r.id) != stale.end();
        cout << fmt::format("runner {:<4} pid {:<8} last pinged {} {}", r.id, r.pid ? to_string(r.pid) : "-",
                            r.last_pinged ? format_time(r.last_pinged) : "never", dead ? "(stale)" : "")
             << endl;
        for (auto& submit : store.unfinished_submissions(r.id))
            cout << fmt::format("    holding submission {} ({}/{})", submit.id, submit.github_org, submit.github_repo) << endl;
    }
    return EXIT_SUCCESS;
}

static int requeue(store::job_store& store, int64_t id) {
    store::submission submit;
    if (!store.get_submission(id, submit)) {
        cerr << "Submission " << id << " does not exist" << endl;
        return EXIT_FAILURE;
    }
    if (submit.exec_finished || !submit.is_assigned()) {
        cerr << "Submission " << id << " is not held by any runner" << endl;
        return EXIT_FAILURE;
    }

    // 管理员手动释放，不受最大尝试次数限制
    auto result = store.release_submission(id, submit.assigned_runner, INT_MAX);
    if (result != store::release_result::RELEASED) {
        cerr << "Submission " << id << " changed concurrently, nothing was done" << endl;
        return EXIT_FAILURE;
    }
    cout << "Submission " << id << " was released from runner " << submit.assigned_runner << endl;
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("grader-ctl options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("settings", po::value<string>(), "path to the JSON settings file. You can either pass it from environ GRADER_SETTINGS")
        ("tags", po::value<string>()->default_value(""), "comma separated grading tags for validate-tests")
        ("all", "validate-tests: ignore tags and print the whole test tree")
        ("command", po::value<string>(), "init-schema, check-database, validate-tests, sweep, runners, submission, requeue")
        ("id", po::value<int64_t>(), "submission id for submission and requeue")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("command", 1).add("id", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help") || !vm.count("command")) {
        cout << "grader-ctl: administration of the submission queue and the test tree" << endl
             << "Usage: " << argv[0] << " <command> [id] [options]" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (vm.count("version")) {
        cout << "grader-ctl 1.0" << endl;
        return EXIT_SUCCESS;
    }

    settings config;
    try {
        config = load_settings(resolve_settings_path(vm.count("settings") ? vm.at("settings").as<string>() : ""));
    } catch (grader_exception& ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }
    setup_logging(config);

    string command = vm.at("command").as<string>();
    if (command == "validate-tests")
        return validate_tests(config, vm.at("tags").as<string>(), vm.count("all") > 0);

    if ((command == "submission" || command == "requeue") && !vm.count("id")) {
        cerr << command << " requires a submission id" << endl;
        return EXIT_FAILURE;
    }

    try {
        store::mysql_store store(config.database);
        if (command == "init-schema") {
            store.init_schema();
            cout << "Schema of database " << config.database.database << " is ready" << endl;
        } else if (command == "check-database") {
            auto [pending, running] = store.count_active();
            cout << fmt::format("Connected to {}@{}/{}: {} pending, {} assigned", config.database.user, config.database.host,
                                config.database.database, pending, running)
                 << endl;
        } else if (command == "sweep") {
            auto released = liveness::sweep(store, config.runner.staleness_threshold(), config.runner.max_attempts);
            for (auto& item : released)
                cout << fmt::format("Submission {} {}", item.submit.id,
                                    item.result == store::release_result::QUARANTINED ? "quarantined" : "released")
                     << endl;
            cout << released.size() << " submissions affected" << endl;
        } else if (command == "runners") {
            return list_runners(store, config);
        } else if (command == "submission") {
            store::submission submit;
            if (!store.get_submission(vm.at("id").as<int64_t>(), submit)) {
                cerr << "Submission " << vm.at("id").as<int64_t>() << " does not exist" << endl;
                return EXIT_FAILURE;
            }
            print_submission(submit);
        } else if (command == "requeue") {
            return requeue(store, vm.at("id").as<int64_t>());
        } else {
            cerr << "Unknown command " << command << endl
                 << endl;
            cerr << desc << endl;
            return EXIT_FAILURE;
        }
    } catch (std::exception& ex) {
        LOG(ERROR) << "Command " << command << " failed: " << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
