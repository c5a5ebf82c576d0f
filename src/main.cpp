#include <curl/curl.h>
#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "executor/checker.hpp"
#include "executor/fetcher.hpp"
#include "reporter/reporter.hpp"
#include "store/mysql_store.hpp"
#include "worker.hpp"
using namespace std;

void signal_handler(int /* signum */) {
    grader::stop_runner();
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("grader-runner options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("settings", po::value<string>(), "path to the JSON settings file. You can either pass it from environ GRADER_SETTINGS")
        ("runner-id", po::value<int>()->default_value(0), "stable identity of this runner, in [0, runner.n_runners)")
        ("watchdog", "also sweep stale runners periodically and release their submissions")
        ("debug", "turn on the debug mode to keep the workspace of each submission for inspection")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader-runner: claim submissions from the queue, build and test them, report the results" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader-runner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        grader::DEBUG = true;
    }

    grader::settings config;
    try {
        config = grader::load_settings(grader::resolve_settings_path(vm.count("settings") ? vm.at("settings").as<string>() : ""));
    } catch (grader::grader_exception& ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }
    grader::setup_logging(config);

    int runner_id = vm.at("runner-id").as<int>();
    CHECK(runner_id >= 0 && runner_id < config.runner.n_runners)
        << "runner id " << runner_id << " is out of range [0, " << config.runner.n_runners << ")";
    CHECK(filesystem::is_directory(config.runner.test_root))
        << "test root " << config.runner.test_root << " is not a directory";
    CHECK(!config.runner.workspace_dir.empty())
        << "runner.workspace_dir should be specified";
    filesystem::create_directories(config.runner.workspace_dir);

    CHECK(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) << "unable to initialize curl";
    defer { curl_global_cleanup(); };

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    grader::executor::register_default_checkers();

    unique_ptr<grader::reporter::result_reporter> reporter;
    if (config.github.auth_token.empty()) {
        LOG(WARNING) << "github.auth_token is not set, results will only be logged";
        reporter = make_unique<grader::reporter::log_reporter>();
    } else {
        reporter = make_unique<grader::reporter::github_reporter>(config.github);
    }
    grader::executor::git_fetcher fetcher(config.github);

    auto connect = [&]() -> unique_ptr<grader::store::job_store> {
        return make_unique<grader::store::mysql_store>(config.database);
    };

    LOG(INFO) << "Starting runner " << runner_id << " (pid " << getpid() << ")";
    try {
        grader::run_runner(config, runner_id, vm.count("watchdog") > 0, connect, *reporter, fetcher);
    } catch (std::exception& ex) {
        LOG(ERROR) << "Runner " << runner_id << " terminated: " << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
