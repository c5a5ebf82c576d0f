#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <iterator>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gateway/gateway.hpp"
#include "reporter/reporter.hpp"
#include "store/mysql_store.hpp"
using namespace std;

// 退出码，供 Web 层区分拒绝的原因
static const int EXIT_AUTHENTICATION_FAILED = 2;
static const int EXIT_MALFORMED_PAYLOAD = 3;

static int respond(int code, const string& message, int exit_code) {
    grader::gateway::ingest_response response;
    response.code = code;
    response.message = message;
    cout << nlohmann::json(response).dump() << endl;
    return exit_code;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("grader-ingest options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("settings", po::value<string>(), "path to the JSON settings file. You can either pass it from environ GRADER_SETTINGS")
        ("event", po::value<string>()->default_value(""), "value of the X-Github-Event header")
        ("signature", po::value<string>()->default_value(""), "value of the X-Hub-Signature-256 header")
        ("payload", po::value<string>(), "file containing the raw request body, read from stdin if omitted")
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
        cout << "grader-ingest: validate a GitHub webhook request and enqueue the submission" << endl
             << "Prints {code, message} as JSON. Exit status: 0 accepted, 2 authentication failed, 3 malformed payload, 1 other errors" << endl
             << "Usage: " << argv[0] << " --event push --signature sha256=... [--payload body.json] [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader-ingest 1.0" << endl;
        return EXIT_SUCCESS;
    }

    grader::settings config;
    try {
        config = grader::load_settings(grader::resolve_settings_path(vm.count("settings") ? vm.at("settings").as<string>() : ""));
    } catch (grader::grader_exception& ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }
    grader::setup_logging(config);

    CHECK(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) << "unable to initialize curl";
    defer { curl_global_cleanup(); };

    grader::gateway::ingest_request request;
    request.event = vm.at("event").as<string>();
    request.signature = vm.at("signature").as<string>();

    try {
        if (vm.count("payload")) {
            request.body = grader::read_file_content(vm.at("payload").as<string>());
        } else {
            request.body.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
        }

        unique_ptr<grader::reporter::result_reporter> reporter;
        if (config.github.auth_token.empty())
            reporter = make_unique<grader::reporter::log_reporter>();
        else
            reporter = make_unique<grader::reporter::github_reporter>(config.github);

        auto connect = [&config]() -> unique_ptr<grader::store::job_store> {
            return make_unique<grader::store::mysql_store>(config.database);
        };
        auto response = grader::gateway::ingest(config.github, request, connect, *reporter, config.notify.path);
        cout << nlohmann::json(response).dump() << endl;
        return EXIT_SUCCESS;
    } catch (grader::authentication_failed& ex) {
        return respond(401, ex.what(), EXIT_AUTHENTICATION_FAILED);
    } catch (grader::malformed_payload& ex) {
        return respond(400, ex.what(), EXIT_MALFORMED_PAYLOAD);
    } catch (std::exception& ex) {
        LOG(ERROR) << "Unable to ingest request: " << boost::diagnostic_information(ex);
        return respond(500, "contact autograder responsible", EXIT_FAILURE);
    }
}
