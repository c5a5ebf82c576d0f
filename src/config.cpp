#include "config.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

bool DEBUG = false;

chrono::seconds runner_settings::heartbeat_interval() const {
    return chrono::seconds(heartbeat_interval_seconds);
}

chrono::seconds runner_settings::staleness_threshold() const {
    return chrono::seconds(heartbeat_interval_seconds * staleness_multiplier);
}

void from_json(const json &j, log_settings &log) {
    if (j.count("dir"))
        j.at("dir").get_to(log.dir);
    if (j.count("verbose"))
        j.at("verbose").get_to(log.verbose);
}

void from_json(const json &j, database_settings &db) {
    j.at("host").get_to(db.host);
    if (j.count("port"))
        j.at("port").get_to(db.port);
    j.at("user").get_to(db.user);
    j.at("password").get_to(db.password);
    j.at("database").get_to(db.database);
}

void from_json(const json &j, notify_settings &notify) {
    notify.path = j.at("path").get<string>();
    if (j.count("poll_timeout_millisec"))
        j.at("poll_timeout_millisec").get_to(notify.poll_timeout_millisec);
}

void from_json(const json &j, github_settings &github) {
    j.at("address").get_to(github.address);
    j.at("org").get_to(github.org);
    if (j.count("allow_any_org"))
        j.at("allow_any_org").get_to(github.allow_any_org);
    if (j.count("branch"))
        j.at("branch").get_to(github.branch);
    if (j.count("allowed_repo_prefixes"))
        j.at("allowed_repo_prefixes").get_to(github.allowed_repo_prefixes);
    if (j.count("allowed_repo_suffixes"))
        j.at("allowed_repo_suffixes").get_to(github.allowed_repo_suffixes);
    if (j.count("prohibited_repo_prefixes"))
        j.at("prohibited_repo_prefixes").get_to(github.prohibited_repo_prefixes);
    if (j.count("prohibited_repo_suffixes"))
        j.at("prohibited_repo_suffixes").get_to(github.prohibited_repo_suffixes);
    if (j.count("auth_token"))
        j.at("auth_token").get_to(github.auth_token);
    if (j.count("webhook_secret"))
        j.at("webhook_secret").get_to(github.webhook_secret);
    if (j.count("max_payload"))
        j.at("max_payload").get_to(github.max_payload);
    if (j.count("comment_signature"))
        j.at("comment_signature").get_to(github.comment_signature);
}

void from_json(const json &j, runner_settings &runner) {
    if (j.count("n_runners"))
        j.at("n_runners").get_to(runner.n_runners);
    if (j.count("database_poll_interval_seconds"))
        j.at("database_poll_interval_seconds").get_to(runner.database_poll_interval_seconds);
    if (j.count("heartbeat_interval_seconds"))
        j.at("heartbeat_interval_seconds").get_to(runner.heartbeat_interval_seconds);
    if (j.count("staleness_multiplier"))
        j.at("staleness_multiplier").get_to(runner.staleness_multiplier);
    if (j.count("max_attempts"))
        j.at("max_attempts").get_to(runner.max_attempts);
    if (j.count("watchdog_interval_seconds"))
        j.at("watchdog_interval_seconds").get_to(runner.watchdog_interval_seconds);
    runner.workspace_dir = j.at("workspace_dir").get<string>();
    runner.test_root = j.at("test_root").get<string>();
}

void from_json(const json &j, settings &config) {
    if (j.count("name"))
        j.at("name").get_to(config.name);
    if (j.count("log"))
        j.at("log").get_to(config.log);
    j.at("database").get_to(config.database);
    j.at("notify").get_to(config.notify);
    j.at("github").get_to(config.github);
    j.at("runner").get_to(config.runner);
}

template <typename T>
static void override_from_env(const char *key, T &value) {
    if (const char *env = getenv(key)) {
        try {
            value = boost::lexical_cast<T>(env);
        } catch (boost::bad_lexical_cast &) {
            throw internal_error(string("invalid value of environment variable ") + key + ": " + env);
        }
    }
}

static void override_from_env(const char *key, filesystem::path &value) {
    if (const char *env = getenv(key)) value = env;
}

void apply_env_overrides(settings &config) {
    override_from_env("GRADER_LOG_DIR", config.log.dir);
    if (const char *verbose = getenv("GRADER_LOG_VERBOSE"))
        config.log.verbose = parse_bool(verbose);
    override_from_env("GRADER_GITHUB_AUTH_TOKEN", config.github.auth_token);
    override_from_env("GRADER_GITHUB_WEBHOOK_SECRET", config.github.webhook_secret);
    override_from_env("GRADER_DATABASE_HOST", config.database.host);
    override_from_env("GRADER_DATABASE_PORT", config.database.port);
    override_from_env("GRADER_DATABASE_USER", config.database.user);
    override_from_env("GRADER_DATABASE_PASSWORD", config.database.password);
    override_from_env("GRADER_DATABASE_NAME", config.database.database);
    override_from_env("GRADER_RUNNER_N_RUNNERS", config.runner.n_runners);
    override_from_env("GRADER_RUNNER_DATABASE_POLL_INTERVAL_SECONDS", config.runner.database_poll_interval_seconds);
    override_from_env("GRADER_RUNNER_WORKSPACE_DIR", config.runner.workspace_dir);
    override_from_env("GRADER_RUNNER_TEST_ROOT", config.runner.test_root);
}

void validate_settings(const settings &config) {
    const auto &runner = config.runner;
    if (runner.n_runners <= 0)
        throw internal_error("runner.n_runners must be positive");
    if (runner.database_poll_interval_seconds <= 0)
        throw internal_error("runner.database_poll_interval_seconds must be positive");
    if (runner.heartbeat_interval_seconds <= 0)
        throw internal_error("runner.heartbeat_interval_seconds must be positive");
    // 阈值太接近心跳间隔时，调度抖动就会让活着的 runner 被误判为死亡
    if (runner.staleness_multiplier < 2)
        throw internal_error("runner.staleness_multiplier must be at least 2");
    if (runner.max_attempts < 1)
        throw internal_error("runner.max_attempts must be at least 1");
    if (runner.watchdog_interval_seconds <= 0)
        throw internal_error("runner.watchdog_interval_seconds must be positive");
    if (config.notify.poll_timeout_millisec <= 0)
        throw internal_error("notify.poll_timeout_millisec must be positive");
}

settings load_settings(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw internal_error("unable to find configuration file " + path.string());

    settings config;
    try {
        json j = json::parse(read_file_content(path));
        config = j.get<settings>();
    } catch (json::exception &ex) {
        throw internal_error("configuration file " + path.string() + " is malformed: " + ex.what());
    }

    apply_env_overrides(config);
    validate_settings(config);
    return config;
}

filesystem::path resolve_settings_path(const string &option) {
    if (!option.empty()) return option;
    string path = get_env("GRADER_SETTINGS", "");
    if (path.empty())
        throw internal_error("configuration file is not specified, pass --settings or set GRADER_SETTINGS");
    return path;
}

void setup_logging(const settings &config) {
    if (!config.log.dir.empty()) {
        filesystem::create_directories(config.log.dir);
        FLAGS_log_dir = config.log.dir;
    } else {
        FLAGS_logtostderr = true;
    }
    if (config.log.verbose) {
        FLAGS_v = 1;
        FLAGS_alsologtostderr = true;
    }
}

}  // namespace grader
