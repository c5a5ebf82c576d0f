#include <stdlib.h>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;

static const char *SETTINGS = R"({
    "database": {"host": "127.0.0.1", "user": "grader", "password": "secret", "database": "grader"},
    "notify": {"path": "/run/grader/notify"},
    "github": {"address": "gits-15.sys.kth.se", "org": "inda-master", "webhook_secret": "from-file"},
    "runner": {"n_runners": 4, "heartbeat_interval_seconds": 5, "workspace_dir": "/tmp/grader", "test_root": "/srv/tests"}
})";

class ConfigTest : public ::testing::Test {
protected:
    grader::test::temp_directory dir;

    void TearDown() override {
        unsetenv("GRADER_GITHUB_WEBHOOK_SECRET");
        unsetenv("GRADER_RUNNER_N_RUNNERS");
        unsetenv("GRADER_SETTINGS");
        unsetenv("GRADER_DATABASE_PORT");
    }
};

TEST_F(ConfigTest, LoadWithDefaults) {
    auto config = load_settings(dir.write("settings.json", SETTINGS));
    EXPECT_EQ("127.0.0.1", config.database.host);
    EXPECT_EQ(3306u, config.database.port);
    EXPECT_EQ("inda-master", config.github.org);
    EXPECT_EQ("refs/heads/master", config.github.branch);
    EXPECT_FALSE(config.github.allow_any_org);
    EXPECT_EQ(4, config.runner.n_runners);
    EXPECT_EQ(3, config.runner.max_attempts);
    EXPECT_EQ(chrono::seconds(5), config.runner.heartbeat_interval());
    EXPECT_EQ(chrono::seconds(15), config.runner.staleness_threshold());
    EXPECT_EQ(filesystem::path("/srv/tests"), config.runner.test_root);
    EXPECT_EQ(5000, config.notify.poll_timeout_millisec);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    setenv("GRADER_GITHUB_WEBHOOK_SECRET", "from-env", 1);
    setenv("GRADER_RUNNER_N_RUNNERS", "8", 1);
    auto config = load_settings(dir.write("settings.json", SETTINGS));
    EXPECT_EQ("from-env", config.github.webhook_secret);
    EXPECT_EQ(8, config.runner.n_runners);

    setenv("GRADER_RUNNER_N_RUNNERS", "many", 1);
    EXPECT_THROW(load_settings(dir.path() / "settings.json"), internal_error);
}

TEST_F(ConfigTest, DatabasePort) {
    auto j = nlohmann::json::parse(SETTINGS);
    j["database"]["port"] = 3307;
    auto config = load_settings(dir.write("port.json", j.dump()));
    EXPECT_EQ(3307u, config.database.port);

    setenv("GRADER_DATABASE_PORT", "13306", 1);
    config = load_settings(dir.path() / "port.json");
    EXPECT_EQ(13306u, config.database.port);
}

TEST_F(ConfigTest, InvalidSettings) {
    EXPECT_THROW(load_settings(dir.path() / "missing.json"), internal_error);
    EXPECT_THROW(load_settings(dir.write("broken.json", "{")), internal_error);
    EXPECT_THROW(load_settings(dir.write("partial.json", R"({"database": {}})")), internal_error);

    auto j = nlohmann::json::parse(SETTINGS);
    j["runner"]["staleness_multiplier"] = 1;
    EXPECT_THROW(load_settings(dir.write("jitter.json", j.dump())), internal_error);

    j = nlohmann::json::parse(SETTINGS);
    j["runner"]["n_runners"] = 0;
    EXPECT_THROW(load_settings(dir.write("empty.json", j.dump())), internal_error);
}

TEST_F(ConfigTest, SettingsPath) {
    unsetenv("GRADER_SETTINGS");
    EXPECT_EQ(filesystem::path("/etc/grader.json"), resolve_settings_path("/etc/grader.json"));
    EXPECT_THROW(resolve_settings_path(""), internal_error);
    setenv("GRADER_SETTINGS", "/srv/grader.json", 1);
    EXPECT_EQ(filesystem::path("/srv/grader.json"), resolve_settings_path(""));
}
