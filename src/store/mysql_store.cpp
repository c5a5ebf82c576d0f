#include "store/mysql_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <tuple>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader::store {
using namespace std;

// 秒
static const int CONNECT_TIMEOUT = 10;

// clang-format off
static const char *SUBMISSION_COLUMNS =
    "id, "
    "IFNULL(DATE_FORMAT(date_submitted, '%Y-%m-%d %H:%i:%s'), ''), "
    "IFNULL(assigned_runner, -1), "
    "grading_tags, "
    "exec_finished, "
    "exec_status_code, "
    "IFNULL(exec_status_text, ''), "
    "IFNULL(DATE_FORMAT(exec_date_started, '%Y-%m-%d %H:%i:%s'), ''), "
    "IFNULL(DATE_FORMAT(exec_date_finished, '%Y-%m-%d %H:%i:%s'), ''), "
    "exec_attempts, "
    "github_address, github_org, github_repo, github_user, github_commit";
// clang-format on

typedef tuple<int64_t, string, int, string, int, int, string, string, string, int, string, string, string, string, string> submission_row;

static submission to_submission(const submission_row &row) {
    submission submit;
    string date_submitted, grading_tags, date_started, date_finished;
    int exec_finished, exec_status_code;
    tie(submit.id, date_submitted, submit.assigned_runner, grading_tags, exec_finished, exec_status_code,
        submit.exec_status_text, date_started, date_finished, submit.exec_attempts,
        submit.github_address, submit.github_org, submit.github_repo, submit.github_user, submit.github_commit) = row;
    submit.date_submitted = parse_time(date_submitted);
    submit.grading_tags = parse_tags(grading_tags);
    submit.exec_finished = exec_finished != 0;
    submit.exec_status = submission_status_from_code(exec_status_code);
    submit.exec_date_started = parse_time(date_started);
    submit.exec_date_finished = parse_time(date_finished);
    return submit;
}

mysql_store::mysql_store(const database_settings &dbcfg) {
    bool connected;
    try {
        connected = db.connect(dbcfg.host.c_str(), dbcfg.user.c_str(), dbcfg.password.c_str(), dbcfg.database.c_str(),
                               CONNECT_TIMEOUT, dbcfg.port);
    } catch (std::runtime_error &ex) {
        throw database_error(string("unable to connect to database: ") + ex.what());
    }
    if (!connected)
        throw database_error(fmt::format("unable to connect to database {} at {}:{}", dbcfg.database, dbcfg.host, dbcfg.port));
}

template <typename... Args>
void mysql_store::execute(const char *sql, Args &&... args) {
    try {
        db.execute(sql, forward<Args>(args)...);
    } catch (std::runtime_error &ex) {
        throw database_error(string(ex.what()) + " in statement: " + sql);
    }
}

template <typename T, typename... Args>
vector<T> mysql_store::query(const char *sql, Args &&... args) {
    try {
        return db.query<T>(sql, forward<Args>(args)...);
    } catch (std::runtime_error &ex) {
        throw database_error(string(ex.what()) + " in query: " + sql);
    }
}

int64_t mysql_store::affected_rows() {
    auto rows = query<tuple<int64_t>>("SELECT ROW_COUNT()");
    if (rows.empty()) throw database_error("ROW_COUNT() returned nothing");
    return get<0>(rows[0]);
}

void mysql_store::init_schema() {
    execute(R"(CREATE TABLE IF NOT EXISTS submissions (
        id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,
        date_submitted DATETIME(6) NOT NULL,
        assigned_runner INT NULL,
        grading_tags TEXT NOT NULL,
        exec_finished TINYINT(1) NOT NULL DEFAULT 0,
        exec_status_code INT NOT NULL DEFAULT 0,
        exec_status_text TEXT NULL,
        exec_date_started DATETIME(6) NULL,
        exec_date_finished DATETIME(6) NULL,
        exec_attempts INT NOT NULL DEFAULT 0,
        github_address VARCHAR(255) NOT NULL,
        github_org VARCHAR(255) NOT NULL,
        github_repo VARCHAR(255) NOT NULL,
        github_user VARCHAR(255) NOT NULL,
        github_commit VARCHAR(64) NOT NULL,
        KEY idx_pending (exec_finished, assigned_runner, id)
    ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4)");
    execute(R"(CREATE TABLE IF NOT EXISTS runners (
        id INT NOT NULL PRIMARY KEY,
        pid BIGINT NULL,
        last_pinged DATETIME(6) NULL
    ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4)");
}

int64_t mysql_store::insert_submission(const submission &submit) {
    execute("INSERT INTO submissions (date_submitted, assigned_runner, grading_tags, exec_finished, exec_status_code, exec_attempts, "
            "github_address, github_org, github_repo, github_user, github_commit) "
            "VALUES (NOW(6), NULL, ?, 0, 0, 0, ?, ?, ?, ?, ?)",
            join_tags(submit.grading_tags), submit.github_address, submit.github_org,
            submit.github_repo, submit.github_user, submit.github_commit);
    auto rows = query<tuple<int64_t>>("SELECT LAST_INSERT_ID()");
    if (rows.empty()) throw database_error("LAST_INSERT_ID() returned nothing");
    int64_t id = get<0>(rows[0]);
    LOG(INFO) << "Inserted submission " << id << " for " << submit.github_org << "/" << submit.github_repo << "@" << submit.github_commit;
    return id;
}

vector<submission> mysql_store::query_submissions(const string &where, int64_t arg) {
    string sql = string("SELECT ") + SUBMISSION_COLUMNS + " FROM submissions WHERE " + where;
    auto rows = query<submission_row>(sql.c_str(), arg);
    vector<submission> result;
    for (auto &row : rows) result.push_back(to_submission(row));
    return result;
}

bool mysql_store::claim_submission(int runner_id, submission &submit) {
    // 这是整个系统中唯一决定"谁来执行"的语句，必须是一条单独的条件更新
    // id=LAST_INSERT_ID(id) 让本连接记住被认领的行
    execute("UPDATE submissions SET assigned_runner=?, exec_date_started=NOW(6), exec_attempts=exec_attempts+1, id=LAST_INSERT_ID(id) "
            "WHERE assigned_runner IS NULL AND exec_finished=0 ORDER BY id LIMIT 1",
            runner_id);
    if (affected_rows() != 1) return false;

    auto rows = query_submissions("id=LAST_INSERT_ID() AND assigned_runner=?", runner_id);
    if (rows.empty())
        throw database_error("claimed submission of runner " + to_string(runner_id) + " disappeared");
    submit = rows[0];
    LOG(INFO) << "Runner " << runner_id << " claimed submission " << submit.id << " (attempt " << submit.exec_attempts << ")";
    return true;
}

bool mysql_store::mark_running(int64_t submission_id, int runner_id) {
    execute("UPDATE submissions SET exec_status_code=?, exec_date_started=NOW(6) WHERE id=? AND assigned_runner=? AND exec_finished=0",
            static_cast<int>(submission_status::RUNNING), submission_id, runner_id);
    return affected_rows() == 1;
}

bool mysql_store::finalize_submission(int64_t submission_id, int runner_id, submission_status status, const string &status_text) {
    execute("UPDATE submissions SET exec_finished=1, exec_status_code=?, exec_status_text=?, exec_date_finished=NOW(6) "
            "WHERE id=? AND assigned_runner=? AND exec_finished=0",
            static_cast<int>(status), status_text, submission_id, runner_id);
    bool owned = affected_rows() == 1;
    if (owned)
        LOG(INFO) << "Submission " << submission_id << " finished by runner " << runner_id << ": " << get_display_message(status);
    else
        LOG(WARNING) << "Submission " << submission_id << " is no longer owned by runner " << runner_id << ", result dropped";
    return owned;
}

release_result mysql_store::release_submission(int64_t submission_id, int runner_id, int max_attempts) {
    execute("UPDATE submissions SET exec_finished=1, exec_status_code=?, exec_status_text=?, exec_date_finished=NOW(6) "
            "WHERE id=? AND assigned_runner=? AND exec_finished=0 AND exec_attempts>=?",
            static_cast<int>(submission_status::QUARANTINED),
            string("The submission was interrupted too many times while being graded and will not be retried."),
            submission_id, runner_id, max_attempts);
    if (affected_rows() == 1) {
        LOG(WARNING) << "Submission " << submission_id << " quarantined after " << max_attempts << " attempts";
        return release_result::QUARANTINED;
    }

    execute("UPDATE submissions SET assigned_runner=NULL, exec_status_code=?, exec_date_started=NULL "
            "WHERE id=? AND assigned_runner=? AND exec_finished=0",
            static_cast<int>(submission_status::NOT_STARTED), submission_id, runner_id);
    if (affected_rows() == 1) {
        LOG(INFO) << "Submission " << submission_id << " released from runner " << runner_id;
        return release_result::RELEASED;
    }
    return release_result::NOT_OWNED;
}

bool mysql_store::get_submission(int64_t submission_id, submission &submit) {
    auto rows = query_submissions("id=?", submission_id);
    if (rows.empty()) return false;
    submit = rows[0];
    return true;
}

vector<submission> mysql_store::unfinished_submissions(int runner_id) {
    return query_submissions("assigned_runner=? AND exec_finished=0 ORDER BY id", runner_id);
}

pair<int64_t, int64_t> mysql_store::count_active() {
    auto rows = query<tuple<int64_t, int64_t>>(
        "SELECT IFNULL(SUM(assigned_runner IS NULL), 0), IFNULL(SUM(assigned_runner IS NOT NULL), 0) FROM submissions WHERE exec_finished=0");
    if (rows.empty()) return {0, 0};
    return {get<0>(rows[0]), get<1>(rows[0])};
}

void mysql_store::heartbeat(int runner_id, int64_t pid) {
    // last_pinged 取 GREATEST 保证在时钟回拨时也不会倒退
    execute("INSERT INTO runners (id, pid, last_pinged) VALUES (?, ?, NOW(6)) "
            "ON DUPLICATE KEY UPDATE pid=VALUES(pid), last_pinged=GREATEST(IFNULL(last_pinged, NOW(6)), NOW(6))",
            runner_id, pid);
    VLOG(1) << "Runner " << runner_id << " heartbeat";
}

void mysql_store::clear_runner(int runner_id) {
    execute("UPDATE runners SET pid=NULL WHERE id=?", runner_id);
}

vector<runner> mysql_store::list_runners() {
    auto rows = query<tuple<int, int64_t, string>>(
        "SELECT id, IFNULL(pid, 0), IFNULL(DATE_FORMAT(last_pinged, '%Y-%m-%d %H:%i:%s'), '') FROM runners ORDER BY id");
    vector<runner> result;
    for (auto &row : rows) {
        runner r;
        string last_pinged;
        tie(r.id, r.pid, last_pinged) = row;
        r.last_pinged = parse_time(last_pinged);
        result.push_back(r);
    }
    return result;
}

vector<int> mysql_store::stale_runners(chrono::seconds threshold) {
    // 也包括持有提交但根本没有 runner 行的 runner id
    auto rows = query<tuple<int>>(
        "SELECT id FROM runners WHERE last_pinged IS NULL OR last_pinged < NOW(6) - INTERVAL ? SECOND "
        "UNION "
        "SELECT DISTINCT assigned_runner FROM submissions WHERE exec_finished=0 AND assigned_runner IS NOT NULL "
        "AND assigned_runner NOT IN (SELECT id FROM runners)",
        static_cast<int64_t>(threshold.count()));
    vector<int> result;
    for (auto &row : rows) result.push_back(get<0>(row));
    return result;
}

}  // namespace grader::store
