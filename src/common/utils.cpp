#include "common/utils.hpp"
#include <boost/algorithm/string.hpp>
#include <ctime>
#include <sstream>

namespace grader {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

bool parse_bool(const string &value) {
    string lower = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

vector<string> split_nonempty(const string &str, char delim) {
    vector<string> result;
    string token;
    istringstream ss(str);
    while (getline(ss, token, delim))
        if (!token.empty()) result.push_back(token);
    return result;
}

string join_tags(const set<string> &tags) {
    return boost::algorithm::join(tags, ";");
}

set<string> parse_tags(const string &joined) {
    auto tokens = split_nonempty(joined, ';');
    return set<string>(tokens.begin(), tokens.end());
}

string format_time(time_t time) {
    if (time == 0) return "";
    struct tm tm;
    localtime_r(&time, &tm);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

time_t parse_time(const string &str) {
    if (str.empty()) return 0;
    struct tm tm = {};
    // 忽略 DATETIME(6) 的小数部分
    if (!strptime(str.c_str(), "%Y-%m-%d %H:%M:%S", &tm)) return 0;
    tm.tm_isdst = -1;
    return mktime(&tm);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace grader
