#include "plan/test_config.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <climits>
#include <optional>
#include <toml++/toml.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader::plan {
using namespace std;
namespace fs = std::filesystem;
using nlohmann::json;

static const string CONFIG_FILE = "config.toml";
static const string TEST_SUFFIX = ".test.toml";

/**
 * @brief 从祖先节点累积下来的 [test] 与 [test.options]
 * 合并是浅层的：子节点的同名键覆盖父节点的值，没有设置的键保持父节点的值。
 */
struct partial_test {
    json test = json::object();
    json options = json::object();
};

/**
 * @brief 一个 config.toml 或者 .test.toml 文件的内容
 */
struct node_config {
    optional<string> title;
    optional<string> description;
    set<string> tags;
    vector<string> include;
    partial_test test;
    // 只有根目录的 config.toml 有，指向解析出来的 toml::table 内部
    const toml::table *build = nullptr;
    const toml::table *limits = nullptr;
};

static toml::table parse_toml(const fs::path &path) {
    try {
        return toml::parse_file(path.string());
    } catch (const toml::parse_error &err) {
        auto &begin = err.source().begin;
        throw malformed_test_config(fmt::format("{}:{}:{}: {}", path, begin.line, begin.column, err.description()));
    }
}

static json toml_to_json(const toml::node &node, const fs::path &source, const string &key) {
    if (auto v = node.as_string()) return json(v->get());
    if (auto v = node.as_integer()) return json(v->get());
    if (auto v = node.as_floating_point()) return json(v->get());
    if (auto v = node.as_boolean()) return json(v->get());
    if (auto arr = node.as_array()) {
        json j = json::array();
        for (auto &elem : *arr)
            j.push_back(toml_to_json(elem, source, key));
        return j;
    }
    if (auto tbl = node.as_table()) {
        json j = json::object();
        for (auto &&[k, v] : *tbl)
            j[string(k.str())] = toml_to_json(v, source, key);
        return j;
    }
    throw malformed_test_config(fmt::format("{}: unsupported value type of key {}", source, key));
}

static optional<string> optional_string(const toml::table &tbl, const string &key, const fs::path &source) {
    auto node = tbl[key];
    if (!node) return {};
    if (!node.is_string())
        throw malformed_test_config(fmt::format("{}: {} must be a string", source, key));
    return node.value<string>();
}

static optional<bool> optional_bool(const toml::table &tbl, const string &key, const fs::path &source) {
    auto node = tbl[key];
    if (!node) return {};
    if (!node.is_boolean())
        throw malformed_test_config(fmt::format("{}: {} must be a boolean", source, key));
    return node.value<bool>();
}

static vector<string> string_array(const toml::table &tbl, const string &key, const fs::path &source) {
    vector<string> result;
    auto node = tbl[key];
    if (!node) return result;
    auto arr = node.as_array();
    if (!arr)
        throw malformed_test_config(fmt::format("{}: {} must be an array of strings", source, key));
    for (auto &elem : *arr) {
        auto value = elem.value<string>();
        if (!value || !elem.is_string())
            throw malformed_test_config(fmt::format("{}: {} must be an array of strings", source, key));
        result.push_back(*value);
    }
    return result;
}

static partial_test read_test_table(const toml::table &tbl, const fs::path &source) {
    partial_test result;
    auto node = tbl["test"];
    if (!node) return result;
    auto test = node.as_table();
    if (!test)
        throw malformed_test_config(fmt::format("{}: [test] must be a table", source));

    for (auto &&[k, v] : *test) {
        string key(k.str());
        if (key == "options") {
            auto options = v.as_table();
            if (!options)
                throw malformed_test_config(fmt::format("{}: [test.options] must be a table", source));
            for (auto &&[ok, ov] : *options) {
                string option_key(ok.str());
                result.options[option_key] = toml_to_json(ov, source, option_key);
            }
        } else if (key == "kind") {
            if (!v.is_string())
                throw malformed_test_config(fmt::format("{}: test.kind must be a string", source));
            result.test["kind"] = *v.value<string>();
        } else if (key == "timeout") {
            if (!v.is_integer() || *v.value<int64_t>() <= 0 || *v.value<int64_t>() > INT_MAX)
                throw malformed_test_config(fmt::format("{}: test.timeout must be a positive integer", source));
            result.test["timeout"] = *v.value<int64_t>();
        } else {
            throw malformed_test_config(fmt::format("{}: unknown key test.{}", source, key));
        }
    }
    return result;
}

static node_config read_node(const toml::table &tbl, const fs::path &source, bool is_dir, bool is_root) {
    node_config cfg;
    for (auto &&[k, v] : tbl) {
        string key(k.str());
        if (key == "description" || key == "tags" || key == "test") continue;
        if (is_dir && (key == "title" || key == "include")) continue;
        if (is_root && (key == "build" || key == "limits")) continue;
        throw malformed_test_config(fmt::format("{}: unknown key {}", source, key));
    }

    if (is_dir) cfg.title = optional_string(tbl, "title", source);
    cfg.description = optional_string(tbl, "description", source);
    for (auto &tag : string_array(tbl, "tags", source))
        cfg.tags.insert(tag);
    if (is_dir) cfg.include = string_array(tbl, "include", source);
    cfg.test = read_test_table(tbl, source);
    if (is_root) {
        cfg.build = tbl["build"].as_table();
        cfg.limits = tbl["limits"].as_table();
        if (tbl["build"] && !cfg.build)
            throw malformed_test_config(fmt::format("{}: [build] must be a table", source));
        if (tbl["limits"] && !cfg.limits)
            throw malformed_test_config(fmt::format("{}: [limits] must be a table", source));
    }
    return cfg;
}

static partial_test merge(const partial_test &parent, const partial_test &child) {
    partial_test result = parent;
    for (auto &[key, value] : child.test.items())
        result.test[key] = value;
    for (auto &[key, value] : child.options.items())
        result.options[key] = value;
    return result;
}

static int positive_int(const toml::table &tbl, const string &key, int def, const fs::path &source) {
    auto node = tbl[key];
    if (!node) return def;
    if (!node.is_integer() || *node.value<int64_t>() <= 0 || *node.value<int64_t>() > INT_MAX)
        throw malformed_test_config(fmt::format("{}: {} must be a positive integer", source, key));
    return (int)*node.value<int64_t>();
}

static void read_build_config(const toml::table &tbl, build_config &build, const fs::path &source) {
    for (auto &&[k, v] : tbl) {
        string key(k.str());
        if (key != "srcdir" && key != "cmd" && key != "timeout" && key != "prohibit_binary_files" &&
            key != "allowed_binary_files" && key != "allowed_binary_mimetypes")
            throw malformed_test_config(fmt::format("{}: unknown key build.{}", source, key));
    }
    if (auto srcdir = optional_string(tbl, "srcdir", source))
        build.srcdir = assert_safe_path(*srcdir);
    if (tbl["cmd"]) {
        build.cmd = string_array(tbl, "cmd", source);
        if (build.cmd.empty())
            throw malformed_test_config(fmt::format("{}: build.cmd must not be empty", source));
    }
    build.timeout = positive_int(tbl, "timeout", build.timeout, source);
    if (auto prohibit = optional_bool(tbl, "prohibit_binary_files", source))
        build.prohibit_binary_files = *prohibit;
    for (auto &file : string_array(tbl, "allowed_binary_files", source))
        build.allowed_binary_files.push_back(assert_safe_path(file));
    build.allowed_binary_mimetypes = string_array(tbl, "allowed_binary_mimetypes", source);
}

static void read_limits_config(const toml::table &tbl, limits_config &limits, const fs::path &source) {
    for (auto &&[k, v] : tbl) {
        string key(k.str());
        if (key != "timeout_test" && key != "max_output" && key != "timeout_total")
            throw malformed_test_config(fmt::format("{}: unknown key limits.{}", source, key));
    }
    limits.timeout_test = positive_int(tbl, "timeout_test", limits.timeout_test, source);
    limits.max_output = positive_int(tbl, "max_output", (int)limits.max_output, source);
    limits.timeout_total = positive_int(tbl, "timeout_total", limits.timeout_total, source);
}

static json default_options(test_kind kind) {
    switch (kind) {
        case test_kind::RUN:
            return {
                {"bin", ""},
                {"args", json::array()},
                {"code", 0},
                {"ignore_stdin", false},
                {"stdin", ""},
                {"ignore_stdout", false},
                {"trim_stdout", false},
                {"strip_whitespace_stdout", false},
                {"stdout", ""},
                {"ignore_stderr", true},
                {"trim_stderr", false},
                {"strip_whitespace_stderr", false},
                {"stderr", ""},
                {"auto_input_files", json::array()}};
        case test_kind::GEN_ASM_AND_RUN:
            return {
                {"bin", ""},
                {"args", json::array()},
                {"code", 0},
                {"ignore_stdin", false},
                {"stdin", ""},
                {"ignore_stderr", true},
                {"trim_stderr", false},
                {"strip_whitespace_stderr", false},
                {"stderr", ""},
                {"assemble_cmd", json::array({"nasm", "-f", "elf64", "-o", "gen.o", "<ASM_FILE>"})},
                {"assemble_code", 0},
                {"compile_cmd", json::array({"cc", "-no-pie", "-o", "gen", "gen.o"})},
                {"compile_code", 0},
                {"run_cmd", json::array({"./gen"})},
                {"run_code", 0},
                {"run_ignore_stdin", false},
                {"run_stdin", ""},
                {"run_ignore_stdout", false},
                {"run_trim_stdout", false},
                {"run_strip_whitespace_stdout", false},
                {"run_stdout", ""},
                {"run_ignore_stderr", true},
                {"run_trim_stderr", false},
                {"run_strip_whitespace_stderr", false},
                {"run_stderr", ""},
                {"auto_input_files", json::array()}};
        case test_kind::CHECK_FILE_EXISTS:
            return {
                {"path", ""},
                {"ignore_mimetype", true},
                {"mimetype_prefix", ""}};
    }
    throw internal_error("unknown test kind");
}

static bool same_type(const json &expected, const json &actual) {
    if (expected.is_number_integer()) return actual.is_number_integer();
    if (expected.is_array()) {
        if (!actual.is_array()) return false;
        return all_of(actual.begin(), actual.end(), [](const json &elem) { return elem.is_string(); });
    }
    return expected.type() == actual.type();
}

static void from_json(const json &j, run_options &run) {
    j.at("bin").get_to(run.bin);
    j.at("args").get_to(run.args);
    j.at("code").get_to(run.code);
    j.at("ignore_stdin").get_to(run.ignore_stdin);
    j.at("stdin").get_to(run.stdin_content);
    j.at("ignore_stdout").get_to(run.ignore_stdout);
    j.at("trim_stdout").get_to(run.trim_stdout);
    j.at("strip_whitespace_stdout").get_to(run.strip_whitespace_stdout);
    j.at("stdout").get_to(run.stdout_content);
    j.at("ignore_stderr").get_to(run.ignore_stderr);
    j.at("trim_stderr").get_to(run.trim_stderr);
    j.at("strip_whitespace_stderr").get_to(run.strip_whitespace_stderr);
    j.at("stderr").get_to(run.stderr_content);
    j.at("auto_input_files").get_to(run.auto_input_files);
}

static void from_json(const json &j, gen_asm_options &gen) {
    j.at("bin").get_to(gen.generate.bin);
    j.at("args").get_to(gen.generate.args);
    j.at("code").get_to(gen.generate.code);
    j.at("ignore_stdin").get_to(gen.generate.ignore_stdin);
    j.at("stdin").get_to(gen.generate.stdin_content);
    gen.generate.ignore_stdout = true;
    j.at("ignore_stderr").get_to(gen.generate.ignore_stderr);
    j.at("trim_stderr").get_to(gen.generate.trim_stderr);
    j.at("strip_whitespace_stderr").get_to(gen.generate.strip_whitespace_stderr);
    j.at("stderr").get_to(gen.generate.stderr_content);
    j.at("auto_input_files").get_to(gen.generate.auto_input_files);

    j.at("assemble_cmd").get_to(gen.assemble_cmd);
    j.at("assemble_code").get_to(gen.assemble_code);
    j.at("compile_cmd").get_to(gen.compile_cmd);
    j.at("compile_code").get_to(gen.compile_code);

    j.at("run_cmd").get_to(gen.run_cmd);
    j.at("run_code").get_to(gen.run.code);
    j.at("run_ignore_stdin").get_to(gen.run.ignore_stdin);
    j.at("run_stdin").get_to(gen.run.stdin_content);
    j.at("run_ignore_stdout").get_to(gen.run.ignore_stdout);
    j.at("run_trim_stdout").get_to(gen.run.trim_stdout);
    j.at("run_strip_whitespace_stdout").get_to(gen.run.strip_whitespace_stdout);
    j.at("run_stdout").get_to(gen.run.stdout_content);
    j.at("run_ignore_stderr").get_to(gen.run.ignore_stderr);
    j.at("run_trim_stderr").get_to(gen.run.trim_stderr);
    j.at("run_strip_whitespace_stderr").get_to(gen.run.strip_whitespace_stderr);
    j.at("run_stderr").get_to(gen.run.stderr_content);
}

static void from_json(const json &j, check_file_options &check) {
    j.at("path").get_to(check.path);
    j.at("ignore_mimetype").get_to(check.ignore_mimetype);
    j.at("mimetype_prefix").get_to(check.mimetype_prefix);
}

static test_kind parse_kind(const string &kind, const fs::path &source) {
    if (kind == "run") return test_kind::RUN;
    if (kind == "gen_asm_and_run") return test_kind::GEN_ASM_AND_RUN;
    if (kind == "check_file_exists") return test_kind::CHECK_FILE_EXISTS;
    throw unsupported_test_kind(fmt::format("{}: unsupported test kind \"{}\"", source, kind));
}

const char *kind_name(test_kind kind) {
    switch (kind) {
        case test_kind::RUN: return "run";
        case test_kind::GEN_ASM_AND_RUN: return "gen_asm_and_run";
        case test_kind::CHECK_FILE_EXISTS: return "check_file_exists";
    }
    return "unknown";
}

static fs::path find_input_file(const fs::path &dir, const string &name, const vector<string> &suffixes, const fs::path &source) {
    fs::path found;
    for (auto &suffix : suffixes) {
        if (suffix.find('/') != string::npos)
            throw malformed_test_config(fmt::format("{}: invalid auto_input_files suffix \"{}\"", source, suffix));
        fs::path candidate = dir / (name + suffix);
        if (!fs::is_regular_file(candidate)) continue;
        if (!found.empty())
            throw malformed_test_config(fmt::format("{}: more than one input file found: {}, {}", source, found.filename(), candidate.filename()));
        found = candidate;
    }
    return found;
}

static test_case resolve_case(const fs::path &file, const node_config &leaf, const partial_test &inherited,
                              const string &group_description, const limits_config &limits) {
    string filename = file.filename().string();
    partial_test merged = merge(inherited, leaf.test);

    test_case result;
    result.name = filename.substr(0, filename.size() - TEST_SUFFIX.size());
    result.source = file;
    result.description = leaf.description ? *leaf.description : group_description;

    if (!merged.test.count("kind"))
        throw malformed_test_config(fmt::format("{}: test.kind is not specified", file));
    result.kind = parse_kind(merged.test.at("kind").get<string>(), file);
    result.timeout = merged.test.count("timeout") ? merged.test.at("timeout").get<int>() : limits.timeout_test;

    json options = default_options(result.kind);
    for (auto &[key, value] : merged.options.items()) {
        if (!options.count(key))
            throw malformed_test_config(fmt::format("{}: unknown option \"{}\" for kind {}", file, key, kind_name(result.kind)));
        if (!same_type(options[key], value))
            throw malformed_test_config(fmt::format("{}: option \"{}\" should be {}, got {}", file, key, options[key].type_name(), value.type_name()));
        if (value.is_number_integer() && (value.get<int64_t>() < INT_MIN || value.get<int64_t>() > INT_MAX))
            throw malformed_test_config(fmt::format("{}: option \"{}\" is out of range: {}", file, key, value.dump()));
        options[key] = value;
    }
    result.options = options;

    try {
        switch (result.kind) {
            case test_kind::RUN:
                from_json(options, result.run);
                if (result.run.bin.empty())
                    throw malformed_test_config(fmt::format("{}: option \"bin\" is required", file));
                result.input_file = find_input_file(file.parent_path(), result.name, result.run.auto_input_files, file);
                break;
            case test_kind::GEN_ASM_AND_RUN:
                from_json(options, result.gen_asm);
                if (result.gen_asm.generate.bin.empty())
                    throw malformed_test_config(fmt::format("{}: option \"bin\" is required", file));
                for (auto key : {"assemble_cmd", "compile_cmd", "run_cmd"})
                    if (options[key].empty())
                        throw malformed_test_config(fmt::format("{}: option \"{}\" must not be empty", file, key));
                result.input_file = find_input_file(file.parent_path(), result.name, result.gen_asm.generate.auto_input_files, file);
                break;
            case test_kind::CHECK_FILE_EXISTS:
                from_json(options, result.check_file);
                if (result.check_file.path.empty())
                    throw malformed_test_config(fmt::format("{}: option \"path\" is required", file));
                assert_safe_path(result.check_file.path);
                break;
        }
    } catch (json::exception &ex) {
        throw malformed_test_config(fmt::format("{}: {}", file, ex.what()));
    }
    return result;
}

static bool is_test_file(const fs::path &path) {
    string filename = path.filename().string();
    return filename.size() > TEST_SUFFIX.size() && boost::algorithm::ends_with(filename, TEST_SUFFIX);
}

struct tree_walker {
    const set<string> &tags;
    bool filter;
    limits_config limits;
    // 当前遍历路径上的目录，用于发现 include 产生的环
    vector<fs::path> stack;

    bool included(const set<string> &required) const {
        return !filter || includes(tags.begin(), tags.end(), required.begin(), required.end());
    }

    node_config read_dir_config(const fs::path &dir, bool is_root) {
        fs::path config_file = dir / CONFIG_FILE;
        if (!fs::is_regular_file(config_file)) return {};
        auto tbl = parse_toml(config_file);
        return read_node(tbl, config_file, true, is_root);
    }

    test_group walk(const fs::path &dir, const node_config &cfg, const partial_test &inherited) {
        fs::path canonical = fs::canonical(dir);
        if (find(stack.begin(), stack.end(), canonical) != stack.end())
            throw malformed_test_config(fmt::format("{}: directory is included recursively", dir));
        stack.push_back(canonical);

        test_group group;
        group.dir = dir;
        group.title = cfg.title ? *cfg.title : dir.filename().string();
        group.description = cfg.description ? *cfg.description : "";
        partial_test accumulated = merge(inherited, cfg.test);

        vector<fs::path> files, dirs;
        for (auto &entry : fs::directory_iterator(dir)) {
            string filename = entry.path().filename().string();
            if (boost::algorithm::starts_with(filename, ".")) continue;
            if (entry.is_directory())
                dirs.push_back(entry.path());
            else if (entry.is_regular_file() && is_test_file(entry.path()))
                files.push_back(entry.path());
        }
        sort(files.begin(), files.end());
        sort(dirs.begin(), dirs.end());
        for (auto &include : cfg.include) {
            fs::path included_dir = dir / include;
            if (!fs::is_directory(included_dir))
                throw malformed_test_config(fmt::format("{}: included directory {} does not exist", dir / CONFIG_FILE, include));
            dirs.push_back(included_dir);
        }

        for (auto &file : files) {
            auto tbl = parse_toml(file);
            auto leaf = read_node(tbl, file, false, false);
            if (!included(leaf.tags)) {
                VLOG(1) << "Skipping test " << file << " by tags";
                continue;
            }
            group.tests.push_back(resolve_case(file, leaf, accumulated, group.description, limits));
        }

        for (auto &subdir : dirs) {
            auto subcfg = read_dir_config(subdir, false);
            if (!included(subcfg.tags)) {
                VLOG(1) << "Skipping directory " << subdir << " by tags";
                continue;
            }
            auto subgroup = walk(subdir, subcfg, accumulated);
            if (subgroup.count() > 0)
                group.subgroups.push_back(move(subgroup));
        }

        stack.pop_back();
        return group;
    }
};

static void number_groups(test_group &group, const string &prefix) {
    for (size_t i = 0; i < group.subgroups.size(); ++i) {
        auto &subgroup = group.subgroups[i];
        string number = fmt::format("{}{}.", prefix, i + 1);
        subgroup.title = fmt::format("{} {}", number, subgroup.title);
        number_groups(subgroup, number);
    }
}

test_plan resolve_plan(const fs::path &root, const set<string> &tags, bool filter) {
    if (!fs::is_directory(root))
        throw malformed_test_config(fmt::format("test root {} is not a directory", root));

    test_plan plan;
    node_config root_cfg;
    fs::path config_file = root / CONFIG_FILE;
    if (fs::is_regular_file(config_file)) {
        auto tbl = parse_toml(config_file);
        root_cfg = read_node(tbl, config_file, true, true);
        if (root_cfg.build) read_build_config(*root_cfg.build, plan.build, config_file);
        if (root_cfg.limits) read_limits_config(*root_cfg.limits, plan.limits, config_file);
        root_cfg.build = nullptr;
        root_cfg.limits = nullptr;
    }

    tree_walker walker{tags, filter, plan.limits, {}};
    if (walker.included(root_cfg.tags)) {
        plan.root = walker.walk(root, root_cfg, partial_test());
    } else {
        plan.root.dir = root;
        plan.root.title = root_cfg.title ? *root_cfg.title : root.filename().string();
    }
    number_groups(plan.root, "");
    return plan;
}

size_t test_group::count() const {
    size_t result = tests.size();
    for (auto &subgroup : subgroups)
        result += subgroup.count();
    return result;
}

static void collect_cases(const test_group &group, vector<const test_case *> &result) {
    for (auto &test : group.tests)
        result.push_back(&test);
    for (auto &subgroup : group.subgroups)
        collect_cases(subgroup, result);
}

vector<const test_case *> test_plan::cases() const {
    vector<const test_case *> result;
    collect_cases(root, result);
    return result;
}

void to_json(json &j, const test_case &c) {
    j = {
        {"name", c.name},
        {"description", c.description},
        {"kind", kind_name(c.kind)},
        {"timeout", c.timeout},
        {"options", c.options},
        {"source", c.source.string()}};
    if (!c.input_file.empty())
        j["input_file"] = c.input_file.string();
}

void to_json(json &j, const test_group &g) {
    j = {
        {"title", g.title},
        {"description", g.description},
        {"dir", g.dir.string()},
        {"tests", g.tests},
        {"subgroups", g.subgroups}};
}

void to_json(json &j, const test_plan &p) {
    j = {
        {"build", {{"srcdir", p.build.srcdir},
                   {"cmd", p.build.cmd},
                   {"timeout", p.build.timeout},
                   {"prohibit_binary_files", p.build.prohibit_binary_files},
                   {"allowed_binary_files", p.build.allowed_binary_files},
                   {"allowed_binary_mimetypes", p.build.allowed_binary_mimetypes}}},
        {"limits", {{"timeout_test", p.limits.timeout_test}, {"max_output", p.limits.max_output}, {"timeout_total", p.limits.timeout_total}}},
        {"root", p.root}};
}

}  // namespace grader::plan
