#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <fstream>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::in | ios::binary);
    if (!fin) throw internal_error("unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::out | ios::binary | ios::trunc);
    if (!fout) throw internal_error("unable to write file " + path.string());
    fout << content;
    if (!fout) throw internal_error("unable to write file " + path.string());
}

bool utf8_check_is_valid(const string &string) {
    int c, i, ix, n, j;
    for (i = 0, ix = string.length(); i < ix; i++) {
        c = (unsigned char)string[i];
        if (c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if ((c & 0xE0) == 0xC0)
            n = 1;  // 110bbbbb
        else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  // U+d800 to U+dfff
        else if ((c & 0xF0) == 0xE0)
            n = 2;  // 1110bbbb
        else if ((c & 0xF8) == 0xF0)
            n = 3;  // 11110bbb
        else
            return false;
        for (j = 0; j < n && i < ix; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

string assert_safe_path(const string &subpath) {
    fs::path p(subpath);
    if (p.is_absolute())
        throw malformed_test_config("path must be relative: " + subpath);
    for (auto &part : p)
        if (part == "..")
            throw malformed_test_config("path is not safe: " + subpath);
    return subpath;
}

void remove_directory_quietly(const fs::path &dir) {
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove directory " << dir << ": " << ec.message();
}

}  // namespace grader
