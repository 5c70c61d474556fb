#include "common/io_utils.hpp"
#include <errno.h>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include "common/utils.hpp"

namespace sortbot {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string());
    if (!fin) throw system_error(errno, system_category(), "unable to open file " + path.string());
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
    ofstream fout(path.string(), ios::out | ios::trunc | ios::binary);
    if (!fout) throw system_error(errno, system_category(), "unable to create file " + path.string());
    fout << content;
    fout.flush();
    if (!fout) throw system_error(errno, system_category(), "unable to write file " + path.string());
}

void replace_file_content(const fs::path &path, const string &content) {
    fs::path temp = path;
    temp += "." + random_uuid() + ".tmp";
    try {
        write_file_content(temp, content);
        fs::rename(temp, path);
    } catch (...) {
        error_code ec;
        fs::remove(temp, ec);
        throw;
    }
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath == "." || subpath == ".." ||
        subpath.find('/') != string::npos || subpath.find('\0') != string::npos)
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace sortbot
