#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <vector>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

filesystem::path which(const string &cmd) {
    if (cmd.empty()) return {};
    if (cmd.find('/') != string::npos)
        return access(cmd.c_str(), X_OK) == 0 ? filesystem::path(cmd) : filesystem::path();

    string path = get_env("PATH", "");
    vector<string> dirs;
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        filesystem::path fullpath = filesystem::path(dir) / cmd;
        if (filesystem::is_regular_file(fullpath) && access(fullpath.c_str(), X_OK) == 0)
            return fullpath;
    }
    return {};
}
