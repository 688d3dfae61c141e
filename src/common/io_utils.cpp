#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <fstream>
#include <system_error>

namespace runner {
using namespace std;
namespace fs = std::filesystem;

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::out | ios::trunc | ios::binary);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

int count_directories_in_directory(const fs::path &dir) {
    if (!fs::is_directory(dir))
        return -1;
    return count_if(fs::directory_iterator(dir), {}, (bool (*)(const fs::path &))fs::is_directory);
}

scoped_scratch_dir::scoped_scratch_dir() : valid(false) {}

scoped_scratch_dir::scoped_scratch_dir(const fs::path &root, const string &prefix) : valid(false) {
    // uuid 保证并发的执行单元不会拿到同一个目录
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    dir = root / (prefix + "-" + uuid);
    if (!fs::create_directory(dir))
        throw system_error(EEXIST, generic_category(), "scratch directory already exists " + dir.string());
    error_code ec;
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        fs::remove_all(dir, ec);
        throw system_error(ec, "unable to set permissions of " + dir.string());
    }
    valid = true;
}

scoped_scratch_dir::scoped_scratch_dir(scoped_scratch_dir &&other) : valid(false) {
    *this = move(other);
}

scoped_scratch_dir::~scoped_scratch_dir() {
    release();
}

scoped_scratch_dir &scoped_scratch_dir::operator=(scoped_scratch_dir &&other) {
    swap(valid, other.valid);
    swap(dir, other.dir);
    return *this;
}

const fs::path &scoped_scratch_dir::path() const {
    return dir;
}

void scoped_scratch_dir::release() noexcept {
    if (!valid) return;
    valid = false;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(ERROR) << "unable to remove scratch directory " << dir << ": " << ec.message();
}

scoped_fd::scoped_fd() : fd(-1) {}

scoped_fd::scoped_fd(int fd) : fd(fd) {}

scoped_fd::scoped_fd(scoped_fd &&other) : fd(-1) {
    *this = move(other);
}

scoped_fd::~scoped_fd() {
    reset();
}

scoped_fd &scoped_fd::operator=(scoped_fd &&other) {
    swap(fd, other.fd);
    return *this;
}

int scoped_fd::get() const {
    return fd;
}

bool scoped_fd::valid() const {
    return fd >= 0;
}

void scoped_fd::reset(int new_fd) {
    if (fd >= 0) close(fd);
    fd = new_fd;
}

}  // namespace runner
