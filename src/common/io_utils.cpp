#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <system_error>
#include "config.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    fout.flush();
    if (!fout) throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.find('/') != string::npos)
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

void make_read_only(const fs::path &dir) {
    for (auto &entry : fs::recursive_directory_iterator(dir))
        if (entry.is_regular_file())
            fs::permissions(entry.path(),
                            fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write,
                            fs::perm_options::remove);
}

scoped_directory::scoped_directory() {}

scoped_directory::scoped_directory(const fs::path &parent, const string &prefix) {
    fs::create_directories(parent);
    // random_generator 不是线程安全的，每次构造一个新的
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path path = parent / (prefix + uuid);
    if (!fs::create_directory(path))
        throw runtime_error("directory already exists " + path.string());
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
    dir = path;
}

scoped_directory::scoped_directory(scoped_directory &&other) {
    *this = move(other);
}

scoped_directory::~scoped_directory() {
    release();
}

scoped_directory &scoped_directory::operator=(scoped_directory &&other) {
    if (this != &other) {
        release();
        dir = move(other.dir);
        other.dir.clear();
    }
    return *this;
}

const fs::path &scoped_directory::path() const {
    return dir;
}

void scoped_directory::release() {
    if (dir.empty()) return;
    if (DEBUG) {
        LOG(INFO) << "Keeping directory " << dir << " in debug mode";
    } else {
        error_code ec;
        fs::remove_all(dir, ec);
        if (ec) LOG(ERROR) << "Unable to delete directory " << dir << ": " << ec.message();
    }
    dir.clear();
}

}  // namespace codejudge
