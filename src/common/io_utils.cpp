#include "common/io_utils.hpp"
#include <errno.h>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <fstream>
#include <system_error>

namespace harness {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string());
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_prefix(const fs::path &path, size_t limit, bool &truncated) {
    truncated = false;
    ifstream fin(path.string(), ios::binary);
    if (!fin) return "";
    string buffer(limit + 1, '\0');
    fin.read(buffer.data(), buffer.size());
    size_t count = fin.gcount();
    if (count > limit) {
        truncated = true;
        count = limit;
    }
    buffer.resize(count);
    return buffer;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    fout.flush();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

void write_all(int fd, const char *data, size_t size) {
    while (size > 0) {
        ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "write");
        }
        data += written;
        size -= written;
    }
}

file_descriptor::file_descriptor() : fd(-1) {}

file_descriptor::file_descriptor(int fd) : fd(fd) {}

file_descriptor::file_descriptor(file_descriptor &&other) noexcept : fd(other.fd) {
    other.fd = -1;
}

file_descriptor::~file_descriptor() {
    reset();
}

file_descriptor &file_descriptor::operator=(file_descriptor &&other) noexcept {
    if (this != &other) {
        reset(other.fd);
        other.fd = -1;
    }
    return *this;
}

int file_descriptor::get() const {
    return fd;
}

bool file_descriptor::valid() const {
    return fd >= 0;
}

void file_descriptor::reset(int new_fd) {
    if (fd >= 0) ::close(fd);
    fd = new_fd;
}

scoped_file_lock::scoped_file_lock(int fd) : fd(fd) {
    while (flock(fd, LOCK_EX) != 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "flock");
    }
}

scoped_file_lock::~scoped_file_lock() {
    flock(fd, LOCK_UN);
}

}  // namespace harness
