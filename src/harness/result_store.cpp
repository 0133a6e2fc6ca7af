#include "harness/result_store.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include <system_error>

namespace harness {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

result_store::result_store(const fs::path &path, bool resume) : file_path(path) {
    int flags = O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC;
    if (!resume) flags |= O_TRUNC;
    fd.reset(open(path.c_str(), flags, 0644));
    if (!fd.valid())
        throw system_error(errno, system_category(), "unable to open result file " + path.string());

    if (resume) recover();
}

void result_store::recover() {
    scoped_file_lock lock(fd.get());

    string content;
    char buf[65536];
    off_t offset = 0;
    while (true) {
        ssize_t nread = pread(fd.get(), buf, sizeof(buf), offset);
        if (nread < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "unable to read result file " + file_path.string());
        }
        if (nread == 0) break;
        content.append(buf, nread);
        offset += nread;
    }

    size_t end = content.rfind('\n');
    size_t valid_size = end == string::npos ? 0 : end + 1;
    if (valid_size < content.size()) {
        LOG(WARNING) << "Discarding " << content.size() - valid_size << " bytes of incomplete record at the end of " << file_path;
        if (ftruncate(fd.get(), valid_size) != 0)
            throw system_error(errno, system_category(), "unable to truncate result file " + file_path.string());
    }

    size_t start = 0, line_number = 0;
    while (start < valid_size) {
        size_t pos = content.find('\n', start);
        string line = content.substr(start, pos - start);
        start = pos + 1;
        ++line_number;
        if (line.find_first_not_of(" \t\r") == string::npos) continue;

        try {
            json j = json::parse(line);
            processed.emplace(j.at("problem_id").get<string>(), j.at("solution_id").get<string>());
        } catch (json::exception &ex) {
            LOG(WARNING) << "Ignoring unparseable record at line " << line_number << " of " << file_path << ": " << ex.what();
        }
    }

    LOG(INFO) << "Loaded " << processed.size() << " existing records from " << file_path;
}

void result_store::append(const result_record &record) {
    string line = json(record).dump(-1, ' ', false, json::error_handler_t::replace) + "\n";

    lock_guard<std::mutex> guard(mutex);
    {
        // 其他进程可能也在向同一个文件追加记录
        scoped_file_lock lock(fd.get());
        write_all(fd.get(), line.data(), line.size());
        if (fdatasync(fd.get()) != 0)
            throw system_error(errno, system_category(), "fdatasync " + file_path.string());
    }
    processed.emplace(record.problem_id, record.solution_id);
}

bool result_store::contains(const string &problem_id, const string &solution_id) const {
    lock_guard<std::mutex> guard(mutex);
    return processed.count({problem_id, solution_id}) > 0;
}

size_t result_store::size() const {
    lock_guard<std::mutex> guard(mutex);
    return processed.size();
}

const fs::path &result_store::path() const {
    return file_path;
}

}  // namespace harness
