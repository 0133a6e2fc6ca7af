#pragma once

#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include "common/io_utils.hpp"
#include "harness/result.hpp"

namespace harness {

/**
 * @brief 追加写入的结果文件（JSONL），每行一条评测记录
 *
 * 1. 每条记录通过一次 write(2) 追加到 O_APPEND 打开的文件，写入时持有进程内的互斥锁
 *    和文件的 flock 排他锁，写入后调用 fdatasync，因此进程在任意时刻崩溃都不会留下
 *    半条记录以外的损坏
 * 2. 恢复模式下打开文件时会截断最后一个 '\n' 之后的残缺记录，并读取已经存在的记录，
 *    以便跳过已经评测过的 (problem_id, solution_id)
 */
class result_store {
public:
    /**
     * @param path 结果文件路径，不存在时创建
     * @param resume 为 true 时保留并读取已有记录，否则清空文件
     * @throw std::system_error 若文件无法打开或读取
     */
    result_store(const std::filesystem::path &path, bool resume);

    /**
     * @brief 追加一条记录并持久化
     * @throw std::system_error 若写入失败
     */
    void append(const result_record &record);

    /**
     * @brief 结果文件中是否已经存在该候选解的记录
     */
    bool contains(const std::string &problem_id, const std::string &solution_id) const;

    /**
     * @brief 结果文件中的记录数
     */
    std::size_t size() const;

    const std::filesystem::path &path() const;

private:
    std::filesystem::path file_path;
    file_descriptor fd;
    mutable std::mutex mutex;
    std::set<std::pair<std::string, std::string>> processed;

    void recover();
};

}  // namespace harness
