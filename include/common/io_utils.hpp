#pragma once

#include <filesystem>
#include <string>

namespace harness {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件开头至多 limit 个字节
 * 用于读取子进程的输出，避免选手程序输出过多导致内存占用过大
 * @param path 文件路径，若文件不存在返回空串
 * @param limit 最多读取的字节数
 * @param truncated 若文件比 limit 更长，设为 true
 */
std::string read_file_prefix(const std::filesystem::path &path, std::size_t limit, bool &truncated);

/**
 * @brief 将文本写入文件，覆盖原有内容
 * @throw std::system_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 将 data 完整写入文件描述符，处理 EINTR 和部分写入
 * @throw std::system_error 若写入失败
 */
void write_all(int fd, const char *data, std::size_t size);

/**
 * @brief 独占的文件描述符，析构时自动关闭
 */
struct file_descriptor {
    file_descriptor();
    explicit file_descriptor(int fd);
    file_descriptor(file_descriptor &&other) noexcept;
    ~file_descriptor();

    file_descriptor(const file_descriptor &) = delete;
    file_descriptor &operator=(const file_descriptor &) = delete;
    file_descriptor &operator=(file_descriptor &&other) noexcept;

    int get() const;

    bool valid() const;

    /**
     * @brief 关闭当前持有的描述符（如果有），并持有新的描述符
     */
    void reset(int new_fd = -1);

private:
    int fd;
};

/**
 * @brief 对已打开的文件加 flock 排他锁，析构时释放
 * 用于多个评测进程同时向同一个结果文件追加记录的情况
 */
struct scoped_file_lock {
    explicit scoped_file_lock(int fd);
    ~scoped_file_lock();

    scoped_file_lock(const scoped_file_lock &) = delete;
    scoped_file_lock &operator=(const scoped_file_lock &) = delete;

private:
    int fd;
};

}  // namespace harness
