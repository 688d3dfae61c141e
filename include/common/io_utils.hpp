#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 将 content 写入文件，文件已存在则覆盖
 * @throw std::system_error 无法打开或写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 查找文件夹内有多少个子文件夹（不递归统计）
 * @param dir 要被统计的文件夹
 * @return 文件夹内的子文件夹数量
 */
int count_directories_in_directory(const std::filesystem::path &dir);

/**
 * @brief 执行单元的临时目录
 * 构造时在 root 下创建一个名为 prefix-<uuid> 的目录（权限 0700），
 * 析构或 release 时递归删除。只能移动，不能复制。
 */
struct scoped_scratch_dir {
    scoped_scratch_dir();
    scoped_scratch_dir(const std::filesystem::path &root, const std::string &prefix);
    scoped_scratch_dir(scoped_scratch_dir &&);
    ~scoped_scratch_dir();

    scoped_scratch_dir &operator=(scoped_scratch_dir &&);

    const std::filesystem::path &path() const;

    /**
     * @brief 删除临时目录，不会抛出异常
     */
    void release() noexcept;

private:
    bool valid;
    std::filesystem::path dir;
};

/**
 * @brief 持有一个文件描述符，析构时关闭
 */
struct scoped_fd {
    scoped_fd();
    explicit scoped_fd(int fd);
    scoped_fd(scoped_fd &&);
    ~scoped_fd();

    scoped_fd &operator=(scoped_fd &&);

    int get() const;
    bool valid() const;
    void reset(int fd = -1);

private:
    int fd;
};

}  // namespace runner
