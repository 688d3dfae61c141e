#pragma once

#include <boost/lexical_cast.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 查找环境变量并转换为 T 类型
 * @throw boost::bad_lexical_cast 环境变量存在但无法转换时
 */
template <typename T>
T get_env_as(const std::string &key, const T &def_value) {
    const char *result = getenv(key.c_str());
    return !result ? def_value : boost::lexical_cast<T>(result);
}

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 相当于命令行工具 which，在 PATH 中查找可执行文件
 * @param cmd 命令名；包含 '/' 时直接检查该路径
 * @return 可执行文件的路径，找不到时返回空路径
 */
std::filesystem::path which(const std::string &cmd);

/**
 * @brief 计时器，构造时开始计时
 * 使用 steady_clock，不受系统时间调整影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};
