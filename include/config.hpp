#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace sortbot {

/**
 * @brief 每个测试点的默认时钟时间限制
 * 单位为秒，超过该时间的 harness 进程组将被 SIGKILL 杀死，结果记为 TIMEOUT
 * @defaultValue 30
 */
extern double TIMEOUT;

/**
 * @brief 运行 harness 的 Python 解释器
 * 可以是绝对路径，也可以是 PATH 中能找到的程序名
 * @defaultValue python3
 */
extern std::string PYTHON;

/**
 * @brief 存放生成的 harness 文件的文件夹
 * 每个测试点会在这个文件夹下生成一个 uuid 命名的 .py 文件，评测结束后立即删除
 *
 * RUN_DIR
 * ├── 0b9d...-harness.py // 正在运行的测试点
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief harness 进程的内存限制（地址空间）
 * 单位为 MB，小于等于 0 表示不限制
 * @defaultValue 128
 */
extern int MEMORY_LIMIT;

/**
 * @brief 每个输出流最多保存多少字节，超过的部分会被读取并丢弃
 * @defaultValue 1MB
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 选手程序所属用户最多同时拥有的进程数（RLIMIT_NPROC），小于等于 0 表示不限制
 * root 用户不受该限制
 * @defaultValue 1024
 */
extern int PROCESS_LIMIT;

/**
 * @brief 同一个提交内最多同时评测多少个测试点
 * @defaultValue 1
 */
extern std::size_t WORKERS;

/**
 * @brief 是否对 harness 进程施加资源限制
 * 关闭后只保留超时和进程组回收，便于调试
 */
extern bool SANDBOX_ENABLED;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统不会删除生成的 harness 文件，
 * 以便手动检查生成的程序是否符合预期。
 */
extern bool DEBUG;

}  // namespace sortbot
