#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

/**
 * 这个头文件包含运行 harness 的沙箱
 * 沙箱将 harness 写入 RUN_DIR 下的临时文件，先启动一个监督进程，再由监督进程以独立的进程组
 * 启动 Python 解释器，通过管道收集标准输出和标准错误流。
 * 监督进程是 child subreaper，解释器的所有后代（包括 setsid 脱离进程组的进程）最终都会
 * 被过继给它，因此运行结束时监督进程可以杀死并回收整棵进程树。
 */
namespace sortbot::sandbox {

/**
 * @brief 沙箱的资源限制配置
 */
struct sandbox_options {
    /**
     * @brief 运行 harness 的解释器
     */
    std::string python = "python3";

    /**
     * @brief 存放 harness 临时文件的文件夹
     */
    std::filesystem::path run_dir;

    /**
     * @brief 地址空间限制，单位为 MB，小于等于 0 表示不限制
     */
    int max_memory_mb = 128;

    /**
     * @brief 每个输出流最多保存的字节数，超过部分被丢弃
     */
    std::size_t output_limit = 1 << 20;

    /**
     * @brief RLIMIT_NPROC，按用户计数，小于等于 0 表示不限制
     */
    int max_processes = 1024;

    /**
     * @brief 是否施加资源限制
     */
    bool enabled = true;

    /**
     * @brief 为真时不删除 harness 临时文件
     */
    bool keep_files = false;
};

/**
 * @brief 一次运行的结果
 */
struct run_result {
    std::string out;
    std::string err;

    /**
     * @brief 是否因为超时被杀死
     */
    bool timed_out = false;

    /**
     * @brief 从启动子进程到子进程结束（或者被杀死）的时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 子进程的退出码，被信号杀死时为 128 + 信号
     */
    int exitcode = 0;

    /**
     * @brief 杀死子进程的信号，没有被信号杀死时为 0
     */
    int signal = 0;

    /**
     * @brief 标准输出或者标准错误流是否因为超过限制被截断
     */
    bool truncated = false;
};

/**
 * @brief 运行一个 harness 程序
 * 无论子进程是否正常退出，返回前解释器的所有后代进程都已经被杀死并回收，
 * harness 临时文件也一定会被删除。
 * @param source harness 的 Python 源代码
 * @param timeout 时钟时间限制，单位为秒
 * @param opt 沙箱配置
 * @throw resource_error 如果无法创建临时文件、管道，或者无法启动子进程
 */
run_result run(const std::string &source, double timeout, const sandbox_options &opt);

}  // namespace sortbot::sandbox
