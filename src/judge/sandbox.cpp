#include "judge/sandbox.hpp"
#include <dirent.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <system_error>
#include <vector>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace sortbot::sandbox {
using namespace std;
namespace fs = std::filesystem;

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

// 监督进程中各个管道所在的固定描述符
const int FD_FIRST = 3;
const int FD_OUT = 3;
const int FD_ERR = 4;
const int FD_EXEC = 5;
const int FD_REPORT = 6;
const int FD_CONTROL = 7;
const int FD_COUNT = 5;

// 回收进程树时最多连续等待多少毫秒
const int REAP_ROUNDS = 2000;

// poll 的最长等待时间，子进程退出的检查粒度
const int POLL_INTERVAL_MS = 10;

// 受控程序的环境变量，不继承评测系统的环境
static const char *CHILD_ENV[] = {
    "PATH=/usr/local/bin:/usr/bin:/bin",
    "LC_ALL=C.UTF-8",
    "HOME=/tmp",
    nullptr};

template <typename... Args>
[[noreturn]] static void error(int err, fmt::format_string<Args...> fmt, Args &&... args) {
    throw resource_error(fmt::format(fmt, std::forward<Args>(args)...) + ": " + system_category().message(err));
}

/**
 * @brief 子进程的一个输出流
 * 超过 limit 的数据依然会被读出，但是会被丢弃，避免子进程因为管道写满而阻塞
 */
struct child_stream {
    int fd = -1;
    string data;
    size_t data_read = 0;

    ~child_stream() {
        if (fd >= 0) close(fd);
    }
};

/**
 * @brief 从管道中读取一次数据
 * @return 是否读到了数据，读到 EOF 时关闭管道
 */
static bool pump(child_stream &stream, size_t limit) {
    char buf[BUF_SIZE];
    ssize_t nread = read(stream.fd, buf, BUF_SIZE);
    if (nread == -1) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return false;
        error(errno, "copying data from fd {}", stream.fd);
    }
    if (nread == 0) {
        // EOF
        close(stream.fd);
        stream.fd = -1;
        return false;
    }
    stream.data_read += nread;
    if (stream.data.size() < limit)
        stream.data.append(buf, min((size_t)nread, limit - stream.data.size()));
    return true;
}

/**
 * @brief 等待两个管道的数据，最多等待 timeout_ms 毫秒
 */
static void pump_pipes(child_stream (&streams)[2], size_t limit, int timeout_ms) {
    struct pollfd fds[2];
    int nfds = 0;
    for (auto &stream : streams) {
        if (stream.fd < 0) continue;
        fds[nfds].fd = stream.fd;
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        ++nfds;
    }

    if (nfds == 0) {
        // 两个管道都已经关闭，只需要等待子进程退出
        if (timeout_ms > 0) usleep(timeout_ms * 1000);
        return;
    }

    int r = poll(fds, nfds, timeout_ms);
    if (r == -1) {
        if (errno == EINTR) return;
        error(errno, "waiting for child data");
    }
    if (r == 0) return;

    for (int i = 0; i < nfds; ++i) {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        for (auto &stream : streams)
            if (stream.fd == fds[i].fd) pump(stream, limit);
    }
}

/**
 * @brief 在子进程被杀死后读完管道中剩余的数据
 * 进程组内的进程已经全部退出，管道中的数据都已经写入完毕，因此不需要等待
 */
static void drain_pipes(child_stream (&streams)[2], size_t limit) {
    auto open_count = [&] { return (streams[0].fd >= 0) + (streams[1].fd >= 0); };
    while (open_count() > 0) {
        size_t total = streams[0].data_read + streams[1].data_read;
        int opened = open_count();
        pump_pipes(streams, limit, 0);
        // 没有新数据也没有管道关闭，说明管道的写端被进程组之外的进程持有
        if (total == streams[0].data_read + streams[1].data_read && opened == open_count())
            break;
    }
}

static void set_limit(int resource, rlim_t value) {
    struct rlimit lim;
    lim.rlim_cur = lim.rlim_max = value;
    setrlimit(resource, &lim);
}

[[noreturn]] static void child_fail(int status_fd) {
    int err = errno;
    // 写入失败时父进程会读到 EOF，随后从监督进程的报告看出子进程异常退出
    while (write(status_fd, &err, sizeof(err)) < 0 && errno == EINTR) {
    }
    _exit(127);
}

static bool write_all(int fd, const void *data, size_t size) {
    const char *p = static_cast<const char *>(data);
    while (size > 0) {
        ssize_t n = write(fd, p, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        size -= n;
    }
    return true;
}

static size_t read_all(int fd, void *data, size_t size) {
    char *p = static_cast<char *>(data);
    size_t total = 0;
    while (total < size) {
        ssize_t n = read(fd, p + total, size - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        total += n;
    }
    return total;
}

/**
 * @brief 解析非负整数，不是纯数字时返回 -1
 * 监督进程中不能分配内存，因此不使用标准库的转换函数
 */
static int parse_number(const char *text) {
    if (!*text) return -1;
    int value = 0;
    for (; *text; ++text) {
        if (*text < '0' || *text > '9') return -1;
        value = value * 10 + (*text - '0');
    }
    return value;
}

/**
 * @brief 关闭所有不小于 low 的文件描述符
 * 监督进程不会 exec，CLOEXEC 对它不起作用，必须手动关闭从评测进程继承的其他评测的管道
 */
static void close_from(int low) {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, low, ~0U, 0) == 0) return;
#endif
    int dir = open("/proc/self/fd", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir >= 0) {
        char buf[BUF_SIZE];
        long n;
        while ((n = syscall(SYS_getdents64, dir, buf, sizeof(buf))) > 0) {
            for (long off = 0; off < n;) {
                auto *entry = reinterpret_cast<struct dirent64 *>(buf + off);
                off += entry->d_reclen;
                int fd = parse_number(entry->d_name);
                if (fd >= low && fd != dir) close(fd);
            }
        }
        close(dir);
        return;
    }

    struct rlimit lim;
    rlim_t max_fd = 65536;
    if (getrlimit(RLIMIT_NOFILE, &lim) == 0 && lim.rlim_cur != RLIM_INFINITY)
        max_fd = min<rlim_t>(lim.rlim_cur, max_fd);
    for (int fd = low; fd < (int)max_fd; ++fd) close(fd);
}

/**
 * @brief 读取 /proc/<pid>/stat 中的父进程号
 * @return 父进程号，进程已经不存在时返回 -1
 */
static pid_t parent_of(int proc_dir, const char *name) {
    char path[32];
    size_t len = 0;
    for (; name[len] && len < sizeof(path) - 6; ++len) path[len] = name[len];
    const char *suffix = "/stat";
    for (size_t i = 0; suffix[i]; ++i) path[len++] = suffix[i];
    path[len] = 0;

    int fd = openat(proc_dir, path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) return -1;
    char stat[512];
    ssize_t n = read(fd, stat, sizeof(stat) - 1);
    close(fd);
    if (n <= 0) return -1;
    stat[n] = 0;

    // 格式为 "pid (comm) state ppid ..."，comm 中可能包含括号
    ssize_t paren = n - 1;
    while (paren >= 0 && stat[paren] != ')') --paren;
    if (paren < 0 || paren + 4 >= n) return -1;
    pid_t ppid = 0;
    for (ssize_t i = paren + 4; i < n && stat[i] >= '0' && stat[i] <= '9'; ++i)
        ppid = ppid * 10 + (stat[i] - '0');
    return ppid;
}

/**
 * @brief 杀死所有父进程为 self 的进程
 * 脱离进程组的后代进程在其父进程死亡后被过继给监督进程，只能通过扫描 /proc 找到
 */
static void kill_adopted(pid_t self) {
    int dir = open("/proc", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir < 0) return;
    char buf[BUF_SIZE];
    long n;
    while ((n = syscall(SYS_getdents64, dir, buf, sizeof(buf))) > 0) {
        for (long off = 0; off < n;) {
            auto *entry = reinterpret_cast<struct dirent64 *>(buf + off);
            off += entry->d_reclen;
            pid_t pid = parse_number(entry->d_name);
            if (pid > 0 && parent_of(dir, entry->d_name) == self) kill(pid, SIGKILL);
        }
    }
    close(dir);
}

/**
 * @brief 杀死并回收监督进程的整棵进程树
 * @param main_pid 解释器进程，也是解释器进程组的 id
 * @param main_status 保存解释器进程的退出状态
 * @return 是否回收到了解释器进程
 */
static bool reap_descendants(pid_t main_pid, int &main_status) {
    pid_t self = getpid();
    bool reaped = false;
    for (int idle = 0; idle < REAP_ROUNDS;) {
        kill(-main_pid, SIGKILL);
        kill_adopted(self);

        int status;
        pid_t pid = waitpid(-1, &status, WNOHANG | __WALL);
        if (pid < 0) {
            if (errno == EINTR) continue;
            break;  // ECHILD，进程树已经回收完毕
        }
        if (pid == 0) {
            // 只有处于不可中断睡眠的进程会拖延到这里
            struct timespec ts = {0, 1000 * 1000};
            nanosleep(&ts, nullptr);
            ++idle;
            continue;
        }
        idle = 0;
        if (pid == main_pid) {
            main_status = status;
            reaped = true;
        }
    }
    return reaped;
}

/**
 * @brief 解释器进程：重定向标准流，设置资源限制，然后执行解释器
 */
[[noreturn]] static void run_child(char *const *argv, const sandbox_options &opt) {
    // 子进程独立成组，超时时杀死整个进程组
    if (setpgid(0, 0) != 0) child_fail(FD_EXEC);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) child_fail(FD_EXEC);
    close(devnull);
    if (dup2(FD_OUT, STDOUT_FILENO) < 0 || dup2(FD_ERR, STDERR_FILENO) < 0) child_fail(FD_EXEC);

    if (opt.enabled) {
        if (opt.max_memory_mb > 0)
            set_limit(RLIMIT_AS, (rlim_t)opt.max_memory_mb * 1024 * 1024);
        set_limit(RLIMIT_CORE, 0);
        set_limit(RLIMIT_FSIZE, opt.output_limit);
        if (opt.max_processes > 0)
            set_limit(RLIMIT_NPROC, opt.max_processes);
    }

    execvpe(argv[0], argv, const_cast<char *const *>(CHILD_ENV));
    child_fail(FD_EXEC);
}

/**
 * @brief 监督进程：启动解释器，等待解释器退出或者父进程要求结束，然后杀死并回收整棵进程树
 * 监督进程由多线程的评测进程 fork 而来且不会 exec，只能调用异步信号安全的函数。
 * 报告管道中依次写入解释器的 pid 和退出状态，没有退出状态说明进程树没有回收完毕
 */
[[noreturn]] static void run_supervisor(char *const *argv, const int (&fds)[FD_COUNT], const sandbox_options &opt) {
    // 独立成组，终端发给评测进程的信号不会杀死监督进程
    setpgid(0, 0);

    // 先复制到高位，再放到固定位置，避免覆盖还没有移动的描述符
    int moved[FD_COUNT];
    for (int i = 0; i < FD_COUNT; ++i) {
        moved[i] = fcntl(fds[i], F_DUPFD_CLOEXEC, FD_FIRST + 2 * FD_COUNT);
        if (moved[i] < 0) child_fail(fds[FD_EXEC - FD_FIRST]);
    }
    for (int i = 0; i < FD_COUNT; ++i) {
        if (dup2(moved[i], FD_FIRST + i) < 0 || fcntl(FD_FIRST + i, F_SETFD, FD_CLOEXEC) < 0)
            child_fail(moved[FD_EXEC - FD_FIRST]);
    }
    close_from(FD_FIRST + FD_COUNT);

    if (prctl(PR_SET_CHILD_SUBREAPER, 1) != 0) child_fail(FD_EXEC);

    pid_t child_pid = fork();
    if (child_pid == -1) child_fail(FD_EXEC);
    if (child_pid == 0) run_child(argv, opt);
    setpgid(child_pid, child_pid);

    close(FD_OUT);
    close(FD_ERR);
    close(FD_EXEC);

    // 评测进程退出后写报告管道不能杀死监督进程
    struct sigaction ignore = {};
    ignore.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &ignore, nullptr);

    write_all(FD_REPORT, &child_pid, sizeof(child_pid));

    while (true) {
        // WNOWAIT 保留僵尸进程，使进程组 id 在杀死进程组之前不会被复用
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, child_pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (info.si_pid == child_pid) break;

        // 控制管道可读或者被关闭，说明评测进程要求结束（超时或者评测进程已经退出）
        struct pollfd control = {FD_CONTROL, POLLIN, 0};
        if (poll(&control, 1, POLL_INTERVAL_MS) > 0) break;
    }

    int status = 0;
    if (reap_descendants(child_pid, status))
        write_all(FD_REPORT, &status, sizeof(status));
    _exit(0);
}

static int decode_status(int status, run_result &result) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        return result.signal + 128;
    } else {
        throw resource_error(fmt::format("unknown status: {:x}", status));
    }
}

run_result run(const string &source, double timeout, const sandbox_options &opt) {
    fs::path run_dir = opt.run_dir.empty() ? fs::temp_directory_path() / "sortbot" : opt.run_dir;
    fs::path harness = run_dir / (random_uuid() + "-harness.py");

    defer {
        if (opt.keep_files) return;
        error_code ec;
        fs::remove(harness, ec);
        if (ec) LOG(ERROR) << "Unable to delete harness file " << harness.string() << ": " << ec.message();
    };

    try {
        fs::create_directories(run_dir);
        write_file_content(harness, source);
    } catch (system_error &e) {
        throw resource_error(string("unable to create harness file: ") + e.what());
    }

    // argv 必须在 fork 之前构造好
    vector<string> cmd = {opt.python, "-I", "-B", harness.string()};
    vector<char *> argv;
    for (auto &arg : cmd) argv.push_back(arg.data());
    argv.push_back(nullptr);

    // 下标与监督进程中的固定描述符一一对应：标准输出、标准错误、exec 结果、报告、控制
    int pipefd[FD_COUNT][2];
    for (auto &p : pipefd) p[0] = p[1] = -1;
    defer {
        for (auto &p : pipefd)
            for (int fd : p)
                if (fd >= 0) close(fd);
    };
    // 管道必须是 CLOEXEC 的，否则其他评测线程启动的解释器会持有管道的写端
    for (auto &p : pipefd)
        if (pipe2(p, O_CLOEXEC) != 0) error(errno, "creating pipe");

    auto &out_pipe = pipefd[FD_OUT - FD_FIRST];
    auto &err_pipe = pipefd[FD_ERR - FD_FIRST];
    auto &exec_pipe = pipefd[FD_EXEC - FD_FIRST];
    auto &report_pipe = pipefd[FD_REPORT - FD_FIRST];
    auto &control_pipe = pipefd[FD_CONTROL - FD_FIRST];

    // 监督进程持有的一端：控制管道是读端，其他管道是写端
    int supervisor_fds[FD_COUNT] = {out_pipe[PIPE_IN], err_pipe[PIPE_IN], exec_pipe[PIPE_IN], report_pipe[PIPE_IN], control_pipe[PIPE_OUT]};

    elapsed_time watch;
    pid_t supervisor = fork();
    if (supervisor == -1) error(errno, "unable to fork");
    if (supervisor == 0) run_supervisor(argv.data(), supervisor_fds, opt);

    // 任何一步抛出异常时，关闭控制管道让监督进程清理进程树，然后回收监督进程
    bool reaped = false;
    defer {
        if (reaped) return;
        if (control_pipe[PIPE_IN] >= 0) {
            close(control_pipe[PIPE_IN]);
            control_pipe[PIPE_IN] = -1;
        }
        while (waitpid(supervisor, nullptr, 0) < 0 && errno == EINTR) {
        }
    };

    for (int &fd : supervisor_fds) {
        close(fd);
        fd = -1;
    }
    out_pipe[PIPE_IN] = err_pipe[PIPE_IN] = exec_pipe[PIPE_IN] = report_pipe[PIPE_IN] = control_pipe[PIPE_OUT] = -1;

    child_stream streams[2];
    streams[0].fd = out_pipe[PIPE_OUT];
    streams[1].fd = err_pipe[PIPE_OUT];
    out_pipe[PIPE_OUT] = err_pipe[PIPE_OUT] = -1;

    {
        // exec 成功时管道因为 CLOEXEC 被关闭，读到 EOF；失败时读到 errno
        int exec_errno = 0;
        if (read_all(exec_pipe[PIPE_OUT], &exec_errno, sizeof(exec_errno)) > 0)
            error(exec_errno, "unable to start command {}", opt.python);
    }

    run_result result;
    auto deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(timeout));

    int supervisor_status = 0;
    while (true) {
        pid_t pid = waitpid(supervisor, &supervisor_status, WNOHANG);
        if (pid == supervisor) {
            reaped = true;
            break;
        }
        if (pid < 0) {
            if (errno == EINTR) continue;
            error(errno, "waiting on supervisor");
        }

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }

        int remaining = (int)chrono::duration_cast<chrono::milliseconds>(deadline - now).count();
        pump_pipes(streams, opt.output_limit, max(0, min(remaining, POLL_INTERVAL_MS)));
    }

    result.wall_time = watch.seconds();
    if (result.timed_out) {
        LOG(WARNING) << "Harness " << harness.filename().string() << " exceeded time limit " << timeout << "s, killing process tree";
        result.wall_time = timeout;
        close(control_pipe[PIPE_IN]);
        control_pipe[PIPE_IN] = -1;
    }

    while (!reaped) {
        if (waitpid(supervisor, &supervisor_status, 0) == supervisor)
            reaped = true;
        else if (errno != EINTR)
            error(errno, "waiting on supervisor");
    }

    pid_t child_pid = 0;
    int child_status = 0;
    bool has_pid = read_all(report_pipe[PIPE_OUT], &child_pid, sizeof(child_pid)) == sizeof(child_pid);
    bool has_status = has_pid && read_all(report_pipe[PIPE_OUT], &child_status, sizeof(child_status)) == sizeof(child_status);
    if (!has_status) {
        // 监督进程被杀死，解释器进程组可能还活着
        if (has_pid && child_pid > 0) kill(-child_pid, SIGKILL);
        throw resource_error(fmt::format("supervisor of {} exited without reaping the process tree, status: {:x}", opt.python, supervisor_status));
    }

    drain_pipes(streams, opt.output_limit);

    result.exitcode = decode_status(child_status, result);
    result.out = move(streams[0].data);
    result.err = move(streams[1].data);
    result.truncated = streams[0].data_read > result.out.size() || streams[1].data_read > result.err.size();
    if (result.truncated)
        LOG(INFO) << "Output of harness " << harness.filename().string() << " truncated to " << opt.output_limit << " bytes";
    return result;
}

}  // namespace sortbot::sandbox
