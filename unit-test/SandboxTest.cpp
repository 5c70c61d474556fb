#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "judge/sandbox.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace sortbot;
using namespace sortbot::test;

class SandboxTest : public ::testing::Test {
protected:
    sandbox::sandbox_options options() {
        return test_config().sandbox;
    }
};

TEST_F(SandboxTest, CapturesStdoutAndStderr) {
    sandbox::run_result result = sandbox::run(R"(import sys
print("hello")
sys.stderr.write("world\n")
)",
                                              10, options());
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.out, "hello\n");
    EXPECT_EQ(result.err, "world\n");
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.signal, 0);
    EXPECT_GE(result.wall_time, 0);
}

TEST_F(SandboxTest, NonZeroExitIsNotTimeout) {
    sandbox::run_result result = sandbox::run("import sys\nsys.exit(3)\n", 10, options());
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exitcode, 3);
}

TEST_F(SandboxTest, StdinIsEmpty) {
    sandbox::run_result result = sandbox::run("import sys\nprint(repr(sys.stdin.read()))\n", 10, options());
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.out, "''\n");
}

TEST_F(SandboxTest, TimeoutKillsWholeProcessGroup) {
    filesystem::path pid_file = test_run_dir() / "grandchild.pid";
    string source = R"(import os, time
pid = os.fork()
if pid == 0:
    while True:
        time.sleep(1)
with open(")" + pid_file.string() +
                    R"(", "w") as f:
    f.write(str(pid))
while True:
    pass
)";

    auto start = chrono::steady_clock::now();
    sandbox::run_result result = sandbox::run(source, 1, options());
    double elapsed = chrono::duration<double>(chrono::steady_clock::now() - start).count();

    EXPECT_TRUE(result.timed_out);
    EXPECT_DOUBLE_EQ(result.wall_time, 1);
    EXPECT_EQ(result.signal, SIGKILL);
    EXPECT_LT(elapsed, 5);

    int grandchild = stoi(read_file_content(pid_file));
    bool gone = false;
    for (int i = 0; i < 100 && !gone; ++i) {
        gone = process_gone(grandchild);
        if (!gone) this_thread::sleep_for(chrono::milliseconds(10));
    }
    EXPECT_TRUE(gone);
}

TEST_F(SandboxTest, BackgroundChildDoesNotSurviveNormalExit) {
    filesystem::path pid_file = test_run_dir() / "background.pid";
    string source = R"(import os, time
pid = os.fork()
if pid == 0:
    os.close(1)
    os.close(2)
    while True:
        time.sleep(1)
with open(")" + pid_file.string() +
                    R"(", "w") as f:
    f.write(str(pid))
print("done")
)";

    sandbox::run_result result = sandbox::run(source, 10, options());
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.out, "done\n");

    int background = stoi(read_file_content(pid_file));
    bool gone = false;
    for (int i = 0; i < 100 && !gone; ++i) {
        gone = process_gone(background);
        if (!gone) this_thread::sleep_for(chrono::milliseconds(10));
    }
    EXPECT_TRUE(gone);
}

TEST_F(SandboxTest, DetachedDescendantsDoNotSurvive) {
    filesystem::path pid_file = test_run_dir() / "detached.pid";
    filesystem::remove(pid_file);
    // 子进程 setsid 脱离进程组，再 fork 一次后退出，孙进程被过继出去
    string source = R"(import os, time
pid = os.fork()
if pid == 0:
    os.setsid()
    if os.fork() == 0:
        os.close(1)
        os.close(2)
        with open(")" + pid_file.string() + R"(.tmp", "w") as f:
            f.write(str(os.getpid()))
        os.rename(")" + pid_file.string() + R"(.tmp", ")" + pid_file.string() + R"(")
        while True:
            time.sleep(1)
    os._exit(0)
os.waitpid(pid, 0)
while not os.path.exists(")" + pid_file.string() + R"("):
    time.sleep(0.01)
print("done")
)";

    sandbox::run_result result = sandbox::run(source, 10, options());
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.out, "done\n");

    int detached = stoi(read_file_content(pid_file));
    EXPECT_TRUE(process_gone(detached));
}

TEST_F(SandboxTest, DetachedDescendantsDoNotSurviveTimeout) {
    filesystem::path pid_file = test_run_dir() / "detached-timeout.pid";
    filesystem::remove(pid_file);
    string source = R"(import os, time
if os.fork() == 0:
    os.setsid()
    with open(")" + pid_file.string() + R"(.tmp", "w") as f:
        f.write(str(os.getpid()))
    os.rename(")" + pid_file.string() + R"(.tmp", ")" + pid_file.string() + R"(")
    while True:
        time.sleep(1)
while True:
    pass
)";

    sandbox::run_result result = sandbox::run(source, 1, options());
    EXPECT_TRUE(result.timed_out);

    int detached = stoi(read_file_content(pid_file));
    EXPECT_TRUE(process_gone(detached));
}

TEST_F(SandboxTest, ProcessLimitIsEnforced) {
    if (geteuid() == 0) GTEST_SKIP() << "RLIMIT_NPROC does not apply to root";
    auto opt = options();
    opt.max_processes = 1;
    sandbox::run_result result = sandbox::run(R"(import os
try:
    pid = os.fork()
except OSError:
    print("refused")
else:
    if pid == 0:
        os._exit(0)
    os.waitpid(pid, 0)
    print("forked")
)",
                                              10, opt);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.out, "refused\n");
}

TEST_F(SandboxTest, HarnessFileIsRemoved) {
    size_t before = count_harness_files();
    sandbox::run("print(1)\n", 10, options());
    sandbox::run("while True: pass\n", 1, options());
    EXPECT_EQ(count_harness_files(), before);
}

TEST_F(SandboxTest, HarnessFileIsKeptInDebugMode) {
    auto opt = options();
    opt.keep_files = true;
    size_t before = count_harness_files();
    sandbox::run("print(1)\n", 10, opt);
    EXPECT_EQ(count_harness_files(), before + 1);

    for (auto &entry : filesystem::directory_iterator(test_run_dir()))
        if (entry.path().extension() == ".py") filesystem::remove(entry.path());
}

TEST_F(SandboxTest, MissingInterpreterThrows) {
    auto opt = options();
    opt.python = "/nonexistent/python3";
    size_t before = count_harness_files();
    EXPECT_THROW(sandbox::run("print(1)\n", 10, opt), resource_error);
    EXPECT_EQ(count_harness_files(), before);
    // 抛出异常前监督进程已经被回收
    EXPECT_EQ(waitpid(-1, nullptr, WNOHANG), -1);
    EXPECT_EQ(errno, ECHILD);
}

TEST_F(SandboxTest, OutputIsTruncated) {
    auto opt = options();
    opt.output_limit = 1024;
    sandbox::run_result result = sandbox::run("import sys\nsys.stdout.write('x' * 100000)\n", 10, opt);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.out.size(), 1024u);
    EXPECT_TRUE(result.truncated);
}

TEST_F(SandboxTest, MemoryLimitIsEnforced) {
    auto opt = options();
    opt.max_memory_mb = 128;
    sandbox::run_result result = sandbox::run("x = bytearray(512 * 1024 * 1024)\nprint('allocated')\n", 10, opt);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.out, "");
    EXPECT_NE(result.err.find("MemoryError"), string::npos);
}

TEST_F(SandboxTest, ConcurrentRunsAreIndependent) {
    sandbox::run_result fast, slow;
    thread t([&] { slow = sandbox::run("while True: pass\n", 1, options()); });
    fast = sandbox::run("print('fast')\n", 10, options());
    t.join();
    EXPECT_FALSE(fast.timed_out);
    EXPECT_EQ(fast.out, "fast\n");
    EXPECT_TRUE(slow.timed_out);
}
