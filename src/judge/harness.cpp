#include "judge/harness.hpp"
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace sortbot {
using namespace std;

// harness 模板，{0} 为选手代码的字符串字面量，{1} 为输入数据，{2} 为标准输出
// 模板里不能出现花括号，因此不使用 dict 字面量和 f-string
// 判定结果写入原来的标准输出的副本，描述符 1 被重定向到标准错误，
// 选手代码通过 print、os.write(1, ...) 或者子进程输出的内容都不会出现在判定行之前
static const char *HARNESS_TEMPLATE = R"(import inspect
import os
import sys
import time


def _main():
    verdict_fd = os.dup(1)
    sys.stdout.flush()
    os.dup2(2, 1)
    sys.stdout = sys.stderr

    def emit(status, elapsed, message=None):
        line = status + "," + repr(float(elapsed))
        if message is not None:
            line += "," + " ".join(str(message).splitlines())
        payload = (line + "\n").encode("utf-8", "replace")
        while payload:
            payload = payload[os.write(verdict_fd, payload):]

    def describe(error):
        text = str(error)
        return text if text else type(error).__name__

    def find_entry(namespace):
        entry = namespace.get("sort_array")
        if callable(entry):
            return entry
        for name, value in list(namespace.items()):
            if name.startswith("_") or name == "sort_array":
                continue
            if inspect.isfunction(value) and value.__module__ == "__main__":
                return value
        raise Exception("No sorting function found")

    source = {0}
    data = {1}
    expected = {2}

    namespace = dict(__name__="__main__", __builtins__=__builtins__)
    try:
        program = compile(source, "<submission>", "exec")
    except SyntaxError as error:
        emit("ERROR", 0.0, "SyntaxError: " + describe(error))
        return

    start = time.perf_counter()
    try:
        exec(program, namespace)
        entry = find_entry(namespace)
        start = time.perf_counter()
        result = entry(list(data))
        elapsed = time.perf_counter() - start
    except BaseException as error:
        emit("ERROR", time.perf_counter() - start, describe(error))
        return

    if result == expected:
        emit("PASS", elapsed)
    else:
        emit("FAIL", elapsed, "Result mismatch")


_main()
)";

static string to_python_literal(const nlohmann::json &value) {
    // ensure_ascii 保证即使选手代码包含非法 UTF-8 也能生成合法的 Python 源文件
    return value.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

string build_harness(const string &code, const test_case &tc) {
    return fmt::format(fmt::runtime(HARNESS_TEMPLATE),
                       to_python_literal(code),
                       to_python_literal(tc.data),
                       to_python_literal(tc.expected));
}

}  // namespace sortbot
