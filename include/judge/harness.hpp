#pragma once

#include <string>
#include "judge/submission.hpp"

namespace sortbot {

/**
 * @brief 生成评测一个测试点的 harness 程序
 * harness 是一个自包含的 Python 程序，负责：
 * 1. 编译并运行选手代码，找到排序函数（优先 sort_array，否则是第一个非 _ 开头的函数）；
 * 2. 只对排序函数的调用计时；
 * 3. 将返回值与标准输出逐值比较；
 * 4. 向标准输出打印恰好一行 OUTCOME,elapsedSeconds[,message]。
 *
 * 选手代码向标准输出打印的内容会被重定向到标准错误流，因此标准输出的第一行一定是评测结果行。
 * 输入数据和标准输出以 JSON 数组字面量嵌入，选手函数拿到的是输入数据的拷贝。
 *
 * @param code 选手代码
 * @param tc 测试点
 * @return harness 的 Python 源代码
 * @throw nlohmann::json::exception 如果选手代码无法编码为 JSON 字符串（在 replace 模式下不会发生）
 */
std::string build_harness(const std::string &code, const test_case &tc);

}  // namespace sortbot
