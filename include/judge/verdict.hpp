#pragma once

#include <string>
#include "judge/submission.hpp"

namespace sortbot {

/**
 * @brief 将 harness 的输出解析为一个测试点的评测结果
 * 解析规则按优先级：
 * 1. timed_out 为真：TIMEOUT，用时为 timeout，信息为 "Execution timed out"；
 * 2. 标准输出第一行以 PASS 开头：PASS，没有信息；
 * 3. 以 FAIL 开头：FAIL，信息为第三个字段，缺失时为 "Test failed"；
 * 4. 其他情况：ERROR，信息为第三个字段，缺失时为标准错误流的内容。
 * 只有前两个逗号是分隔符，信息本身可以包含逗号。
 * 用时取第二个字段，无法解析（非数字、负数、NaN、无穷）时取 fallback_elapsed。
 *
 * 这是一个纯函数，不会抛出异常。
 * @param out harness 的标准输出
 * @param err harness 的标准错误流
 * @param timed_out harness 是否超时被杀死
 * @param fallback_elapsed harness 没有报告用时时使用的用时，一般为进程的时钟时间
 * @param timeout 时间限制
 * @return 评测结果，test_case_id 由调用方填写
 */
test_outcome parse_verdict(const std::string &out, const std::string &err, bool timed_out, double fallback_elapsed, double timeout);

}  // namespace sortbot
