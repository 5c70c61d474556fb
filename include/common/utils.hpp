#pragma once

#include <chrono>
#include <string>

namespace sortbot {

/**
 * @brief 生成一个随机 uuid 字符串，用于提交 id 和临时文件名
 */
std::string random_uuid();

/**
 * @brief 计时器，从构造开始计算经过的时钟时间
 * 使用 steady_clock，不受系统时间调整的影响
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的秒数
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace sortbot
