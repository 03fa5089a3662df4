#pragma once

#include "TimestampHelper.hpp"

/**
 * @brief 时间源
 *
 * 领域逻辑只通过参数接收当前时间，由服务层从注入的时间源读取，
 * 测试中替换为可控时钟。
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

/**
 * @brief 系统时钟（UTC，截断到秒）
 */
class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    }
};
