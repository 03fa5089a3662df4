#pragma once

#include "AppException.hpp"

/**
 * @brief 金额（以分为单位的定点数）
 *
 * 数据库列为 NUMERIC(10,2)，读写时按分换算，避免浮点误差。
 */
class Money {
public:
    constexpr Money() = default;

    static constexpr Money fromCents(int64_t cents) {
        Money m;
        m.cents_ = cents;
        return m;
    }

    static constexpr Money zero() { return Money{}; }

    /**
     * @brief 解析十进制金额字符串（如 "3"、"3.5"、"10.00"）
     * @throws ValidationException 格式非法或超过两位小数
     */
    static Money parse(const std::string& text) {
        if (text.empty()) {
            throw ValidationException("金额不能为空");
        }

        size_t i = 0;
        bool negative = false;
        if (text[0] == '-' || text[0] == '+') {
            negative = text[0] == '-';
            i = 1;
        }

        int64_t whole = 0;
        size_t wholeDigits = 0;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            whole = whole * 10 + (text[i] - '0');
            if (whole > MAX_WHOLE) {
                throw ValidationException("金额超出范围: " + text);
            }
            ++wholeDigits;
            ++i;
        }

        int64_t fraction = 0;
        size_t fractionDigits = 0;
        if (i < text.size() && text[i] == '.') {
            ++i;
            while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
                if (++fractionDigits > 2) {
                    throw ValidationException("金额最多两位小数: " + text);
                }
                fraction = fraction * 10 + (text[i] - '0');
                ++i;
            }
            if (fractionDigits == 1) fraction *= 10;
        }

        if (i != text.size() || (wholeDigits == 0 && fractionDigits == 0)) {
            throw ValidationException("金额格式无效: " + text);
        }

        int64_t cents = whole * 100 + fraction;
        return fromCents(negative ? -cents : cents);
    }

    /**
     * @brief 从 JSON 解析（兼容字符串 "3.00" 与数字 3.0）
     */
    static Money fromJson(const Json::Value& value) {
        if (value.isString()) {
            return parse(value.asString());
        }
        if (value.isIntegral()) {
            return fromCents(value.asInt64() * 100);
        }
        if (value.isDouble()) {
            return fromCents(static_cast<int64_t>(std::llround(value.asDouble() * 100.0)));
        }
        throw ValidationException("金额格式无效");
    }

    int64_t cents() const { return cents_; }
    bool isZero() const { return cents_ == 0; }
    bool isNegative() const { return cents_ < 0; }
    bool isPositive() const { return cents_ > 0; }

    /**
     * @brief 格式化为两位小数（如 "3.00"、"-0.50"）
     */
    std::string toString() const {
        int64_t abs = cents_ < 0 ? -cents_ : cents_;
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%s%lld.%02lld",
                      cents_ < 0 ? "-" : "",
                      static_cast<long long>(abs / 100),
                      static_cast<long long>(abs % 100));
        return buf;
    }

    Money operator+(Money other) const { return fromCents(cents_ + other.cents_); }
    Money operator-(Money other) const { return fromCents(cents_ - other.cents_); }
    Money operator*(int64_t factor) const { return fromCents(cents_ * factor); }
    Money& operator+=(Money other) { cents_ += other.cents_; return *this; }
    Money& operator-=(Money other) { cents_ -= other.cents_; return *this; }

    auto operator<=>(const Money&) const = default;

private:
    static constexpr int64_t MAX_WHOLE = 100000000000LL;

    int64_t cents_ = 0;
};

inline std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.toString();
}

inline trantor::LogStream& operator<<(trantor::LogStream& os, const Money& money) {
    return os << money.toString();
}
