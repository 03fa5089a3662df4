#pragma once

#include "Money.hpp"
#include "TimestampHelper.hpp"

/**
 * @brief Field 值获取辅助类
 * 兼容 Drogon 新版 API
 */
class FieldHelper {
public:
    static std::string getString(const drogon::orm::Field& field, const std::string& defaultValue = "") {
        if (field.isNull()) {
            return defaultValue;
        }
        return field.as<std::string>();
    }

    static int getInt(const drogon::orm::Field& field, int defaultValue = 0) {
        if (field.isNull()) {
            return defaultValue;
        }
        return field.as<int>();
    }

    static int64_t getInt64(const drogon::orm::Field& field, int64_t defaultValue = 0) {
        if (field.isNull()) {
            return defaultValue;
        }
        return field.as<int64_t>();
    }

    static bool getBool(const drogon::orm::Field& field, bool defaultValue = false) {
        if (field.isNull()) {
            return defaultValue;
        }
        return field.as<bool>();
    }

    /**
     * @brief 读取以 epoch 秒表示的时间列（SQL 中 EXTRACT(EPOCH FROM ...)::BIGINT）
     */
    static Timestamp getTimestamp(const drogon::orm::Field& field) {
        return TimestampHelper::fromEpochSeconds(field.as<int64_t>());
    }

    static std::optional<Timestamp> getOptionalTimestamp(const drogon::orm::Field& field) {
        if (field.isNull()) {
            return std::nullopt;
        }
        return getTimestamp(field);
    }

    /**
     * @brief 读取以分表示的金额列（SQL 中 ROUND(col * 100)::BIGINT）
     */
    static Money getMoney(const drogon::orm::Field& field) {
        return Money::fromCents(getInt64(field));
    }

    static std::optional<Money> getOptionalMoney(const drogon::orm::Field& field) {
        if (field.isNull()) {
            return std::nullopt;
        }
        return Money::fromCents(field.as<int64_t>());
    }
};
