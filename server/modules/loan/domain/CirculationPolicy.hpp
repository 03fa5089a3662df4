#pragma once

#include "common/utils/Constants.hpp"
#include "common/utils/Money.hpp"

/**
 * @brief 借阅规则参数
 *
 * 来自配置 custom_config.circulation，缺省项取 Constants 中的默认值。
 */
struct CirculationPolicy {
    int loanPeriodDays = Constants::DEFAULT_LOAN_PERIOD_DAYS;
    int maxRenewals = Constants::DEFAULT_MAX_RENEWALS;
    Money lateFeePerDay = Money::fromCents(Constants::DEFAULT_LATE_FEE_PER_DAY_CENTS);
    Money feeThreshold = Money::fromCents(Constants::DEFAULT_FEE_THRESHOLD_CENTS);
    Money lostFee = Money::fromCents(Constants::DEFAULT_LOST_FEE_CENTS);
    Money damagedFee = Money::fromCents(Constants::DEFAULT_DAMAGED_FEE_CENTS);
    bool allowRenewWhileOverdue = false;
    int lockTimeoutMs = Constants::DEFAULT_LOCK_TIMEOUT_MS;

    std::chrono::days loanPeriod() const { return std::chrono::days{loanPeriodDays}; }

    /**
     * @brief 从 JSON 读取（缺省字段保留默认值）
     * @throws ValidationException 字段类型或取值非法
     */
    static CirculationPolicy fromJson(const Json::Value& json) {
        CirculationPolicy policy;
        if (json.isNull()) return policy;
        if (!json.isObject()) {
            throw ValidationException("[circulation] 必须是 JSON 对象");
        }

        policy.loanPeriodDays = readInt(json, "loan_period_days", policy.loanPeriodDays);
        policy.maxRenewals = readInt(json, "max_renewals", policy.maxRenewals);
        policy.lockTimeoutMs = readInt(json, "lock_timeout_ms", policy.lockTimeoutMs);
        if (json.isMember("late_fee_per_day")) policy.lateFeePerDay = Money::fromJson(json["late_fee_per_day"]);
        if (json.isMember("fee_threshold")) policy.feeThreshold = Money::fromJson(json["fee_threshold"]);
        if (json.isMember("lost_fee")) policy.lostFee = Money::fromJson(json["lost_fee"]);
        if (json.isMember("damaged_fee")) policy.damagedFee = Money::fromJson(json["damaged_fee"]);
        if (json.isMember("allow_renew_while_overdue")) {
            if (!json["allow_renew_while_overdue"].isBool()) {
                throw ValidationException("[circulation] allow_renew_while_overdue 必须是布尔值");
            }
            policy.allowRenewWhileOverdue = json["allow_renew_while_overdue"].asBool();
        }

        auto errors = policy.validate();
        if (!errors.empty()) {
            throw ValidationException("[circulation] " + errors.front());
        }
        return policy;
    }

    /**
     * @brief 校验取值范围，返回全部错误
     */
    std::vector<std::string> validate() const {
        std::vector<std::string> errors;
        if (loanPeriodDays <= 0) errors.emplace_back("loan_period_days 必须大于 0");
        if (maxRenewals < 0) errors.emplace_back("max_renewals 不能为负数");
        if (lockTimeoutMs <= 0) errors.emplace_back("lock_timeout_ms 必须大于 0");
        if (lateFeePerDay.isNegative()) errors.emplace_back("late_fee_per_day 不能为负数");
        if (feeThreshold.isNegative()) errors.emplace_back("fee_threshold 不能为负数");
        if (lostFee.isNegative()) errors.emplace_back("lost_fee 不能为负数");
        if (damagedFee.isNegative()) errors.emplace_back("damaged_fee 不能为负数");
        return errors;
    }

private:
    static int readInt(const Json::Value& json, const char* key, int defaultValue) {
        if (!json.isMember(key)) return defaultValue;
        if (!json[key].isInt()) {
            throw ValidationException(std::string("[circulation] ") + key + " 必须是整数");
        }
        return json[key].asInt();
    }
};
