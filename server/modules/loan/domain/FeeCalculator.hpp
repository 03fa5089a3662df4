#pragma once

#include "common/utils/Money.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 逾期与滞纳金计算（纯函数，当前时间由参数传入）
 *
 * - 逾期天数：未归还且 now > dueDate 时，按天向上取整
 * - 滞纳金：max(0, 归还时刻与到期日之间的完整天数) × 每日费率，
 *   在归还时计算一次并固化，之后不再增长
 */
class FeeCalculator {
public:
    explicit FeeCalculator(Money perDay) : perDay_(perDay) {}

    static bool isOverdue(Timestamp dueDate, std::optional<Timestamp> returnedAt, Timestamp now) {
        if (returnedAt) return false;
        return now > dueDate;
    }

    static int daysOverdue(Timestamp dueDate, std::optional<Timestamp> returnedAt, Timestamp now) {
        if (!isOverdue(dueDate, returnedAt, now)) return 0;
        auto late = std::chrono::ceil<std::chrono::days>(now - dueDate);
        return static_cast<int>(late.count());
    }

    /**
     * @brief 到期日与给定时刻之间的完整天数（提前或当日归还为 0）
     */
    static int wholeDaysLate(Timestamp dueDate, Timestamp at) {
        if (at <= dueDate) return 0;
        auto late = std::chrono::floor<std::chrono::days>(at - dueDate);
        return static_cast<int>(late.count());
    }

    Money lateFee(Timestamp dueDate, Timestamp returnTime) const {
        return perDay_ * wholeDaysLate(dueDate, returnTime);
    }

    Money perDay() const { return perDay_; }

private:
    Money perDay_;
};
