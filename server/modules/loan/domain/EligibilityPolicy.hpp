#pragma once

#include "modules/loan/domain/CirculationPolicy.hpp"
#include "modules/member/domain/Member.hpp"

/**
 * @brief 不可借阅的原因
 */
enum class Ineligibility {
    None,
    Inactive,
    MembershipExpired,
    FeesOverThreshold,
    BorrowLimitReached
};

/**
 * @brief 借阅资格策略（纯函数）
 *
 * 欠费阈值为闭区间：欠费恰好等于阈值时仍可借阅。
 */
class EligibilityPolicy {
public:
    explicit EligibilityPolicy(const CirculationPolicy& policy) : policy_(policy) {}

    /**
     * @brief 返回第一个不满足的条件，满足全部条件时返回 None
     * @param activeLoanCount 会员当前处于 Active / Overdue 的借阅数
     */
    Ineligibility borrowCheck(const Member& member, int activeLoanCount, Timestamp now) const {
        if (!member.isActive()) return Ineligibility::Inactive;
        if (!(member.membershipExpiresAt() > now)) return Ineligibility::MembershipExpired;
        if (!feesWithinThreshold(member)) return Ineligibility::FeesOverThreshold;
        if (activeLoanCount >= member.maxBooksAllowed()) return Ineligibility::BorrowLimitReached;
        return Ineligibility::None;
    }

    bool canBorrowBooks(const Member& member, int activeLoanCount, Timestamp now) const {
        return borrowCheck(member, activeLoanCount, now) == Ineligibility::None;
    }

    /**
     * @brief 逾期借阅是否仍可续借：需配置允许且欠费未超过阈值
     */
    bool overdueRenewalAllowed(const Member& member) const {
        return policy_.allowRenewWhileOverdue && feesWithinThreshold(member);
    }

    bool feesWithinThreshold(const Member& member) const {
        return member.outstandingFees() <= policy_.feeThreshold;
    }

    std::string describe(Ineligibility reason, const Member& member) const {
        switch (reason) {
            case Ineligibility::None:
                return "满足借阅条件";
            case Ineligibility::Inactive:
                return "会员已停用";
            case Ineligibility::MembershipExpired:
                return "会员资格已于 " + TimestampHelper::format(member.membershipExpiresAt()) + " 过期";
            case Ineligibility::FeesOverThreshold:
                return "欠费 " + member.outstandingFees().toString()
                     + " 超过上限 " + policy_.feeThreshold.toString();
            case Ineligibility::BorrowLimitReached:
                return "在借数量已达上限 " + std::to_string(member.maxBooksAllowed());
        }
        return "不满足借阅条件";
    }

private:
    const CirculationPolicy& policy_;
};
