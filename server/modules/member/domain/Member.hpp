#pragma once

#include "common/domain/Aggregate.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/Money.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 会员聚合根（本核心只读引用）
 *
 * 会员资料的增删改不在借阅核心内；这里只关心借阅资格相关字段，
 * 以及与借阅绑定的欠费增减（必须与借阅修改处于同一事务）。
 */
class Member : public Aggregate<Member> {
public:
    /**
     * @brief 新建会员（用于数据准备）
     */
    static Member create(Timestamp membershipExpiresAt,
                         int maxBooksAllowed = Constants::DEFAULT_MAX_BOOKS_ALLOWED) {
        if (maxBooksAllowed <= 0) {
            throw ValidationException("最大借阅数必须大于 0");
        }
        Member member;
        member.membershipExpiresAt_ = membershipExpiresAt;
        member.maxBooksAllowed_ = maxBooksAllowed;
        member.markDirty();
        return member;
    }

    static Member restore(int id, Timestamp membershipExpiresAt, int maxBooksAllowed,
                          Money outstandingFees, bool active) {
        if (outstandingFees.isNegative()) {
            throw InvariantViolationException("会员 #" + std::to_string(id) + " 欠费为负数");
        }
        Member member;
        member.setId(id);
        member.membershipExpiresAt_ = membershipExpiresAt;
        member.maxBooksAllowed_ = maxBooksAllowed;
        member.outstandingFees_ = outstandingFees;
        member.active_ = active;
        return member;
    }

    // ==================== 业务操作 ====================

    /**
     * @brief 记入与借阅相关的罚金
     */
    void addFee(Money amount) {
        if (!amount.isPositive()) {
            throw LoanError::InvalidAmount("罚金必须大于 0");
        }
        outstandingFees_ += amount;
        markDirty();
    }

    /**
     * @brief 冲减已支付的借阅罚金
     *
     * 欠费可能已被外部缴费流程抵扣，冲减不会使欠费为负。
     */
    void settleFee(Money amount) {
        if (!amount.isPositive()) {
            throw LoanError::InvalidAmount("支付金额必须大于 0");
        }
        if (amount > outstandingFees_) {
            LOG_WARN << "Member#" << id() << " settles " << amount
                     << " but only owes " << outstandingFees_;
            outstandingFees_ = Money::zero();
        } else {
            outstandingFees_ -= amount;
        }
        markDirty();
    }

    // ==================== 数据访问 ====================

    Timestamp membershipExpiresAt() const { return membershipExpiresAt_; }
    int maxBooksAllowed() const { return maxBooksAllowed_; }
    Money outstandingFees() const { return outstandingFees_; }
    bool isActive() const { return active_; }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id();
        json["membership_expires_at"] = TimestampHelper::format(membershipExpiresAt_);
        json["max_books_allowed"] = maxBooksAllowed_;
        json["outstanding_fees"] = outstandingFees_.toString();
        json["is_active"] = active_;
        return json;
    }

private:
    Timestamp membershipExpiresAt_{};
    int maxBooksAllowed_ = Constants::DEFAULT_MAX_BOOKS_ALLOWED;
    Money outstandingFees_;
    bool active_ = true;
};
