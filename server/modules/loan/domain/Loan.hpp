#pragma once

#include "common/domain/Aggregate.hpp"
#include "common/utils/Money.hpp"
#include "common/utils/TimestampHelper.hpp"
#include "modules/loan/domain/FeeCalculator.hpp"

/**
 * @brief 借阅状态枚举（与数据库 loan_status_enum 对齐）
 *
 * Overdue 既可以由读取时推导（Active 且已过到期日），
 * 也可以由逾期对账任务持久化。
 */
enum class LoanStatus {
    Active,
    Overdue,
    Returned,      // 终态
    ReturnedLate,  // 终态
    Lost,          // 终态
    Damaged,       // 终态
    Cancelled      // 终态
};

inline std::string loanStatusToString(LoanStatus status) {
    switch (status) {
        case LoanStatus::Active:       return "active";
        case LoanStatus::Overdue:      return "overdue";
        case LoanStatus::Returned:     return "returned";
        case LoanStatus::ReturnedLate: return "returned_late";
        case LoanStatus::Lost:         return "lost";
        case LoanStatus::Damaged:      return "damaged";
        case LoanStatus::Cancelled:    return "cancelled";
    }
    return "active";
}

/**
 * @throws InvariantViolationException 存储中出现未知状态
 */
inline LoanStatus loanStatusFromString(const std::string& text) {
    if (text == "active") return LoanStatus::Active;
    if (text == "overdue") return LoanStatus::Overdue;
    if (text == "returned") return LoanStatus::Returned;
    if (text == "returned_late") return LoanStatus::ReturnedLate;
    if (text == "lost") return LoanStatus::Lost;
    if (text == "damaged") return LoanStatus::Damaged;
    if (text == "cancelled") return LoanStatus::Cancelled;
    throw InvariantViolationException("未知借阅状态: " + text);
}

inline bool isTerminal(LoanStatus status) {
    return status != LoanStatus::Active && status != LoanStatus::Overdue;
}

/**
 * @brief 该状态是否占用一个图书副本（计入 CopiesOnLoan）
 */
inline bool holdsCopy(LoanStatus status) {
    return status == LoanStatus::Active || status == LoanStatus::Overdue;
}

/**
 * @brief 借阅记录的持久化形态（仓储读写用）
 */
struct LoanRecord {
    int id = 0;
    int memberId = 0;
    int bookId = 0;
    Timestamp borrowedAt{};
    Timestamp dueDate{};
    std::optional<Timestamp> returnedAt;
    LoanStatus status = LoanStatus::Active;
    std::optional<Money> lateFee;
    bool isFeePaid = false;
    int renewalCount = 0;
    int maxRenewalsAllowed = 0;
    std::string notes;
};

/**
 * @brief 借阅聚合根（借阅状态机）
 *
 * 状态转换表：
 *   Active  →[return 按时]→ Returned
 *   Active  →[return 逾期]→ ReturnedLate
 *   Active  →[renew]→ Active（续借次数 +1，到期日顺延）
 *   Active  →[markLost / markDamaged]→ Lost / Damaged
 *   Active  →[cancel]→ Cancelled（仅限未续借）
 *   Active  →[markOverdue]→ Overdue（对账任务）
 *   Overdue →[return]→ ReturnedLate
 *   Overdue →[renew 允许时]→ Active
 *
 * 借阅只引用会员与图书的 ID，不持有对方聚合；副本的占用与释放
 * 由协调服务在同一事务内与状态转换成对完成。
 */
class Loan : public Aggregate<Loan> {
public:
    // ==================== 静态工厂方法 ====================

    /**
     * @brief 新建借阅（到期日 = 借出时间 + 借期）
     */
    static Loan open(int memberId, int bookId, Timestamp borrowedAt,
                     std::chrono::days loanPeriod, int maxRenewals) {
        if (memberId <= 0 || bookId <= 0) {
            throw ValidationException("会员 ID 与图书 ID 必须大于 0");
        }
        if (loanPeriod.count() <= 0) {
            throw ValidationException("借期必须大于 0");
        }
        if (maxRenewals < 0) {
            throw ValidationException("最大续借次数不能为负数");
        }

        Loan loan;
        loan.rec_.memberId = memberId;
        loan.rec_.bookId = bookId;
        loan.rec_.borrowedAt = borrowedAt;
        loan.rec_.dueDate = borrowedAt + loanPeriod;
        loan.rec_.maxRenewalsAllowed = maxRenewals;
        loan.markDirty();
        return loan;
    }

    /**
     * @brief 从存储恢复
     */
    static Loan restore(LoanRecord record) {
        auto corrupt = [&](const std::string& what) {
            return InvariantViolationException("借阅 #" + std::to_string(record.id) + " " + what);
        };
        if (record.renewalCount < 0 || record.maxRenewalsAllowed < 0 ||
            record.renewalCount > record.maxRenewalsAllowed) {
            throw corrupt("续借次数非法");
        }
        if (record.lateFee && record.lateFee->isNegative()) {
            throw corrupt("罚金为负数");
        }
        if (record.dueDate <= record.borrowedAt) {
            throw corrupt("到期日不晚于借出时间");
        }
        if (record.returnedAt && *record.returnedAt < record.borrowedAt) {
            throw corrupt("归还时间早于借出时间");
        }
        Loan loan;
        loan.setId(record.id);
        loan.rec_ = std::move(record);
        return loan;
    }

    // ==================== 状态转换 ====================

    /**
     * @brief 续借
     * @param overdueRenewalAllowed 逾期时是否仍允许续借（由资格策略给出）
     */
    void renew(Timestamp now, std::chrono::days loanPeriod, bool overdueRenewalAllowed) {
        if (isTerminal(rec_.status)) {
            throw LoanError::NotRenewable("借阅已结束（" + loanStatusToString(rec_.status) + "）");
        }
        if (rec_.renewalCount >= rec_.maxRenewalsAllowed) {
            throw LoanError::RenewalLimitExceeded(rec_.maxRenewalsAllowed);
        }
        if (isOverdue(now) && !overdueRenewalAllowed) {
            throw LoanError::NotRenewable("借阅已逾期");
        }

        rec_.dueDate += loanPeriod;
        ++rec_.renewalCount;
        transition(LoanStatus::Active, "renew");
        markDirty();
    }

    /**
     * @brief 归还
     * @return 本次产生的滞纳金（按时归还为 0）
     */
    Money markReturned(Timestamp now, const FeeCalculator& fees) {
        if (isTerminal(rec_.status)) {
            throw LoanError::AlreadyReturned(id());
        }

        rec_.returnedAt = now;
        if (now <= rec_.dueDate) {
            rec_.lateFee = Money::zero();
            transition(LoanStatus::Returned, "return");
        } else {
            rec_.lateFee = fees.lateFee(rec_.dueDate, now);
            transition(LoanStatus::ReturnedLate, "returnLate");
        }
        markDirty();
        return *rec_.lateFee;
    }

    /**
     * @brief 报失：固定罚金 + 截至报失时的滞纳金，副本不再回库
     * @return 本次产生的罚金
     */
    Money markLost(Timestamp now, Money fixedFee, const FeeCalculator& fees) {
        return assessWriteOff(now, fixedFee, fees, LoanStatus::Lost, "markLost");
    }

    /**
     * @brief 报损，可附带损坏说明
     */
    Money markDamaged(Timestamp now, Money fixedFee, const FeeCalculator& fees, std::string notes = {}) {
        Money fee = assessWriteOff(now, fixedFee, fees, LoanStatus::Damaged, "markDamaged");
        rec_.notes = std::move(notes);
        return fee;
    }

    /**
     * @brief 撤销（未续借的在借记录，副本由协调服务释放）
     */
    void cancel(Timestamp now) {
        if (!canBeCancelled()) {
            throw LoanError::NotCancellable(id());
        }
        rec_.returnedAt = now;
        transition(LoanStatus::Cancelled, "cancel");
        markDirty();
    }

    /**
     * @brief 对账：Active 且已过到期日时持久化为 Overdue
     * @return 是否发生状态变化
     */
    bool markOverdue(Timestamp now) {
        if (rec_.status != LoanStatus::Active || !(rec_.dueDate < now)) {
            return false;
        }
        transition(LoanStatus::Overdue, "sweep");
        markDirty();
        return true;
    }

    /**
     * @brief 支付罚金（必须足额且精确）
     */
    void payLateFee(Money amount) {
        if (!amount.isPositive()) {
            throw LoanError::InvalidAmount("金额必须大于 0");
        }
        if (!hasFeeOwed()) {
            throw LoanError::NoFeeOwed(id());
        }
        if (amount != *rec_.lateFee) {
            throw LoanError::InvalidAmount("应付 " + rec_.lateFee->toString() + "，实付 " + amount.toString());
        }
        rec_.isFeePaid = true;
        markDirty();
    }

    // ==================== 派生状态 ====================

    bool isOverdue(Timestamp now) const {
        if (rec_.status == LoanStatus::Overdue) return true;
        if (rec_.status != LoanStatus::Active) return false;
        return FeeCalculator::isOverdue(rec_.dueDate, rec_.returnedAt, now);
    }

    int daysOverdue(Timestamp now) const {
        if (!holdsCopy(rec_.status)) return 0;
        return FeeCalculator::daysOverdue(rec_.dueDate, rec_.returnedAt, now);
    }

    bool canBeRenewed(Timestamp now, bool overdueRenewalAllowed) const {
        return !isTerminal(rec_.status)
            && rec_.renewalCount < rec_.maxRenewalsAllowed
            && (!isOverdue(now) || overdueRenewalAllowed);
    }

    bool canBeCancelled() const {
        return rec_.status == LoanStatus::Active && rec_.renewalCount == 0;
    }

    bool hasFeeOwed() const {
        return rec_.lateFee && rec_.lateFee->isPositive() && !rec_.isFeePaid;
    }

    // ==================== 数据访问 ====================

    int memberId() const { return rec_.memberId; }
    int bookId() const { return rec_.bookId; }
    Timestamp borrowedAt() const { return rec_.borrowedAt; }
    Timestamp dueDate() const { return rec_.dueDate; }
    const std::optional<Timestamp>& returnedAt() const { return rec_.returnedAt; }
    LoanStatus status() const { return rec_.status; }
    const std::optional<Money>& lateFee() const { return rec_.lateFee; }
    bool isFeePaid() const { return rec_.isFeePaid; }
    int renewalCount() const { return rec_.renewalCount; }
    int maxRenewalsAllowed() const { return rec_.maxRenewalsAllowed; }
    const std::string& notes() const { return rec_.notes; }

    /**
     * @brief 持久化形态（ID 取当前标识）
     */
    LoanRecord record() const {
        LoanRecord record = rec_;
        record.id = id();
        return record;
    }

    Json::Value toJson(Timestamp now) const {
        Json::Value json;
        json["id"] = id();
        json["member_id"] = rec_.memberId;
        json["book_id"] = rec_.bookId;
        json["borrowed_at"] = TimestampHelper::format(rec_.borrowedAt);
        json["due_date"] = TimestampHelper::format(rec_.dueDate);
        json["returned_at"] = rec_.returnedAt ? Json::Value(TimestampHelper::format(*rec_.returnedAt)) : Json::Value::null;
        json["status"] = loanStatusToString(rec_.status);
        json["late_fee"] = rec_.lateFee ? Json::Value(rec_.lateFee->toString()) : Json::Value::null;
        json["is_fee_paid"] = rec_.isFeePaid;
        json["renewal_count"] = rec_.renewalCount;
        json["max_renewals_allowed"] = rec_.maxRenewalsAllowed;
        json["is_overdue"] = isOverdue(now);
        json["days_overdue"] = daysOverdue(now);
        if (!rec_.notes.empty()) json["notes"] = rec_.notes;
        return json;
    }

private:
    LoanRecord rec_;

    Money assessWriteOff(Timestamp now, Money fixedFee, const FeeCalculator& fees,
                         LoanStatus target, const char* event) {
        if (isTerminal(rec_.status)) {
            throw LoanError::AlreadyReturned(id());
        }
        Money fee = fixedFee + fees.lateFee(rec_.dueDate, now);
        rec_.lateFee = fee;
        rec_.isFeePaid = false;
        transition(target, event);
        markDirty();
        return fee;
    }

    void transition(LoanStatus newStatus, const char* event) {
        if (rec_.status != newStatus) {
            LOG_DEBUG << "LoanFSM#" << id() << ": " << loanStatusToString(rec_.status)
                      << " →[" << event << "]→ " << loanStatusToString(newStatus);
            rec_.status = newStatus;
        }
    }
};
