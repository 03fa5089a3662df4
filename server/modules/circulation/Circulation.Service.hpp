#pragma once

#include "store/CirculationStore.hpp"
#include "common/domain/EventBus.hpp"
#include "common/utils/Clock.hpp"
#include "modules/loan/domain/CirculationPolicy.hpp"
#include "modules/loan/domain/EligibilityPolicy.hpp"
#include "modules/loan/domain/Events.hpp"

/**
 * @brief 库存核对结果
 */
struct InventoryReport {
    Book book;
    int activeLoans = 0;

    Json::Value toJson() const {
        Json::Value json = book.toJson();
        json["active_loans"] = activeLoans;
        json["consistent"] = activeLoans == book.copiesOnLoan();
        return json;
    }
};

/**
 * @brief 借阅协调服务
 *
 * 唯一允许在同一操作中同时修改图书库存与借阅的组件。
 * 每个公开操作都在一个工作单元内完成：要么全部提交，要么全部回滚。
 *
 * 约定：
 * - 参数校验在开启事务之前完成
 * - 行锁顺序固定为 Member → Book → Loan；以借阅 ID 为入口的操作
 *   先做一次无锁读取得到会员与图书 ID，再按顺序加锁并重新读取
 * - 领域事件只在提交成功后发布
 * - StorageBusy 原样抛出，由调用方决定是否重试
 */
class CirculationService {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    CirculationService(CirculationStore& store, const Clock& clock, CirculationPolicy policy,
                       EventBus& bus = EventBus::instance())
        : store_(store), clock_(clock), policy_(std::move(policy)),
          eligibility_(policy_), fees_(policy_.lateFeePerDay), bus_(bus) {}

    CirculationService(const CirculationService&) = delete;
    CirculationService& operator=(const CirculationService&) = delete;

    const CirculationPolicy& policy() const { return policy_; }
    const Clock& clock() const { return clock_; }

    // ==================== 借阅流转 ====================

    /**
     * @brief 借书：资格检查 → 预留副本 → 创建借阅
     * @throws MemberIneligible / OutOfStock / NotFound
     */
    Task<Loan> createLoan(int memberId, int bookId) {
        requireId(memberId, "会员");
        requireId(bookId, "图书");
        auto now = clock_.now();

        auto uow = co_await store_.begin();

        auto member = co_await lockMember(*uow, memberId);
        int activeLoans = co_await uow->loans().countActiveByMember(memberId);
        auto reason = eligibility_.borrowCheck(member, activeLoans, now);
        if (reason != Ineligibility::None) {
            throw LoanError::MemberIneligible(eligibility_.describe(reason, member));
        }

        auto book = co_await lockBook(*uow, bookId);
        if (book.isDeleted()) {
            throw NotFoundException("图书 #" + std::to_string(bookId) + " 已下架");
        }
        book.reserveCopy();
        co_await uow->books().save(book);

        auto loan = Loan::open(memberId, bookId, now, policy_.loanPeriod(), policy_.maxRenewals);
        co_await uow->loans().insert(loan);

        co_await uow->commit();

        LOG_INFO << "[Circulation] Loan#" << loan.id() << " created: member#" << memberId
                 << " book#" << bookId << " due " << TimestampHelper::format(loan.dueDate())
                 << " (available " << book.availableCopies() << "/" << book.totalCopies() << ")";
        co_await bus_.publish(LoanCreated{loan.id(), memberId, bookId, loan.dueDate(), now});
        co_return loan;
    }

    /**
     * @brief 还书：状态转换 + 释放副本 + 逾期罚金记入会员欠费
     * @throws AlreadyReturned / NotFound
     */
    Task<Loan> returnLoan(int loanId) {
        requireId(loanId, "借阅");
        auto now = clock_.now();

        auto uow = co_await store_.begin();
        auto ctx = co_await lockLoan(*uow, loanId, true, true);

        Money fee = ctx.loan.markReturned(now, fees_);
        ctx.book->releaseCopy();
        if (fee.isPositive()) {
            ctx.member->addFee(fee);
        }

        co_await uow->loans().save(ctx.loan);
        co_await uow->books().save(*ctx.book);
        co_await uow->members().save(*ctx.member);
        co_await uow->commit();

        bool late = ctx.loan.status() == LoanStatus::ReturnedLate;
        LOG_INFO << "[Circulation] Loan#" << loanId << " returned"
                 << (late ? " late, fee " + fee.toString() : " on time");
        co_await bus_.publish(LoanReturned{loanId, ctx.loan.memberId(), ctx.loan.bookId(), late, fee, now});
        co_return std::move(ctx.loan);
    }

    /**
     * @brief 续借（副本保持借出）
     * @throws RenewalLimitExceeded / NotRenewable / NotFound
     */
    Task<Loan> renewLoan(int loanId) {
        requireId(loanId, "借阅");
        auto now = clock_.now();

        auto uow = co_await store_.begin();
        auto ctx = co_await lockLoan(*uow, loanId, true, false);

        ctx.loan.renew(now, policy_.loanPeriod(), eligibility_.overdueRenewalAllowed(*ctx.member));

        co_await uow->loans().save(ctx.loan);
        co_await uow->commit();

        LOG_INFO << "[Circulation] Loan#" << loanId << " renewed ("
                 << ctx.loan.renewalCount() << "/" << ctx.loan.maxRenewalsAllowed() << "), due "
                 << TimestampHelper::format(ctx.loan.dueDate());
        co_await bus_.publish(LoanRenewed{loanId, ctx.loan.renewalCount(), ctx.loan.dueDate(), now});
        co_return std::move(ctx.loan);
    }

    /**
     * @brief 报失：副本注销，不回库；罚金 = 报失费 + 已产生的滞纳金
     * @throws AlreadyReturned / NotFound
     */
    Task<Loan> reportLost(int loanId) {
        requireId(loanId, "借阅");
        auto now = clock_.now();

        auto uow = co_await store_.begin();
        auto ctx = co_await lockLoan(*uow, loanId, true, true);

        Money fee = ctx.loan.markLost(now, policy_.lostFee, fees_);
        co_await writeOff(*uow, ctx, fee);
        co_await uow->commit();

        LOG_INFO << "[Circulation] Loan#" << loanId << " reported lost, fee " << fee;
        co_await bus_.publish(LoanReportedLost{loanId, ctx.loan.memberId(), ctx.loan.bookId(), fee, now});
        co_return std::move(ctx.loan);
    }

    /**
     * @brief 报损：同报失，可附带损坏说明
     * @throws AlreadyReturned / NotFound
     */
    Task<Loan> reportDamaged(int loanId, std::string notes = {}) {
        requireId(loanId, "借阅");
        auto now = clock_.now();

        auto uow = co_await store_.begin();
        auto ctx = co_await lockLoan(*uow, loanId, true, true);

        Money fee = ctx.loan.markDamaged(now, policy_.damagedFee, fees_, std::move(notes));
        co_await writeOff(*uow, ctx, fee);
        co_await uow->commit();

        LOG_INFO << "[Circulation] Loan#" << loanId << " reported damaged, fee " << fee;
        co_await bus_.publish(LoanReportedDamaged{
            loanId, ctx.loan.memberId(), ctx.loan.bookId(), fee, ctx.loan.notes(), now});
        co_return std::move(ctx.loan);
    }

    /**
     * @brief 支付罚金（必须与应付金额完全一致）
     * @throws InvalidAmount / NoFeeOwed / NotFound
     */
    Task<Loan> payLateFee(int loanId, Money amount) {
        requireId(loanId, "借阅");
        if (!amount.isPositive()) {
            throw LoanError::InvalidAmount("金额必须大于 0");
        }
        auto now = clock_.now();

        auto uow = co_await store_.begin();
        auto ctx = co_await lockLoan(*uow, loanId, true, false);

        ctx.loan.payLateFee(amount);
        ctx.member->settleFee(amount);

        co_await uow->loans().save(ctx.loan);
        co_await uow->members().save(*ctx.member);
        co_await uow->commit();

        LOG_INFO << "[Circulation] Loan#" << loanId << " fee paid: " << amount;
        co_await bus_.publish(LateFeePaid{loanId, ctx.loan.memberId(), amount, now});
        co_return std::move(ctx.loan);
    }

    /**
     * @brief 撤销未续借的在借记录，副本回库
     * @throws NotCancellable / NotFound
     */
    Task<Loan> cancelLoan(int loanId) {
        requireId(loanId, "借阅");
        auto now = clock_.now();

        auto uow = co_await store_.begin();
        auto ctx = co_await lockLoan(*uow, loanId, false, true);

        ctx.loan.cancel(now);
        ctx.book->releaseCopy();

        co_await uow->loans().save(ctx.loan);
        co_await uow->books().save(*ctx.book);
        co_await uow->commit();

        LOG_INFO << "[Circulation] Loan#" << loanId << " cancelled";
        co_await bus_.publish(LoanCancelled{loanId, ctx.loan.bookId(), now});
        co_return std::move(ctx.loan);
    }

    /**
     * @brief 逾期对账：把到期日早于 asOf 的 Active 借阅持久化为 Overdue
     * @return 本次标记的数量
     */
    Task<int> markOverdueLoans(std::optional<Timestamp> asOf = std::nullopt) {
        auto now = asOf.value_or(clock_.now());

        auto uow = co_await store_.begin();
        auto candidates = co_await uow->loans().findOverdue(now, true);

        std::vector<Loan> marked;
        for (auto& loan : candidates) {
            if (loan.markOverdue(now)) {
                co_await uow->loans().save(loan);
                marked.push_back(std::move(loan));
            }
        }
        co_await uow->commit();

        if (!marked.empty()) {
            LOG_INFO << "[Circulation] Overdue sweep marked " << marked.size() << " loan(s) as of "
                     << TimestampHelper::format(now);
        }
        for (const auto& loan : marked) {
            co_await bus_.publish(LoanMarkedOverdue{loan.id(), loan.daysOverdue(now), now});
        }
        co_return static_cast<int>(marked.size());
    }

    // ==================== 查询 ====================

    Task<Loan> getLoan(int loanId) {
        requireId(loanId, "借阅");
        auto uow = co_await store_.begin();
        auto loan = co_await uow->loans().get(loanId);
        uow->rollback();
        if (!loan) {
            throw NotFoundException("借阅 #" + std::to_string(loanId) + " 不存在");
        }
        co_return std::move(*loan);
    }

    /**
     * @brief 会员当前在借（Active / Overdue）的借阅
     */
    Task<std::vector<Loan>> activeLoansOf(int memberId) {
        requireId(memberId, "会员");
        auto uow = co_await store_.begin();
        if (!co_await uow->members().get(memberId)) {
            throw NotFoundException("会员 #" + std::to_string(memberId) + " 不存在");
        }
        auto loans = co_await uow->loans().findActiveByMember(memberId);
        uow->rollback();
        co_return loans;
    }

    /**
     * @brief 截至 asOf 已逾期的借阅（含推导出的逾期）
     */
    Task<std::vector<Loan>> overdueLoans(std::optional<Timestamp> asOf = std::nullopt) {
        auto now = asOf.value_or(clock_.now());
        auto uow = co_await store_.begin();
        auto loans = co_await uow->loans().findOverdue(now, false);
        uow->rollback();
        co_return loans;
    }

    // ==================== 库存台账 ====================

    /**
     * @brief 增加副本
     */
    Task<Book> addCopies(int bookId, int count) {
        requireId(bookId, "图书");
        if (count <= 0) {
            throw ValidationException("新增副本数必须大于 0");
        }
        auto now = clock_.now();

        auto uow = co_await store_.begin();
        auto book = co_await lockBook(*uow, bookId);
        if (book.isDeleted()) {
            throw NotFoundException("图书 #" + std::to_string(bookId) + " 已下架");
        }
        book.addCopies(count);
        co_await uow->books().save(book);
        co_await uow->commit();

        LOG_INFO << "[Circulation] Book#" << bookId << " +" << count << " copies, total "
                 << book.totalCopies();
        co_await bus_.publish(BookCopiesAdded{bookId, count, book.totalCopies(), now});
        co_return book;
    }

    /**
     * @brief 下架图书（要求无在借副本）
     * @throws PreconditionFailed / NotFound
     */
    Task<Book> retireBook(int bookId) {
        requireId(bookId, "图书");
        auto now = clock_.now();

        auto uow = co_await store_.begin();
        auto book = co_await lockBook(*uow, bookId);
        bool alreadyRetired = book.isDeleted();
        int activeLoans = co_await uow->loans().countActiveByBook(bookId);
        book.markDeleted(activeLoans);
        co_await uow->books().save(book);
        co_await uow->commit();

        if (!alreadyRetired) {
            LOG_INFO << "[Circulation] Book#" << bookId << " retired";
            co_await bus_.publish(BookRetired{bookId, now});
        }
        co_return book;
    }

    /**
     * @brief 核对 CopiesOnLoan 与在借借阅数
     * @throws InvariantViolation 两者不一致
     */
    Task<InventoryReport> checkInventory(int bookId) {
        requireId(bookId, "图书");

        auto uow = co_await store_.begin();
        auto book = co_await lockBook(*uow, bookId);
        int activeLoans = co_await uow->loans().countActiveByBook(bookId);
        uow->rollback();

        if (activeLoans != book.copiesOnLoan()) {
            LOG_ERROR << "[Circulation] Inventory mismatch on Book#" << bookId
                      << ": copiesOnLoan=" << book.copiesOnLoan() << " activeLoans=" << activeLoans;
            throw InvariantViolationException(
                "图书 #" + std::to_string(bookId) + " 在借副本数 " + std::to_string(book.copiesOnLoan())
                + " 与在借记录数 " + std::to_string(activeLoans) + " 不一致");
        }
        co_return InventoryReport{std::move(book), activeLoans};
    }

private:
    CirculationStore& store_;
    const Clock& clock_;
    CirculationPolicy policy_;
    EligibilityPolicy eligibility_;
    FeeCalculator fees_;
    EventBus& bus_;

    /**
     * @brief 已加锁的借阅及其关联聚合
     */
    struct LoanContext {
        std::optional<Member> member;
        std::optional<Book> book;
        Loan loan;
    };

    static void requireId(int id, const char* what) {
        if (id <= 0) {
            throw ValidationException(std::string("无效的") + what + " ID: " + std::to_string(id));
        }
    }

    static Task<Member> lockMember(CirculationUnitOfWork& uow, int memberId) {
        auto member = co_await uow.members().getForUpdate(memberId);
        if (!member) {
            throw NotFoundException("会员 #" + std::to_string(memberId) + " 不存在");
        }
        co_return std::move(*member);
    }

    static Task<Book> lockBook(CirculationUnitOfWork& uow, int bookId) {
        auto book = co_await uow.books().getForUpdate(bookId);
        if (!book) {
            throw NotFoundException("图书 #" + std::to_string(bookId) + " 不存在");
        }
        co_return std::move(*book);
    }

    /**
     * @brief 按 Member → Book → Loan 顺序锁定借阅及其关联聚合
     */
    static Task<LoanContext> lockLoan(CirculationUnitOfWork& uow, int loanId, bool withMember, bool withBook) {
        auto snapshot = co_await uow.loans().get(loanId);
        if (!snapshot) {
            throw NotFoundException("借阅 #" + std::to_string(loanId) + " 不存在");
        }

        std::optional<Member> member;
        std::optional<Book> book;
        if (withMember) member = co_await lockMember(uow, snapshot->memberId());
        if (withBook) book = co_await lockBook(uow, snapshot->bookId());

        auto loan = co_await uow.loans().getForUpdate(loanId);
        if (!loan) {
            throw NotFoundException("借阅 #" + std::to_string(loanId) + " 不存在");
        }
        co_return LoanContext{std::move(member), std::move(book), std::move(*loan)};
    }

    /**
     * @brief 报失 / 报损的公共部分：注销副本、记入罚金、保存三个聚合
     */
    static Task<void> writeOff(CirculationUnitOfWork& uow, LoanContext& ctx, Money fee) {
        ctx.book->writeOffCopy();
        if (fee.isPositive()) {
            ctx.member->addFee(fee);
        }
        co_await uow.loans().save(ctx.loan);
        co_await uow.books().save(*ctx.book);
        co_await uow.members().save(*ctx.member);
    }
};
