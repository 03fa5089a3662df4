#pragma once

#include "modules/loan/domain/Events.hpp"
#include "common/domain/EventBus.hpp"

/**
 * @brief 借阅事件处理器
 *
 * 协调服务只负责事务内的状态变更；提交之后的审计日志
 * 与会员通知由事件驱动，失败不影响已提交的结果。
 */
class LoanEventHandlers {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    /**
     * @brief 注册所有借阅事件处理器（应用启动时调用）
     */
    static void registerAll(EventBus& bus = EventBus::instance()) {
        // 借出 → 审计
        bus.subscribe<LoanCreated>([](const LoanCreated& event) -> Task<void> {
            LOG_DEBUG << "LoanEventHandler: member#" << event.memberId << " borrowed book#" << event.bookId
                      << " (loan#" << event.aggregateId << ", due " << TimestampHelper::format(event.dueDate) << ")";
            co_return;
        });

        // 逾期归还 → 通知会员罚金
        bus.subscribe<LoanReturned>([](const LoanReturned& event) -> Task<void> {
            if (!event.late) co_return;
            LOG_INFO << "LoanEventHandler: notify member#" << event.memberId << " late fee "
                     << event.lateFee << " for loan#" << event.aggregateId;
            co_return;
        });

        bus.subscribe<LoanRenewed>([](const LoanRenewed& event) -> Task<void> {
            LOG_DEBUG << "LoanEventHandler: loan#" << event.aggregateId << " renewal #"
                      << event.renewalCount << ", new due " << TimestampHelper::format(event.dueDate);
            co_return;
        });

        // 报失 / 报损 → 副本已注销，提示补充馆藏
        bus.subscribe<LoanReportedLost>([](const LoanReportedLost& event) -> Task<void> {
            LOG_WARN << "LoanEventHandler: book#" << event.bookId << " lost by member#" << event.memberId
                     << ", copy written off, fee " << event.fee;
            co_return;
        });

        bus.subscribe<LoanReportedDamaged>([](const LoanReportedDamaged& event) -> Task<void> {
            LOG_WARN << "LoanEventHandler: book#" << event.bookId << " damaged by member#" << event.memberId
                     << ", copy written off, fee " << event.fee
                     << (event.notes.empty() ? "" : " (" + event.notes + ")");
            co_return;
        });

        bus.subscribe<LateFeePaid>([](const LateFeePaid& event) -> Task<void> {
            LOG_DEBUG << "LoanEventHandler: member#" << event.memberId << " paid " << event.amount
                      << " for loan#" << event.aggregateId;
            co_return;
        });

        // 对账标记逾期 → 通知会员
        bus.subscribe<LoanMarkedOverdue>([](const LoanMarkedOverdue& event) -> Task<void> {
            LOG_INFO << "LoanEventHandler: notify overdue loan#" << event.aggregateId
                     << " (" << event.daysOverdue << " day(s))";
            co_return;
        });

        bus.subscribe<BookRetired>([](const BookRetired& event) -> Task<void> {
            LOG_DEBUG << "LoanEventHandler: book#" << event.aggregateId << " retired from circulation";
            co_return;
        });

        LOG_INFO << "LoanEventHandlers: All handlers registered";
    }
};
