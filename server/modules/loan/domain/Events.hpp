#pragma once

#include "common/domain/DomainEvent.hpp"
#include "common/utils/Money.hpp"

// ==================== 借阅相关事件 ====================

struct LoanCreated : DomainEvent {
    int memberId;
    int bookId;
    Timestamp dueDate;

    LoanCreated(int loanId, int m, int b, Timestamp due, Timestamp at)
        : DomainEvent("LoanCreated", loanId, "Loan", at)
        , memberId(m), bookId(b), dueDate(due) {}
};

struct LoanReturned : DomainEvent {
    int memberId;
    int bookId;
    bool late;
    Money lateFee;

    LoanReturned(int loanId, int m, int b, bool l, Money fee, Timestamp at)
        : DomainEvent("LoanReturned", loanId, "Loan", at)
        , memberId(m), bookId(b), late(l), lateFee(fee) {}
};

struct LoanRenewed : DomainEvent {
    int renewalCount;
    Timestamp dueDate;

    LoanRenewed(int loanId, int count, Timestamp due, Timestamp at)
        : DomainEvent("LoanRenewed", loanId, "Loan", at)
        , renewalCount(count), dueDate(due) {}
};

struct LoanReportedLost : DomainEvent {
    int memberId;
    int bookId;
    Money fee;

    LoanReportedLost(int loanId, int m, int b, Money f, Timestamp at)
        : DomainEvent("LoanReportedLost", loanId, "Loan", at)
        , memberId(m), bookId(b), fee(f) {}
};

struct LoanReportedDamaged : DomainEvent {
    int memberId;
    int bookId;
    Money fee;
    std::string notes;

    LoanReportedDamaged(int loanId, int m, int b, Money f, std::string n, Timestamp at)
        : DomainEvent("LoanReportedDamaged", loanId, "Loan", at)
        , memberId(m), bookId(b), fee(f), notes(std::move(n)) {}
};

struct LoanCancelled : DomainEvent {
    int bookId;

    LoanCancelled(int loanId, int b, Timestamp at)
        : DomainEvent("LoanCancelled", loanId, "Loan", at), bookId(b) {}
};

struct LateFeePaid : DomainEvent {
    int memberId;
    Money amount;

    LateFeePaid(int loanId, int m, Money a, Timestamp at)
        : DomainEvent("LateFeePaid", loanId, "Loan", at), memberId(m), amount(a) {}
};

struct LoanMarkedOverdue : DomainEvent {
    int daysOverdue;

    LoanMarkedOverdue(int loanId, int days, Timestamp at)
        : DomainEvent("LoanMarkedOverdue", loanId, "Loan", at), daysOverdue(days) {}
};

// ==================== 库存相关事件 ====================

struct BookCopiesAdded : DomainEvent {
    int added;
    int totalCopies;

    BookCopiesAdded(int bookId, int n, int total, Timestamp at)
        : DomainEvent("BookCopiesAdded", bookId, "Book", at), added(n), totalCopies(total) {}
};

struct BookRetired : DomainEvent {
    BookRetired(int bookId, Timestamp at)
        : DomainEvent("BookRetired", bookId, "Book", at) {}
};
