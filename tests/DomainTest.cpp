#include "TestSupport.hpp"

#include "common/domain/Domain.hpp"

using namespace std::chrono_literals;

// ==================== Money ====================

TEST(MoneyTest, ParsesDecimalStrings) {
    EXPECT_EQ(Money::parse("3").cents(), 300);
    EXPECT_EQ(Money::parse("3.5").cents(), 350);
    EXPECT_EQ(Money::parse("10.00").cents(), 1000);
    EXPECT_EQ(Money::parse(".25").cents(), 25);
    EXPECT_EQ(Money::parse("-0.50").cents(), -50);
}

TEST(MoneyTest, RejectsMalformedAmounts) {
    EXPECT_THROW(Money::parse(""), ValidationException);
    EXPECT_THROW(Money::parse("1.234"), ValidationException);
    EXPECT_THROW(Money::parse("abc"), ValidationException);
    EXPECT_THROW(Money::parse("1.2x"), ValidationException);
    EXPECT_THROW(Money::parse("."), ValidationException);
}

TEST(MoneyTest, FormatsTwoDecimals) {
    EXPECT_EQ(Money::fromCents(300).toString(), "3.00");
    EXPECT_EQ(Money::fromCents(5).toString(), "0.05");
    EXPECT_EQ(Money::fromCents(-50).toString(), "-0.50");
}

TEST(MoneyTest, ReadsJsonStringsAndNumbers) {
    EXPECT_EQ(Money::fromJson(Json::Value("0.50")).cents(), 50);
    EXPECT_EQ(Money::fromJson(Json::Value(2)).cents(), 200);
    EXPECT_EQ(Money::fromJson(Json::Value(0.1)).cents(), 10);
    EXPECT_THROW(Money::fromJson(Json::Value(true)), ValidationException);
}

// ==================== Timestamp ====================

TEST(TimestampTest, ParsesAndFormatsUtc) {
    auto ts = at("2024-01-15T08:30:00Z");
    EXPECT_EQ(TimestampHelper::format(ts), "2024-01-15T08:30:00Z");
    EXPECT_EQ(at("2024-01-15"), at("2024-01-15T00:00:00"));
    EXPECT_EQ(at("2024-01-15 08:30:00"), ts);
    EXPECT_THROW(at("2024-13-01"), ValidationException);
    EXPECT_THROW(at("yesterday"), ValidationException);
}

TEST(TimestampTest, RejectsOffsetsAndTrailingText) {
    EXPECT_THROW(at("2030-01-01T00:00:00+08:00"), ValidationException);
    EXPECT_THROW(at("2030-01-01T00:00:00Zjunk"), ValidationException);
    EXPECT_THROW(at("2030-01-01T00:00:00.5Z"), ValidationException);
    EXPECT_THROW(at("2030-01-01 00:00:00Z"), ValidationException);
    EXPECT_THROW(at("2030-01-01x"), ValidationException);
    EXPECT_NO_THROW(at("2030-01-01T00:00:00Z"));
}

// ==================== Book ====================

TEST(BookTest, ReserveAndReleaseKeepCopiesInRange) {
    auto book = Book::create(2);
    book.reserveCopy();
    book.reserveCopy();
    EXPECT_EQ(book.availableCopies(), 0);
    EXPECT_EQ(book.copiesOnLoan(), 2);
    EXPECT_FALSE(book.isAvailable());

    expectAppError([&] { book.reserveCopy(); }, ErrorCodes::OUT_OF_STOCK);
    EXPECT_EQ(book.availableCopies(), 0);

    book.releaseCopy();
    book.releaseCopy();
    EXPECT_EQ(book.availableCopies(), 2);
    EXPECT_THROW(book.releaseCopy(), InvariantViolationException);
}

TEST(BookTest, WriteOffRemovesACopyOnLoan) {
    auto book = Book::create(3);
    book.reserveCopy();
    book.writeOffCopy();
    EXPECT_EQ(book.totalCopies(), 2);
    EXPECT_EQ(book.availableCopies(), 2);
    EXPECT_EQ(book.copiesOnLoan(), 0);
    EXPECT_THROW(book.writeOffCopy(), InvariantViolationException);
}

TEST(BookTest, RestoreRejectsCorruptCounts) {
    EXPECT_THROW(Book::restore(1, 2, 3, false), InvariantViolationException);
    EXPECT_THROW(Book::restore(1, 2, -1, false), InvariantViolationException);
    EXPECT_NO_THROW(Book::restore(1, 2, 2, false));
}

TEST(BookTest, RetireRequiresNoCopiesOnLoan) {
    auto book = Book::restore(7, 2, 1, false);
    expectAppError([&] { book.markDeleted(1); }, ErrorCodes::PRECONDITION_FAILED);
    EXPECT_THROW(book.markDeleted(0), InvariantViolationException);

    book.releaseCopy();
    book.markDeleted(0);
    EXPECT_TRUE(book.isDeleted());
    EXPECT_FALSE(book.isAvailable());
}

TEST(BookTest, AddCopiesRejectsNonPositiveCount) {
    auto book = Book::create(1);
    EXPECT_THROW(book.addCopies(0), ValidationException);
    book.addCopies(4);
    EXPECT_EQ(book.totalCopies(), 5);
    EXPECT_EQ(book.availableCopies(), 5);
}

// ==================== FeeCalculator ====================

TEST(FeeCalculatorTest, DaysOverdueRoundsUp) {
    auto due = at("2024-01-15T10:00:00Z");
    EXPECT_EQ(FeeCalculator::daysOverdue(due, std::nullopt, due), 0);
    EXPECT_EQ(FeeCalculator::daysOverdue(due, std::nullopt, due + 1s), 1);
    EXPECT_EQ(FeeCalculator::daysOverdue(due, std::nullopt, due + 24h), 1);
    EXPECT_EQ(FeeCalculator::daysOverdue(due, std::nullopt, due + 25h), 2);
    EXPECT_EQ(FeeCalculator::daysOverdue(due, due + 48h, due + 72h), 0);
}

TEST(FeeCalculatorTest, LateFeeCountsWholeDays) {
    FeeCalculator fees(Money::parse("0.50"));
    auto due = at("2024-01-15T10:00:00Z");
    EXPECT_EQ(fees.lateFee(due, due - 1h), Money::zero());
    EXPECT_EQ(fees.lateFee(due, due + 23h), Money::zero());
    EXPECT_EQ(fees.lateFee(due, due + 24h), Money::parse("0.50"));
    EXPECT_EQ(fees.lateFee(due, due + 6 * 24h + 5h), Money::parse("3.00"));
}

// ==================== Loan ====================

class LoanTest : public ::testing::Test {
protected:
    Timestamp start = at("2024-01-01T10:00:00Z");
    FeeCalculator fees{Money::parse("0.50")};

    Loan openLoan(int maxRenewals = 2) {
        auto loan = Loan::open(1, 2, start, std::chrono::days{14}, maxRenewals);
        loan.markPersisted(42);
        return loan;
    }
};

TEST_F(LoanTest, OpenSetsDueDateFromLoanPeriod) {
    auto loan = openLoan();
    EXPECT_EQ(loan.status(), LoanStatus::Active);
    EXPECT_EQ(loan.dueDate(), at("2024-01-15T10:00:00Z"));
    EXPECT_EQ(loan.renewalCount(), 0);
    EXPECT_FALSE(loan.returnedAt().has_value());
}

TEST_F(LoanTest, RestoreRejectsCorruptRecords) {
    auto valid = openLoan().record();
    EXPECT_NO_THROW(Loan::restore(valid));

    auto overRenewed = valid;
    overRenewed.renewalCount = 3;
    EXPECT_THROW(Loan::restore(overRenewed), InvariantViolationException);

    auto dueAtBorrow = valid;
    dueAtBorrow.dueDate = dueAtBorrow.borrowedAt;
    EXPECT_THROW(Loan::restore(dueAtBorrow), InvariantViolationException);

    auto returnedEarly = valid;
    returnedEarly.returnedAt = start - std::chrono::hours{1};
    EXPECT_THROW(Loan::restore(returnedEarly), InvariantViolationException);
}

TEST_F(LoanTest, OnTimeReturnHasNoFee) {
    auto loan = openLoan();
    auto fee = loan.markReturned(start + std::chrono::days{14}, fees);
    EXPECT_EQ(loan.status(), LoanStatus::Returned);
    EXPECT_EQ(fee, Money::zero());
    EXPECT_FALSE(loan.hasFeeOwed());
}

TEST_F(LoanTest, LateReturnFixesFeeAtReturnTime) {
    auto loan = openLoan();
    auto fee = loan.markReturned(start + std::chrono::days{20}, fees);
    EXPECT_EQ(loan.status(), LoanStatus::ReturnedLate);
    EXPECT_EQ(fee, Money::parse("3.00"));
    EXPECT_TRUE(loan.hasFeeOwed());
    EXPECT_EQ(loan.daysOverdue(start + std::chrono::days{40}), 0);

    expectAppError([&] { loan.markReturned(start + std::chrono::days{21}, fees); },
                   ErrorCodes::ALREADY_RETURNED);
    EXPECT_EQ(*loan.lateFee(), Money::parse("3.00"));
}

TEST_F(LoanTest, RenewExtendsFromCurrentDueDate) {
    auto loan = openLoan();
    loan.renew(start + std::chrono::days{10}, std::chrono::days{14}, false);
    EXPECT_EQ(loan.dueDate(), at("2024-01-29T10:00:00Z"));
    EXPECT_EQ(loan.renewalCount(), 1);
    EXPECT_FALSE(loan.canBeCancelled());
}

TEST_F(LoanTest, RenewStopsAtLimit) {
    auto loan = openLoan(2);
    loan.renew(start, std::chrono::days{14}, false);
    loan.renew(start, std::chrono::days{14}, false);
    auto due = loan.dueDate();

    expectAppError([&] { loan.renew(start, std::chrono::days{14}, false); },
                   ErrorCodes::RENEWAL_LIMIT_EXCEEDED);
    EXPECT_EQ(loan.renewalCount(), 2);
    EXPECT_EQ(loan.dueDate(), due);
}

TEST_F(LoanTest, OverdueRenewalNeedsPermission) {
    auto loan = openLoan();
    auto late = start + std::chrono::days{15};
    EXPECT_TRUE(loan.isOverdue(late));
    EXPECT_FALSE(loan.canBeRenewed(late, false));
    expectAppError([&] { loan.renew(late, std::chrono::days{14}, false); }, ErrorCodes::NOT_RENEWABLE);

    loan.renew(late, std::chrono::days{14}, true);
    EXPECT_EQ(loan.status(), LoanStatus::Active);
    EXPECT_EQ(loan.dueDate(), at("2024-01-29T10:00:00Z"));
}

TEST_F(LoanTest, TerminalLoanCannotBeRenewed) {
    auto loan = openLoan();
    loan.markReturned(start, fees);
    expectAppError([&] { loan.renew(start, std::chrono::days{14}, true); }, ErrorCodes::NOT_RENEWABLE);
}

TEST_F(LoanTest, LostAddsLateFeeToFixedFee) {
    auto loan = openLoan();
    auto fee = loan.markLost(start + std::chrono::days{16}, Money::parse("20.00"), fees);
    EXPECT_EQ(loan.status(), LoanStatus::Lost);
    EXPECT_EQ(fee, Money::parse("21.00"));
    EXPECT_FALSE(loan.isFeePaid());
    EXPECT_FALSE(loan.returnedAt().has_value());
    EXPECT_FALSE(loan.isOverdue(start + std::chrono::days{30}));
}

TEST_F(LoanTest, DamagedKeepsNotes) {
    auto loan = openLoan();
    auto fee = loan.markDamaged(start, Money::parse("10.00"), fees, "water damage");
    EXPECT_EQ(loan.status(), LoanStatus::Damaged);
    EXPECT_EQ(fee, Money::parse("10.00"));
    EXPECT_EQ(loan.notes(), "water damage");

    expectAppError([&] { loan.markLost(start, Money::parse("20.00"), fees); },
                   ErrorCodes::ALREADY_RETURNED);
}

TEST_F(LoanTest, CancelOnlyBeforeRenewal) {
    auto loan = openLoan();
    loan.cancel(start + 1h);
    EXPECT_EQ(loan.status(), LoanStatus::Cancelled);
    EXPECT_FALSE(holdsCopy(loan.status()));

    auto renewed = openLoan();
    renewed.renew(start, std::chrono::days{14}, false);
    expectAppError([&] { renewed.cancel(start); }, ErrorCodes::NOT_CANCELLABLE);
}

TEST_F(LoanTest, SweepMarksOnlyPastDueActiveLoans) {
    auto loan = openLoan();
    EXPECT_FALSE(loan.markOverdue(loan.dueDate()));
    EXPECT_TRUE(loan.markOverdue(loan.dueDate() + 1s));
    EXPECT_EQ(loan.status(), LoanStatus::Overdue);
    EXPECT_FALSE(loan.markOverdue(loan.dueDate() + 2s));
    EXPECT_FALSE(loan.canBeCancelled());
}

TEST_F(LoanTest, FeePaymentMustMatchExactly) {
    auto loan = openLoan();
    expectAppError([&] { loan.payLateFee(Money::parse("1.00")); }, ErrorCodes::NO_FEE_OWED);

    loan.markReturned(start + std::chrono::days{20}, fees);
    expectAppError([&] { loan.payLateFee(Money::zero()); }, ErrorCodes::INVALID_AMOUNT);
    expectAppError([&] { loan.payLateFee(Money::parse("2.99")); }, ErrorCodes::INVALID_AMOUNT);
    EXPECT_FALSE(loan.isFeePaid());

    loan.payLateFee(Money::parse("3.00"));
    EXPECT_TRUE(loan.isFeePaid());
    expectAppError([&] { loan.payLateFee(Money::parse("3.00")); }, ErrorCodes::NO_FEE_OWED);
}

TEST(LoanStatusTest, RoundTripsStoredNames) {
    for (auto status : {LoanStatus::Active, LoanStatus::Overdue, LoanStatus::Returned,
                        LoanStatus::ReturnedLate, LoanStatus::Lost, LoanStatus::Damaged,
                        LoanStatus::Cancelled}) {
        EXPECT_EQ(loanStatusFromString(loanStatusToString(status)), status);
    }
    EXPECT_THROW(loanStatusFromString("borrowed"), InvariantViolationException);
}

// ==================== EligibilityPolicy ====================

class EligibilityTest : public ::testing::Test {
protected:
    Timestamp now = at("2024-06-01T00:00:00Z");
    CirculationPolicy policy;
    EligibilityPolicy eligibility{policy};

    Member memberWithFees(const std::string& fees) {
        return Member::restore(1, at("2025-01-01"), 5, Money::parse(fees), true);
    }
};

TEST_F(EligibilityTest, FeeThresholdIsInclusive) {
    EXPECT_EQ(eligibility.borrowCheck(memberWithFees("10.00"), 0, now), Ineligibility::None);
    EXPECT_EQ(eligibility.borrowCheck(memberWithFees("10.01"), 0, now), Ineligibility::FeesOverThreshold);
}

TEST_F(EligibilityTest, ReportsEachReason) {
    auto inactive = Member::restore(1, at("2025-01-01"), 5, Money::zero(), false);
    EXPECT_EQ(eligibility.borrowCheck(inactive, 0, now), Ineligibility::Inactive);

    auto expired = Member::restore(1, now, 5, Money::zero(), true);
    EXPECT_EQ(eligibility.borrowCheck(expired, 0, now), Ineligibility::MembershipExpired);

    auto member = memberWithFees("0");
    EXPECT_EQ(eligibility.borrowCheck(member, 4, now), Ineligibility::None);
    EXPECT_EQ(eligibility.borrowCheck(member, 5, now), Ineligibility::BorrowLimitReached);
    EXPECT_FALSE(eligibility.canBorrowBooks(member, 5, now));
    EXPECT_FALSE(eligibility.describe(Ineligibility::BorrowLimitReached, member).empty());
}

TEST_F(EligibilityTest, OverdueRenewalFollowsPolicyAndFees) {
    EXPECT_FALSE(eligibility.overdueRenewalAllowed(memberWithFees("0")));

    policy.allowRenewWhileOverdue = true;
    EXPECT_TRUE(eligibility.overdueRenewalAllowed(memberWithFees("10.00")));
    EXPECT_FALSE(eligibility.overdueRenewalAllowed(memberWithFees("10.01")));
}

// ==================== Member ====================

TEST(MemberTest, SettlingNeverGoesNegative) {
    auto member = Member::restore(1, at("2025-01-01"), 5, Money::parse("2.00"), true);
    member.settleFee(Money::parse("0.50"));
    EXPECT_EQ(member.outstandingFees(), Money::parse("1.50"));
    member.settleFee(Money::parse("5.00"));
    EXPECT_EQ(member.outstandingFees(), Money::zero());
    expectAppError([&] { member.addFee(Money::zero()); }, ErrorCodes::INVALID_AMOUNT);
}
