#pragma once

#include "CirculationStore.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/database/TransactionGuard.hpp"
#include "common/utils/FieldHelper.hpp"

namespace pg_detail {

inline std::string boolParam(bool value) { return value ? "true" : "false"; }

inline std::string epochParam(Timestamp ts) {
    return std::to_string(TimestampHelper::toEpochSeconds(ts));
}

// 空字符串经 NULLIF 转为 SQL NULL
inline std::string optionalEpochParam(const std::optional<Timestamp>& ts) {
    return ts ? epochParam(*ts) : "";
}

inline std::string optionalCentsParam(const std::optional<Money>& money) {
    return money ? std::to_string(money->cents()) : "";
}

inline constexpr const char* LOAN_COLUMNS = R"(
    id, member_id, book_id,
    EXTRACT(EPOCH FROM borrowed_at)::BIGINT AS borrowed_at,
    EXTRACT(EPOCH FROM due_date)::BIGINT AS due_date,
    EXTRACT(EPOCH FROM returned_at)::BIGINT AS returned_at,
    status::TEXT AS status,
    ROUND(late_fee * 100)::BIGINT AS late_fee,
    is_fee_paid, renewal_count, max_renewals_allowed, notes
)";

inline Loan loanFromRow(const drogon::orm::Row& row) {
    LoanRecord record;
    record.id = FieldHelper::getInt(row["id"]);
    record.memberId = FieldHelper::getInt(row["member_id"]);
    record.bookId = FieldHelper::getInt(row["book_id"]);
    record.borrowedAt = FieldHelper::getTimestamp(row["borrowed_at"]);
    record.dueDate = FieldHelper::getTimestamp(row["due_date"]);
    record.returnedAt = FieldHelper::getOptionalTimestamp(row["returned_at"]);
    record.status = loanStatusFromString(FieldHelper::getString(row["status"]));
    record.lateFee = FieldHelper::getOptionalMoney(row["late_fee"]);
    record.isFeePaid = FieldHelper::getBool(row["is_fee_paid"]);
    record.renewalCount = FieldHelper::getInt(row["renewal_count"]);
    record.maxRenewalsAllowed = FieldHelper::getInt(row["max_renewals_allowed"]);
    record.notes = FieldHelper::getString(row["notes"]);
    return Loan::restore(std::move(record));
}

}  // namespace pg_detail

/**
 * @brief 图书仓储（PostgreSQL）
 */
class PgBookRepository : public BookRepository {
public:
    explicit PgBookRepository(TransactionGuard& tx) : tx_(tx) {}

    Task<std::optional<Book>> get(int id) override {
        co_return co_await load(id, false);
    }

    Task<std::optional<Book>> getForUpdate(int id) override {
        co_return co_await load(id, true);
    }

    Task<void> save(Book& book) override {
        if (book.isNew()) {
            auto result = co_await tx_.execSqlCoro(R"(
                INSERT INTO book (total_copies, available_copies, deleted_at)
                VALUES (?, ?, CASE WHEN ?::BOOLEAN THEN CURRENT_TIMESTAMP END)
                RETURNING id
            )", {
                std::to_string(book.totalCopies()), std::to_string(book.availableCopies()),
                pg_detail::boolParam(book.isDeleted())
            });
            book.markPersisted(FieldHelper::getInt(result[0]["id"]));
            co_return;
        }
        if (!book.isDirty()) co_return;

        co_await tx_.execSqlCoro(R"(
            UPDATE book
            SET total_copies = ?, available_copies = ?,
                deleted_at = CASE WHEN ?::BOOLEAN THEN COALESCE(deleted_at, CURRENT_TIMESTAMP) END
            WHERE id = ?
        )", {
            std::to_string(book.totalCopies()), std::to_string(book.availableCopies()),
            pg_detail::boolParam(book.isDeleted()), std::to_string(book.id())
        });
        book.markPersisted(book.id());
    }

private:
    TransactionGuard& tx_;

    Task<std::optional<Book>> load(int id, bool forUpdate) {
        std::string sql = R"(
            SELECT id, total_copies, available_copies, deleted_at IS NOT NULL AS is_deleted
            FROM book WHERE id = ?
        )";
        if (forUpdate) sql += " FOR UPDATE";

        auto result = co_await tx_.execSqlCoro(sql, {std::to_string(id)});
        if (result.empty()) co_return std::nullopt;

        const auto& row = result[0];
        co_return Book::restore(
            FieldHelper::getInt(row["id"]),
            FieldHelper::getInt(row["total_copies"]),
            FieldHelper::getInt(row["available_copies"]),
            FieldHelper::getBool(row["is_deleted"]));
    }
};

/**
 * @brief 会员仓储（PostgreSQL）
 */
class PgMemberRepository : public MemberRepository {
public:
    explicit PgMemberRepository(TransactionGuard& tx) : tx_(tx) {}

    Task<std::optional<Member>> get(int id) override {
        co_return co_await load(id, false);
    }

    Task<std::optional<Member>> getForUpdate(int id) override {
        co_return co_await load(id, true);
    }

    Task<void> save(Member& member) override {
        if (member.isNew()) {
            auto result = co_await tx_.execSqlCoro(R"(
                INSERT INTO member (membership_expires_at, max_books_allowed, outstanding_fees, is_active)
                VALUES (to_timestamp(?::BIGINT), ?, ?::NUMERIC / 100, ?)
                RETURNING id
            )", {
                pg_detail::epochParam(member.membershipExpiresAt()),
                std::to_string(member.maxBooksAllowed()),
                std::to_string(member.outstandingFees().cents()),
                pg_detail::boolParam(member.isActive())
            });
            member.markPersisted(FieldHelper::getInt(result[0]["id"]));
            co_return;
        }
        if (!member.isDirty()) co_return;

        co_await tx_.execSqlCoro(R"(
            UPDATE member
            SET outstanding_fees = ?::NUMERIC / 100, is_active = ?
            WHERE id = ?
        )", {
            std::to_string(member.outstandingFees().cents()),
            pg_detail::boolParam(member.isActive()),
            std::to_string(member.id())
        });
        member.markPersisted(member.id());
    }

private:
    TransactionGuard& tx_;

    Task<std::optional<Member>> load(int id, bool forUpdate) {
        std::string sql = R"(
            SELECT id,
                   EXTRACT(EPOCH FROM membership_expires_at)::BIGINT AS membership_expires_at,
                   max_books_allowed,
                   ROUND(outstanding_fees * 100)::BIGINT AS outstanding_fees,
                   is_active
            FROM member WHERE id = ?
        )";
        if (forUpdate) sql += " FOR UPDATE";

        auto result = co_await tx_.execSqlCoro(sql, {std::to_string(id)});
        if (result.empty()) co_return std::nullopt;

        const auto& row = result[0];
        co_return Member::restore(
            FieldHelper::getInt(row["id"]),
            FieldHelper::getTimestamp(row["membership_expires_at"]),
            FieldHelper::getInt(row["max_books_allowed"]),
            FieldHelper::getMoney(row["outstanding_fees"]),
            FieldHelper::getBool(row["is_active"]));
    }
};

/**
 * @brief 借阅仓储（PostgreSQL）
 */
class PgLoanRepository : public LoanRepository {
public:
    explicit PgLoanRepository(TransactionGuard& tx) : tx_(tx) {}

    Task<std::optional<Loan>> get(int id) override {
        co_return co_await load(id, false);
    }

    Task<std::optional<Loan>> getForUpdate(int id) override {
        co_return co_await load(id, true);
    }

    Task<void> insert(Loan& loan) override {
        if (!loan.isNew()) {
            throw InvariantViolationException("借阅 #" + std::to_string(loan.id()) + " 已存在，不能重复插入");
        }
        auto rec = loan.record();
        auto result = co_await tx_.execSqlCoro(R"(
            INSERT INTO loan (member_id, book_id, borrowed_at, due_date, returned_at, status,
                              late_fee, is_fee_paid, renewal_count, max_renewals_allowed, notes)
            VALUES (?, ?, to_timestamp(?::BIGINT), to_timestamp(?::BIGINT),
                    to_timestamp(NULLIF(?, '')::BIGINT), ?::loan_status_enum,
                    NULLIF(?, '')::NUMERIC / 100, ?, ?, ?, ?)
            RETURNING id
        )", {
            std::to_string(rec.memberId), std::to_string(rec.bookId),
            pg_detail::epochParam(rec.borrowedAt), pg_detail::epochParam(rec.dueDate),
            pg_detail::optionalEpochParam(rec.returnedAt), loanStatusToString(rec.status),
            pg_detail::optionalCentsParam(rec.lateFee), pg_detail::boolParam(rec.isFeePaid),
            std::to_string(rec.renewalCount), std::to_string(rec.maxRenewalsAllowed), rec.notes
        });
        loan.markPersisted(FieldHelper::getInt(result[0]["id"]));
    }

    Task<void> save(Loan& loan) override {
        if (loan.isNew()) {
            co_await insert(loan);
            co_return;
        }
        if (!loan.isDirty()) co_return;

        auto rec = loan.record();
        co_await tx_.execSqlCoro(R"(
            UPDATE loan
            SET due_date = to_timestamp(?::BIGINT),
                returned_at = to_timestamp(NULLIF(?, '')::BIGINT),
                status = ?::loan_status_enum,
                late_fee = NULLIF(?, '')::NUMERIC / 100,
                is_fee_paid = ?, renewal_count = ?, notes = ?
            WHERE id = ?
        )", {
            pg_detail::epochParam(rec.dueDate), pg_detail::optionalEpochParam(rec.returnedAt),
            loanStatusToString(rec.status), pg_detail::optionalCentsParam(rec.lateFee),
            pg_detail::boolParam(rec.isFeePaid), std::to_string(rec.renewalCount), rec.notes,
            std::to_string(rec.id)
        });
        loan.markPersisted(loan.id());
    }

    Task<int> countActiveByMember(int memberId) override {
        auto result = co_await tx_.execSqlCoro(
            "SELECT COUNT(*)::INT AS cnt FROM loan WHERE member_id = ? AND status IN ('active', 'overdue')",
            {std::to_string(memberId)});
        co_return FieldHelper::getInt(result[0]["cnt"]);
    }

    Task<int> countActiveByBook(int bookId) override {
        auto result = co_await tx_.execSqlCoro(
            "SELECT COUNT(*)::INT AS cnt FROM loan WHERE book_id = ? AND status IN ('active', 'overdue')",
            {std::to_string(bookId)});
        co_return FieldHelper::getInt(result[0]["cnt"]);
    }

    Task<std::vector<Loan>> findActiveByMember(int memberId) override {
        auto result = co_await tx_.execSqlCoro(
            std::string("SELECT ") + pg_detail::LOAN_COLUMNS
            + " FROM loan WHERE member_id = ? AND status IN ('active', 'overdue') ORDER BY due_date, id",
            {std::to_string(memberId)});
        co_return toLoans(result);
    }

    Task<std::vector<Loan>> findOverdue(Timestamp asOf, bool forUpdate) override {
        std::string sql = std::string("SELECT ") + pg_detail::LOAN_COLUMNS
            + " FROM loan WHERE status IN ('active', 'overdue') AND due_date < to_timestamp(?::BIGINT)"
              " ORDER BY id";
        if (forUpdate) sql += " FOR UPDATE";

        auto result = co_await tx_.execSqlCoro(sql, {pg_detail::epochParam(asOf)});
        co_return toLoans(result);
    }

private:
    TransactionGuard& tx_;

    Task<std::optional<Loan>> load(int id, bool forUpdate) {
        std::string sql = std::string("SELECT ") + pg_detail::LOAN_COLUMNS + " FROM loan WHERE id = ?";
        if (forUpdate) sql += " FOR UPDATE";

        auto result = co_await tx_.execSqlCoro(sql, {std::to_string(id)});
        if (result.empty()) co_return std::nullopt;
        co_return pg_detail::loanFromRow(result[0]);
    }

    static std::vector<Loan> toLoans(const drogon::orm::Result& result) {
        std::vector<Loan> loans;
        loans.reserve(result.size());
        for (const auto& row : result) {
            loans.push_back(pg_detail::loanFromRow(row));
        }
        return loans;
    }
};

/**
 * @brief PostgreSQL 工作单元：三个仓储共享一个 TransactionGuard
 */
class PgCirculationUnitOfWork : public CirculationUnitOfWork {
public:
    explicit PgCirculationUnitOfWork(TransactionGuard guard)
        : guard_(std::move(guard)), books_(guard_), members_(guard_), loans_(guard_) {}

    BookRepository& books() override { return books_; }
    MemberRepository& members() override { return members_; }
    LoanRepository& loans() override { return loans_; }

    Task<void> commit() override {
        co_await guard_.commit();
    }

    void rollback() override {
        if (guard_.isCommitted()) return;
        guard_.rollback();
    }

private:
    TransactionGuard guard_;
    PgBookRepository books_;
    PgMemberRepository members_;
    PgLoanRepository loans_;
};

/**
 * @brief PostgreSQL 存储
 *
 * 行锁由 SELECT ... FOR UPDATE 获取，锁等待时间由 SET LOCAL lock_timeout
 * 限定在当前事务内；超时（55P03）映射为 StorageBusyException。
 */
class PgCirculationStore : public CirculationStore {
public:
    PgCirculationStore(DatabaseService db, std::chrono::milliseconds lockTimeout)
        : db_(std::move(db)), lockTimeout_(lockTimeout) {}

    Task<std::unique_ptr<CirculationUnitOfWork>> begin() override {
        auto guard = co_await TransactionGuard::create(db_);
        co_await guard.execSqlCoro("SET LOCAL lock_timeout = '" + std::to_string(lockTimeout_.count()) + "ms'");
        co_return std::make_unique<PgCirculationUnitOfWork>(std::move(guard));
    }

    std::string name() const override { return "postgres"; }

private:
    DatabaseService db_;
    std::chrono::milliseconds lockTimeout_;
};
