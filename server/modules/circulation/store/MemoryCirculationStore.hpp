#pragma once

#include "CirculationStore.hpp"
#include "common/utils/Constants.hpp"

class MemoryCirculationUnitOfWork;

/**
 * @brief 进程内存储引擎（测试与嵌入式场景）
 *
 * 与 PostgreSQL 存储提供相同的事务语义：
 * - 读已提交：工作单元只看到已提交数据和自己的写集
 * - 行锁：getForUpdate / save 对行加排他锁，持有到提交或回滚；
 *   等待超过锁超时时间抛出 StorageBusyException
 * - 原子提交：写集在一次加锁内整体替换已提交数据，回滚则整体丢弃
 * - ID 由计数器分配，回滚不归还（与 SERIAL 一致）
 */
class MemoryCirculationStore : public CirculationStore {
public:
    explicit MemoryCirculationStore(
        std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(Constants::DEFAULT_LOCK_TIMEOUT_MS))
        : lockTimeout_(lockTimeout) {}

    Task<std::unique_ptr<CirculationUnitOfWork>> begin() override;

    std::string name() const override { return "memory"; }

    // ==================== 已提交数据快照 ====================

    std::optional<Book> committedBook(int id) const {
        std::lock_guard lock(mutex_);
        return find(books_, id);
    }

    std::optional<Member> committedMember(int id) const {
        std::lock_guard lock(mutex_);
        return find(members_, id);
    }

    std::optional<Loan> committedLoan(int id) const {
        std::lock_guard lock(mutex_);
        return find(loans_, id);
    }

    std::vector<Loan> committedLoans() const {
        std::lock_guard lock(mutex_);
        std::vector<Loan> loans;
        loans.reserve(loans_.size());
        for (const auto& [id, loan] : loans_) loans.push_back(loan);
        return loans;
    }

private:
    friend class MemoryCirculationUnitOfWork;

    enum class Table { Book, Member, Loan };
    using RowKey = std::pair<Table, int>;

    mutable std::mutex mutex_;
    std::condition_variable lockReleased_;

    std::map<int, Book> books_;
    std::map<int, Member> members_;
    std::map<int, Loan> loans_;

    std::map<RowKey, uint64_t> rowLocks_;  // 行 → 持有锁的事务
    uint64_t nextTxId_ = 1;
    int nextBookId_ = 1;
    int nextMemberId_ = 1;
    int nextLoanId_ = 1;

    std::chrono::milliseconds lockTimeout_;

    template<typename T>
    static std::optional<T> find(const std::map<int, T>& table, int id) {
        auto it = table.find(id);
        if (it == table.end()) return std::nullopt;
        return it->second;
    }

    static const char* tableName(Table table) {
        switch (table) {
            case Table::Book:   return "book";
            case Table::Member: return "member";
            case Table::Loan:   return "loan";
        }
        return "unknown";
    }

    /**
     * @brief 获取行锁（可重入），超时抛出 StorageBusyException
     */
    void acquire(uint64_t txId, RowKey key, std::vector<RowKey>& held) {
        std::unique_lock lock(mutex_);
        auto available = [&] {
            auto it = rowLocks_.find(key);
            return it == rowLocks_.end() || it->second == txId;
        };
        if (!lockReleased_.wait_for(lock, lockTimeout_, available)) {
            LOG_WARN << "MemoryStore: tx#" << txId << " lock timeout on "
                     << tableName(key.first) << "#" << key.second
                     << " after " << lockTimeout_.count() << "ms";
            throw StorageBusyException(
                std::string("等待行锁超时: ") + tableName(key.first) + " #" + std::to_string(key.second));
        }
        if (rowLocks_.emplace(key, txId).second) {
            held.push_back(key);
        }
    }

    /**
     * @brief 释放事务持有的全部行锁（调用方已持有 mutex_）
     */
    void releaseLocked(const std::vector<RowKey>& held) {
        for (const auto& key : held) {
            rowLocks_.erase(key);
        }
    }
};

/**
 * @brief 进程内工作单元
 */
class MemoryCirculationUnitOfWork : public CirculationUnitOfWork {
    using Table = MemoryCirculationStore::Table;
    using RowKey = MemoryCirculationStore::RowKey;

public:
    MemoryCirculationUnitOfWork(MemoryCirculationStore& store, uint64_t txId)
        : store_(store), txId_(txId), books_(*this), members_(*this), loans_(*this) {}

    ~MemoryCirculationUnitOfWork() override {
        if (!finished_) {
            LOG_WARN << "MemoryStore: tx#" << txId_ << " auto-rollback in destructor";
            rollback();
        }
    }

    MemoryCirculationUnitOfWork(const MemoryCirculationUnitOfWork&) = delete;
    MemoryCirculationUnitOfWork& operator=(const MemoryCirculationUnitOfWork&) = delete;

    BookRepository& books() override { return books_; }
    MemberRepository& members() override { return members_; }
    LoanRepository& loans() override { return loans_; }

    Task<void> commit() override {
        ensureOpen();
        {
            std::lock_guard lock(store_.mutex_);
            for (const auto& [id, book] : bookWrites_) store_.books_.insert_or_assign(id, book);
            for (const auto& [id, member] : memberWrites_) store_.members_.insert_or_assign(id, member);
            for (const auto& [id, loan] : loanWrites_) store_.loans_.insert_or_assign(id, loan);
            store_.releaseLocked(held_);
        }
        store_.lockReleased_.notify_all();
        finished_ = true;

        LOG_DEBUG << "MemoryStore: tx#" << txId_ << " committed ("
                  << bookWrites_.size() << " book, " << memberWrites_.size() << " member, "
                  << loanWrites_.size() << " loan)";
        co_return;
    }

    void rollback() override {
        if (finished_) return;
        {
            std::lock_guard lock(store_.mutex_);
            store_.releaseLocked(held_);
        }
        store_.lockReleased_.notify_all();
        bookWrites_.clear();
        memberWrites_.clear();
        loanWrites_.clear();
        finished_ = true;
        LOG_DEBUG << "MemoryStore: tx#" << txId_ << " rolled back";
    }

private:
    MemoryCirculationStore& store_;
    uint64_t txId_;
    bool finished_ = false;
    std::vector<RowKey> held_;

    std::map<int, Book> bookWrites_;
    std::map<int, Member> memberWrites_;
    std::map<int, Loan> loanWrites_;

    void ensureOpen() const {
        if (finished_) {
            throw DatabaseException("Transaction already finished");
        }
    }

    template<typename T>
    std::optional<T> read(const std::map<int, T>& writes, const std::map<int, T>& committed, int id) {
        ensureOpen();
        if (auto it = writes.find(id); it != writes.end()) return it->second;
        std::lock_guard lock(store_.mutex_);
        return MemoryCirculationStore::find(committed, id);
    }

    template<typename T>
    std::optional<T> readForUpdate(const std::map<int, T>& writes, const std::map<int, T>& committed,
                                   Table table, int id) {
        ensureOpen();
        store_.acquire(txId_, {table, id}, held_);
        return read(writes, committed, id);
    }

    template<typename T>
    void write(std::map<int, T>& writes, Table table, int& nextId, T& aggregate) {
        ensureOpen();
        if (aggregate.isNew()) {
            int id = 0;
            {
                std::lock_guard lock(store_.mutex_);
                id = nextId++;
            }
            aggregate.markPersisted(id);
        } else {
            if (!aggregate.isDirty()) return;
            store_.acquire(txId_, {table, aggregate.id()}, held_);
            aggregate.markPersisted(aggregate.id());
        }
        writes.insert_or_assign(aggregate.id(), aggregate);
    }

    /**
     * @brief 借阅的合并视图（已提交数据叠加本事务写集）
     */
    std::vector<Loan> scanLoans(const std::function<bool(const Loan&)>& predicate) {
        ensureOpen();
        std::vector<Loan> result;
        {
            std::lock_guard lock(store_.mutex_);
            for (const auto& [id, loan] : store_.loans_) {
                if (loanWrites_.count(id)) continue;
                if (predicate(loan)) result.push_back(loan);
            }
        }
        for (const auto& [id, loan] : loanWrites_) {
            if (predicate(loan)) result.push_back(loan);
        }
        std::sort(result.begin(), result.end(),
                  [](const Loan& a, const Loan& b) { return a.id() < b.id(); });
        return result;
    }

    // ==================== 按表分派（仓储通过这些方法访问存储） ====================

    std::optional<Book> loadBook(int id, bool forUpdate) {
        return forUpdate ? readForUpdate(bookWrites_, store_.books_, Table::Book, id)
                         : read(bookWrites_, store_.books_, id);
    }

    std::optional<Member> loadMember(int id, bool forUpdate) {
        return forUpdate ? readForUpdate(memberWrites_, store_.members_, Table::Member, id)
                         : read(memberWrites_, store_.members_, id);
    }

    std::optional<Loan> loadLoan(int id, bool forUpdate) {
        return forUpdate ? readForUpdate(loanWrites_, store_.loans_, Table::Loan, id)
                         : read(loanWrites_, store_.loans_, id);
    }

    void saveBook(Book& book) { write(bookWrites_, Table::Book, store_.nextBookId_, book); }
    void saveMember(Member& member) { write(memberWrites_, Table::Member, store_.nextMemberId_, member); }
    void saveLoan(Loan& loan) { write(loanWrites_, Table::Loan, store_.nextLoanId_, loan); }

    class Books : public BookRepository {
    public:
        explicit Books(MemoryCirculationUnitOfWork& uow) : uow_(uow) {}

        Task<std::optional<Book>> get(int id) override { co_return uow_.loadBook(id, false); }
        Task<std::optional<Book>> getForUpdate(int id) override { co_return uow_.loadBook(id, true); }

        Task<void> save(Book& book) override {
            uow_.saveBook(book);
            co_return;
        }

    private:
        MemoryCirculationUnitOfWork& uow_;
    };

    class Members : public MemberRepository {
    public:
        explicit Members(MemoryCirculationUnitOfWork& uow) : uow_(uow) {}

        Task<std::optional<Member>> get(int id) override { co_return uow_.loadMember(id, false); }
        Task<std::optional<Member>> getForUpdate(int id) override { co_return uow_.loadMember(id, true); }

        Task<void> save(Member& member) override {
            uow_.saveMember(member);
            co_return;
        }

    private:
        MemoryCirculationUnitOfWork& uow_;
    };

    class Loans : public LoanRepository {
    public:
        explicit Loans(MemoryCirculationUnitOfWork& uow) : uow_(uow) {}

        Task<std::optional<Loan>> get(int id) override { co_return uow_.loadLoan(id, false); }
        Task<std::optional<Loan>> getForUpdate(int id) override { co_return uow_.loadLoan(id, true); }

        Task<void> insert(Loan& loan) override {
            if (!loan.isNew()) {
                throw InvariantViolationException("借阅 #" + std::to_string(loan.id()) + " 已存在，不能重复插入");
            }
            uow_.saveLoan(loan);
            co_return;
        }

        Task<void> save(Loan& loan) override {
            uow_.saveLoan(loan);
            co_return;
        }

        Task<int> countActiveByMember(int memberId) override {
            auto loans = uow_.scanLoans([memberId](const Loan& l) {
                return l.memberId() == memberId && holdsCopy(l.status());
            });
            co_return static_cast<int>(loans.size());
        }

        Task<int> countActiveByBook(int bookId) override {
            auto loans = uow_.scanLoans([bookId](const Loan& l) {
                return l.bookId() == bookId && holdsCopy(l.status());
            });
            co_return static_cast<int>(loans.size());
        }

        Task<std::vector<Loan>> findActiveByMember(int memberId) override {
            co_return uow_.scanLoans([memberId](const Loan& l) {
                return l.memberId() == memberId && holdsCopy(l.status());
            });
        }

        Task<std::vector<Loan>> findOverdue(Timestamp asOf, bool forUpdate) override {
            auto matches = [asOf](const Loan& l) {
                return holdsCopy(l.status()) && l.dueDate() < asOf;
            };
            auto candidates = uow_.scanLoans(matches);
            if (!forUpdate) co_return candidates;

            // 按 ID 顺序加锁后重新读取，过滤掉等待期间已被其他事务结束的借阅
            std::vector<Loan> locked;
            for (const auto& candidate : candidates) {
                auto loan = uow_.loadLoan(candidate.id(), true);
                if (loan && matches(*loan)) locked.push_back(std::move(*loan));
            }
            co_return locked;
        }

    private:
        MemoryCirculationUnitOfWork& uow_;
    };

    Books books_;
    Members members_;
    Loans loans_;
};

inline drogon::Task<std::unique_ptr<CirculationUnitOfWork>> MemoryCirculationStore::begin() {
    uint64_t txId = 0;
    {
        std::lock_guard lock(mutex_);
        txId = nextTxId_++;
    }
    co_return std::make_unique<MemoryCirculationUnitOfWork>(*this, txId);
}
