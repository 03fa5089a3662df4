#pragma once

#include "modules/inventory/domain/Book.hpp"
#include "modules/member/domain/Member.hpp"
#include "modules/loan/domain/Loan.hpp"

/**
 * @brief 借阅核心的存储抽象（工作单元 + 仓储）
 *
 * 一个工作单元对应一个数据库事务：三个仓储共享同一事务，
 * commit() 之前的修改对其他工作单元不可见；未提交即析构时自动回滚。
 *
 * getForUpdate() 获取行锁，锁被占用时阻塞等待，超过锁等待时间
 * 抛出 StorageBusyException。调用方按 Member → Book → Loan 的顺序加锁。
 */

class BookRepository {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    virtual ~BookRepository() = default;

    virtual Task<std::optional<Book>> get(int id) = 0;
    virtual Task<std::optional<Book>> getForUpdate(int id) = 0;

    /**
     * @brief 新建（isNew）时插入并回写 ID，否则在有修改时更新
     */
    virtual Task<void> save(Book& book) = 0;
};

class MemberRepository {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    virtual ~MemberRepository() = default;

    virtual Task<std::optional<Member>> get(int id) = 0;
    virtual Task<std::optional<Member>> getForUpdate(int id) = 0;
    virtual Task<void> save(Member& member) = 0;
};

class LoanRepository {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    virtual ~LoanRepository() = default;

    virtual Task<std::optional<Loan>> get(int id) = 0;
    virtual Task<std::optional<Loan>> getForUpdate(int id) = 0;
    virtual Task<void> insert(Loan& loan) = 0;
    virtual Task<void> save(Loan& loan) = 0;

    /**
     * @brief 会员处于 Active / Overdue 状态的借阅数
     */
    virtual Task<int> countActiveByMember(int memberId) = 0;

    /**
     * @brief 图书处于 Active / Overdue 状态的借阅数（即在借副本数）
     */
    virtual Task<int> countActiveByBook(int bookId) = 0;

    virtual Task<std::vector<Loan>> findActiveByMember(int memberId) = 0;

    /**
     * @brief 到期日早于 asOf 且仍占用副本的借阅，按 ID 升序
     * @param forUpdate 是否同时锁定这些行
     */
    virtual Task<std::vector<Loan>> findOverdue(Timestamp asOf, bool forUpdate) = 0;
};

class CirculationUnitOfWork {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    virtual ~CirculationUnitOfWork() = default;

    virtual BookRepository& books() = 0;
    virtual MemberRepository& members() = 0;
    virtual LoanRepository& loans() = 0;

    virtual Task<void> commit() = 0;
    virtual void rollback() = 0;
};

class CirculationStore {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    virtual ~CirculationStore() = default;

    virtual Task<std::unique_ptr<CirculationUnitOfWork>> begin() = 0;

    /**
     * @brief 存储名称（日志用）
     */
    virtual std::string name() const = 0;
};
