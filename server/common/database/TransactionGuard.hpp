#pragma once

#include "DatabaseService.hpp"

/**
 * @brief 事务守卫类（RAII 风格）
 *
 * 特性：
 * - 自动回滚：析构时如果未提交则自动回滚
 * - 异常安全：异常发生时保证事务回滚
 * - 错误映射：数据库异常统一转换为 StorageBusy / Database 异常
 * - 协程支持：所有操作都是协程
 *
 * 使用示例：
 * @code
 * auto guard = co_await TransactionGuard::create(dbService);
 *
 * co_await guard.execSqlCoro("SELECT ... FOR UPDATE", {...});
 * co_await guard.execSqlCoro("UPDATE ...", {...});
 *
 * co_await guard.commit();
 * @endcode
 */
class TransactionGuard {
public:
    using Transaction = drogon::orm::Transaction;
    using Result = drogon::orm::Result;
    template<typename T = void> using Task = drogon::Task<T>;

private:
    std::shared_ptr<Transaction> transaction_;
    bool committed_{false};
    bool rolledBack_{false};

    explicit TransactionGuard(std::shared_ptr<Transaction> trans)
        : transaction_(std::move(trans)) {}

public:
    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    TransactionGuard(TransactionGuard&& other) noexcept
        : transaction_(std::move(other.transaction_))
        , committed_(other.committed_)
        , rolledBack_(other.rolledBack_) {
        other.committed_ = true;  // 防止移动后的对象回滚
    }

    TransactionGuard& operator=(TransactionGuard&& other) noexcept {
        if (this != &other) {
            transaction_ = std::move(other.transaction_);
            committed_ = other.committed_;
            rolledBack_ = other.rolledBack_;
            other.committed_ = true;  // 防止移动后的对象回滚
        }
        return *this;
    }

    /**
     * @brief 创建事务守卫
     */
    template<typename DbService>
    static Task<TransactionGuard> create(DbService& dbService) {
        auto trans = co_await dbService.newTransactionCoro();
        co_return TransactionGuard(trans);
    }

    /**
     * @brief 析构时自动回滚未提交的事务
     */
    ~TransactionGuard() {
        if (!committed_ && !rolledBack_ && transaction_) {
            try {
                LOG_WARN << "Transaction auto-rollback in destructor";
                transaction_->rollback();
            } catch (const std::exception& e) {
                LOG_ERROR << "Failed to rollback transaction in destructor: " << e.what();
            }
        }
    }

    /**
     * @brief 执行 SQL（带参数绑定）
     * 使用 PostgreSQL 原生 $N 参数化查询，由 libpq 服务端绑定防止 SQL 注入
     */
    Task<Result> execSqlCoro(const std::string& sql, const std::vector<std::string>& params = {}) {
        ensureOpen();

        try {
            if (params.empty()) {
                co_return co_await transaction_->execSqlCoro(sql);
            }
            auto binder = *transaction_ << toParameterized(sql, params.size());
            for (const auto& p : params) {
                binder << p;
            }
            co_return co_await drogon::orm::internal::SqlAwaiter(std::move(binder));
        } catch (const drogon::orm::DrogonDbException& e) {
            // Drogon 在语句失败时已自动回滚该事务
            rolledBack_ = true;
            rethrowDbError(e);
        }
    }

    /**
     * @brief 提交事务并等待确认
     *
     * 通过 setCommitCallback 挂起协程，等待 PostgreSQL 确认 COMMIT 后才继续，
     * 确保数据库写入真正完成后，再发布领域事件。
     */
    Task<void> commit() {
        ensureOpen();

        // 等待 PostgreSQL COMMIT 确认：
        //   1. 注册 setCommitCallback 作为恢复点
        //   2. tx_.reset() 析构 Transaction → 发送 COMMIT 命令
        //   3. 协程挂起，直到 PostgreSQL 响应到来触发回调
        //   4. 回调中 handle.resume() 恢复协程，保证 DB 写入已完成
        struct CommitAwaiter : drogon::CallbackAwaiter<bool> {
            std::shared_ptr<Transaction> tx_;
            explicit CommitAwaiter(std::shared_ptr<Transaction> tx)
                : tx_(std::move(tx)) {}

            void await_suspend(std::coroutine_handle<> handle) {
                tx_->setCommitCallback([this, handle](bool success) {
                    setValue(success);
                    handle.resume();
                });
                tx_.reset();  // 析构 → 发送 COMMIT 命令
            }
        };

        bool success = co_await CommitAwaiter{std::move(transaction_)};
        committed_ = true;

        if (!success) {
            // COMMIT 失败时 PostgreSQL 已回滚全部修改，重试是安全的
            throw StorageBusyException("事务提交失败，请稍后重试");
        }

        LOG_DEBUG << "Transaction committed successfully";
    }

    /**
     * @brief 显式回滚事务
     */
    void rollback() {
        if (committed_) {
            throw DatabaseException("Cannot rollback: transaction already committed");
        }
        if (rolledBack_) {
            return;  // 已回滚，直接返回
        }

        transaction_->rollback();
        rolledBack_ = true;
        LOG_DEBUG << "Transaction rolled back";
    }

    bool isCommitted() const { return committed_; }
    bool isRolledBack() const { return rolledBack_; }

private:
    void ensureOpen() const {
        if (committed_) {
            throw DatabaseException("Transaction already committed");
        }
        if (rolledBack_) {
            throw DatabaseException("Transaction already rolled back");
        }
    }
};
