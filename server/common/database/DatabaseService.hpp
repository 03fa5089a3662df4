#pragma once

#include "common/utils/AppException.hpp"

/**
 * @brief 将 SQL 中的 ? 占位符转换为 PostgreSQL 原生 $1, $2, ... 格式
 *
 * 配合 Drogon ORM 的 SqlBinder 使用，由 libpq 的 PQexecParams 执行
 * 服务端参数绑定，彻底防止 SQL 注入（无需客户端转义）
 */
inline std::string toParameterized(const std::string& sql, size_t paramCount) {
    if (paramCount == 0) return sql;

    std::string result;
    result.reserve(sql.size() + paramCount * 3);
    size_t idx = 1;
    for (size_t i = 0; i < sql.size(); ++i) {
        if (sql[i] == '?' && idx <= paramCount) {
            result += '$';
            result += std::to_string(idx++);
        } else {
            result += sql[i];
        }
    }
    return result;
}

/**
 * @brief 数据库异常 → 应用异常
 *
 * 锁等待超时（55P03）、死锁（40P01）、序列化失败（40001）与连接中断
 * 视为存储繁忙，调用方可退避重试；其余错误不可重试。
 */
[[noreturn]] inline void rethrowDbError(const drogon::orm::DrogonDbException& e) {
    const auto& base = e.base();
    if (const auto* sqlError = dynamic_cast<const drogon::orm::SqlError*>(&base)) {
        const auto& state = sqlError->sqlState();
        if (state == "55P03" || state == "40P01" || state == "40001") {
            LOG_WARN << "Storage busy (SQLSTATE " << state << "): " << base.what();
            throw StorageBusyException("存储繁忙（SQLSTATE " + state + "），请稍后重试");
        }
    }
    if (dynamic_cast<const drogon::orm::BrokenConnection*>(&base)) {
        LOG_WARN << "Database connection broken: " << base.what();
        throw StorageBusyException("数据库连接中断，请稍后重试");
    }
    LOG_ERROR << "Database error: " << base.what();
    throw DatabaseException(std::string("数据库错误: ") + base.what());
}

/**
 * @brief 数据库配置（由 main.cpp 初始化）
 */
struct AppDbConfig {
    static bool& useFast() {
        static bool value = false;
        return value;
    }
};

/**
 * @brief 数据库服务类
 *
 * 默认使用 Drogon 应用配置中的 "default" 客户端；
 * 集成测试可直接注入自行创建的客户端。
 */
class DatabaseService {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    using Result = drogon::orm::Result;
    using Transaction = drogon::orm::Transaction;
    template<typename T = void> using Task = drogon::Task<T>;

    DatabaseService() = default;
    explicit DatabaseService(DbClientPtr client) : client_(std::move(client)) {}

    DbClientPtr getClient() const {
        if (client_) return client_;
        return AppDbConfig::useFast()
            ? drogon::app().getFastDbClient("default")
            : drogon::app().getDbClient("default");
    }

    Task<void> ping() {
        co_await getClient()->execSqlCoro("SELECT 1");
    }

    Task<Result> execSqlCoro(const std::string& sql,
                              const std::vector<std::string>& params = {}) {
        try {
            if (params.empty()) {
                co_return co_await getClient()->execSqlCoro(sql);
            }
            // 使用 PostgreSQL 原生参数绑定（$1, $2, ...），由 libpq 服务端处理
            auto binder = *getClient() << toParameterized(sql, params.size());
            for (const auto& p : params) {
                binder << p;
            }
            co_return co_await drogon::orm::internal::SqlAwaiter(std::move(binder));
        } catch (const drogon::orm::DrogonDbException& e) {
            rethrowDbError(e);
        }
    }

    Task<std::shared_ptr<Transaction>> newTransactionCoro() {
        try {
            co_return co_await getClient()->newTransactionCoro();
        } catch (const drogon::orm::DrogonDbException& e) {
            rethrowDbError(e);
        }
    }

private:
    DbClientPtr client_;
};
