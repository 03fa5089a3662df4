#pragma once

#include "DatabaseService.hpp"

/**
 * @brief 借阅核心表结构初始化（幂等，启动时执行）
 *
 * 表上的 CHECK 约束与领域不变式一致，作为应用层校验之外的最后防线：
 * - book: 0 ≤ available_copies ≤ total_copies
 * - member: outstanding_fees ≥ 0
 * - loan: 0 ≤ renewal_count ≤ max_renewals_allowed, late_fee ≥ 0,
 *         due_date > borrowed_at, returned_at ≥ borrowed_at
 */
class DatabaseInitializer {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    template<typename T = void> using Task = drogon::Task<T>;

private:
    static DbClientPtr getDbClient() {
        return AppDbConfig::useFast()
            ? drogon::app().getFastDbClient("default")
            : drogon::app().getDbClient("default");
    }

public:
    static Task<> initialize() {
        co_await initialize(getDbClient());
    }

    static Task<> initialize(DbClientPtr db) {
        LOG_INFO << "Checking database initialization...";

        // 抑制 IF NOT EXISTS 产生的 NOTICE（"relation already exists, skipping"）
        co_await db->execSqlCoro("SET client_min_messages = WARNING");

        // 数据库级别固定 UTC 时区（所有连接生效，无需每个连接 SET timezone）
        co_await db->execSqlCoro(R"(
            DO $$ BEGIN
                EXECUTE format('ALTER DATABASE %I SET timezone = ''UTC''', current_database());
            END $$
        )");

        co_await createEnumTypes(db);
        co_await createTables(db);
        co_await createTriggers(db);

        LOG_INFO << "Database initialization completed";
    }

private:
    static Task<> createEnumTypes(const DbClientPtr& db) {
        // 借阅状态枚举
        co_await db->execSqlCoro(R"(
            DO $$ BEGIN
                CREATE TYPE loan_status_enum AS ENUM
                    ('active', 'overdue', 'returned', 'returned_late', 'lost', 'damaged', 'cancelled');
            EXCEPTION
                WHEN duplicate_object THEN null;
            END $$
        )");

        LOG_INFO << "Enum types created/verified";
    }

    static Task<> createTables(const DbClientPtr& db) {
        // 图书库存表（软删除）
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS book (
                id SERIAL PRIMARY KEY,
                total_copies INT NOT NULL DEFAULT 0,
                available_copies INT NOT NULL DEFAULT 0,
                created_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                deleted_at TIMESTAMPTZ NULL,
                CONSTRAINT chk_book_copies CHECK (available_copies >= 0 AND available_copies <= total_copies)
            )
        )");

        // 会员表（借阅核心只读资格字段，欠费随借阅罚金增减）
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS member (
                id SERIAL PRIMARY KEY,
                membership_expires_at TIMESTAMPTZ NOT NULL,
                max_books_allowed INT NOT NULL DEFAULT 5,
                outstanding_fees NUMERIC(10,2) NOT NULL DEFAULT 0,
                is_active BOOLEAN NOT NULL DEFAULT TRUE,
                created_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                CONSTRAINT chk_member_fees CHECK (outstanding_fees >= 0),
                CONSTRAINT chk_member_max_books CHECK (max_books_allowed > 0)
            )
        )");

        // 借阅表（只增不删，作为历史记录保留）
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS loan (
                id SERIAL PRIMARY KEY,
                member_id INT NOT NULL REFERENCES member(id),
                book_id INT NOT NULL REFERENCES book(id),
                borrowed_at TIMESTAMPTZ NOT NULL,
                due_date TIMESTAMPTZ NOT NULL,
                returned_at TIMESTAMPTZ NULL,
                status loan_status_enum NOT NULL DEFAULT 'active',
                late_fee NUMERIC(10,2) NULL,
                is_fee_paid BOOLEAN NOT NULL DEFAULT FALSE,
                renewal_count INT NOT NULL DEFAULT 0,
                max_renewals_allowed INT NOT NULL DEFAULT 2,
                notes TEXT NOT NULL DEFAULT '',
                created_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP,
                CONSTRAINT chk_loan_renewals CHECK (renewal_count >= 0 AND max_renewals_allowed >= 0
                                                    AND renewal_count <= max_renewals_allowed),
                CONSTRAINT chk_loan_fee CHECK (late_fee IS NULL OR late_fee >= 0),
                CONSTRAINT chk_loan_due CHECK (due_date > borrowed_at),
                CONSTRAINT chk_loan_returned CHECK (returned_at IS NULL OR returned_at >= borrowed_at)
            )
        )");
        // 会员在借查询（资格检查、在借列表）
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_loan_member_active ON loan (member_id) WHERE status IN ('active', 'overdue'))");
        // 图书在借计数（库存对账、下架检查）
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_loan_book_active ON loan (book_id) WHERE status IN ('active', 'overdue'))");
        // 逾期扫描
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_loan_due_active ON loan (due_date) WHERE status IN ('active', 'overdue'))");

        LOG_INFO << "Tables created/verified";
    }

    static Task<> createTriggers(const DbClientPtr& db) {
        // 创建自动更新 updated_at 的触发器函数
        co_await db->execSqlCoro(R"(
            CREATE OR REPLACE FUNCTION update_updated_at_column()
            RETURNS TRIGGER AS $$
            BEGIN
                NEW.updated_at = CURRENT_TIMESTAMP;
                RETURN NEW;
            END;
            $$ language 'plpgsql'
        )");

        for (const char* table : {"book", "member", "loan"}) {
            co_await db->execSqlCoro(std::string(R"(
                DO $$ BEGIN
                    CREATE TRIGGER update_)") + table + R"(_updated_at BEFORE UPDATE ON )" + table + R"(
                        FOR EACH ROW EXECUTE FUNCTION update_updated_at_column();
                EXCEPTION WHEN duplicate_object THEN null; END $$
            )");
        }

        LOG_INFO << "Triggers created/verified";
    }
};
