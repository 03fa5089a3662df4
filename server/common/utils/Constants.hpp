#pragma once

/**
 * @brief 全局常量定义
 *
 * 集中管理项目中的魔法数字，提高可维护性和可读性
 */
namespace Constants {

// ==================== 日志相关 ====================

/** 日志文件名前缀 */
inline constexpr const char* LOG_FILE_PREFIX = "circulation-server";

// ==================== 借阅规则默认值 ====================

/** 借阅期限（天） */
inline constexpr int DEFAULT_LOAN_PERIOD_DAYS = 14;

/** 最大续借次数 */
inline constexpr int DEFAULT_MAX_RENEWALS = 2;

/** 每日滞纳金（分）- 0.50 */
inline constexpr int64_t DEFAULT_LATE_FEE_PER_DAY_CENTS = 50;

/** 允许借阅的欠费上限（分，含边界）- 10.00 */
inline constexpr int64_t DEFAULT_FEE_THRESHOLD_CENTS = 1000;

/** 遗失赔偿费（分）- 20.00 */
inline constexpr int64_t DEFAULT_LOST_FEE_CENTS = 2000;

/** 损坏赔偿费（分）- 10.00 */
inline constexpr int64_t DEFAULT_DAMAGED_FEE_CENTS = 1000;

/** 会员默认最大借阅数 */
inline constexpr int DEFAULT_MAX_BOOKS_ALLOWED = 5;

// ==================== 存储相关 ====================

/** 行锁等待超时（毫秒） */
inline constexpr int DEFAULT_LOCK_TIMEOUT_MS = 5000;

/** 存储引擎 - PostgreSQL */
inline constexpr const char* STORAGE_POSTGRES = "postgres";

/** 存储引擎 - 进程内存 */
inline constexpr const char* STORAGE_MEMORY = "memory";

// ==================== 重试策略 ====================

/** 存储繁忙时最大尝试次数（含首次） */
inline constexpr int RETRY_MAX_ATTEMPTS = 3;

/** 重试基础延迟（毫秒） */
inline constexpr int RETRY_BASE_DELAY_MS = 50;

/** 重试最大延迟（毫秒） */
inline constexpr int RETRY_MAX_DELAY_MS = 1000;

/** 重试抖动比例（±20%） */
inline constexpr double RETRY_JITTER_RATIO = 0.2;

}  // namespace Constants
