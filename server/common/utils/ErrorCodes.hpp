#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 0: 成功
 * - 1xxx: 客户端错误（请求参数、资源不存在等）
 * - 3xxx: 借阅业务规则错误（终态，不自动重试，状态不变）
 * - 5xxx: 服务器内部错误
 */
namespace ErrorCodes {

// ==================== 成功 ====================

/** 操作成功 */
inline constexpr int SUCCESS = 0;

// ==================== 客户端错误 (1xxx) ====================

/** 资源不存在 */
inline constexpr int NOT_FOUND = 1001;

/** 请求参数错误 */
inline constexpr int BAD_REQUEST = 1002;

// ==================== 借阅业务错误 (3xxx) ====================

/** 无可借副本 */
inline constexpr int OUT_OF_STOCK = 3001;

/** 会员不满足借阅条件 */
inline constexpr int MEMBER_INELIGIBLE = 3002;

/** 续借次数已达上限 */
inline constexpr int RENEWAL_LIMIT_EXCEEDED = 3003;

/** 当前借阅不可续借 */
inline constexpr int NOT_RENEWABLE = 3004;

/** 借阅已归还或已结束 */
inline constexpr int ALREADY_RETURNED = 3005;

/** 支付金额无效 */
inline constexpr int INVALID_AMOUNT = 3006;

/** 无应付罚金 */
inline constexpr int NO_FEE_OWED = 3007;

/** 借阅不可撤销 */
inline constexpr int NOT_CANCELLABLE = 3008;

/** 前置条件不满足（如下架仍有在借副本的图书） */
inline constexpr int PRECONDITION_FAILED = 3009;

// ==================== 服务器错误 (5xxx) ====================

/** 服务器内部错误 */
inline constexpr int INTERNAL_ERROR = 5000;

/** 数据库错误（不可重试） */
inline constexpr int DATABASE_ERROR = 5001;

/** 数据一致性被破坏（内部缺陷） */
inline constexpr int INVARIANT_VIOLATION = 5003;

/** 存储繁忙（锁等待超时、死锁、连接中断），可重试 */
inline constexpr int STORAGE_BUSY = 5004;

}  // namespace ErrorCodes
