#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 应用异常基类
 */
class AppException : public std::exception {
public:
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

private:
    int code_;
    std::string message_;
    HttpStatusCode status_;

public:
    AppException(int code, std::string message, HttpStatusCode status = k400BadRequest)
        : code_(code), message_(std::move(message)), status_(status) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
    HttpStatusCode getStatus() const { return status_; }
};

/**
 * @brief 通用异常 - 资源不存在
 */
class NotFoundException : public AppException {
public:
    explicit NotFoundException(const std::string& message = "资源不存在")
        : AppException(ErrorCodes::NOT_FOUND, message, k404NotFound) {}
};

/**
 * @brief 通用异常 - 验证失败（事务开启前拒绝）
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "验证失败")
        : AppException(ErrorCodes::BAD_REQUEST, message, k400BadRequest) {}
};

/**
 * @brief 数据一致性被破坏
 *
 * 表示内部缺陷（如可借副本将变为负数或超过总数），
 * 必须中止事务，绝不静默修正。
 */
class InvariantViolationException : public AppException {
public:
    explicit InvariantViolationException(const std::string& message)
        : AppException(ErrorCodes::INVARIANT_VIOLATION, message, k500InternalServerError) {}
};

/**
 * @brief 存储繁忙（锁等待超时、死锁、连接中断）
 *
 * 唯一允许调用方退避重试的异常类型。
 */
class StorageBusyException : public AppException {
public:
    explicit StorageBusyException(const std::string& message = "存储繁忙，请稍后重试")
        : AppException(ErrorCodes::STORAGE_BUSY, message, k503ServiceUnavailable) {}
};

/**
 * @brief 数据库错误（不可重试）
 */
class DatabaseException : public AppException {
public:
    explicit DatabaseException(const std::string& message)
        : AppException(ErrorCodes::DATABASE_ERROR, message, k500InternalServerError) {}
};

/**
 * @brief 借阅业务规则异常
 *
 * 所有业务规则失败均为终态：不自动重试，状态不变。
 */
namespace LoanError {
    using enum drogon::HttpStatusCode;

    inline AppException OutOfStock(int bookId) {
        return AppException(ErrorCodes::OUT_OF_STOCK,
            "图书 #" + std::to_string(bookId) + " 暂无可借副本", k409Conflict);
    }

    inline AppException MemberIneligible(const std::string& reason) {
        return AppException(ErrorCodes::MEMBER_INELIGIBLE, "会员不满足借阅条件: " + reason, k403Forbidden);
    }

    inline AppException RenewalLimitExceeded(int maxRenewals) {
        return AppException(ErrorCodes::RENEWAL_LIMIT_EXCEEDED,
            "续借次数已达上限（" + std::to_string(maxRenewals) + " 次）", k409Conflict);
    }

    inline AppException NotRenewable(const std::string& reason) {
        return AppException(ErrorCodes::NOT_RENEWABLE, "当前借阅不可续借: " + reason, k409Conflict);
    }

    inline AppException AlreadyReturned(int loanId) {
        return AppException(ErrorCodes::ALREADY_RETURNED,
            "借阅 #" + std::to_string(loanId) + " 已归还或已结束", k409Conflict);
    }

    inline AppException InvalidAmount(const std::string& detail) {
        return AppException(ErrorCodes::INVALID_AMOUNT, "支付金额无效: " + detail, k400BadRequest);
    }

    inline AppException NoFeeOwed(int loanId) {
        return AppException(ErrorCodes::NO_FEE_OWED,
            "借阅 #" + std::to_string(loanId) + " 无应付罚金", k409Conflict);
    }

    inline AppException NotCancellable(int loanId) {
        return AppException(ErrorCodes::NOT_CANCELLABLE,
            "借阅 #" + std::to_string(loanId) + " 已续借或已结束，不可撤销", k409Conflict);
    }

    inline AppException PreconditionFailed(const std::string& message) {
        return AppException(ErrorCodes::PRECONDITION_FAILED, message, k409Conflict);
    }
}
