#pragma once

#include "common/domain/Aggregate.hpp"

/**
 * @brief 图书库存聚合根（库存台账）
 *
 * 拥有 totalCopies / availableCopies 及其不变式：
 *   0 ≤ availableCopies ≤ totalCopies
 * 每次修改后都会校验。图书只做软删除，历史借阅记录保持有效。
 *
 * 在借副本数（totalCopies - availableCopies）必须等于该书处于
 * Active / Overdue 状态的借阅数，由协调服务在同一事务内成对维护。
 */
class Book : public Aggregate<Book> {
public:
    // ==================== 静态工厂方法 ====================

    /**
     * @brief 新建图书（可借副本 = 总副本）
     */
    static Book create(int totalCopies) {
        if (totalCopies < 0) {
            throw ValidationException("总副本数不能为负数");
        }
        Book book;
        book.totalCopies_ = totalCopies;
        book.availableCopies_ = totalCopies;
        book.markDirty();
        return book;
    }

    /**
     * @brief 从存储恢复
     * @throws InvariantViolationException 存储中的数据已违反不变式
     */
    static Book restore(int id, int totalCopies, int availableCopies, bool deleted) {
        Book book;
        book.setId(id);
        book.totalCopies_ = totalCopies;
        book.availableCopies_ = availableCopies;
        book.deleted_ = deleted;
        book.checkInvariant();
        return book;
    }

    // ==================== 台账操作 ====================

    /**
     * @brief 预留一个副本（借出）
     */
    void reserveCopy() {
        if (availableCopies_ == 0) {
            throw LoanError::OutOfStock(id());
        }
        --availableCopies_;
        checkInvariant();
        markDirty();
    }

    /**
     * @brief 释放一个副本（归还）
     *
     * 可借副本已等于总副本时拒绝，防止重复归还。
     */
    void releaseCopy() {
        if (availableCopies_ == totalCopies_) {
            throw InvariantViolationException(
                "图书 #" + std::to_string(id()) + " 无在借副本，拒绝重复归还");
        }
        ++availableCopies_;
        checkInvariant();
        markDirty();
    }

    /**
     * @brief 注销一个在借副本（报失 / 报损）
     *
     * 副本永久退出流通：总副本减一，可借副本不变。
     */
    void writeOffCopy() {
        if (copiesOnLoan() == 0) {
            throw InvariantViolationException(
                "图书 #" + std::to_string(id()) + " 无在借副本可注销");
        }
        --totalCopies_;
        checkInvariant();
        markDirty();
    }

    /**
     * @brief 增加副本
     */
    void addCopies(int count) {
        if (count <= 0) {
            throw ValidationException("新增副本数必须大于 0");
        }
        totalCopies_ += count;
        availableCopies_ += count;
        checkInvariant();
        markDirty();
    }

    /**
     * @brief 下架（软删除）
     * @param activeLoanCount 该书处于 Active / Overdue 状态的借阅数
     */
    void markDeleted(int activeLoanCount) {
        if (activeLoanCount != copiesOnLoan()) {
            throw InvariantViolationException(
                "图书 #" + std::to_string(id()) + " 在借副本数 " + std::to_string(copiesOnLoan())
                + " 与在借记录数 " + std::to_string(activeLoanCount) + " 不一致");
        }
        if (activeLoanCount > 0) {
            throw LoanError::PreconditionFailed(
                "图书 #" + std::to_string(id()) + " 仍有 " + std::to_string(activeLoanCount) + " 个副本在借，不能下架");
        }
        if (deleted_) return;
        deleted_ = true;
        markDirty();
    }

    // ==================== 数据访问 ====================

    int totalCopies() const { return totalCopies_; }
    int availableCopies() const { return availableCopies_; }
    int copiesOnLoan() const { return totalCopies_ - availableCopies_; }
    bool isDeleted() const { return deleted_; }
    bool isAvailable() const { return availableCopies_ > 0 && !deleted_; }

    /**
     * @brief 校验 0 ≤ availableCopies ≤ totalCopies
     */
    void checkInvariant() const {
        if (totalCopies_ < 0 || availableCopies_ < 0 || availableCopies_ > totalCopies_) {
            throw InvariantViolationException(
                "图书 #" + std::to_string(id()) + " 库存不变式被破坏: available="
                + std::to_string(availableCopies_) + ", total=" + std::to_string(totalCopies_));
        }
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id();
        json["total_copies"] = totalCopies_;
        json["available_copies"] = availableCopies_;
        json["copies_on_loan"] = copiesOnLoan();
        json["is_deleted"] = deleted_;
        return json;
    }

private:
    int totalCopies_ = 0;
    int availableCopies_ = 0;
    bool deleted_ = false;
};
