#pragma once

#include "common/utils/AppException.hpp"

/**
 * @brief 聚合根基类
 *
 * 所有领域模型的基础，提供：
 * - 标识（新建时为 0，插入后由仓储赋值）
 * - 脏标记（仓储据此跳过未修改的聚合）
 *
 * 聚合本身不访问数据库；加载与持久化由工作单元内的仓储完成，
 * 跨聚合的修改只能由协调服务在同一工作单元内进行。
 */
template<typename Derived>
class Aggregate {
public:
    // ========== 状态查询 ==========

    int id() const { return id_; }
    bool isNew() const { return id_ == 0; }
    bool isDirty() const { return dirty_; }

    /**
     * @brief 仓储持久化后调用：写入标识并清除脏标记
     */
    void markPersisted(int id) {
        if (id_ != 0 && id_ != id) {
            throw InvariantViolationException("聚合标识不可变更");
        }
        id_ = id;
        dirty_ = false;
    }

protected:
    int id_ = 0;
    bool dirty_ = false;

    Aggregate() = default;

    /**
     * @brief 标记为脏（有修改）
     */
    void markDirty() { dirty_ = true; }

    /**
     * @brief 设置 ID（仅用于从存储恢复）
     */
    void setId(int id) { id_ = id; }
};
