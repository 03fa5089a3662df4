#pragma once

#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 领域事件基类
 *
 * 领域事件代表已经提交的业务事实，用于解耦协调服务与副作用（日志、通知等）。
 * 事件只在事务提交成功后发布，回滚的操作不会产生任何事件。
 *
 * 具体事件定义在各模块的 domain/Events.hpp 中。
 */
struct DomainEvent {
    std::string type;                    // 事件类型标识
    int aggregateId = 0;                 // 聚合根 ID
    std::string aggregateType;           // 聚合根类型
    Timestamp occurredAt{};              // 业务时间（取自协调服务的时钟）

    DomainEvent() = default;

    DomainEvent(std::string eventType, int aggId, std::string aggType, Timestamp at)
        : type(std::move(eventType))
        , aggregateId(aggId)
        , aggregateType(std::move(aggType))
        , occurredAt(at) {}

    virtual ~DomainEvent() = default;

    DomainEvent(const DomainEvent&) = default;
    DomainEvent& operator=(const DomainEvent&) = default;
    DomainEvent(DomainEvent&&) = default;
    DomainEvent& operator=(DomainEvent&&) = default;
};
