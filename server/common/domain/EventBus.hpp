#pragma once

#include "DomainEvent.hpp"

/**
 * @brief 事件处理器类型
 */
using EventHandler = std::function<drogon::Task<void>(const DomainEvent&)>;

/**
 * @brief 事件总线 - 发布订阅模式
 *
 * 订阅者的异常只记录日志，不会传回发布方：
 * 事件发布时事务已经提交，业务结果不能再被撤销。
 *
 * 使用示例：
 * @code
 * // 发布事件
 * co_await EventBus::instance().publish(LoanCreated{loanId, memberId, bookId, dueDate, now});
 *
 * // 订阅事件（在初始化时）
 * EventBus::instance().subscribe<LoanCreated>([](const LoanCreated& e) -> Task<void> {
 *     LOG_INFO << "Loan created: " << e.aggregateId;
 *     co_return;
 * });
 * @endcode
 */
class EventBus {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    static EventBus& instance() {
        static EventBus bus;
        return bus;
    }

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief 发布事件
     */
    template<typename E>
    Task<void> publish(const E& event) {
        static_assert(std::is_base_of_v<DomainEvent, E>, "E must derive from DomainEvent");

        LOG_DEBUG << "EventBus: Publishing " << event.type
                  << " for " << event.aggregateType << "#" << event.aggregateId;

        std::vector<EventHandler> handlers;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(event)));
            if (it != handlers_.end()) handlers = it->second;
        }

        for (const auto& handler : handlers) {
            try {
                co_await handler(event);
            } catch (const std::exception& e) {
                LOG_ERROR << "EventBus: Handler failed for " << event.type
                          << ": " << e.what();
            }
        }
    }

    /**
     * @brief 订阅事件
     */
    template<typename E>
    void subscribe(std::function<Task<void>(const E&)> handler) {
        static_assert(std::is_base_of_v<DomainEvent, E>, "E must derive from DomainEvent");

        std::unique_lock lock(mutex_);
        handlers_[std::type_index(typeid(E))].push_back(
            [handler = std::move(handler)](const DomainEvent& e) -> Task<void> {
                co_await handler(static_cast<const E&>(e));
            }
        );
    }

    /**
     * @brief 注销所有事件处理器（服务关闭时调用）
     */
    void unsubscribeAll() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
        LOG_INFO << "EventBus: All handlers unsubscribed";
    }

private:
    std::shared_mutex mutex_;
    std::map<std::type_index, std::vector<EventHandler>> handlers_;
};
