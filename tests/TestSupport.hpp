#pragma once

#include <gtest/gtest.h>

#include "common/utils/Clock.hpp"
#include "modules/circulation/Circulation.Service.hpp"
#include "modules/circulation/store/MemoryCirculationStore.hpp"

/**
 * @brief 可手动拨动的时钟
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start) : now_(start) {}

    Timestamp now() const override { return now_.load(); }

    void set(Timestamp ts) { now_.store(ts); }
    void advance(std::chrono::seconds delta) { now_.store(now_.load() + delta); }
    void advanceDays(int days) { advance(std::chrono::days{days}); }

private:
    std::atomic<Timestamp> now_;
};

inline Timestamp at(const std::string& text) {
    return TimestampHelper::parse(text);
}

/**
 * @brief 断言抛出指定错误码的 AppException
 */
template<typename Fn>
void expectAppError(Fn&& fn, int code) {
    try {
        fn();
        ADD_FAILURE() << "expected AppException with code " << code;
    } catch (const AppException& e) {
        EXPECT_EQ(e.getCode(), code) << e.getMessage();
    }
}

/**
 * @brief 直接向存储写入初始数据
 */
inline int seedBook(CirculationStore& store, int copies) {
    return drogon::sync_wait([&]() -> drogon::Task<int> {
        auto uow = co_await store.begin();
        auto book = Book::create(copies);
        co_await uow->books().save(book);
        co_await uow->commit();
        co_return book.id();
    }());
}

inline int seedMember(CirculationStore& store, Timestamp expiresAt,
                      int maxBooks = Constants::DEFAULT_MAX_BOOKS_ALLOWED,
                      Money fees = Money::zero()) {
    return drogon::sync_wait([&]() -> drogon::Task<int> {
        auto uow = co_await store.begin();
        auto member = Member::create(expiresAt, maxBooks);
        if (fees.isPositive()) member.addFee(fees);
        co_await uow->members().save(member);
        co_await uow->commit();
        co_return member.id();
    }());
}

/**
 * @brief 内存存储 + 手动时钟 + 独立事件总线
 */
class CirculationFixture : public ::testing::Test {
protected:
    ManualClock clock{at("2024-01-01T10:00:00Z")};
    MemoryCirculationStore store{std::chrono::milliseconds(200)};
    EventBus bus;
    CirculationPolicy policy;
    std::unique_ptr<CirculationService> service;

    void SetUp() override {
        service = std::make_unique<CirculationService>(store, clock, policy, bus);
    }

    /**
     * @brief 以新策略重建服务
     */
    void usePolicy(const CirculationPolicy& newPolicy) {
        policy = newPolicy;
        service = std::make_unique<CirculationService>(store, clock, policy, bus);
    }

    int member(int maxBooks = Constants::DEFAULT_MAX_BOOKS_ALLOWED, Money fees = Money::zero()) {
        return seedMember(store, at("2030-01-01"), maxBooks, fees);
    }

    int book(int copies) {
        return seedBook(store, copies);
    }

    Book committedBook(int id) {
        auto book = store.committedBook(id);
        EXPECT_TRUE(book.has_value());
        return *book;
    }

    Member committedMember(int id) {
        auto member = store.committedMember(id);
        EXPECT_TRUE(member.has_value());
        return *member;
    }

    template<typename T>
    T run(drogon::Task<T> task) {
        return drogon::sync_wait(std::move(task));
    }
};
