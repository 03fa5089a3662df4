#pragma once

#include "Circulation.Service.hpp"
#include "store/MemoryCirculationStore.hpp"
#include "store/PgCirculationStore.hpp"
#include "common/utils/RetryPolicy.hpp"

/**
 * @brief 借阅核心运行时（进程级单例）
 *
 * 持有时钟、存储与协调服务，由 main.cpp 在配置加载后初始化，
 * 控制器通过它访问协调服务。
 */
class CirculationRuntime {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    static CirculationRuntime& instance() {
        static CirculationRuntime runtime;
        return runtime;
    }

    /**
     * @param storage "postgres" 或 "memory"
     */
    void initialize(const CirculationPolicy& policy, const RetryPolicy& retry, const std::string& storage) {
        std::chrono::milliseconds lockTimeout(policy.lockTimeoutMs);
        std::unique_ptr<CirculationStore> store;
        if (storage == Constants::STORAGE_MEMORY) {
            store = std::make_unique<MemoryCirculationStore>(lockTimeout);
        } else if (storage == Constants::STORAGE_POSTGRES) {
            store = std::make_unique<PgCirculationStore>(DatabaseService{}, lockTimeout);
        } else {
            throw ValidationException("未知存储引擎: " + storage);
        }
        initialize(policy, retry, std::move(store));
    }

    void initialize(const CirculationPolicy& policy, const RetryPolicy& retry,
                    std::unique_ptr<CirculationStore> store) {
        store_ = std::move(store);
        retry_ = retry;
        service_ = std::make_unique<CirculationService>(*store_, clock_, policy);

        LOG_INFO << "CirculationRuntime: storage=" << store_->name()
                 << " loan_period=" << policy.loanPeriodDays << "d"
                 << " max_renewals=" << policy.maxRenewals
                 << " late_fee_per_day=" << policy.lateFeePerDay
                 << " fee_threshold=" << policy.feeThreshold;
    }

    CirculationService& service() {
        if (!service_) {
            throw AppException(ErrorCodes::INTERNAL_ERROR, "借阅服务尚未初始化",
                               drogon::k503ServiceUnavailable);
        }
        return *service_;
    }

    const RetryPolicy& retry() const { return retry_; }
    const Clock& clock() const { return clock_; }

    /**
     * @brief 在重试策略下执行协调服务操作
     */
    template<typename Fn>
    auto run(const std::string& name, Fn&& operation) -> decltype(operation(std::declval<CirculationService&>())) {
        auto& svc = service();
        co_return co_await retry_.run([&] { return operation(svc); }, name);
    }

    /**
     * @brief 定时逾期对账（存储繁忙时按重试策略退避）
     */
    Task<void> sweepOverdue() {
        try {
            co_await run("markOverdueLoans", [](CirculationService& svc) { return svc.markOverdueLoans(); });
        } catch (const AppException& e) {
            LOG_ERROR << "CirculationRuntime: overdue sweep failed: " << e.what();
        } catch (const drogon::orm::DrogonDbException& e) {
            LOG_ERROR << "CirculationRuntime: overdue sweep database error: " << e.base().what();
        } catch (const std::exception& e) {
            LOG_ERROR << "CirculationRuntime: overdue sweep error: " << e.what();
        }
    }

    void shutdown() {
        service_.reset();
        store_.reset();
    }

private:
    CirculationRuntime() = default;

    SystemClock clock_;
    RetryPolicy retry_;
    std::unique_ptr<CirculationStore> store_;
    std::unique_ptr<CirculationService> service_;
};
