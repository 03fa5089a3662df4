#pragma once

#include "AppException.hpp"
#include "Constants.hpp"

/**
 * @brief 存储繁忙时的指数退避重试
 *
 * - 只重试 StorageBusyException（锁超时、死锁、连接中断）
 * - 业务规则异常、验证异常、不变式异常立即向上抛出
 * - 延迟 = base × 2^attempt，不超过 max，叠加 ±20% 随机抖动
 *
 * 被重试的操作必须整体位于一个工作单元内：失败的尝试已回滚，
 * 重试不会看到上一次的部分结果。
 */
class RetryPolicy {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    using Sleeper = std::function<Task<void>(std::chrono::milliseconds)>;

    int maxAttempts = Constants::RETRY_MAX_ATTEMPTS;
    std::chrono::milliseconds baseDelay{Constants::RETRY_BASE_DELAY_MS};
    std::chrono::milliseconds maxDelay{Constants::RETRY_MAX_DELAY_MS};

    /**
     * @brief 从 JSON 读取（custom_config.retry）
     */
    static RetryPolicy fromJson(const Json::Value& json) {
        RetryPolicy policy;
        if (json.isNull()) return policy;
        if (!json.isObject()) {
            throw ValidationException("[retry] 必须是 JSON 对象");
        }
        if (json.isMember("max_attempts")) policy.maxAttempts = json["max_attempts"].asInt();
        if (json.isMember("base_delay_ms")) policy.baseDelay = std::chrono::milliseconds(json["base_delay_ms"].asInt());
        if (json.isMember("max_delay_ms")) policy.maxDelay = std::chrono::milliseconds(json["max_delay_ms"].asInt());

        if (policy.maxAttempts < 1) {
            throw ValidationException("[retry] max_attempts 必须至少为 1");
        }
        if (policy.baseDelay.count() < 0 || policy.maxDelay < policy.baseDelay) {
            throw ValidationException("[retry] 需满足 0 ≤ base_delay_ms ≤ max_delay_ms");
        }
        return policy;
    }

    /**
     * @brief 第 attempt 次失败后的等待时间（attempt 从 0 开始）
     */
    std::chrono::milliseconds delayFor(int attempt) const {
        double delay = static_cast<double>(baseDelay.count()) * std::pow(2.0, static_cast<double>(attempt));
        delay = (std::min)(delay, static_cast<double>(maxDelay.count()));

        // ±20% 随机抖动
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(
            -Constants::RETRY_JITTER_RATIO, Constants::RETRY_JITTER_RATIO);
        delay *= (1.0 + dist(rng));

        return std::chrono::milliseconds(static_cast<int64_t>((std::max)(delay, 0.0)));
    }

    /**
     * @brief 执行操作，StorageBusy 时退避重试，用尽次数后抛出最后一次异常
     */
    template<typename Fn>
    auto run(Fn&& operation, const std::string& name) const -> decltype(operation()) {
        for (int attempt = 0;; ++attempt) {
            std::optional<StorageBusyException> busy;
            try {
                co_return co_await operation();
            } catch (const StorageBusyException& e) {
                if (attempt + 1 >= maxAttempts) {
                    LOG_WARN << "Retry: " << name << " gave up after " << maxAttempts
                             << " attempts: " << e.what();
                    throw;
                }
                busy = e;
            }

            auto delay = delayFor(attempt);
            LOG_WARN << "Retry: " << name << " attempt " << (attempt + 1) << "/" << maxAttempts
                     << " failed (" << busy->what() << "), retrying in " << delay.count() << "ms";
            co_await sleep(delay);
        }
    }

    /**
     * @brief 替换等待方式（测试中跳过真实等待）
     */
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
    Sleeper sleeper_;

    Task<void> sleep(std::chrono::milliseconds delay) const {
        if (sleeper_) {
            co_await sleeper_(delay);
            co_return;
        }
        if (delay.count() <= 0) co_return;
        if (auto* loop = trantor::EventLoop::getEventLoopOfCurrentThread()) {
            co_await drogon::sleepCoro(loop, std::chrono::duration<double>(delay));
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
};
