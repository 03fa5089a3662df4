#include "TestSupport.hpp"

#include "common/utils/ConfigManager.hpp"

using namespace std::chrono_literals;

namespace {

Json::Value parseJson(const std::string& text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    std::istringstream is(text);
    EXPECT_TRUE(Json::parseFromStream(builder, is, &root, &errs)) << errs;
    return root;
}

Json::Value baseConfig() {
    return parseJson(R"({
        "listeners": [{"address": "0.0.0.0", "port": 8080}],
        "db_clients": [{
            "name": "default", "rdbms": "postgresql", "host": "127.0.0.1", "port": 5432,
            "dbname": "circulation", "user": "circulation", "passwd": "secret"
        }],
        "custom_config": {}
    })");
}

std::vector<std::string> errorsOf(const Json::Value& root) {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    ConfigManager::validate(root, errors, warnings);
    return errors;
}

}  // namespace

// ==================== ConfigManager ====================

TEST(ConfigManagerTest, AcceptsMinimalPostgresConfig) {
    EXPECT_TRUE(errorsOf(baseConfig()).empty());
}

TEST(ConfigManagerTest, RequiresListenersAndDatabase) {
    auto root = baseConfig();
    root.removeMember("listeners");
    root.removeMember("db_clients");
    EXPECT_EQ(errorsOf(root).size(), 2u);
}

TEST(ConfigManagerTest, MemoryStorageNeedsNoDatabase) {
    auto root = baseConfig();
    root.removeMember("db_clients");
    root["custom_config"]["storage"] = "memory";
    EXPECT_TRUE(errorsOf(root).empty());

    root["custom_config"]["storage"] = "sqlite";
    EXPECT_FALSE(errorsOf(root).empty());
}

TEST(ConfigManagerTest, RejectsInvalidPortAndSweepInterval) {
    auto root = baseConfig();
    root["listeners"][0]["port"] = 70000;
    root["custom_config"]["overdue_sweep_interval_sec"] = -1;
    EXPECT_EQ(errorsOf(root).size(), 2u);
}

TEST(ConfigManagerTest, WarnsOnPlaceholderPassword) {
    auto root = baseConfig();
    root["db_clients"][0]["passwd"] = "CHANGE_ME";

    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    ConfigManager::validate(root, errors, warnings);
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(warnings.size(), 1u);
}

TEST(ConfigManagerTest, ReportsCirculationAndRetryErrors) {
    auto root = baseConfig();
    root["custom_config"]["circulation"]["loan_period_days"] = 0;
    root["custom_config"]["retry"]["max_attempts"] = 0;
    auto errors = errorsOf(root);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_NE(errors[0].find("[circulation]"), std::string::npos);
    EXPECT_NE(errors[1].find("[retry]"), std::string::npos);
}

TEST(ConfigManagerTest, RejectsUnknownLogLevel) {
    auto root = baseConfig();
    root["custom_config"]["log_level"] = "debug";
    EXPECT_TRUE(errorsOf(root).empty());

    root["custom_config"]["log_level"] = "VERBOSE";
    ASSERT_EQ(errorsOf(root).size(), 1u);
    EXPECT_NE(errorsOf(root)[0].find("log_level"), std::string::npos);
}

// ==================== CirculationPolicy ====================

TEST(CirculationPolicyTest, DefaultsWhenAbsent) {
    auto policy = CirculationPolicy::fromJson(Json::Value::null);
    EXPECT_EQ(policy.loanPeriodDays, 14);
    EXPECT_EQ(policy.maxRenewals, 2);
    EXPECT_EQ(policy.lateFeePerDay, Money::parse("0.50"));
    EXPECT_EQ(policy.feeThreshold, Money::parse("10.00"));
    EXPECT_FALSE(policy.allowRenewWhileOverdue);
}

TEST(CirculationPolicyTest, ReadsOverrides) {
    auto policy = CirculationPolicy::fromJson(parseJson(R"({
        "loan_period_days": 21, "max_renewals": 1, "late_fee_per_day": "0.25",
        "fee_threshold": 5, "lost_fee": "30.00", "allow_renew_while_overdue": true
    })"));
    EXPECT_EQ(policy.loanPeriod(), std::chrono::days{21});
    EXPECT_EQ(policy.maxRenewals, 1);
    EXPECT_EQ(policy.lateFeePerDay, Money::parse("0.25"));
    EXPECT_EQ(policy.feeThreshold, Money::parse("5.00"));
    EXPECT_EQ(policy.lostFee, Money::parse("30.00"));
    EXPECT_EQ(policy.damagedFee, Money::parse("10.00"));
    EXPECT_TRUE(policy.allowRenewWhileOverdue);
}

TEST(CirculationPolicyTest, RejectsBadValues) {
    EXPECT_THROW(CirculationPolicy::fromJson(parseJson(R"({"max_renewals": -1})")), ValidationException);
    EXPECT_THROW(CirculationPolicy::fromJson(parseJson(R"({"late_fee_per_day": "-0.50"})")), ValidationException);
    EXPECT_THROW(CirculationPolicy::fromJson(parseJson(R"({"loan_period_days": "14"})")), ValidationException);
    EXPECT_THROW(CirculationPolicy::fromJson(parseJson(R"({"allow_renew_while_overdue": 1})")), ValidationException);
    EXPECT_THROW(CirculationPolicy::fromJson(Json::Value(3)), ValidationException);
}

// ==================== RetryPolicy ====================

class RetryPolicyTest : public ::testing::Test {
protected:
    RetryPolicy retry;
    std::vector<std::chrono::milliseconds> sleeps;

    void SetUp() override {
        retry.maxAttempts = 3;
        retry.baseDelay = 10ms;
        retry.maxDelay = 100ms;
        retry.setSleeper([this](std::chrono::milliseconds delay) -> drogon::Task<void> {
            sleeps.push_back(delay);
            co_return;
        });
    }
};

TEST_F(RetryPolicyTest, RetriesStorageBusyUntilSuccess) {
    int calls = 0;
    auto result = drogon::sync_wait(retry.run([&]() -> drogon::Task<int> {
        if (++calls < 3) throw StorageBusyException("lock timeout");
        co_return 7;
    }, "test"));

    EXPECT_EQ(result, 7);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps.size(), 2u);
}

TEST_F(RetryPolicyTest, GivesUpAfterMaxAttempts) {
    int calls = 0;
    EXPECT_THROW(drogon::sync_wait(retry.run([&]() -> drogon::Task<int> {
        ++calls;
        throw StorageBusyException("deadlock");
        co_return 0;
    }, "test")), StorageBusyException);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps.size(), 2u);
}

TEST_F(RetryPolicyTest, BusinessErrorsAreNotRetried) {
    int calls = 0;
    try {
        drogon::sync_wait(retry.run([&]() -> drogon::Task<int> {
            ++calls;
            throw LoanError::OutOfStock(1);
            co_return 0;
        }, "test"));
        ADD_FAILURE() << "expected OutOfStock";
    } catch (const AppException& e) {
        EXPECT_EQ(e.getCode(), ErrorCodes::OUT_OF_STOCK);
    }
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(RetryPolicyTest, DelayGrowsWithinJitterAndCap) {
    for (int attempt = 0; attempt < 6; ++attempt) {
        auto delay = retry.delayFor(attempt);
        auto nominal = std::min<int64_t>(10LL << attempt, 100);
        EXPECT_GE(delay.count(), static_cast<int64_t>(nominal * 0.8) - 1);
        EXPECT_LE(delay.count(), static_cast<int64_t>(nominal * 1.2) + 1);
    }
}

TEST(RetryPolicyConfigTest, ValidatesBounds) {
    auto retry = RetryPolicy::fromJson(Json::Value::null);
    EXPECT_EQ(retry.maxAttempts, Constants::RETRY_MAX_ATTEMPTS);

    Json::Value json;
    json["base_delay_ms"] = 500;
    json["max_delay_ms"] = 100;
    EXPECT_THROW(RetryPolicy::fromJson(json), ValidationException);
}
