#include "TestSupport.hpp"

#include "common/filters/RequestAdvices.hpp"
#include "common/utils/ExceptionHandler.hpp"
#include "common/utils/LoggerManager.hpp"

// ==================== 访问日志上下文 ====================

TEST(RequestContextTest, TakesIdsFromPath) {
    EXPECT_EQ(RequestAdvices::circulationContext("/api/loans/7/return", nullptr), "loan=7");
    EXPECT_EQ(RequestAdvices::circulationContext("/api/members/4/loans", nullptr), "member=4");
    EXPECT_EQ(RequestAdvices::circulationContext("/api/books/12/inventory", nullptr), "book=12");
    EXPECT_EQ(RequestAdvices::circulationContext("/api/loans/overdue", nullptr), "");
    EXPECT_EQ(RequestAdvices::circulationContext("/api/loans/overdue/sweep", nullptr), "");
}

TEST(RequestContextTest, TakesIdsFromBody) {
    Json::Value body;
    body["member_id"] = 3;
    body["book_id"] = 9;
    EXPECT_EQ(RequestAdvices::circulationContext("/api/loans", &body), "member=3 book=9");

    Json::Value payment;
    payment["amount"] = "3.00";
    EXPECT_EQ(RequestAdvices::circulationContext("/api/loans/5/pay", &payment), "loan=5");
}

TEST(RequestContextTest, PathWinsOverBody) {
    Json::Value body;
    body["book_id"] = 1;
    body["member_id"] = "not-a-number";
    EXPECT_EQ(RequestAdvices::circulationContext("/api/books/2/copies", &body), "book=2");
}

// ==================== 错误响应 ====================

TEST(ExceptionResponseTest, BusinessErrorKeepsCodeAndStatus) {
    auto resp = AppExceptionHandler::toResponse(LoanError::OutOfStock(5), "/api/loans");
    EXPECT_EQ(resp->statusCode(), drogon::k409Conflict);
    ASSERT_TRUE(resp->getJsonObject());
    const auto& json = *resp->getJsonObject();
    EXPECT_EQ(json["code"].asInt(), ErrorCodes::OUT_OF_STOCK);
    EXPECT_EQ(json["status"].asInt(), 409);
    EXPECT_FALSE(json["message"].asString().empty());
}

TEST(ExceptionResponseTest, StorageBusyIsServiceUnavailable) {
    auto resp = AppExceptionHandler::toResponse(StorageBusyException("lock timeout"), "/api/loans/1/renew");
    EXPECT_EQ(resp->statusCode(), drogon::k503ServiceUnavailable);
    EXPECT_EQ((*resp->getJsonObject())["code"].asInt(), ErrorCodes::STORAGE_BUSY);
}

TEST(ExceptionResponseTest, UnknownErrorIsInternal) {
    auto resp = AppExceptionHandler::toResponse(std::runtime_error("boom"), "/api/loans");
    EXPECT_EQ(resp->statusCode(), drogon::k500InternalServerError);
    const auto& json = *resp->getJsonObject();
    EXPECT_EQ(json["code"].asInt(), ErrorCodes::INTERNAL_ERROR);
    EXPECT_EQ(json["message"].asString().find("boom"), std::string::npos);
}

// ==================== 日志 ====================

TEST(LoggerManagerTest, ParsesLevelNames) {
    EXPECT_EQ(LoggerManager::parseLevel("DEBUG"), trantor::Logger::kDebug);
    EXPECT_EQ(LoggerManager::parseLevel("warn"), trantor::Logger::kWarn);
    EXPECT_FALSE(LoggerManager::parseLevel("VERBOSE").has_value());
    EXPECT_FALSE(LoggerManager::parseLevel("").has_value());
}

TEST(LoggerManagerTest, NamesFilesByUtcDay) {
    auto day = std::chrono::floor<std::chrono::days>(at("2024-03-05T23:59:59Z"));
    EXPECT_EQ(LoggerManager::fileNameFor(day), "circulation-server_2024-03-05");
}
