#pragma once

#include "AppException.hpp"
#include "Response.hpp"

/**
 * @brief 全局异常处理器
 *
 * 将 AppException 转换为对应 HTTP 状态码的 JSON 响应，
 * 其他异常统一返回 500 错误。
 * 不变式破坏记为 ERROR，存储繁忙记为 WARN（可重试）。
 */
class AppExceptionHandler {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;

    static void setup() {
        drogon::app().setExceptionHandler([](const std::exception& e,
                                       const HttpRequestPtr& req,
                                       std::function<void (const HttpResponsePtr &)> &&callback) {
            callback(toResponse(e, req->path()));
        });
    }

    static HttpResponsePtr toResponse(const std::exception& e, const std::string& path) {
        if (const auto* appEx = dynamic_cast<const AppException*>(&e)) {
            if (appEx->getCode() == ErrorCodes::INVARIANT_VIOLATION) {
                LOG_ERROR << "Invariant violation on " << path << ": " << appEx->getMessage();
            } else if (appEx->getCode() == ErrorCodes::STORAGE_BUSY) {
                LOG_WARN << "Storage busy on " << path << ": " << appEx->getMessage();
            }
            return Response::error(appEx->getCode(), appEx->getMessage(), appEx->getStatus());
        }

        LOG_ERROR << "Unhandled exception on " << path << ": " << e.what();
        return Response::error(ErrorCodes::INTERNAL_ERROR, "服务器内部错误",
                               drogon::k500InternalServerError);
    }
};
