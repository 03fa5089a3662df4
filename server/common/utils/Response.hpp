#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 统一响应格式工具类
 *
 * 成功：{code: 0, message, data}；失败：{code, message, status}
 */
class Response {
public:
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpResponse = drogon::HttpResponse;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static HttpResponsePtr ok(const Json::Value &data = Json::Value::null,
                               const std::string &message = "Success") {
        return build(data, message, k200OK);
    }

    static HttpResponsePtr created(const Json::Value &data = Json::Value::null,
                                    const std::string &message = "创建成功") {
        return build(data, message, k201Created);
    }

    /**
     * @brief 列表响应（data 为数组，附带 total）
     */
    static HttpResponsePtr list(const Json::Value &items) {
        Json::Value data;
        data["list"] = items;
        data["total"] = static_cast<Json::UInt>(items.size());
        return build(data, "Success", k200OK);
    }

    static HttpResponsePtr error(int code,
                                   const std::string &message,
                                   HttpStatusCode status = k400BadRequest) {
        Json::Value json;
        json["code"] = code;
        json["message"] = message;
        json["status"] = static_cast<int>(status);

        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(status);
        return resp;
    }

private:
    static HttpResponsePtr build(const Json::Value &data, const std::string &message, HttpStatusCode status) {
        Json::Value json;
        json["code"] = ErrorCodes::SUCCESS;
        json["message"] = message;
        if (!data.isNull()) {
            json["data"] = data;
        }

        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(status);
        return resp;
    }
};
