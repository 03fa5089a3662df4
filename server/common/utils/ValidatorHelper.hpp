#pragma once

#include "AppException.hpp"
#include "Money.hpp"
#include "TimestampHelper.hpp"

/**
 * @brief 请求参数校验与解析
 *
 * 校验失败统一抛出 ValidationException，由全局异常处理器转换为 400 响应。
 */
class ValidatorHelper {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;

    /**
     * @brief 获取 JSON 请求体
     */
    static const Json::Value& requireJsonBody(const HttpRequestPtr& req) {
        auto json = req->getJsonObject();
        if (!json || !json->isObject()) {
            throw ValidationException("请求体必须是 JSON 对象");
        }
        return *json;
    }

    /**
     * @brief 可选的 JSON 请求体（无请求体时返回空对象）
     */
    static Json::Value optionalJsonBody(const HttpRequestPtr& req) {
        if (req->body().empty()) return Json::Value(Json::objectValue);
        return requireJsonBody(req);
    }

    static int requirePositiveInt(const Json::Value& json, const std::string& field) {
        if (!json.isMember(field) || !json[field].isInt() || json[field].asInt() <= 0) {
            throw ValidationException(field + " 必须是正整数");
        }
        return json[field].asInt();
    }

    static Money requireMoney(const Json::Value& json, const std::string& field) {
        if (!json.isMember(field)) {
            throw ValidationException("缺少字段: " + field);
        }
        return Money::fromJson(json[field]);
    }

    static std::string optionalString(const Json::Value& json, const std::string& field) {
        if (!json.isMember(field) || json[field].isNull()) return "";
        if (!json[field].isString()) {
            throw ValidationException(field + " 必须是字符串");
        }
        return json[field].asString();
    }

    /**
     * @brief 可选的时间查询参数（如 ?as_of=2024-01-15）
     */
    static std::optional<Timestamp> optionalTimestampParam(const HttpRequestPtr& req, const std::string& name) {
        auto value = req->getParameter(name);
        if (value.empty()) return std::nullopt;
        return TimestampHelper::parse(value);
    }
};
