#pragma once

/**
 * @brief 请求/响应拦截器
 *
 * 每个请求记录一行访问日志：方法、路径、状态码、耗时，
 * 以及从路径和请求体中取出的借阅上下文（loan/member/book ID）。
 * 写操作记 INFO，查询记 DEBUG。
 */
class RequestAdvices {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;

    static void setup() {
        drogon::app().registerPreHandlingAdvice([](const HttpRequestPtr& req) {
            req->attributes()->insert("startTime", std::chrono::steady_clock::now());
        });

        drogon::app().registerPostHandlingAdvice([](const HttpRequestPtr& req, const HttpResponsePtr& resp) {
            // 借阅状态随时变化，API 响应禁止缓存
            if (req->path().starts_with("/api/") && resp->getHeader("Cache-Control").empty()) {
                resp->addHeader("Cache-Control", "no-cache");
            }
            logRequest(req, resp);
        });
    }

    /**
     * @brief 借阅上下文，如 "loan=7" 或 "member=3 book=9"
     *
     * 路径中 /loans/{id}、/members/{id}、/books/{id} 优先，
     * 请求体中的 member_id / book_id 补充路径里没有的。
     */
    static std::string circulationContext(const std::string& path, const Json::Value* body) {
        static const std::array<std::pair<std::string_view, std::string_view>, 3> resources{{
            {"loans", "loan"}, {"members", "member"}, {"books", "book"},
        }};

        std::vector<std::string_view> segments;
        std::string_view rest(path);
        while (!rest.empty()) {
            auto slash = rest.find('/');
            auto segment = rest.substr(0, slash);
            if (!segment.empty()) segments.push_back(segment);
            if (slash == std::string_view::npos) break;
            rest.remove_prefix(slash + 1);
        }

        std::vector<std::pair<std::string, std::string>> ids;
        auto add = [&ids](std::string_view key, std::string value) {
            for (const auto& [existing, _] : ids) {
                if (existing == key) return;
            }
            ids.emplace_back(std::string(key), std::move(value));
        };

        for (size_t i = 0; i + 1 < segments.size(); ++i) {
            const auto& next = segments[i + 1];
            if (!std::all_of(next.begin(), next.end(), [](unsigned char c) { return std::isdigit(c); })) {
                continue;
            }
            for (const auto& [plural, key] : resources) {
                if (segments[i] == plural) add(key, std::string(next));
            }
        }

        if (body && body->isObject()) {
            for (const auto& [field, key] : {std::pair{"member_id", "member"}, std::pair{"book_id", "book"}}) {
                if ((*body)[field].isIntegral()) add(key, std::to_string((*body)[field].asInt64()));
            }
        }

        std::string context;
        for (const auto& [key, value] : ids) {
            if (!context.empty()) context += ' ';
            context += key + "=" + value;
        }
        return context;
    }

private:
    static void logRequest(const HttpRequestPtr& req, const HttpResponsePtr& resp) {
        std::string duration = "-";
        const auto& attributes = req->attributes();
        if (attributes->find("startTime")) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now()
                - attributes->get<std::chrono::steady_clock::time_point>("startTime"));
            duration = std::to_string(elapsed.count()) + "ms";
        }

        auto context = circulationContext(req->path(), req->getJsonObject().get());
        auto status = static_cast<int>(resp->statusCode());

        if (req->method() == drogon::Get) {
            LOG_DEBUG << req->methodString() << " " << req->path() << " -> " << status
                      << " (" << duration << ")" << (context.empty() ? "" : " " + context);
        } else {
            LOG_INFO << req->methodString() << " " << req->path() << " -> " << status
                     << " (" << duration << ")" << (context.empty() ? "" : " " + context);
        }
    }
};
