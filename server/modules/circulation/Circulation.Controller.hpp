#pragma once

#include "CirculationRuntime.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ValidatorHelper.hpp"

/**
 * @brief 借阅流转控制器
 *
 * 只做参数解析与响应封装，业务规则全部在协调服务内；
 * 存储繁忙时按配置的重试策略退避重试。
 */
class CirculationController : public drogon::HttpController<CirculationController> {
public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    // 固定路径先于 {id} 注册
    ADD_METHOD_TO(CirculationController::overdue, "/api/loans/overdue", Get);
    ADD_METHOD_TO(CirculationController::sweepOverdue, "/api/loans/overdue/sweep", Post);
    ADD_METHOD_TO(CirculationController::create, "/api/loans", Post);
    ADD_METHOD_TO(CirculationController::detail, "/api/loans/{id}", Get);
    ADD_METHOD_TO(CirculationController::returnLoan, "/api/loans/{id}/return", Post);
    ADD_METHOD_TO(CirculationController::renew, "/api/loans/{id}/renew", Post);
    ADD_METHOD_TO(CirculationController::reportLost, "/api/loans/{id}/lost", Post);
    ADD_METHOD_TO(CirculationController::reportDamaged, "/api/loans/{id}/damaged", Post);
    ADD_METHOD_TO(CirculationController::cancel, "/api/loans/{id}/cancel", Post);
    ADD_METHOD_TO(CirculationController::pay, "/api/loans/{id}/pay", Post);
    ADD_METHOD_TO(CirculationController::memberLoans, "/api/members/{id}/loans", Get);
    ADD_METHOD_TO(CirculationController::addCopies, "/api/books/{id}/copies", Post);
    ADD_METHOD_TO(CirculationController::retire, "/api/books/{id}", Delete);
    ADD_METHOD_TO(CirculationController::inventory, "/api/books/{id}/inventory", Get);
    METHOD_LIST_END

    /**
     * @brief 借书 {member_id, book_id}
     */
    Task<HttpResponsePtr> create(HttpRequestPtr req) {
        const auto& body = ValidatorHelper::requireJsonBody(req);
        int memberId = ValidatorHelper::requirePositiveInt(body, "member_id");
        int bookId = ValidatorHelper::requirePositiveInt(body, "book_id");

        auto loan = co_await runtime().run("createLoan", [=](CirculationService& svc) {
            return svc.createLoan(memberId, bookId);
        });
        co_return Response::created(loanJson(loan), "借阅成功");
    }

    Task<HttpResponsePtr> detail(HttpRequestPtr /*req*/, int id) {
        auto loan = co_await runtime().service().getLoan(id);
        co_return Response::ok(loanJson(loan));
    }

    Task<HttpResponsePtr> returnLoan(HttpRequestPtr /*req*/, int id) {
        auto loan = co_await runtime().run("returnLoan", [=](CirculationService& svc) {
            return svc.returnLoan(id);
        });
        co_return Response::ok(loanJson(loan), "归还成功");
    }

    Task<HttpResponsePtr> renew(HttpRequestPtr /*req*/, int id) {
        auto loan = co_await runtime().run("renewLoan", [=](CirculationService& svc) {
            return svc.renewLoan(id);
        });
        co_return Response::ok(loanJson(loan), "续借成功");
    }

    Task<HttpResponsePtr> reportLost(HttpRequestPtr /*req*/, int id) {
        auto loan = co_await runtime().run("reportLost", [=](CirculationService& svc) {
            return svc.reportLost(id);
        });
        co_return Response::ok(loanJson(loan), "已登记遗失");
    }

    /**
     * @brief 报损 {notes?}
     */
    Task<HttpResponsePtr> reportDamaged(HttpRequestPtr req, int id) {
        auto body = ValidatorHelper::optionalJsonBody(req);
        auto notes = ValidatorHelper::optionalString(body, "notes");

        auto loan = co_await runtime().run("reportDamaged", [=](CirculationService& svc) {
            return svc.reportDamaged(id, notes);
        });
        co_return Response::ok(loanJson(loan), "已登记损坏");
    }

    Task<HttpResponsePtr> cancel(HttpRequestPtr /*req*/, int id) {
        auto loan = co_await runtime().run("cancelLoan", [=](CirculationService& svc) {
            return svc.cancelLoan(id);
        });
        co_return Response::ok(loanJson(loan), "已撤销");
    }

    /**
     * @brief 支付罚金 {amount: "3.00"}
     */
    Task<HttpResponsePtr> pay(HttpRequestPtr req, int id) {
        const auto& body = ValidatorHelper::requireJsonBody(req);
        Money amount = ValidatorHelper::requireMoney(body, "amount");

        auto loan = co_await runtime().run("payLateFee", [=](CirculationService& svc) {
            return svc.payLateFee(id, amount);
        });
        co_return Response::ok(loanJson(loan), "支付成功");
    }

    /**
     * @brief 逾期列表（?as_of= 指定时间，默认当前）
     */
    Task<HttpResponsePtr> overdue(HttpRequestPtr req) {
        auto asOf = ValidatorHelper::optionalTimestampParam(req, "as_of");
        auto loans = co_await runtime().service().overdueLoans(asOf);
        co_return Response::list(loansJson(loans));
    }

    /**
     * @brief 手动触发逾期对账
     */
    Task<HttpResponsePtr> sweepOverdue(HttpRequestPtr req) {
        auto asOf = ValidatorHelper::optionalTimestampParam(req, "as_of");
        int marked = co_await runtime().run("markOverdueLoans", [=](CirculationService& svc) {
            return svc.markOverdueLoans(asOf);
        });

        Json::Value data;
        data["marked"] = marked;
        co_return Response::ok(data);
    }

    Task<HttpResponsePtr> memberLoans(HttpRequestPtr /*req*/, int id) {
        auto loans = co_await runtime().service().activeLoansOf(id);
        co_return Response::list(loansJson(loans));
    }

    /**
     * @brief 增加副本 {count}
     */
    Task<HttpResponsePtr> addCopies(HttpRequestPtr req, int id) {
        const auto& body = ValidatorHelper::requireJsonBody(req);
        int count = ValidatorHelper::requirePositiveInt(body, "count");

        auto book = co_await runtime().run("addCopies", [=](CirculationService& svc) {
            return svc.addCopies(id, count);
        });
        co_return Response::ok(book.toJson(), "副本已增加");
    }

    Task<HttpResponsePtr> retire(HttpRequestPtr /*req*/, int id) {
        auto book = co_await runtime().run("retireBook", [=](CirculationService& svc) {
            return svc.retireBook(id);
        });
        co_return Response::ok(book.toJson(), "图书已下架");
    }

    Task<HttpResponsePtr> inventory(HttpRequestPtr /*req*/, int id) {
        auto report = co_await runtime().service().checkInventory(id);
        co_return Response::ok(report.toJson());
    }

private:
    static CirculationRuntime& runtime() { return CirculationRuntime::instance(); }

    static Json::Value loanJson(const Loan& loan) {
        return loan.toJson(runtime().clock().now());
    }

    static Json::Value loansJson(const std::vector<Loan>& loans) {
        auto now = runtime().clock().now();
        Json::Value items(Json::arrayValue);
        for (const auto& loan : loans) {
            items.append(loan.toJson(now));
        }
        return items;
    }
};
