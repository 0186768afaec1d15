#pragma once

#include "AppException.hpp"
#include "ErrorCodes.hpp"

#include <drogon/HttpAppFramework.h>
#include <drogon/orm/Exception.h>
#include <trantor/utils/Logger.h>

/**
 * @brief 全局异常处理器
 *
 * 将 AppException 转换为对应 HTTP 状态码的 JSON 响应，
 * 数据库异常返回 DATABASE_ERROR，其他异常统一返回 500 错误
 */
class AppExceptionHandler {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpResponse = drogon::HttpResponse;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static void setup() {
        drogon::app().setExceptionHandler([](const std::exception& e,
                                       const HttpRequestPtr& req,
                                       std::function<void (const HttpResponsePtr &)> &&callback) {
            callback(toResponse(e, req ? req->path() : std::string{}));
        });
    }

    /**
     * @brief 异常 → JSON 响应
     */
    static HttpResponsePtr toResponse(const std::exception& e, const std::string& path) {
        Json::Value json;
        HttpStatusCode status = k500InternalServerError;

        if (const auto* appEx = dynamic_cast<const AppException*>(&e)) {
            json["code"] = appEx->getCode();
            json["message"] = appEx->getMessage();
            status = appEx->getStatus();
            LOG_DEBUG << "[Http] " << path << " rejected: " << appEx->getMessage();
        } else if (dynamic_cast<const drogon::orm::DrogonDbException*>(&e)) {
            LOG_ERROR << "[Http] Database error on " << path << ": " << e.what();
            json["code"] = ErrorCodes::DATABASE_ERROR;
            json["message"] = "数据库错误";
        } else {
            LOG_ERROR << "[Http] Unhandled exception on " << path << ": " << e.what();
            json["code"] = ErrorCodes::INTERNAL_ERROR;
            json["message"] = "服务器内部错误";
        }

        json["status"] = static_cast<int>(status);
        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(status);
        return resp;
    }
};
