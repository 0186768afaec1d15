#pragma once

#include "ErrorCodes.hpp"

#include <drogon/HttpResponse.h>
#include <json/json.h>

/**
 * @brief 统一响应格式工具类
 *
 * JSON 接口统一为 {"code": 0, "message": "...", "data": ...}；
 * 指标接口返回纯文本。
 */
class Response {
public:
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpResponse = drogon::HttpResponse;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static HttpResponsePtr ok(const Json::Value &data = Json::Value::null,
                              const std::string &message = "Success") {
        Json::Value json;
        json["code"] = 0;
        json["message"] = message;
        if (!data.isNull()) {
            json["data"] = data;
        }

        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(k200OK);
        return resp;
    }

    static HttpResponsePtr created(const Json::Value &data, const std::string &message = "创建成功") {
        Json::Value json;
        json["code"] = 0;
        json["message"] = message;
        json["data"] = data;

        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(k201Created);
        return resp;
    }

    static HttpResponsePtr deleted(const std::string &message = "删除成功") {
        Json::Value json;
        json["code"] = 0;
        json["message"] = message;

        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(k200OK);
        return resp;
    }

    /** Prometheus 文本格式 0.0.4 */
    static HttpResponsePtr metrics(std::string body) {
        auto resp = HttpResponse::newHttpResponse();
        resp->setStatusCode(k200OK);
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setBody(std::move(body));
        return resp;
    }

    static HttpResponsePtr error(int code,
                                 const std::string &message,
                                 HttpStatusCode status = k400BadRequest) {
        Json::Value json;
        json["code"] = code;
        json["message"] = message;

        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(status);
        return resp;
    }

    static HttpResponsePtr notFound(const std::string &message = "资源不存在") {
        return error(ErrorCodes::NOT_FOUND, message, k404NotFound);
    }

    static HttpResponsePtr badRequest(const std::string &message = "请求参数错误") {
        return error(ErrorCodes::BAD_REQUEST, message, k400BadRequest);
    }

    static HttpResponsePtr internalError(const std::string &message = "服务器内部错误") {
        return error(ErrorCodes::INTERNAL_ERROR, message, k500InternalServerError);
    }

    static HttpResponsePtr conflict(const std::string &message = "数据冲突") {
        return error(ErrorCodes::CONFLICT, message, k409Conflict);
    }
};
