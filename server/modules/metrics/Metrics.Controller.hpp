#pragma once

#include "common/AppContext.hpp"
#include "common/utils/Response.hpp"

#include <drogon/HttpController.h>

/**
 * @brief 指标与健康检查
 *
 * - GET /metrics：Prometheus 文本格式
 * - GET /health：运行状态与累计计数
 */
class MetricsController : public drogon::HttpController<MetricsController, false> {
private:
    AppContext& ctx_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    explicit MetricsController(AppContext& ctx) : ctx_(ctx) {}

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(MetricsController::metrics, "/metrics", Get);
    ADD_METHOD_TO(MetricsController::health, "/health", Get);
    METHOD_LIST_END

    Task<HttpResponsePtr> metrics(HttpRequestPtr req) {
        co_return Response::metrics(ctx_.metrics.exposition());
    }

    Task<HttpResponsePtr> health(HttpRequestPtr req) {
        Json::Value data;
        data["status"] = "ok";
        data["uptime_seconds"] = static_cast<Json::Int64>(ctx_.metrics.uptimeSeconds());
        data["active_connections"] = static_cast<Json::Int64>(ctx_.metrics.activeConnections());
        data["packets_received"] = static_cast<Json::Int64>(ctx_.metrics.totalPacketsReceived());
        data["packet_errors"] = static_cast<Json::Int64>(ctx_.metrics.totalPacketErrors());
        co_return Response::ok(data);
    }
};
