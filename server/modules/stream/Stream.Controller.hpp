#pragma once

#include "modules/fusion/FusionEngine.hpp"
#include "modules/rate/AdaptiveRateController.hpp"
#include "common/utils/Response.hpp"

#include <drogon/HttpController.h>

/**
 * @brief 视觉分析协作接口
 *
 * 外部视觉检测进程通过这里上报置信度与积压深度：
 * - POST /api/streams/{stream}/vision  {"confidence": 0.85}
 * - POST /api/streams/{stream}/backlog {"depth": 6} → 建议帧率与帧间隔
 * - GET  /api/locations/{loc}/fusion   位置的当前融合状态
 *
 * 视频流到位置的映射来自 custom_config.streams，未映射时流 ID 即位置 ID。
 */
class StreamController : public drogon::HttpController<StreamController, false> {
private:
    FusionEngine& engine_;
    AdaptiveRateController& rateController_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    StreamController(FusionEngine& engine, AdaptiveRateController& rateController)
        : engine_(engine), rateController_(rateController) {}

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(StreamController::vision, "/api/streams/{stream}/vision", Post);
    ADD_METHOD_TO(StreamController::backlog, "/api/streams/{stream}/backlog", Post);
    ADD_METHOD_TO(StreamController::fusion, "/api/locations/{loc}/fusion", Get);
    METHOD_LIST_END

    /**
     * @brief 上报视觉置信度并立即评估一次融合
     */
    Task<HttpResponsePtr> vision(HttpRequestPtr req, std::string stream) {
        auto json = req->getJsonObject();
        if (!json) co_return Response::badRequest("请求体格式错误");
        if (!json->isMember("confidence") || !(*json)["confidence"].isNumeric()) {
            co_return Response::badRequest("缺少字段或类型错误: confidence");
        }

        std::string locationId = rateController_.locationFor(stream).value_or(stream);
        auto result = engine_.setVisionConfidence(locationId, (*json)["confidence"].asDouble());

        Json::Value data = result.toJson();
        data["location_id"] = locationId;
        co_return Response::ok(data);
    }

    /**
     * @brief 上报待处理帧数，返回建议帧率
     */
    Task<HttpResponsePtr> backlog(HttpRequestPtr req, std::string stream) {
        auto json = req->getJsonObject();
        if (!json) co_return Response::badRequest("请求体格式错误");
        if (!json->isMember("depth") || !(*json)["depth"].isInt() || (*json)["depth"].asInt() < 0) {
            co_return Response::badRequest("depth 必须是非负整数");
        }

        double fps = rateController_.update(stream, (*json)["depth"].asInt());

        Json::Value data;
        data["stream_id"] = stream;
        data["fps"] = fps;
        data["interval_ms"] = rateController_.intervalMs(stream);
        co_return Response::ok(data);
    }

    Task<HttpResponsePtr> fusion(HttpRequestPtr req, std::string loc) {
        auto snapshot = engine_.snapshot(loc);
        if (!snapshot) {
            co_return Response::notFound("位置暂无数据: " + loc);
        }
        co_return Response::ok(snapshot->toJson());
    }
};
