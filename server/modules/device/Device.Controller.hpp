#pragma once

#include "Device.Service.hpp"
#include "common/utils/Response.hpp"

#include <drogon/HttpController.h>

/**
 * @brief 设备管理控制器
 *
 * 依赖在 main 中注入，因此不自动创建（AutoCreation = false），
 * 通过 app().registerController() 注册。
 */
class DeviceController : public drogon::HttpController<DeviceController, false> {
private:
    DeviceService service_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    DeviceController(AppContext& ctx, DeviceRepository& repository, DeviceRegistry& registry,
                     DeviceScheduler& scheduler, DeviceStatusTracker& deviceStatus)
        : service_(ctx, repository, registry, scheduler, deviceStatus) {}

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(DeviceController::list, "/api/devices", Get);
    ADD_METHOD_TO(DeviceController::schedule, "/api/devices/schedule", Get);
    ADD_METHOD_TO(DeviceController::detail, "/api/devices/{id}", Get);
    ADD_METHOD_TO(DeviceController::create, "/api/devices", Post);
    ADD_METHOD_TO(DeviceController::update, "/api/devices/{id}", Put);
    ADD_METHOD_TO(DeviceController::remove, "/api/devices/{id}", Delete);
    METHOD_LIST_END

    Task<HttpResponsePtr> list(HttpRequestPtr req) {
        Json::Value result;
        result["list"] = service_.list();
        co_return Response::ok(result);
    }

    /**
     * @brief 调度器运行状态
     */
    Task<HttpResponsePtr> schedule(HttpRequestPtr req) {
        co_return Response::ok(service_.schedule());
    }

    Task<HttpResponsePtr> detail(HttpRequestPtr req, int id) {
        if (id <= 0) co_return Response::badRequest("无效的资源ID");
        co_return Response::ok(service_.detail(id));
    }

    /**
     * @brief 注册设备
     * 异常由全局异常处理器统一处理
     */
    Task<HttpResponsePtr> create(HttpRequestPtr req) {
        auto json = req->getJsonObject();
        if (!json) co_return Response::badRequest("请求体格式错误");

        co_return Response::created(co_await service_.create(*json));
    }

    Task<HttpResponsePtr> update(HttpRequestPtr req, int id) {
        if (id <= 0) co_return Response::badRequest("无效的资源ID");

        auto json = req->getJsonObject();
        if (!json) co_return Response::badRequest("请求体格式错误");

        co_return Response::ok(co_await service_.update(id, *json), "更新成功");
    }

    Task<HttpResponsePtr> remove(HttpRequestPtr req, int id) {
        if (id <= 0) co_return Response::badRequest("无效的资源ID");
        co_await service_.remove(id);
        co_return Response::deleted();
    }
};
