#include "modules/device/DeviceRegistry.hpp"
#include "common/utils/ExceptionHandler.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace {

Json::Value deviceJson() {
    Json::Value json;
    json["name"] = "  Hall-PFDS  ";
    json["ip"] = "192.168.1.50";
    json["mode"] = "On Demand";
    json["poll_seconds"] = 30;
    json["location_id"] = "RoomA";
    return json;
}

Device makeDevice(int id, const std::string& ip = "192.168.1.50") {
    return Device::create(id, "PFDS-" + std::to_string(id), ip, 9001, "RoomA",
                          DeviceMode::OnDemand, 30);
}

}  // namespace

// ==================== 校验 ====================

TEST(DeviceTest, CreateValidatesFields) {
    EXPECT_NO_THROW(makeDevice(0));
    EXPECT_NO_THROW(Device::create(1, "v6", "fe80::1", 9001, "", DeviceMode::Continuous, 1));

    EXPECT_THROW(Device::create(-1, "a", "10.0.0.1", 9001, "", DeviceMode::OnDemand, 30), ValidationException);
    EXPECT_THROW(Device::create(1, "   ", "10.0.0.1", 9001, "", DeviceMode::OnDemand, 30), ValidationException);
    EXPECT_THROW(Device::create(1, std::string(129, 'n'), "10.0.0.1", 9001, "", DeviceMode::OnDemand, 30),
                 ValidationException);
    EXPECT_THROW(Device::create(1, "a", "10.0.0.256", 9001, "", DeviceMode::OnDemand, 30), ValidationException);
    EXPECT_THROW(Device::create(1, "a", "pfds.local", 9001, "", DeviceMode::OnDemand, 30), ValidationException);
    EXPECT_THROW(Device::create(1, "a", "10.0.0.1", 0, "", DeviceMode::OnDemand, 30), ValidationException);
    EXPECT_THROW(Device::create(1, "a", "10.0.0.1", 9001, "Room:A", DeviceMode::OnDemand, 30), ValidationException);
    EXPECT_NO_THROW(Device::create(1, "a", "10.0.0.1", 9001, "default room", DeviceMode::OnDemand, 30));
    EXPECT_THROW(Device::create(1, "a", "10.0.0.1", 9001, "", DeviceMode::OnDemand, 0), ValidationException);
    EXPECT_THROW(Device::create(1, "a", "10.0.0.1", 9001, "", DeviceMode::OnDemand, 3601), ValidationException);
}

TEST(DeviceTest, ParsesModeAliases) {
    EXPECT_EQ(parseDeviceMode("Continuous"), DeviceMode::Continuous);
    EXPECT_EQ(parseDeviceMode("on demand"), DeviceMode::OnDemand);
    EXPECT_EQ(parseDeviceMode("OnDemand"), DeviceMode::OnDemand);
    EXPECT_FALSE(parseDeviceMode("Burst").has_value());
}

TEST(DeviceTest, FromJsonAppliesDefaults) {
    auto device = Device::fromJson(0, deviceJson(), 9001);
    EXPECT_EQ(device.name(), "Hall-PFDS");
    EXPECT_EQ(device.port(), 9001);
    EXPECT_EQ(device.mode(), DeviceMode::OnDemand);
    EXPECT_EQ(device.locationId(), "RoomA");

    auto json = device.withId(7).toJson();
    EXPECT_EQ(json["id"].asInt(), 7);
    EXPECT_EQ(json["mode"].asString(), "On Demand");
    EXPECT_EQ(json["poll_seconds"].asInt(), 30);
}

TEST(DeviceTest, FromJsonRejectsBadPayloads) {
    auto missing = deviceJson();
    missing.removeMember("ip");
    EXPECT_THROW(Device::fromJson(0, missing, 9001), ValidationException);

    auto badMode = deviceJson();
    badMode["mode"] = "Burst";
    EXPECT_THROW(Device::fromJson(0, badMode, 9001), ValidationException);

    auto textPoll = deviceJson();
    textPoll["poll_seconds"] = "30";
    EXPECT_THROW(Device::fromJson(0, textPoll, 9001), ValidationException);

    auto badPort = deviceJson();
    badPort["port"] = 70000;
    EXPECT_THROW(Device::fromJson(0, badPort, 9001), ValidationException);

    EXPECT_THROW(Device::fromJson(0, Json::Value("x"), 9001), ValidationException);
}

TEST(DeviceTest, ScheduleDiffersOnlyForSchedulingFields) {
    auto base = makeDevice(1);
    auto renamed = Device::create(1, "Renamed", "192.168.1.50", 9001, "RoomB", DeviceMode::OnDemand, 30);
    auto faster = Device::create(1, "PFDS-1", "192.168.1.50", 9001, "RoomA", DeviceMode::OnDemand, 5);

    EXPECT_FALSE(base.scheduleDiffers(renamed));
    EXPECT_TRUE(base.scheduleDiffers(faster));
}

// ==================== 注册表 ====================

TEST(DeviceRegistryTest, AddUpdateRemove) {
    DeviceRegistry registry;
    auto v0 = registry.version();

    registry.add(makeDevice(1));
    registry.add(makeDevice(2, "192.168.1.51"));
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_GT(registry.version(), v0);

    EXPECT_THROW(registry.add(makeDevice(1)), ConflictException);
    EXPECT_THROW(registry.add(makeDevice(0)), ValidationException);

    registry.update(Device::create(2, "Moved", "192.168.1.50", 9001, "", DeviceMode::Continuous, 10));
    EXPECT_EQ(registry.find(2)->name(), "Moved");
    EXPECT_EQ(registry.findByIp("192.168.1.50").size(), 2u);

    registry.remove(1);
    EXPECT_FALSE(registry.find(1).has_value());
    EXPECT_THROW(registry.remove(1), NotFoundException);
    EXPECT_THROW(registry.update(makeDevice(42)), NotFoundException);
}

TEST(DeviceRegistryTest, ReplaceAllSkipsInvalidEntries) {
    DeviceRegistry registry;
    registry.add(makeDevice(9));

    registry.replaceAll({makeDevice(3), makeDevice(0), makeDevice(1), makeDevice(3)});

    auto snapshot = registry.snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].id(), 1);
    EXPECT_EQ(snapshot[1].id(), 3);
}

// ==================== 管理接口错误映射 ====================

TEST(HttpErrorMappingTest, MapsExceptionsToStatusAndCode) {
    auto notFound = AppExceptionHandler::toResponse(NotFoundException("设备不存在: 9"), "/api/devices/9");
    EXPECT_EQ(notFound->getStatusCode(), drogon::k404NotFound);
    auto body = notFound->getJsonObject();
    ASSERT_TRUE(body);
    EXPECT_EQ((*body)["code"].asInt(), ErrorCodes::NOT_FOUND);
    EXPECT_EQ((*body)["message"].asString(), "设备不存在: 9");

    auto conflict = AppExceptionHandler::toResponse(ConflictException("设备ID已存在: 1"), "/api/devices");
    EXPECT_EQ(conflict->getStatusCode(), drogon::k409Conflict);

    auto invalid = AppExceptionHandler::toResponse(ValidationException("轮询间隔必须在 1-3600 秒之间"), "/api/devices");
    EXPECT_EQ(invalid->getStatusCode(), drogon::k400BadRequest);
    EXPECT_EQ((*invalid->getJsonObject())["code"].asInt(), ErrorCodes::VALIDATION_FAILED);

    auto internal = AppExceptionHandler::toResponse(std::runtime_error("boom"), "/metrics");
    EXPECT_EQ(internal->getStatusCode(), drogon::k500InternalServerError);
    EXPECT_EQ((*internal->getJsonObject())["code"].asInt(), ErrorCodes::INTERNAL_ERROR);
}
