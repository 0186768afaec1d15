#pragma once

#include "domain/Device.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/utils/AppException.hpp"
#include "common/utils/FieldHelper.hpp"

#include <trantor/utils/Logger.h>

#include <vector>

/**
 * @brief pfds_devices 表的持久化
 *
 * 读出的行必须通过 Device::create 校验，非法行记录警告后跳过，
 * 不会进入注册表和调度器。
 */
class DeviceRepository {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    using Row = drogon::orm::Row;

    explicit DeviceRepository(uint16_t defaultPort, DatabaseService db = DatabaseService{})
        : defaultPort_(defaultPort), db_(std::move(db)) {}

    Task<std::vector<Device>> loadAll() {
        auto result = co_await db_.execSqlCoro(
            "SELECT id, name, ip, location_id, mode, poll_seconds, port FROM pfds_devices ORDER BY id ASC");

        std::vector<Device> devices;
        devices.reserve(result.size());
        for (const auto& row : result) {
            try {
                devices.push_back(fromRow(row));
            } catch (const ValidationException& e) {
                LOG_WARN << "[Registry] Skipping invalid device row id="
                         << FieldHelper::getInt(row["id"]) << ": " << e.getMessage();
            }
        }
        co_return devices;
    }

    /**
     * @brief 插入新设备，返回带数据库 ID 的实例
     */
    Task<Device> insert(const Device& device) {
        auto result = co_await db_.execSqlCoro(
            "INSERT INTO pfds_devices (name, ip, location_id, mode, poll_seconds, port) VALUES (?, ?, ?, ?, ?, ?)",
            params(device));
        auto newId = static_cast<int>(result.insertId());
        if (newId <= 0) {
            throw AppException(ErrorCodes::DATABASE_ERROR, "无法获取新设备ID", drogon::k500InternalServerError);
        }
        co_return device.withId(newId);
    }

    /**
     * @throws NotFoundException 行不存在
     */
    Task<void> update(const Device& device) {
        auto values = params(device);
        values.push_back(std::to_string(device.id()));
        auto result = co_await db_.execSqlCoro(
            "UPDATE pfds_devices SET name = ?, ip = ?, location_id = ?, mode = ?, poll_seconds = ?, port = ? WHERE id = ?",
            values);
        if (result.affectedRows() == 0) {
            throw NotFoundException("设备不存在: " + std::to_string(device.id()));
        }
    }

    /**
     * @throws NotFoundException 行不存在
     */
    Task<void> remove(int id) {
        auto result = co_await db_.execSqlCoro(
            "DELETE FROM pfds_devices WHERE id = ?", {std::to_string(id)});
        if (result.affectedRows() == 0) {
            throw NotFoundException("设备不存在: " + std::to_string(id));
        }
    }

private:
    uint16_t defaultPort_;
    DatabaseService db_;

    Device fromRow(const Row& row) const {
        std::string modeText = FieldHelper::getString(row["mode"]);
        auto mode = parseDeviceMode(modeText);
        if (!mode) {
            throw ValidationException("未知的设备模式: " + modeText);
        }
        int port = FieldHelper::getInt(row["port"], defaultPort_);
        if (port < 1 || port > 65535) {
            throw ValidationException("设备端口无效: " + std::to_string(port));
        }
        return Device::create(
            FieldHelper::getInt(row["id"]),
            FieldHelper::getString(row["name"]),
            FieldHelper::getString(row["ip"]),
            static_cast<uint16_t>(port),
            FieldHelper::getString(row["location_id"]),
            *mode,
            FieldHelper::getInt(row["poll_seconds"]));
    }

    static std::vector<std::string> params(const Device& device) {
        return {
            device.name(),
            device.ip(),
            device.locationId(),
            deviceModeToString(device.mode()),
            std::to_string(device.pollSeconds()),
            std::to_string(device.port())
        };
    }
};
