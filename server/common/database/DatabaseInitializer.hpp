#pragma once

#include "DatabaseService.hpp"
#include "common/utils/Constants.hpp"

#include <trantor/utils/Logger.h>

/**
 * @brief 设备注册表建表（幂等）
 *
 * 表结构与现场部署的 pfds_devices.db 保持兼容，
 * 旧库缺少的列在启动时补齐。
 */
class DatabaseInitializer {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    template<typename T = void> using Task = drogon::Task<T>;

    static Task<> initialize(DatabaseService db = DatabaseService{}) {
        auto client = db.getClient();

        LOG_INFO << "[Database] Checking device registry schema...";

        co_await createTables(client);
        co_await migrateColumns(client);

        LOG_INFO << "[Database] Device registry schema ready";
    }

private:
    static Task<> createTables(const DbClientPtr& db) {
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS pfds_devices (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL,
                ip TEXT NOT NULL,
                location_id TEXT,
                mode TEXT NOT NULL,
                poll_seconds INTEGER NOT NULL,
                port INTEGER,
                created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_pfds_devices_ip ON pfds_devices (ip))");
    }

    static Task<> migrateColumns(const DbClientPtr& db) {
        // 确保 port 字段存在（兼容旧表结构；SQLite 的 ADD COLUMN 不支持 IF NOT EXISTS）
        auto columns = co_await db->execSqlCoro("PRAGMA table_info(pfds_devices)");
        bool hasPort = false;
        for (const auto& row : columns) {
            if (row["name"].as<std::string>() == "port") {
                hasPort = true;
                break;
            }
        }
        if (!hasPort) {
            co_await db->execSqlCoro("ALTER TABLE pfds_devices ADD COLUMN port INTEGER");
            LOG_INFO << "[Database] Added column pfds_devices.port";
        }
    }
};
