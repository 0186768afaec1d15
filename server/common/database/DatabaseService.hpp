#pragma once

#include <drogon/HttpAppFramework.h>
#include <drogon/orm/DbClient.h>

#include <string>
#include <vector>

/**
 * @brief 数据库服务类
 *
 * 设备注册表存放在 SQLite 中（drogon 的 sqlite3 客户端），
 * SQL 直接使用 SQLite 原生的 ? 占位符，参数由驱动绑定。
 */
class DatabaseService {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    using Result = drogon::orm::Result;
    template<typename T = void> using Task = drogon::Task<T>;

    explicit DatabaseService(std::string clientName = "default")
        : clientName_(std::move(clientName)) {}

    DbClientPtr getClient() const {
        return drogon::app().getDbClient(clientName_);
    }

    Task<void> ping() {
        co_await getClient()->execSqlCoro("SELECT 1");
    }

    Task<Result> execSqlCoro(const std::string& sql,
                             const std::vector<std::string>& params = {}) {
        if (params.empty()) {
            co_return co_await getClient()->execSqlCoro(sql);
        }
        auto binder = *getClient() << sql;
        for (const auto& p : params) {
            binder << p;
        }
        co_return co_await drogon::orm::internal::SqlAwaiter(std::move(binder));
    }

private:
    std::string clientName_;
};
