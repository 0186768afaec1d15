#pragma once

#include <drogon/orm/Field.h>

#include <string>

/**
 * @brief Field 值获取辅助类（NULL 列返回默认值）
 */
class FieldHelper {
public:
    static std::string getString(const drogon::orm::Field& field, const std::string& defaultValue = "") {
        if (field.isNull()) {
            return defaultValue;
        }
        return field.as<std::string>();
    }

    static int getInt(const drogon::orm::Field& field, int defaultValue = 0) {
        if (field.isNull()) {
            return defaultValue;
        }
        return field.as<int>();
    }
};
