#pragma once

#include "ErrorCodes.hpp"

#include <drogon/HttpTypes.h>

#include <exception>
#include <string>

/**
 * @brief 应用异常基类
 *
 * 仅用于管理边界（配置加载、设备增删改、HTTP 接口）。
 * 报文解析与指令下发的失败以值返回，不走异常。
 */
class AppException : public std::exception {
public:
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

private:
    int code_;
    std::string message_;
    HttpStatusCode status_;

public:
    AppException(int code, std::string message, HttpStatusCode status = k400BadRequest)
        : code_(code), message_(std::move(message)), status_(status) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
    HttpStatusCode getStatus() const { return status_; }
};

/**
 * @brief 资源不存在
 */
class NotFoundException : public AppException {
public:
    explicit NotFoundException(const std::string& message = "资源不存在")
        : AppException(ErrorCodes::NOT_FOUND, message, k404NotFound) {}
};

/**
 * @brief 配置/参数校验失败（ConfigError）
 *
 * 所有校验型构造函数在越界或格式错误时抛出，
 * 非法值不会进入下游组件。
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "验证失败")
        : AppException(ErrorCodes::VALIDATION_FAILED, message, k400BadRequest) {}
};

/**
 * @brief 数据冲突（唯一键重复）
 */
class ConflictException : public AppException {
public:
    explicit ConflictException(const std::string& message = "数据冲突")
        : AppException(ErrorCodes::CONFLICT, message, k409Conflict) {}
};
