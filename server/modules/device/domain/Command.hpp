#pragma once

#include "common/utils/Constants.hpp"
#include "common/utils/ErrorCodes.hpp"

#include <json/json.h>
#include <trantor/utils/Date.h>

#include <chrono>
#include <optional>
#include <string>

/**
 * @brief 设备指令（闭集）
 */
enum class CommandType {
    Request1,
    PeriodOn
};

inline const char* commandTypeToString(CommandType type) {
    switch (type) {
        case CommandType::Request1: return Constants::COMMAND_REQUEST1;
        case CommandType::PeriodOn: return Constants::COMMAND_PERIOD_ON;
    }
    return Constants::COMMAND_REQUEST1;
}

/**
 * @brief 下发失败类型（值类型，不抛出）
 */
enum class DispatchErrorKind {
    Unreachable,      // 连接被拒绝 / 不可达
    Timeout,          // 超时内未收到应答
    Closed,           // 应答前连接被对端关闭
    InvalidTarget     // 地址无法解析
};

inline const char* dispatchErrorKindToString(DispatchErrorKind kind) {
    switch (kind) {
        case DispatchErrorKind::Unreachable:   return "unreachable";
        case DispatchErrorKind::Timeout:       return "timeout";
        case DispatchErrorKind::Closed:        return "closed";
        case DispatchErrorKind::InvalidTarget: return "invalid_target";
    }
    return "unreachable";
}

struct DispatchError {
    DispatchErrorKind kind = DispatchErrorKind::Unreachable;
    std::string message;

    int code() const {
        switch (kind) {
            case DispatchErrorKind::Unreachable:   return ErrorCodes::DISPATCH_UNREACHABLE;
            case DispatchErrorKind::Timeout:       return ErrorCodes::DISPATCH_TIMEOUT;
            case DispatchErrorKind::Closed:        return ErrorCodes::DISPATCH_CLOSED;
            case DispatchErrorKind::InvalidTarget: return ErrorCodes::DISPATCH_INVALID_TARGET;
        }
        return ErrorCodes::DISPATCH_UNREACHABLE;
    }
};

/**
 * @brief 一次下发尝试的结果
 *
 * 只在单次下发期间存在，交给调度器更新状态、计入指标后即丢弃。
 */
struct CommandOutcome {
    int deviceId = 0;
    CommandType command = CommandType::Request1;
    bool success = false;
    std::optional<DispatchError> error;
    double latencyMs = 0.0;
    std::chrono::system_clock::time_point dispatchedAt;

    static CommandOutcome ok(int deviceId, CommandType command, double latencyMs,
                             std::chrono::system_clock::time_point dispatchedAt) {
        CommandOutcome o;
        o.deviceId = deviceId;
        o.command = command;
        o.success = true;
        o.latencyMs = latencyMs;
        o.dispatchedAt = dispatchedAt;
        return o;
    }

    static CommandOutcome failed(int deviceId, CommandType command, DispatchErrorKind kind,
                                 std::string message, double latencyMs,
                                 std::chrono::system_clock::time_point dispatchedAt) {
        CommandOutcome o;
        o.deviceId = deviceId;
        o.command = command;
        o.success = false;
        o.error = DispatchError{kind, std::move(message)};
        o.latencyMs = latencyMs;
        o.dispatchedAt = dispatchedAt;
        return o;
    }

    Json::Value toJson() const {
        Json::Value json;
        json["device_id"] = deviceId;
        json["command"] = commandTypeToString(command);
        json["success"] = success;
        json["latency_ms"] = latencyMs;
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            dispatchedAt.time_since_epoch()).count();
        json["dispatched_at"] = trantor::Date(static_cast<int64_t>(micros)).toDbString();
        if (error) {
            json["error"] = dispatchErrorKindToString(error->kind);
            json["error_code"] = error->code();
            json["message"] = error->message;
        }
        return json;
    }
};
