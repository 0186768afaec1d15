#pragma once

#include "common/utils/Constants.hpp"
#include "common/utils/ErrorCodes.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wire {

/**
 * @brief 报文格式变体
 *
 * - Separate:   位置标识作为独立字段或独立的 #locid 行
 * - Embedded:   位置标识作为标签前缀（#frameRoomA: / #SensorRoomA:）
 * - Continuous: 无位置标识，热成像为连续十六进制（无分隔符）
 * - NoLoc:      无位置标识，由调用方回退到对端 IP
 */
enum class PacketFormat {
    Separate,
    Embedded,
    Continuous,
    NoLoc
};

inline const char* packetFormatToString(PacketFormat format) {
    switch (format) {
        case PacketFormat::Separate:   return "separate";
        case PacketFormat::Embedded:   return "embedded";
        case PacketFormat::Continuous: return "continuous";
        case PacketFormat::NoLoc:      return "no_loc";
    }
    return "unknown";
}

/**
 * @brief 身份报文（#serialno / #locid），两字段之一非空
 */
struct IdentityRecord {
    std::string serial;
    std::string locationId;

    bool operator==(const IdentityRecord&) const = default;
};

/**
 * @brief 热成像帧（32×24，行优先）
 *
 * raw 保留原始 16 位字，celsius 为标定后的温度；
 * trailer 为设备附带的 66 字标定区（可为空），原样保留。
 */
struct ThermalFrame {
    std::string locationId;               // 报文自带的位置（可为空）
    std::vector<uint16_t> raw;
    std::vector<double> celsius;
    std::vector<uint16_t> trailer;

    double at(int row, int col) const {
        return celsius[static_cast<size_t>(row) * Constants::THERMAL_WIDTH + col];
    }

    double maxTemperature() const {
        if (celsius.empty()) return 0.0;
        return *std::max_element(celsius.begin(), celsius.end());
    }

    bool operator==(const ThermalFrame&) const = default;
};

/**
 * @brief 传感器采样（ADC1=烟雾/气体, ADC2=火焰模拟量, MPY30=火焰数字量）
 */
struct SensorSample {
    std::string locationId;               // 报文自带的位置（可为空）
    int adc1 = 0;
    int adc2 = 0;
    bool flameFlag = false;
    std::chrono::system_clock::time_point timestamp;

    bool operator==(const SensorSample&) const = default;
};

using DecodedRecord = std::variant<IdentityRecord, ThermalFrame, SensorSample>;

/**
 * @brief 解析错误类型
 */
enum class ParseErrorKind {
    Empty,
    Framing,
    UnknownTag,
    BadHex,
    CellCount,
    FieldCount,
    BadField,
    BadIdentity,
    Oversized
};

/**
 * @brief 解析错误（值类型，解析器从不抛出）
 */
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Framing;
    std::string message;

    int code() const {
        switch (kind) {
            case ParseErrorKind::Empty:       return ErrorCodes::PARSE_EMPTY;
            case ParseErrorKind::Framing:     return ErrorCodes::PARSE_FRAMING;
            case ParseErrorKind::UnknownTag:  return ErrorCodes::PARSE_UNKNOWN_TAG;
            case ParseErrorKind::BadHex:      return ErrorCodes::PARSE_BAD_HEX;
            case ParseErrorKind::CellCount:   return ErrorCodes::PARSE_CELL_COUNT;
            case ParseErrorKind::FieldCount:  return ErrorCodes::PARSE_FIELD_COUNT;
            case ParseErrorKind::BadField:    return ErrorCodes::PARSE_BAD_FIELD;
            case ParseErrorKind::BadIdentity: return ErrorCodes::PARSE_BAD_IDENTITY;
            case ParseErrorKind::Oversized:   return ErrorCodes::PARSE_OVERSIZED;
        }
        return ErrorCodes::PARSE_FRAMING;
    }
};

/**
 * @brief 单条报文的解析结果
 */
struct DecodeResult {
    PacketFormat format = PacketFormat::NoLoc;
    std::optional<DecodedRecord> record;
    std::optional<ParseError> error;

    bool ok() const { return record.has_value(); }

    static DecodeResult success(PacketFormat format, DecodedRecord rec) {
        DecodeResult r;
        r.format = format;
        r.record = std::move(rec);
        return r;
    }

    static DecodeResult failure(ParseErrorKind kind, std::string message) {
        DecodeResult r;
        r.error = ParseError{kind, std::move(message)};
        return r;
    }
};

/**
 * @brief 取记录自带的位置标识（无则为空）
 */
inline const std::string& recordLocation(const DecodedRecord& record) {
    return std::visit([](const auto& r) -> const std::string& {
        return r.locationId;
    }, record);
}

}  // namespace wire
