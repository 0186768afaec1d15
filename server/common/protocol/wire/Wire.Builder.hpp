#pragma once

#include "Wire.Types.hpp"
#include "Wire.Utils.hpp"
#include "common/utils/AppConfig.hpp"
#include "common/utils/AppException.hpp"

#include <cmath>
#include <string>

namespace wire {

/**
 * @brief 报文构建器
 *
 * 将解析结果重新编码为指定格式的报文（不含换行），
 * 用于设备仿真、回放以及编解码一致性校验。
 */
class Builder {
public:
    /**
     * @brief 按格式编码一条记录
     * @throws ValidationException Separate/Embedded 格式缺少位置标识
     */
    static std::string encode(const DecodedRecord& record, PacketFormat format) {
        return std::visit([format](const auto& r) { return encodeRecord(r, format); }, record);
    }

    /** 编码并追加换行（可直接写入 socket） */
    static std::string encodeLine(const DecodedRecord& record, PacketFormat format) {
        return encode(record, format) + "\n";
    }

    static std::string serialPacket(const std::string& serial) {
        return "#serialno:" + serial + "!";
    }

    static std::string locationPacket(const std::string& locationId) {
        return "#locid:" + locationId + "!";
    }

    /**
     * @brief 温度反算原始字（四舍五入到最近的标定刻度）
     */
    static uint16_t rawFromCelsius(double celsius, const ThermalCalibration& cal) {
        double raw = std::round((celsius - cal.offset) / cal.scale);
        if (cal.isSigned) {
            raw = std::clamp(raw, -32768.0, 32767.0);
            return static_cast<uint16_t>(static_cast<int16_t>(raw));
        }
        return static_cast<uint16_t>(std::clamp(raw, 0.0, 65535.0));
    }

    /**
     * @brief 由原始字构造一帧（按标定计算温度）
     */
    static ThermalFrame makeFrame(std::vector<uint16_t> raw, const ThermalCalibration& cal,
                                  std::string locationId = {}) {
        ThermalFrame frame;
        frame.locationId = std::move(locationId);
        frame.raw = std::move(raw);
        frame.celsius.reserve(frame.raw.size());
        for (uint16_t word : frame.raw) {
            frame.celsius.push_back(WireUtils::calibrate(word, cal.isSigned, cal.scale, cal.offset));
        }
        return frame;
    }

private:
    static const std::string& requireLocation(const std::string& locationId, PacketFormat format) {
        if (locationId.empty()) {
            throw ValidationException(std::string("格式 ") + packetFormatToString(format) + " 需要位置标识");
        }
        return locationId;
    }

    static std::string encodeRecord(const IdentityRecord& identity, PacketFormat) {
        if (!identity.serial.empty()) {
            return serialPacket(identity.serial);
        }
        return locationPacket(identity.locationId);
    }

    static std::string encodeRecord(const ThermalFrame& frame, PacketFormat format) {
        std::string out;
        out.reserve((frame.raw.size() + frame.trailer.size()) * 5 + 80);

        bool spaced = false;
        switch (format) {
            case PacketFormat::Embedded:
                out += "#frame" + requireLocation(frame.locationId, format) + ":";
                break;
            case PacketFormat::Separate:
                out += "#frame:" + requireLocation(frame.locationId, format) + ":";
                break;
            case PacketFormat::Continuous:
                out += "#frame:";
                break;
            case PacketFormat::NoLoc:
                out += "#frame:";
                spaced = true;
                break;
        }

        bool first = true;
        auto append = [&](uint16_t word) {
            if (spaced && !first) out += ' ';
            WireUtils::appendWord(out, word);
            first = false;
        };
        for (uint16_t word : frame.raw) append(word);
        for (uint16_t word : frame.trailer) append(word);

        out += '!';
        return out;
    }

    static std::string encodeRecord(const SensorSample& sample, PacketFormat format) {
        std::string fields = "ADC1=" + std::to_string(sample.adc1)
                           + ",ADC2=" + std::to_string(sample.adc2)
                           + ",MPY30=" + (sample.flameFlag ? "1" : "0");
        switch (format) {
            case PacketFormat::Embedded:
                return "#Sensor" + requireLocation(sample.locationId, format) + ":" + fields + "!";
            case PacketFormat::Separate:
                return "#Sensor:" + requireLocation(sample.locationId, format) + ":" + fields + "!";
            case PacketFormat::Continuous:
            case PacketFormat::NoLoc:
                break;
        }
        return "#Sensor:" + fields + "!";
    }
};

}  // namespace wire
