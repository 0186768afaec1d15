#pragma once

#include "Wire.Types.hpp"
#include "Wire.Utils.hpp"
#include "common/utils/AppConfig.hpp"

#include <charconv>
#include <string>
#include <string_view>

namespace wire {

/**
 * @brief 现场单元报文解析器
 *
 * 无状态：每次调用只解析一条报文（调用方已按换行切分），
 * 任何非法输入都返回 ParseError，不抛异常。
 *
 * 报文格式：
 * - #serialno:<serial>!
 * - #locid:<loc>!
 * - #frame<loc>:<hex>!  /  #frame:<loc>:<hex>!  /  #frame:<hex>!
 * - #Sensor<loc>:<fields>!  /  #Sensor:<loc>:<fields>!  /  #Sensor:<fields>!
 */
class Parser {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit Parser(ThermalCalibration calibration = {})
        : calibration_(calibration) {}

    const ThermalCalibration& calibration() const { return calibration_; }

    DecodeResult decode(std::string_view packet) const {
        return decode(packet, std::chrono::system_clock::now());
    }

    /**
     * @brief 解析单条报文
     * @param packet 不含换行的报文文本
     * @param receivedAt 接收时间（写入 SensorSample.timestamp）
     */
    DecodeResult decode(std::string_view packet, TimePoint receivedAt) const {
        auto text = WireUtils::trim(packet);
        if (text.empty()) {
            return DecodeResult::failure(ParseErrorKind::Empty, "empty packet");
        }
        if (text.front() != '#') {
            return DecodeResult::failure(ParseErrorKind::Framing, "packet must start with '#'");
        }
        if (text.size() < 2 || text.back() != '!') {
            return DecodeResult::failure(ParseErrorKind::Framing, "packet must end with '!'");
        }

        text = text.substr(1, text.size() - 2);
        auto colon = text.find(':');
        if (colon == std::string_view::npos) {
            return DecodeResult::failure(ParseErrorKind::Framing, "missing ':' after packet tag");
        }

        auto tag = text.substr(0, colon);
        auto body = text.substr(colon + 1);

        if (WireUtils::equalsNoCase(tag, "serialno")) {
            return decodeIdentity(body, true);
        }
        if (WireUtils::equalsNoCase(tag, "locid")) {
            return decodeIdentity(body, false);
        }
        if (WireUtils::startsWithNoCase(tag, "frame")) {
            return decodeFrame(tag.substr(5), body);
        }
        if (WireUtils::startsWithNoCase(tag, "sensor")) {
            return decodeSensor(tag.substr(6), body, receivedAt);
        }
        return DecodeResult::failure(ParseErrorKind::UnknownTag,
            "unknown packet tag '" + std::string(tag) + "'");
    }

private:
    ThermalCalibration calibration_;

    // ==================== 身份 ====================

    static DecodeResult decodeIdentity(std::string_view body, bool isSerial) {
        auto value = WireUtils::trim(body);
        if (!WireUtils::isValidLocationId(value)) {
            return DecodeResult::failure(ParseErrorKind::BadIdentity,
                std::string(isSerial ? "invalid serial number" : "invalid location id")
                + " '" + std::string(value) + "'");
        }

        IdentityRecord identity;
        if (isSerial) {
            identity.serial = std::string(value);
        } else {
            identity.locationId = std::string(value);
        }
        return DecodeResult::success(PacketFormat::Separate, std::move(identity));
    }

    // ==================== 热成像帧 ====================

    DecodeResult decodeFrame(std::string_view tagSuffix, std::string_view body) const {
        ThermalFrame frame;
        PacketFormat format;
        std::string_view payload;

        if (auto embedded = WireUtils::trim(tagSuffix); !embedded.empty()) {
            if (!WireUtils::isValidLocationId(embedded)) {
                return DecodeResult::failure(ParseErrorKind::BadIdentity,
                    "invalid embedded location '" + std::string(embedded) + "'");
            }
            frame.locationId = std::string(embedded);
            format = PacketFormat::Embedded;
            payload = body;
        } else if (auto sep = body.find(':'); sep != std::string_view::npos) {
            auto loc = WireUtils::trim(body.substr(0, sep));
            if (!WireUtils::isValidLocationId(loc)) {
                return DecodeResult::failure(ParseErrorKind::BadIdentity,
                    "invalid location field '" + std::string(loc) + "'");
            }
            frame.locationId = std::string(loc);
            format = PacketFormat::Separate;
            payload = body.substr(sep + 1);
        } else {
            payload = body;
            format = WireUtils::containsSpace(WireUtils::trim(payload))
                ? PacketFormat::NoLoc
                : PacketFormat::Continuous;
        }

        std::vector<uint16_t> words;
        if (auto err = parseWords(WireUtils::trim(payload), words)) {
            DecodeResult failed;
            failed.error = std::move(err);
            return failed;
        }

        constexpr size_t grid = Constants::THERMAL_CELLS;
        constexpr size_t extended = grid + Constants::THERMAL_TRAILER_WORDS;
        if (words.size() != grid && words.size() != extended) {
            return DecodeResult::failure(ParseErrorKind::CellCount,
                "expected " + std::to_string(grid) + " cells, got " + std::to_string(words.size()));
        }

        frame.raw.assign(words.begin(), words.begin() + grid);
        frame.trailer.assign(words.begin() + grid, words.end());
        frame.celsius.reserve(grid);
        for (uint16_t word : frame.raw) {
            frame.celsius.push_back(WireUtils::calibrate(
                word, calibration_.isSigned, calibration_.scale, calibration_.offset));
        }
        return DecodeResult::success(format, std::move(frame));
    }

    /**
     * @brief 解析十六进制负载：空白分隔的 4 字符字，或连续十六进制
     */
    static std::optional<ParseError> parseWords(std::string_view payload, std::vector<uint16_t>& words) {
        if (payload.empty()) {
            return ParseError{ParseErrorKind::CellCount, "expected 768 cells, got 0"};
        }

        if (WireUtils::containsSpace(payload)) {
            size_t pos = 0;
            while (pos < payload.size()) {
                while (pos < payload.size() && std::isspace(static_cast<unsigned char>(payload[pos]))) ++pos;
                size_t start = pos;
                while (pos < payload.size() && !std::isspace(static_cast<unsigned char>(payload[pos]))) ++pos;
                if (start == pos) break;
                auto token = payload.substr(start, pos - start);
                auto word = WireUtils::parseWord(token);
                if (!word) {
                    return ParseError{ParseErrorKind::BadHex,
                        "invalid hex word '" + std::string(token) + "' at cell " + std::to_string(words.size())};
                }
                words.push_back(*word);
            }
            return std::nullopt;
        }

        if (payload.size() % Constants::HEX_CHARS_PER_CELL != 0) {
            return ParseError{ParseErrorKind::BadHex,
                "hex payload length " + std::to_string(payload.size()) + " is not a multiple of 4"};
        }
        words.reserve(payload.size() / Constants::HEX_CHARS_PER_CELL);
        for (size_t i = 0; i < payload.size(); i += Constants::HEX_CHARS_PER_CELL) {
            auto word = WireUtils::parseWord(payload.substr(i, Constants::HEX_CHARS_PER_CELL));
            if (!word) {
                return ParseError{ParseErrorKind::BadHex,
                    "invalid hex at offset " + std::to_string(i)};
            }
            words.push_back(*word);
        }
        return std::nullopt;
    }

    // ==================== 传感器采样 ====================

    static DecodeResult decodeSensor(std::string_view tagSuffix, std::string_view body, TimePoint receivedAt) {
        SensorSample sample;
        sample.timestamp = receivedAt;
        PacketFormat format;
        std::string_view fields = body;

        if (auto embedded = WireUtils::trim(tagSuffix); !embedded.empty()) {
            if (!WireUtils::isValidLocationId(embedded)) {
                return DecodeResult::failure(ParseErrorKind::BadIdentity,
                    "invalid embedded location '" + std::string(embedded) + "'");
            }
            sample.locationId = std::string(embedded);
            format = PacketFormat::Embedded;
        } else if (auto loc = splitLocationField(body, fields)) {
            if (!WireUtils::isValidLocationId(*loc)) {
                return DecodeResult::failure(ParseErrorKind::BadIdentity,
                    "invalid location field '" + std::string(*loc) + "'");
            }
            sample.locationId = std::string(*loc);
            format = PacketFormat::Separate;
        } else {
            format = PacketFormat::NoLoc;
        }

        if (auto err = parseSensorFields(fields, sample)) {
            DecodeResult failed;
            failed.format = format;
            failed.error = std::move(err);
            return failed;
        }
        return DecodeResult::success(format, std::move(sample));
    }

    /**
     * @brief 识别 "<loc>:<fields>" 形式的独立位置字段
     *
     * 位置段不含 '=' 与 ','，且冒号后不是 '='（兼容 "ADC1:=1734" 写法）。
     */
    static std::optional<std::string_view> splitLocationField(std::string_view body, std::string_view& rest) {
        auto colon = body.find(':');
        if (colon == std::string_view::npos) return std::nullopt;
        auto candidate = body.substr(0, colon);
        if (candidate.find('=') != std::string_view::npos ||
            candidate.find(',') != std::string_view::npos) {
            return std::nullopt;
        }
        if (colon + 1 < body.size() && body[colon + 1] == '=') {
            return std::nullopt;
        }
        rest = body.substr(colon + 1);
        return WireUtils::trim(candidate);
    }

    static std::optional<ParseError> parseSensorFields(std::string_view text, SensorSample& sample) {
        std::vector<std::string_view> fields;
        size_t start = 0;
        while (start <= text.size()) {
            auto comma = text.find(',', start);
            auto end = comma == std::string_view::npos ? text.size() : comma;
            auto field = WireUtils::trim(text.substr(start, end - start));
            if (!field.empty()) fields.push_back(field);
            if (comma == std::string_view::npos) break;
            start = comma + 1;
        }

        if (fields.size() != Constants::SENSOR_FIELD_COUNT) {
            return ParseError{ParseErrorKind::FieldCount,
                "expected " + std::to_string(Constants::SENSOR_FIELD_COUNT)
                + " fields, got " + std::to_string(fields.size())};
        }

        bool seenAdc1 = false, seenAdc2 = false, seenFlame = false;
        for (auto field : fields) {
            auto eq = field.find('=');
            if (eq == std::string_view::npos) {
                return ParseError{ParseErrorKind::BadField,
                    "field '" + std::string(field) + "' is not key=value"};
            }
            auto key = WireUtils::trim(field.substr(0, eq));
            while (!key.empty() && key.back() == ':') key.remove_suffix(1);
            auto value = WireUtils::trim(field.substr(eq + 1));

            if (WireUtils::equalsNoCase(key, "ADC1") || WireUtils::equalsNoCase(key, "ADC2")) {
                bool first = WireUtils::equalsNoCase(key, "ADC1");
                bool& seen = first ? seenAdc1 : seenAdc2;
                if (seen) {
                    return ParseError{ParseErrorKind::BadField, "duplicate field " + std::string(key)};
                }
                auto adc = parseAdc(value);
                if (!adc) {
                    return ParseError{ParseErrorKind::BadField,
                        "field " + std::string(key) + " value '" + std::string(value) + "' is not a 12-bit ADC reading"};
                }
                (first ? sample.adc1 : sample.adc2) = *adc;
                seen = true;
            } else if (WireUtils::equalsNoCase(key, "MPY30") || WireUtils::equalsNoCase(key, "FLAME")) {
                if (seenFlame) {
                    return ParseError{ParseErrorKind::BadField, "duplicate flame field"};
                }
                auto flag = parseFlag(value);
                if (!flag) {
                    return ParseError{ParseErrorKind::BadField,
                        "flame flag value '" + std::string(value) + "' is not 0/1/true/false"};
                }
                sample.flameFlag = *flag;
                seenFlame = true;
            } else {
                return ParseError{ParseErrorKind::BadField, "unknown field '" + std::string(key) + "'"};
            }
        }
        return std::nullopt;
    }

    static std::optional<int> parseAdc(std::string_view value) {
        int result = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
        if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
            return std::nullopt;
        }
        if (result < 0 || result > Constants::ADC_MAX) return std::nullopt;
        return result;
    }

    static std::optional<bool> parseFlag(std::string_view value) {
        if (value == "1" || WireUtils::equalsNoCase(value, "true")) return true;
        if (value == "0" || WireUtils::equalsNoCase(value, "false")) return false;
        return std::nullopt;
    }
};

}  // namespace wire
