#pragma once

#include "Wire.Types.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace wire {

/**
 * @brief 报文协议工具函数
 */
class WireUtils {
private:
    /**
     * @brief 预生成的 HEX 查找表（O(1) 查表替代格式化）
     */
    struct HexTable {
        char digits[16]{};
        int8_t values[256]{};
        HexTable() {
            const char* hex = "0123456789ABCDEF";
            for (int i = 0; i < 16; ++i) digits[i] = hex[i];
            for (int i = 0; i < 256; ++i) values[i] = -1;
            for (int i = 0; i < 10; ++i) values['0' + i] = static_cast<int8_t>(i);
            for (int i = 0; i < 6; ++i) {
                values['A' + i] = static_cast<int8_t>(10 + i);
                values['a' + i] = static_cast<int8_t>(10 + i);
            }
        }
    };
    static inline const HexTable hexTable_{};

public:
    /**
     * @brief 解析 4 个十六进制字符为 16 位字
     * @return 含非法字符时返回 nullopt
     */
    static std::optional<uint16_t> parseWord(std::string_view text) {
        if (text.size() != Constants::HEX_CHARS_PER_CELL) return std::nullopt;
        uint16_t value = 0;
        for (char c : text) {
            int8_t nibble = hexTable_.values[static_cast<unsigned char>(c)];
            if (nibble < 0) return std::nullopt;
            value = static_cast<uint16_t>((value << 4) | nibble);
        }
        return value;
    }

    /** 16 位字转 4 位大写 HEX */
    static void appendWord(std::string& out, uint16_t word) {
        out += hexTable_.digits[(word >> 12) & 0x0F];
        out += hexTable_.digits[(word >> 8) & 0x0F];
        out += hexTable_.digits[(word >> 4) & 0x0F];
        out += hexTable_.digits[word & 0x0F];
    }

    static std::string_view trim(std::string_view text) {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        return text;
    }

    /** 忽略大小写的前缀匹配 */
    static bool startsWithNoCase(std::string_view text, std::string_view prefix) {
        if (text.size() < prefix.size()) return false;
        for (size_t i = 0; i < prefix.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(text[i])) !=
                std::tolower(static_cast<unsigned char>(prefix[i]))) {
                return false;
            }
        }
        return true;
    }

    static bool equalsNoCase(std::string_view a, std::string_view b) {
        return a.size() == b.size() && startsWithNoCase(a, b);
    }

    static bool containsSpace(std::string_view text) {
        for (char c : text) {
            if (std::isspace(static_cast<unsigned char>(c))) return true;
        }
        return false;
    }

    /**
     * @brief 位置标识校验：1-64 字符，允许内部空格（如 "default room"）
     *
     * 调用方先 trim；首尾空白、控制字符以及 ':'、'!'、'#' 均不合法。
     */
    static bool isValidLocationId(std::string_view id) {
        if (id.empty() || id.size() > Constants::LOCATION_ID_MAX_LENGTH) return false;
        if (trim(id).size() != id.size()) return false;
        for (char c : id) {
            if (std::iscntrl(static_cast<unsigned char>(c)) || c == ':' || c == '!' || c == '#') {
                return false;
            }
        }
        return true;
    }

    /**
     * @brief 原始字按标定转温度
     */
    static double calibrate(uint16_t raw, bool isSigned, double scale, double offset) {
        double value = isSigned
            ? static_cast<double>(static_cast<int16_t>(raw))
            : static_cast<double>(raw);
        return value * scale + offset;
    }
};

/**
 * @brief 流式分帧结果
 */
struct PacketSlice {
    enum class Status {
        NeedMore,     // 缓冲区内没有完整报文
        Complete,     // packet 有效，consumed 为需要移除的字节数（含换行）
        Oversized     // 超长且无换行，调用方应丢弃缓冲区
    };

    Status status = Status::NeedMore;
    std::string_view packet;
    size_t consumed = 0;
};

/**
 * @brief 从流缓冲区中切出一条报文（以 '\n' 结尾，容忍 "\r\n"）
 *
 * 只切分不解析，一次最多返回一条报文。
 */
inline PacketSlice nextPacket(std::string_view buffer, size_t maxPacketBytes) {
    PacketSlice slice;
    auto pos = buffer.find('\n');
    if (pos == std::string_view::npos) {
        if (buffer.size() > maxPacketBytes) {
            slice.status = PacketSlice::Status::Oversized;
            slice.consumed = buffer.size();
        }
        return slice;
    }

    slice.consumed = pos + 1;
    std::string_view line = buffer.substr(0, pos);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.size() > maxPacketBytes) {
        slice.status = PacketSlice::Status::Oversized;
        return slice;
    }
    slice.status = PacketSlice::Status::Complete;
    slice.packet = line;
    return slice;
}

}  // namespace wire
