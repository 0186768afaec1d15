#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief 全局常量定义
 *
 * 集中管理项目中的魔法数字，提高可维护性和可读性
 */
namespace Constants {

// ==================== 热成像帧 ====================

/** 热成像宽度（列） */
inline constexpr int THERMAL_WIDTH = 32;

/** 热成像高度（行） */
inline constexpr int THERMAL_HEIGHT = 24;

/** 热成像像素数 */
inline constexpr size_t THERMAL_CELLS = THERMAL_WIDTH * THERMAL_HEIGHT;

/** 设备附带的标定区字数（完整帧 = 768 + 66 字） */
inline constexpr size_t THERMAL_TRAILER_WORDS = 66;

/** 每个像素的十六进制字符数 */
inline constexpr size_t HEX_CHARS_PER_CELL = 4;

// ==================== 传感器 ====================

/** 12 位 ADC 满量程 */
inline constexpr int ADC_MAX = 4095;

/** 传感器报文字段数 */
inline constexpr size_t SENSOR_FIELD_COUNT = 3;

/** 位置标识最大长度 */
inline constexpr size_t LOCATION_ID_MAX_LENGTH = 64;

// ==================== 接入服务 ====================

/** 默认接入端口 */
inline constexpr uint16_t DEFAULT_INGESTION_PORT = 9001;

/** 单条报文最大字节数 */
inline constexpr size_t DEFAULT_MAX_PACKET_BYTES = 16384;

/** 每个位置的交接队列容量 */
inline constexpr size_t DEFAULT_QUEUE_CAPACITY = 64;

/** 空闲连接超时（秒） */
inline constexpr int DEFAULT_IDLE_TIMEOUT_SEC = 30;

/** 融合消费者单次最多处理的记录数（超过后让出 EventLoop） */
inline constexpr size_t FUSION_DRAIN_BATCH = 32;

// ==================== 设备调度 ====================

/** 轮询间隔下限（秒） */
inline constexpr int POLL_INTERVAL_MIN_SEC = 1;

/** 轮询间隔上限（秒） */
inline constexpr int POLL_INTERVAL_MAX_SEC = 3600;

/** 设备默认指令端口 */
inline constexpr uint16_t DEFAULT_DEVICE_PORT = 9001;

/** 指令应答超时（毫秒） */
inline constexpr int DEFAULT_ACK_TIMEOUT_MS = 3000;

/** PERIOD_ON 失败后的重试节奏（秒） */
inline constexpr double PERIOD_ON_RETRY_SEC = 30.0;

/** PERIOD_ON 重试节奏上限（秒） */
inline constexpr double PERIOD_ON_RETRY_MAX_SEC = 300.0;

/** 同一设备下发失败日志的最小间隔（秒） */
inline constexpr double FAILURE_LOG_INTERVAL_SEC = 300.0;

/** 设备无任何活动超过该时长即判定离线（秒） */
inline constexpr double DEVICE_OFFLINE_TIMEOUT_SEC = 30.0;

// ==================== 设备模式 ====================

/** 连续上报模式 */
inline constexpr const char* DEVICE_MODE_CONTINUOUS = "Continuous";

/** 按需模式 */
inline constexpr const char* DEVICE_MODE_ON_DEMAND = "On Demand";

// ==================== 指令 ====================

inline constexpr const char* COMMAND_REQUEST1 = "REQUEST1";
inline constexpr const char* COMMAND_PERIOD_ON = "PERIOD_ON";

// ==================== 指标 ====================

/** Prometheus 指标名前缀 */
inline constexpr const char* METRICS_PREFIX = "firewatch_";

}  // namespace Constants
