#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 0: 成功
 * - 1xxx: 客户端错误（请求参数、资源不存在、冲突等）
 * - 3xxx: 报文解析错误（不抛出，随 ParseError 返回）
 * - 4xxx: 指令下发错误（不抛出，随 CommandOutcome 返回）
 * - 5xxx: 服务器内部错误
 */
namespace ErrorCodes {

// ==================== 成功 ====================

/** 操作成功 */
inline constexpr int SUCCESS = 0;

// ==================== 客户端错误 (1xxx) ====================

/** 资源不存在 */
inline constexpr int NOT_FOUND = 1001;

/** 请求参数错误 */
inline constexpr int BAD_REQUEST = 1002;

/** 数据冲突（如设备 ID 重复） */
inline constexpr int CONFLICT = 1004;

/** 配置或参数校验失败 */
inline constexpr int VALIDATION_FAILED = 1005;

// ==================== 报文解析错误 (3xxx) ====================

/** 空报文 */
inline constexpr int PARSE_EMPTY = 3001;

/** 帧格式错误（缺少 # / ! / :） */
inline constexpr int PARSE_FRAMING = 3002;

/** 未知报文类型 */
inline constexpr int PARSE_UNKNOWN_TAG = 3003;

/** 十六进制内容非法 */
inline constexpr int PARSE_BAD_HEX = 3004;

/** 热成像像素数量不符 */
inline constexpr int PARSE_CELL_COUNT = 3005;

/** 传感器字段数量不符 */
inline constexpr int PARSE_FIELD_COUNT = 3006;

/** 传感器字段内容非法 */
inline constexpr int PARSE_BAD_FIELD = 3007;

/** 位置标识非法 */
inline constexpr int PARSE_BAD_IDENTITY = 3008;

/** 报文超长 */
inline constexpr int PARSE_OVERSIZED = 3009;

// ==================== 指令下发错误 (4xxx) ====================

/** 设备拒绝连接或不可达 */
inline constexpr int DISPATCH_UNREACHABLE = 4001;

/** 应答超时 */
inline constexpr int DISPATCH_TIMEOUT = 4002;

/** 应答前连接被关闭 */
inline constexpr int DISPATCH_CLOSED = 4003;

/** 设备地址无效 */
inline constexpr int DISPATCH_INVALID_TARGET = 4004;

// ==================== 服务器错误 (5xxx) ====================

/** 服务器内部错误 */
inline constexpr int INTERNAL_ERROR = 5000;

/** 数据库错误 */
inline constexpr int DATABASE_ERROR = 5001;

}  // namespace ErrorCodes
