#pragma once

/**
 * @brief 现场单元文本报文协议
 *
 * 包含:
 * - Wire.Types.hpp   - 记录与错误类型
 * - Wire.Utils.hpp   - 工具函数（HEX 查表、标定、流式分帧）
 * - Wire.Parser.hpp  - 报文解析器
 * - Wire.Builder.hpp - 报文构建器
 */

#include "Wire.Types.hpp"
#include "Wire.Utils.hpp"
#include "Wire.Parser.hpp"
#include "Wire.Builder.hpp"
