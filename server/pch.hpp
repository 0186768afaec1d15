// 预编译头文件 (PCH)
// 仅包含稳定的标准库和第三方库头文件
// 不包含项目内部头文件（变化频繁会导致 PCH 频繁重建）
#pragma once

// ==================== C++ 标准库 ====================

// 容器
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <set>
#include <array>
#include <deque>
#include <unordered_map>
#include <variant>

// 工具
#include <functional>
#include <optional>
#include <memory>
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <atomic>
#include <typeindex>

// IO / 格式化
#include <sstream>
#include <iomanip>
#include <iostream>
#include <fstream>
#include <filesystem>

// 其他
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <ctime>
#include <algorithm>
#include <numeric>
#include <utility>
#include <cctype>
#include <exception>
#include <stdexcept>

// ==================== Drogon / Trantor 框架 ====================

#include <drogon/drogon.h>
#include <drogon/HttpController.h>
#include <drogon/HttpAppFramework.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>
#include <drogon/orm/DbClient.h>

#include <trantor/net/TcpServer.h>
#include <trantor/net/TcpClient.h>
#include <trantor/net/EventLoopThread.h>
#include <trantor/net/EventLoopThreadPool.h>
#include <trantor/utils/AsyncFileLogger.h>
#include <trantor/utils/Logger.h>

// ==================== 第三方库 ====================

#include <json/json.h>
