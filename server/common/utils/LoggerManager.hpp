#pragma once

#include <trantor/utils/AsyncFileLogger.h>
#include <trantor/utils/Logger.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

/**
 * @brief 日志管理器 - 使用 trantor::AsyncFileLogger 异步写盘 + 按日期轮转
 *
 * 文件命名: logs/firewatch_YYYY-MM-DD*.log
 * 轮转策略: 每天自动创建新文件 + 单文件超 100MB 时轮转
 *
 * trantor::Logger 的输出函数是进程级的，因此这里保留静态状态；
 * 其余组件只使用 LOG_* 宏。
 */
class LoggerManager {
private:
    static std::unique_ptr<trantor::AsyncFileLogger> fileLogger_;
    static std::shared_mutex loggerMutex_;
    static std::string logDir_;
    static std::atomic<int> currentDay_;
    static std::atomic<bool> mirrorToConsole_;
    static constexpr uint64_t FILE_SIZE_LIMIT = 100 * 1024 * 1024;  // 100MB
    static constexpr const char* FILE_PREFIX = "firewatch_";

    /** 当天日期 YYYYMMDD */
    static int todayInt() {
        auto now = std::chrono::system_clock::now();
        auto dp = std::chrono::floor<std::chrono::days>(now);
        std::chrono::year_month_day ymd{dp};
        return static_cast<int>(ymd.year()) * 10000
             + static_cast<unsigned>(ymd.month()) * 100
             + static_cast<unsigned>(ymd.day());
    }

    static std::string dayToStr(int day) {
        char buf[11];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                      day / 10000, day % 10000 / 100, day % 100);
        return buf;
    }

    static std::unique_ptr<trantor::AsyncFileLogger> createLogger(int day) {
        auto logger = std::make_unique<trantor::AsyncFileLogger>();
        logger->setFileName(logDir_ + "/" + FILE_PREFIX + dayToStr(day));
        logger->setFileSizeLimit(FILE_SIZE_LIMIT);
        logger->startLogging();
        return logger;
    }

    static void rotateDailyLog(int today) {
        std::unique_ptr<trantor::AsyncFileLogger> oldLogger;
        {
            std::unique_lock lock(loggerMutex_);
            if (today == currentDay_.load(std::memory_order_relaxed)) return;

            oldLogger = std::move(fileLogger_);
            fileLogger_ = createLogger(today);
            currentDay_.store(today, std::memory_order_relaxed);
        }
        // oldLogger 在锁外析构，自动 flush 剩余数据
    }

    static void outputFunction(const char* msg, const uint64_t len) {
        std::string formatted = formatLogMessage(std::string_view(msg, len));

        int today = todayInt();
        if (today != currentDay_.load(std::memory_order_relaxed)) {
            rotateDailyLog(today);
        }

        if (mirrorToConsole_.load(std::memory_order_relaxed)) {
            std::fwrite(formatted.data(), 1, formatted.size(), stdout);
        }

        std::shared_lock lock(loggerMutex_);
        if (fileLogger_) {
            fileLogger_->output(formatted.c_str(), formatted.size());
        }
    }

    static void flushFunction() {
        if (mirrorToConsole_.load(std::memory_order_relaxed)) {
            std::fflush(stdout);
        }
        std::shared_lock lock(loggerMutex_);
        if (fileLogger_) {
            fileLogger_->flush();
        }
    }

public:
    /**
     * @brief 格式化 trantor 原始日志行
     *
     * 原始: "YYYYMMDD HH:MM:SS.micro ThreadID LEVEL [func] message - file:line"
     * 目标: "YYYY-MM-DD HH:MM:SS ThreadID LEVEL message"
     */
    static std::string formatLogMessage(std::string_view raw) {
        std::string logMsg(raw);
        if (logMsg.size() < 17 || logMsg[8] != ' ') return logMsg;

        size_t timeEnd = logMsg.find(' ', 9);
        if (timeEnd == std::string::npos || timeEnd <= 15) return logMsg;

        std::string rest = logMsg.substr(timeEnd);

        // lambda 的函数名 [operator()] 没有信息量
        size_t opStart = rest.find("[operator()");
        if (opStart == std::string::npos) opStart = rest.find("[operator ()");
        if (opStart != std::string::npos) {
            size_t opEnd = rest.find("] ", opStart);
            if (opEnd != std::string::npos) {
                rest = rest.substr(0, opStart) + rest.substr(opEnd + 2);
            }
        }

        size_t filePos = rest.rfind(" - ");
        if (filePos != std::string::npos) {
            std::string_view suffix(rest.data() + filePos + 3, rest.size() - filePos - 3);
            if (suffix.find(".cpp:") != std::string_view::npos ||
                suffix.find(".hpp:") != std::string_view::npos) {
                rest = rest.substr(0, filePos) + "\n";
            }
        }

        return logMsg.substr(0, 4) + "-" + logMsg.substr(4, 2) + "-" + logMsg.substr(6, 2)
             + " " + logMsg.substr(9, 8) + rest;
    }

    /**
     * @brief 日志级别名 → trantor 级别（大小写不敏感）
     */
    static std::optional<trantor::Logger::LogLevel> parseLevel(std::string_view level) {
        std::string upper;
        upper.reserve(level.size());
        for (char c : level) {
            upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
        if (upper == "TRACE") return trantor::Logger::kTrace;
        if (upper == "DEBUG") return trantor::Logger::kDebug;
        if (upper == "INFO") return trantor::Logger::kInfo;
        if (upper == "WARN" || upper == "WARNING") return trantor::Logger::kWarn;
        if (upper == "ERROR") return trantor::Logger::kError;
        if (upper == "FATAL") return trantor::Logger::kFatal;
        return std::nullopt;
    }

    /**
     * @brief 初始化日志系统
     * @param logDir 日志目录路径
     */
    static void initialize(const std::string& logDir) {
        std::filesystem::create_directories(logDir);
        logDir_ = logDir;

        int today = todayInt();
        currentDay_.store(today, std::memory_order_relaxed);
        {
            std::unique_lock lock(loggerMutex_);
            fileLogger_ = createLogger(today);
        }

        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(outputFunction, flushFunction);
        trantor::Logger::setLogLevel(trantor::Logger::kInfo);
    }

    /**
     * @brief 设置日志级别，未知名称保持当前级别
     */
    static void setLogLevel(const std::string& level) {
        if (auto parsed = parseLevel(level)) {
            trantor::Logger::setLogLevel(*parsed);
        }
    }

    static void setConsoleMirror(bool enabled) {
        mirrorToConsole_.store(enabled, std::memory_order_relaxed);
    }

    static void close() {
        std::unique_lock lock(loggerMutex_);
        fileLogger_.reset();
    }
};

// inline 避免多翻译单元 ODR 违规
inline std::unique_ptr<trantor::AsyncFileLogger> LoggerManager::fileLogger_;
inline std::shared_mutex LoggerManager::loggerMutex_;
inline std::string LoggerManager::logDir_;
inline std::atomic<int> LoggerManager::currentDay_{0};
inline std::atomic<bool> LoggerManager::mirrorToConsole_{false};
