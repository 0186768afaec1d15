#pragma once

#include "AppConfig.hpp"
#include "LoggerManager.hpp"
#include "common/protocol/wire/Wire.Utils.hpp"
#include "modules/fusion/ConfidencePolicy.hpp"

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * @brief 配置管理器 - 负责加载、验证并提取应用配置
 *
 * 启动时检查配置文件的完整性和正确性：
 * - JSON 语法检查
 * - Drogon 必填段（listeners、db_clients）
 * - custom_config 各段的类型与取值，由各配置结构的 validate() 判定
 *
 * 错误全部收集后一次性输出，任一错误都会中止启动；
 * 成功时返回类型化的 AppConfig，由 main 放入 AppContext。
 */
class ConfigManager {
public:
    /**
     * @brief 提取结果：配置 + 收集到的错误与警告
     */
    struct Extraction {
        AppConfig config;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        bool ok() const { return errors.empty(); }
    };

    /**
     * @brief 查找、验证并加载配置文件
     * @return 失败时为空，已输出详细错误信息到 stderr 和日志
     */
    static std::optional<AppConfig> load() {
        auto configPath = findConfigFile();
        if (!configPath) {
            return std::nullopt;
        }
        return loadFrom(*configPath);
    }

    static std::optional<AppConfig> loadFrom(const std::string& path) {
        Json::Value root;
        if (!parseConfigFile(path, root)) {
            return std::nullopt;
        }

        auto extraction = extract(root);
        extraction.config.configPath = path;

        if (!extraction.warnings.empty()) {
            printWarnings("配置警告 (" + path + ")", extraction.warnings);
        }
        if (!extraction.ok()) {
            printErrors("配置验证失败: " + path, extraction.errors);
            return std::nullopt;
        }

        try {
            drogon::app().loadConfigFile(path);
        } catch (const std::exception& e) {
            printErrors("Drogon 加载配置失败", {e.what()});
            return std::nullopt;
        }

        LOG_INFO << "[Config] Loaded from " << path;
        return std::move(extraction.config);
    }

    /**
     * @brief 从已解析的 JSON 提取并验证配置（不触碰 Drogon）
     */
    static Extraction extract(const Json::Value& root) {
        Extraction out;
        if (!root.isObject()) {
            out.errors.emplace_back("配置文件根节点必须是 JSON 对象");
            return out;
        }

        validateListeners(root, out.errors);
        validateDbClients(root, out.errors);

        if (!root.isMember("custom_config")) {
            out.warnings.emplace_back("[custom_config] 未配置，全部使用默认值");
            return out;
        }
        const auto& custom = root["custom_config"];
        if (!custom.isObject()) {
            out.errors.emplace_back("[custom_config] 必须是 JSON 对象");
            return out;
        }

        static const std::set<std::string> knownKeys = {
            "log_level", "log_dir", "console_log", "ingestion", "calibration", "fusion",
            "gas_sensor", "rate_controller", "streams", "scheduler"
        };
        for (const auto& key : custom.getMemberNames()) {
            if (!knownKeys.count(key)) {
                out.warnings.push_back("[custom_config] 未知配置项将被忽略: " + key);
            }
        }

        Reader reader{out.errors};
        auto& cfg = out.config;

        reader.string(custom, "log_level", "custom_config", cfg.logLevel);
        if (!LoggerManager::parseLevel(cfg.logLevel)) {
            out.errors.push_back("[custom_config] log_level 无效: " + cfg.logLevel
                                 + "（可选: TRACE / DEBUG / INFO / WARN / ERROR / FATAL）");
        }
        reader.string(custom, "log_dir", "custom_config", cfg.logDir);
        reader.boolean(custom, "console_log", "custom_config", cfg.consoleLog);

        extractIngestion(custom, reader, cfg.ingestion, out.errors);
        extractCalibration(custom, reader, cfg.calibration, out.errors);
        extractFusion(custom, reader, cfg.fusion, out.errors);
        extractGasSensor(custom, reader, cfg.gasSensor, out.errors);
        extractRateController(custom, reader, cfg.rateController, out.errors);
        extractStreams(custom, cfg.streams, out.errors);
        extractScheduler(custom, reader, cfg.scheduler, out.errors);

        checkPortClash(root, cfg, out.errors);
        return out;
    }

private:
    /**
     * @brief 带类型检查的字段读取，缺失时保留默认值
     */
    struct Reader {
        std::vector<std::string>& errors;

        bool present(const Json::Value& obj, const char* key) const {
            return obj.isMember(key) && !obj[key].isNull();
        }

        void number(const Json::Value& obj, const char* key, const std::string& section, double& target) {
            if (!present(obj, key)) return;
            if (!obj[key].isNumeric()) {
                errors.push_back("[" + section + "] " + key + " 必须是数字");
                return;
            }
            target = obj[key].asDouble();
        }

        void integer(const Json::Value& obj, const char* key, const std::string& section, int& target) {
            if (!present(obj, key)) return;
            if (!obj[key].isInt()) {
                errors.push_back("[" + section + "] " + key + " 必须是整数");
                return;
            }
            target = obj[key].asInt();
        }

        void count(const Json::Value& obj, const char* key, const std::string& section, size_t& target) {
            if (!present(obj, key)) return;
            if (!obj[key].isUInt()) {
                errors.push_back("[" + section + "] " + key + " 必须是非负整数");
                return;
            }
            target = obj[key].asUInt();
        }

        void port(const Json::Value& obj, const char* key, const std::string& section, uint16_t& target) {
            if (!present(obj, key)) return;
            if (!obj[key].isInt() || obj[key].asInt() < 1 || obj[key].asInt() > 65535) {
                errors.push_back("[" + section + "] " + key + " 值无效（有效范围: 1-65535）");
                return;
            }
            target = static_cast<uint16_t>(obj[key].asInt());
        }

        void string(const Json::Value& obj, const char* key, const std::string& section, std::string& target) {
            if (!present(obj, key)) return;
            if (!obj[key].isString()) {
                errors.push_back("[" + section + "] " + key + " 必须是字符串");
                return;
            }
            target = obj[key].asString();
        }

        void boolean(const Json::Value& obj, const char* key, const std::string& section, bool& target) {
            if (!present(obj, key)) return;
            if (!obj[key].isBool()) {
                errors.push_back("[" + section + "] " + key + " 必须是布尔值");
                return;
            }
            target = obj[key].asBool();
        }

        /** 取子对象；缺失时返回 null，类型错误时记录错误 */
        const Json::Value* section(const Json::Value& custom, const char* key) {
            if (!present(custom, key)) return nullptr;
            if (!custom[key].isObject()) {
                errors.push_back(std::string("[") + key + "] 必须是 JSON 对象");
                return nullptr;
            }
            return &custom[key];
        }
    };

    template<typename Section>
    static void runValidate(const Section& section, std::vector<std::string>& errors) {
        try {
            section.validate();
        } catch (const ValidationException& e) {
            errors.push_back(e.getMessage());
        }
    }

    // ─── custom_config 各段 ──────────────────────────────────────

    static void extractIngestion(const Json::Value& custom, Reader& r, IngestionConfig& c,
                                 std::vector<std::string>& errors) {
        if (const auto* s = r.section(custom, "ingestion")) {
            r.string(*s, "host", "ingestion", c.host);
            r.port(*s, "port", "ingestion", c.port);
            r.count(*s, "io_threads", "ingestion", c.ioThreads);
            r.count(*s, "fusion_threads", "ingestion", c.fusionThreads);
            r.count(*s, "queue_capacity", "ingestion", c.queueCapacity);
            r.count(*s, "max_packet_bytes", "ingestion", c.maxPacketBytes);
            r.integer(*s, "idle_timeout_seconds", "ingestion", c.idleTimeoutSeconds);
            r.string(*s, "greeting", "ingestion", c.greeting);
        }
        runValidate(c, errors);
    }

    static void extractCalibration(const Json::Value& custom, Reader& r, ThermalCalibration& c,
                                   std::vector<std::string>& errors) {
        if (const auto* s = r.section(custom, "calibration")) {
            r.boolean(*s, "signed", "calibration", c.isSigned);
            r.number(*s, "scale", "calibration", c.scale);
            r.number(*s, "offset", "calibration", c.offset);
        }
        runValidate(c, errors);
    }

    static void extractFusion(const Json::Value& custom, Reader& r, FusionConfig& c,
                              std::vector<std::string>& errors) {
        if (const auto* s = r.section(custom, "fusion")) {
            r.number(*s, "temp_threshold", "fusion", c.tempThreshold);
            r.number(*s, "gas_threshold", "fusion", c.gasThreshold);
            r.number(*s, "smoke_threshold", "fusion", c.smokeThreshold);
            r.number(*s, "flame_threshold", "fusion", c.flameThreshold);
            r.number(*s, "vision_threshold", "fusion", c.visionThreshold);
            r.integer(*s, "min_sources", "fusion", c.minSources);
            r.number(*s, "hold_seconds", "fusion", c.holdSeconds);
            r.number(*s, "hot_cell_decay_seconds", "fusion", c.hotCellDecaySeconds);
            r.string(*s, "confidence_policy", "fusion", c.confidencePolicy);

            if (r.present(*s, "weights")) {
                const auto& weights = (*s)["weights"];
                if (!weights.isObject()) {
                    errors.emplace_back("[fusion] weights 必须是 JSON 对象");
                } else {
                    for (const auto& source : weights.getMemberNames()) {
                        if (!weights[source].isNumeric()) {
                            errors.push_back("[fusion] 权重必须是数字: " + source);
                            continue;
                        }
                        c.weights[source] = weights[source].asDouble();
                    }
                }
            }
        }
        runValidate(c, errors);

        try {
            makeConfidencePolicy(c);
        } catch (const ValidationException& e) {
            errors.push_back(e.getMessage());
        }
    }

    static void extractGasSensor(const Json::Value& custom, Reader& r, GasSensorConfig& c,
                                 std::vector<std::string>& errors) {
        if (const auto* s = r.section(custom, "gas_sensor")) {
            r.number(*s, "curve_a", "gas_sensor", c.curveA);
            r.number(*s, "curve_b", "gas_sensor", c.curveB);
            r.number(*s, "load_resistance", "gas_sensor", c.loadResistance);
            r.number(*s, "supply_voltage", "gas_sensor", c.supplyVoltage);
            r.number(*s, "r0", "gas_sensor", c.r0);
            r.integer(*s, "adc_resolution", "gas_sensor", c.adcResolution);
        }
        runValidate(c, errors);
    }

    static void extractRateController(const Json::Value& custom, Reader& r, RateControllerConfig& c,
                                      std::vector<std::string>& errors) {
        if (const auto* s = r.section(custom, "rate_controller")) {
            r.number(*s, "base_fps", "rate_controller", c.baseFps);
            r.number(*s, "min_fps", "rate_controller", c.minFps);
            r.number(*s, "max_fps", "rate_controller", c.maxFps);
            r.integer(*s, "high_watermark", "rate_controller", c.highWatermark);
            r.integer(*s, "low_watermark", "rate_controller", c.lowWatermark);
            r.number(*s, "adjustment_cooldown", "rate_controller", c.cooldownSeconds);
        }
        runValidate(c, errors);
    }

    static void extractStreams(const Json::Value& custom, std::map<std::string, std::string>& streams,
                               std::vector<std::string>& errors) {
        if (!custom.isMember("streams") || custom["streams"].isNull()) return;
        const auto& node = custom["streams"];
        if (!node.isObject()) {
            errors.emplace_back("[streams] 必须是 JSON 对象（stream_id → location_id）");
            return;
        }
        for (const auto& streamId : node.getMemberNames()) {
            const auto& loc = node[streamId];
            if (!loc.isString() || !wire::WireUtils::isValidLocationId(loc.asString())) {
                errors.push_back("[streams] " + streamId + " 的位置标识无效");
                continue;
            }
            streams[streamId] = loc.asString();
        }
    }

    static void extractScheduler(const Json::Value& custom, Reader& r, SchedulerConfig& c,
                                 std::vector<std::string>& errors) {
        if (const auto* s = r.section(custom, "scheduler")) {
            r.number(*s, "tick_seconds", "scheduler", c.tickSeconds);
            r.integer(*s, "ack_timeout_ms", "scheduler", c.ackTimeoutMs);
            r.port(*s, "device_port", "scheduler", c.devicePort);
            r.number(*s, "period_on_retry_seconds", "scheduler", c.periodOnRetrySeconds);
            r.number(*s, "period_on_retry_growth", "scheduler", c.periodOnRetryGrowth);
            r.number(*s, "period_on_retry_max_seconds", "scheduler", c.periodOnRetryMaxSeconds);
            r.number(*s, "failure_log_interval_seconds", "scheduler", c.failureLogIntervalSeconds);
            r.number(*s, "offline_timeout_seconds", "scheduler", c.offlineTimeoutSeconds);
            r.count(*s, "dispatch_threads", "scheduler", c.dispatchThreads);
        }
        runValidate(c, errors);
    }

    // ─── Drogon 段 ──────────────────────────────────────────────

    static void validateListeners(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("listeners") || !root["listeners"].isArray() || root["listeners"].empty()) {
            errors.emplace_back("[listeners] 缺少监听配置，需要至少一个监听地址");
            return;
        }

        for (Json::ArrayIndex i = 0; i < root["listeners"].size(); ++i) {
            const auto& item = root["listeners"][i];
            auto prefix = "[listeners[" + std::to_string(i) + "]] ";

            if (!item.isMember("address") || !item["address"].isString() ||
                item["address"].asString().empty()) {
                errors.push_back(prefix + "缺少 address 字段");
            }

            validatePort(item, prefix, errors);
        }
    }

    static void validateDbClients(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("db_clients") || !root["db_clients"].isArray() ||
            root["db_clients"].empty()) {
            errors.emplace_back("[db_clients] 缺少数据库配置，设备注册表需要一个 sqlite3 连接");
            return;
        }

        for (Json::ArrayIndex i = 0; i < root["db_clients"].size(); ++i) {
            const auto& db = root["db_clients"][i];
            auto prefix = "[db_clients[" + std::to_string(i) + "]] ";

            for (const char* field : {"name", "rdbms"}) {
                if (!db.isMember(field) || !db[field].isString() || db[field].asString().empty()) {
                    errors.push_back(prefix + "缺少必填字段: " + field);
                }
            }
            if (db.get("rdbms", "").asString() == "sqlite3") {
                if (!db.isMember("filename") || !db["filename"].isString() ||
                    db["filename"].asString().empty()) {
                    errors.push_back(prefix + "sqlite3 需要 filename 字段");
                }
            } else {
                for (const char* field : {"host", "dbname", "user"}) {
                    if (!db.isMember(field) || !db[field].isString() || db[field].asString().empty()) {
                        errors.push_back(prefix + "缺少必填字段: " + field);
                    }
                }
                validatePort(db, prefix, errors);
            }
        }
    }

    /** 接入端口不能与 HTTP 监听端口重复 */
    static void checkPortClash(const Json::Value& root, const AppConfig& cfg, std::vector<std::string>& errors) {
        if (!root.isMember("listeners") || !root["listeners"].isArray()) return;
        for (const auto& item : root["listeners"]) {
            if (item.isMember("port") && item["port"].isInt() &&
                item["port"].asInt() == static_cast<int>(cfg.ingestion.port)) {
                errors.push_back("[ingestion] port " + std::to_string(cfg.ingestion.port)
                                 + " 与 HTTP 监听端口冲突");
            }
        }
    }

    // ─── 文件 ──────────────────────────────────────────────────

    static std::optional<std::string> findConfigFile() {
        static const std::vector<std::string> paths = {
            "./config/config.local.json",
            "../../config/config.local.json",
            "../config/config.local.json",
            "./config/config.json",
            "../../config/config.json",
            "../config/config.json",
            "config.json"
        };

        for (const auto& path : paths) {
            if (std::filesystem::exists(path)) {
                return path;
            }
        }

        std::vector<std::string> hints = {"请在以下位置之一创建配置文件:"};
        for (const auto& p : paths) {
            hints.push_back("  - " + p);
        }
        printErrors("未找到配置文件", hints);
        return std::nullopt;
    }

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printErrors("无法打开配置文件: " + path, {"请检查文件是否存在及读取权限"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            printErrors("JSON 解析失败: " + path, {
                errs,
                "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"
            });
            return false;
        }
        return true;
    }

    // ─── 工具方法 ──────────────────────────────────────────────

    static void validatePort(const Json::Value& obj, const std::string& prefix,
                             std::vector<std::string>& errors) {
        if (!obj.isMember("port") || !obj["port"].isNumeric()) {
            errors.push_back(prefix + "缺少 port 字段");
        } else {
            int port = obj["port"].asInt();
            if (port < 1 || port > 65535) {
                errors.push_back(prefix + "port 值无效: " +
                    std::to_string(port) + "（有效范围: 1-65535）");
            }
        }
    }

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        std::string border(60, '=');
        std::cerr << "\n" << border << "\n";
        std::cerr << " [ERROR] " << title << "\n";
        std::cerr << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] " << msg;
        }
        std::cerr << border << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '-') << "\n";
        std::cerr << " [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::string(60, '-') << "\n" << std::endl;
    }
};
