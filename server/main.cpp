// mimalloc: 全局替换 new/delete，必须在所有其他 include 之前
#include <mimalloc-new-delete.h>

// Utils
#include "common/AppContext.hpp"
#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/ExceptionHandler.hpp"

// Database
#include "common/database/DatabaseInitializer.hpp"
#include "common/database/DatabaseService.hpp"

// Ingestion
#include "common/network/IngestionServer.hpp"
#include "common/network/IngestionEvents.hpp"
#include "common/network/CommandDispatcher.hpp"
#include "common/protocol/RecordDispatcher.hpp"

// Fusion / Rate
#include "modules/fusion/FusionEngine.hpp"
#include "modules/rate/AdaptiveRateController.hpp"

// Devices
#include "modules/device/DeviceRegistry.hpp"
#include "modules/device/DeviceRepository.hpp"
#include "modules/device/DeviceScheduler.hpp"
#include "modules/device/DeviceStatusTracker.hpp"
#include "modules/device/domain/DeviceEventHandlers.hpp"

// Controllers
#include "modules/device/Device.Controller.hpp"
#include "modules/metrics/Metrics.Controller.hpp"
#include "modules/stream/Stream.Controller.hpp"

#include <iostream>

using namespace drogon;

// ─── 启动错误输出 ──────────────────────────────────────────

/**
 * @brief 输出启动阶段错误到控制台和日志
 */
void printStartupError(const std::string& title, const std::string& detail,
                       const std::vector<std::string>& hints = {}) {
    std::string border(60, '=');
    std::cerr << "\n" << border << "\n";
    std::cerr << " [ERROR] " << title << "\n";
    std::cerr << std::string(60, '-') << "\n";
    std::cerr << "  " << detail << "\n";
    if (!hints.empty()) {
        std::cerr << "\n  请检查:\n";
        for (const auto& hint : hints) {
            std::cerr << "    - " << hint << "\n";
        }
    }
    std::cerr << border << "\n" << std::endl;

    LOG_FATAL << "[Startup] " << title << ": " << detail;
}

/**
 * @brief 根据失败阶段返回排查提示
 */
std::vector<std::string> getStageHints(const std::string& stage) {
    if (stage == "database:ping" || stage == "database:initialize") {
        return {
            "config 中 db_clients 的 filename 是否可写",
            "sqlite3 数据库文件是否被其他进程锁定",
        };
    }
    if (stage == "registry:load") {
        return {
            "pfds_devices 表结构是否与当前版本兼容",
        };
    }
    if (stage == "ingestion:listen") {
        return {
            "custom_config.ingestion.port 是否已被占用",
            "custom_config.ingestion.host 是否为本机地址",
        };
    }
    return {};
}

/**
 * @brief 进程内组件（生命周期与 main 相同）
 */
struct Components {
    explicit Components(AppContext& ctx)
        : ctx(ctx)
        , fusion(ctx)
        , rateController(ctx)
        , records(ctx, [this](const std::string& locationId, const wire::DecodedRecord& record,
                              RecordDispatcher::TimePoint) {
              fusion.ingest(locationId, record);
          })
        , ingestion(ctx, records)
        , repository(ctx.config.scheduler.devicePort)
        , commands(ctx)
        , scheduler(ctx, registry, commands.asDispatchFunction())
        , deviceStatus(ctx, registry) {}

    AppContext& ctx;
    FusionEngine fusion;
    AdaptiveRateController rateController;
    RecordDispatcher records;
    IngestionServer ingestion;
    DeviceRegistry registry;
    DeviceRepository repository;
    CommandDispatcher commands;
    DeviceScheduler scheduler;
    DeviceStatusTracker deviceStatus;
};

/**
 * @brief 事件订阅（在启动任何组件之前）
 */
void registerEventHandlers(Components& c) {
    DeviceEventHandlers::registerAll(c.ctx.eventBus, c.scheduler, c.deviceStatus);
}

/**
 * @brief 服务器启动回调
 */
void onServerStarted(Components& c) {
    auto listeners = app().getListeners();
    std::cout << "firewatch started" << std::endl;
    for (const auto& addr : listeners) {
        std::cout << "  -> http://" << addr.toIpPort() << std::endl;
        LOG_INFO << "[Startup] HTTP listening on http://" << addr.toIpPort();
    }
    std::cout << "Logs: " << c.ctx.config.logDir << "/firewatch_*.log" << std::endl;

    std::string stage = "ingestion:listen";
    try {
        c.records.start();
        c.commands.start();
        c.ingestion.start();
    } catch (const std::exception& e) {
        printStartupError("启动阶段失败: " + stage, e.what(), getStageHints(stage));
        app().getLoop()->queueInLoop([]() { app().quit(); });
        return;
    }

    // 设备注册表加载完成后才启动调度
    async_run([&c]() -> Task<> {
        std::string stage = "startup:init";
        try {
            stage = "database:ping";
            LOG_INFO << "[Startup] " << stage;
            DatabaseService dbHealthCheck;
            co_await dbHealthCheck.ping();

            stage = "database:initialize";
            LOG_INFO << "[Startup] " << stage;
            co_await DatabaseInitializer::initialize();

            stage = "registry:load";
            LOG_INFO << "[Startup] " << stage;
            c.registry.replaceAll(co_await c.repository.loadAll());
            c.deviceStatus.sync();

            stage = "scheduler:start";
            LOG_INFO << "[Startup] " << stage;
            c.scheduler.start(app().getLoop());
            c.deviceStatus.start(app().getLoop());

            LOG_INFO << "[Startup] bootstrap completed";
        } catch (const std::exception& e) {
            printStartupError("启动阶段失败: " + stage, e.what(), getStageHints(stage));
            app().getLoop()->queueInLoop([]() {
                app().quit();
            });
        }
    });
}

/**
 * @brief 服务器退出回调
 */
void onServerStopping(Components& c) {
    LOG_INFO << "[Shutdown] Server is stopping, cleaning up resources...";

    // 1. 停止调度并等待在途指令（下发线程池仍在运行）
    c.deviceStatus.stop();
    c.scheduler.stop(std::chrono::milliseconds(c.ctx.config.scheduler.ackTimeoutMs + 500));

    // 2. 停止接入，再排空融合队列
    c.ingestion.stop();
    if (!c.records.waitUntilIdle(std::chrono::milliseconds(2000))) {
        LOG_WARN << "[Shutdown] Fusion queues not drained before timeout";
    }
    c.records.stop();

    // 3. 停止下发线程池
    c.commands.stop();

    // 4. 注销所有事件处理器
    c.ctx.eventBus.unsubscribeAll();

    LOG_INFO << "[Shutdown] All resources cleaned up";
}

int main() {
    // 0. 验证 mimalloc 已激活
    int v = mi_version();
    std::cout << "mimalloc v" << (v / 100) << "." << (v % 100) << " active" << std::endl;

    // 1. 初始化日志系统（配置加载前先写默认目录，保证配置错误也有记录）
    LoggerManager::initialize("./logs");

    // 2. 加载并验证配置文件（失败时 ConfigManager 已输出详细错误）
    auto config = ConfigManager::load();
    if (!config) {
        std::cerr << "Server startup aborted due to configuration errors." << std::endl;
        return 1;
    }

    // 3. 应用日志配置
    if (config->logDir != "./logs") {
        LoggerManager::initialize(config->logDir);
    }
    LoggerManager::setLogLevel(config->logLevel);
    LoggerManager::setConsoleMirror(config->consoleLog);

    // 4. 构造进程上下文与组件
    AppContext ctx(std::move(*config));
    Components components(ctx);
    registerEventHandlers(components);

    // 5. 设置全局异常处理
    AppExceptionHandler::setup();

    // 6. 注册控制器（依赖注入，不自动创建）
    app().registerController(std::make_shared<DeviceController>(
        ctx, components.repository, components.registry, components.scheduler, components.deviceStatus));
    app().registerController(std::make_shared<MetricsController>(ctx));
    app().registerController(std::make_shared<StreamController>(
        components.fusion, components.rateController));

    // 7. 注册启动回调
    app().registerBeginningAdvice([&components]() {
        try {
            DatabaseService dbService;
            if (!dbService.getClient()) {
                printStartupError("数据库客户端不可用",
                    "Drogon 未能创建 DB 客户端 'default'", getStageHints("database:ping"));
                std::exit(1);
            }
        } catch (const std::exception& e) {
            printStartupError("数据库客户端初始化失败", e.what(), getStageHints("database:ping"));
            std::exit(1);
        }

        onServerStarted(components);
    });

    // 8. 启动服务器
    app().run();

    // 9. 服务器退出后清理资源
    onServerStopping(components);
    LoggerManager::close();

    return 0;
}
