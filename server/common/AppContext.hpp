#pragma once

#include "common/domain/EventBus.hpp"
#include "common/metrics/MetricsCollector.hpp"
#include "common/utils/AppConfig.hpp"

/**
 * @brief 进程级上下文
 *
 * main 中构造一次，以引用传入各组件构造函数；
 * 组件之间共享的配置、指标与事件总线都经由它访问，不使用全局单例。
 */
struct AppContext {
    explicit AppContext(AppConfig cfg) : config(std::move(cfg)) {}

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    const AppConfig config;
    MetricsCollector metrics;
    EventBus eventBus;
};
