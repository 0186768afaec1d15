#pragma once

#include "DomainEvent.hpp"

#include <trantor/utils/Logger.h>

#include <functional>
#include <map>
#include <shared_mutex>
#include <typeindex>
#include <vector>

/**
 * @brief 事件处理器类型
 */
using EventHandler = std::function<void(const DomainEvent&)>;

/**
 * @brief 事件总线 - 发布订阅模式
 *
 * 发布方在自己的线程上同步调用订阅者（融合消费线程、下发 IO 线程），
 * 订阅者应只做轻量工作；耗时操作自行投递到其他 EventLoop。
 * 单个订阅者抛出的异常被记录后隔离，不影响其他订阅者与发布方。
 *
 * 使用示例：
 * @code
 * ctx.eventBus.subscribe<AlarmRaised>([](const AlarmRaised& e) {
 *     LOG_WARN << "[Alarm] " << e.aggregateId << " confidence=" << e.result.confidence;
 * });
 * ctx.eventBus.publish(AlarmRaised{locationId, result});
 * @endcode
 */
class EventBus {
public:
    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief 发布事件
     */
    template<typename E>
    void publish(const E& event) {
        static_assert(std::is_base_of_v<DomainEvent, E>, "E must derive from DomainEvent");

        LOG_TRACE << "EventBus: Publishing " << event.type
                  << " for " << event.aggregateType << "#" << event.aggregateId;

        std::vector<EventHandler> handlers;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(E)));
            if (it == handlers_.end()) return;
            handlers = it->second;
        }

        for (const auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                LOG_ERROR << "EventBus: Handler failed for " << event.type
                          << ": " << e.what();
            }
        }
    }

    /**
     * @brief 订阅事件
     */
    template<typename E>
    void subscribe(std::function<void(const E&)> handler) {
        static_assert(std::is_base_of_v<DomainEvent, E>, "E must derive from DomainEvent");

        std::unique_lock lock(mutex_);
        handlers_[std::type_index(typeid(E))].push_back(
            [handler = std::move(handler)](const DomainEvent& e) {
                handler(static_cast<const E&>(e));
            }
        );
    }

    /**
     * @brief 注销所有事件处理器（服务关闭时调用）
     */
    void unsubscribeAll() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
        LOG_INFO << "EventBus: All handlers unsubscribed";
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::type_index, std::vector<EventHandler>> handlers_;
};
