#pragma once

#include "common/domain/DomainEvent.hpp"
#include "FusionTypes.hpp"

// ==================== 融合告警事件 ====================

struct AlarmRaised : DomainEvent {
    FusionResult result;

    AlarmRaised(std::string locationId, FusionResult r)
        : DomainEvent("AlarmRaised", std::move(locationId), "Location")
        , result(std::move(r)) {}
};

struct AlarmCleared : DomainEvent {
    FusionResult result;

    AlarmCleared(std::string locationId, FusionResult r)
        : DomainEvent("AlarmCleared", std::move(locationId), "Location")
        , result(std::move(r)) {}
};
