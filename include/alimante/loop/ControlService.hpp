#pragma once
// include/alimante/loop/ControlService.hpp
//
// The hardware-facing collaborator driven by MainLoop. Implementations own
// sensor drivers and actuators; the loop only sees this interface.

#include "alimante/config/Config.hpp"
#include "alimante/events/EventBus.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>

namespace alimante::loop {

using json = nlohmann::json;

class ControlService {
public:
    virtual ~ControlService() = default;

    virtual bool Initialize() = 0;
    virtual bool Start() = 0;
    virtual void Stop() = 0;

    // One control step: read inputs, drive outputs. Called once per cycle.
    virtual void Update() = 0;

    // Latest sensor snapshot, in the shape SafetyService::CheckSafetyLimits accepts.
    [[nodiscard]] virtual json GetSensorData() = 0;
    [[nodiscard]] virtual json GetSystemStatus() const = 0;
    [[nodiscard]] virtual bool IsRunning() const = 0;

    // Releases hardware handles. The default just stops.
    virtual void Cleanup() { Stop(); }
};

// Builds the control service once the layered configuration is loaded.
using ControlServiceFactory =
    std::function<std::shared_ptr<ControlService>(const config::SystemConfig&, events::EventBus&)>;

} // namespace alimante::loop
