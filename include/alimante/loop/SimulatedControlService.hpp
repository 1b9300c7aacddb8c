#pragma once
// include/alimante/loop/SimulatedControlService.hpp
//
// ControlService without hardware. Each Update() advances a step counter and
// every reading follows `base + amplitude * sin(2*pi*step/period)`. Values come
// from the `simulation` section of the main config:
//
//   "simulation": {
//     "period_cycles": 600,
//     "temperature": {"base": 26.0, "amplitude": 2.0},
//     "humidity":    {"base": 65.0, "amplitude": 8.0},
//     "air_quality": {"base": 40.0, "amplitude": 10.0},
//     "water_level": {"base": 70.0, "amplitude": 5.0}
//   }

#include "alimante/loop/ControlService.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace alimante::loop {

struct SimulatedChannel {
    double base      = 0.0;
    double amplitude = 0.0;
};

struct SimulationProfile {
    std::uint32_t    periodCycles = 600;
    SimulatedChannel temperature{26.0, 2.0};
    SimulatedChannel humidity{65.0, 8.0};
    SimulatedChannel airQuality{40.0, 10.0};
    SimulatedChannel waterLevel{70.0, 5.0};

    [[nodiscard]] static SimulationProfile FromJson(const json& section);
};

class SimulatedControlService final : public ControlService {
public:
    explicit SimulatedControlService(SimulationProfile profile = {});

    bool Initialize() override;
    bool Start() override;
    void Stop() override;
    void Update() override;

    [[nodiscard]] json GetSensorData() override;
    [[nodiscard]] json GetSystemStatus() const override;
    [[nodiscard]] bool IsRunning() const override;

private:
    [[nodiscard]] double Sample(const SimulatedChannel& ch) const;

    const SimulationProfile m_profile;

    mutable std::mutex m_mutex;
    bool               m_initialized = false;
    bool               m_running     = false;
    std::uint64_t      m_step        = 0;
    std::uint64_t      m_starts      = 0;
};

// Factory for MainLoop: reads `simulation` from the main config.
[[nodiscard]] ControlServiceFactory MakeSimulatedControlFactory();

} // namespace alimante::loop
