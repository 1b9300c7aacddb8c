#pragma once
// include/alimante/safety/SafetyService.hpp
//
// Evaluates sensor snapshots against hard limits and owns the emergency-stop
// latch. Once armed, further critical readings do not re-emit
// `emergency_stop`; only ClearEmergencyStop() re-arms it (and emits
// `emergency_resume`). The latch is never cleared automatically.
//
// Thread-safe. Events are emitted after the internal lock is released. Within
// one check, `emergency_stop` follows the `safety_alert` of the violation that
// armed it, before the alerts for the remaining violations.

#include "alimante/events/EventBus.hpp"
#include "alimante/safety/SafetyLimits.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace alimante::safety {

struct ActiveAlert {
    std::string kind;
    std::string message;
    Severity    severity = Severity::Critical;
    TimePoint   timestamp{};
    bool        acknowledged = false;
};

struct EmergencyStopState {
    bool        armed = false;
    std::string reason;
    TimePoint   since{};
};

struct SafetyStats {
    std::uint64_t safetyChecks       = 0;
    std::uint64_t violationsDetected = 0;
    std::uint64_t emergencyStops     = 0;
    std::uint64_t alertsGenerated    = 0;
    TimePoint     startTime{};
};

struct SafetyStatus {
    bool        emergencyStop = false;
    std::size_t activeAlerts  = 0; // unacknowledged
    std::size_t totalAlerts   = 0;
    std::size_t violations    = 0;
    SafetyStats stats;
};

// Missing or unreadable file: logged as a warning, defaults returned.
[[nodiscard]] SafetyLimits LoadSafetyLimitsOrDefaults(const std::filesystem::path& file);

class SafetyService {
public:
    SafetyService(events::EventBus& bus, SafetyLimits limits);

    [[nodiscard]] static SafetyService FromConfigFile(events::EventBus& bus, const std::filesystem::path& file);

    SafetyService(const SafetyService&) = delete;
    SafetyService& operator=(const SafetyService&) = delete;
    SafetyService(SafetyService&&) = delete;
    SafetyService& operator=(SafetyService&&) = delete;

    // Returns true when no limit is violated. Each violation is logged,
    // recorded, turned into an alert and emitted as `safety_alert`; a critical
    // one arms the emergency stop.
    bool CheckSafetyLimits(const json& sensorSnapshot);

    // Arms the latch if not already armed. Returns true on the transition.
    bool TriggerEmergencyStop(const SafetyViolation& violation);

    // False (and no event) when not armed.
    bool ClearEmergencyStop();

    // Index into the full alert list (acknowledged ones included).
    bool AcknowledgeAlert(std::size_t index);

    [[nodiscard]] std::vector<ActiveAlert> GetActiveAlerts() const;
    // Violations no older than `sinceHours`. An infinite window returns all of
    // them; NaN or a negative window returns none.
    [[nodiscard]] std::vector<SafetyViolation> GetViolations(double sinceHours = 24.0) const;
    [[nodiscard]] bool IsEmergencyStopped() const;
    [[nodiscard]] EmergencyStopState GetEmergencyStopState() const;
    [[nodiscard]] SafetyStatus GetSafetyStatus() const;
    [[nodiscard]] json GetStatus() const;
    [[nodiscard]] const SafetyLimits& Limits() const noexcept { return m_limits; }

    // Maintenance reset: drops alerts, violations and the latch without
    // emitting `emergency_resume`.
    void ResetSafetyData();

private:
    [[nodiscard]] std::optional<json> ArmLocked(const SafetyViolation& violation);

    events::EventBus&             m_bus;
    const SafetyLimits            m_limits;

    mutable std::mutex            m_mutex;
    EmergencyStopState            m_emergency;
    std::vector<ActiveAlert>      m_alerts;
    std::vector<SafetyViolation>  m_violations;
    SafetyStats                   m_stats;
};

} // namespace alimante::safety
