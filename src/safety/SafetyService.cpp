// src/safety/SafetyService.cpp
#include "alimante/safety/SafetyService.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace alimante::safety {

SafetyLimits LoadSafetyLimitsOrDefaults(const std::filesystem::path& file)
{
    auto loaded = LoadSafetyLimits(file);
    if (loaded) {
        spdlog::info("Safety: limits loaded from {}", file.string());
        return std::move(*loaded);
    }

    if (loaded.error().code == config::ConfigError::Code::FileMissing)
        spdlog::warn("Safety: limits file {} not found, using built-in defaults", file.string());
    else
        spdlog::warn("Safety: limits file unusable ({}: {}), using built-in defaults",
                     config::ToString(loaded.error().code), loaded.error().message);
    return SafetyLimits{};
}

SafetyService::SafetyService(events::EventBus& bus, SafetyLimits limits)
    : m_bus(bus)
    , m_limits(std::move(limits))
{
    m_stats.startTime = std::chrono::system_clock::now();
}

SafetyService SafetyService::FromConfigFile(events::EventBus& bus, const std::filesystem::path& file)
{
    return SafetyService(bus, LoadSafetyLimitsOrDefaults(file));
}

std::optional<json> SafetyService::ArmLocked(const SafetyViolation& violation)
{
    if (m_emergency.armed)
        return std::nullopt;

    m_emergency.armed  = true;
    m_emergency.reason = violation.message;
    m_emergency.since  = std::chrono::system_clock::now();
    ++m_stats.emergencyStops;

    return json{
        {"reason", violation.message},
        {"timestamp", ToUnixSeconds(m_emergency.since)},
        {"violation", violation},
    };
}

bool SafetyService::CheckSafetyLimits(const json& sensorSnapshot)
{
    const TimePoint now = std::chrono::system_clock::now();
    const NormalizedSnapshot snap = NormalizeSnapshot(sensorSnapshot);

    for (const auto& err : snap.errors)
        spdlog::error("Safety: skipping {} reading: {}", ToString(err.parameter), err.message);

    std::vector<SafetyViolation> found;
    const auto collect = [&found](std::optional<SafetyViolation> v) {
        if (v) found.push_back(std::move(*v));
    };

    const SensorReadings& r = snap.readings;
    if (r.temperature) collect(CheckTemperature(*r.temperature, m_limits.temperature, now));
    if (r.humidity)    collect(CheckHumidity(*r.humidity, m_limits.humidity, now));
    if (r.airQuality)  collect(CheckAirQuality(*r.airQuality, m_limits.airQualityHazardous, now));
    if (r.waterLevel)  collect(CheckWaterLevel(*r.waterLevel, m_limits.waterCriticalLevel, now));

    std::optional<json>        stopPayload;
    std::optional<std::size_t> stopIndex; // alert that armed the latch
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_stats.safetyChecks;

        for (const auto& v : found) {
            m_violations.push_back(v);
            ++m_stats.violationsDetected;

            m_alerts.push_back(ActiveAlert{v.kind, v.message, v.severity, v.timestamp, false});
            ++m_stats.alertsGenerated;
        }

        for (std::size_t i = 0; i < found.size(); ++i) {
            if (found[i].severity == Severity::Critical) {
                stopPayload = ArmLocked(found[i]);
                if (stopPayload)
                    stopIndex = i;
                break;
            }
        }
    }

    for (std::size_t i = 0; i < found.size(); ++i) {
        spdlog::critical("SAFETY VIOLATION: {}", found[i].message);
        m_bus.Emit(events::kSafetyAlert, json(found[i]));

        if (stopIndex == i) {
            spdlog::critical("EMERGENCY STOP: {}", found[i].message);
            m_bus.Emit(events::kEmergencyStop, *stopPayload);
        }
    }

    return found.empty();
}

bool SafetyService::TriggerEmergencyStop(const SafetyViolation& violation)
{
    std::optional<json> payload;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        payload = ArmLocked(violation);
    }
    if (!payload)
        return false;

    spdlog::critical("EMERGENCY STOP: {}", violation.message);
    m_bus.Emit(events::kEmergencyStop, *payload);
    return true;
}

bool SafetyService::ClearEmergencyStop()
{
    TimePoint clearedAt;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_emergency.armed)
            return false;

        m_emergency = EmergencyStopState{};
        clearedAt = std::chrono::system_clock::now();
    }

    spdlog::info("Safety: emergency stop cleared by operator");
    m_bus.Emit(events::kEmergencyResume, json{{"timestamp", ToUnixSeconds(clearedAt)}});
    return true;
}

bool SafetyService::AcknowledgeAlert(std::size_t index)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (index >= m_alerts.size())
        return false;

    m_alerts[index].acknowledged = true;
    spdlog::info("Safety: alert {} acknowledged ({})", index, m_alerts[index].kind);
    return true;
}

std::vector<ActiveAlert> SafetyService::GetActiveAlerts() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ActiveAlert> out;
    for (const auto& a : m_alerts)
        if (!a.acknowledged)
            out.push_back(a);
    return out;
}

std::vector<SafetyViolation> SafetyService::GetViolations(double sinceHours) const
{
    // Compared in floating-point seconds: any window, including inf, is safe.
    // NaN matches nothing.
    const double    windowSeconds = sinceHours * 3600.0;
    const TimePoint now           = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<SafetyViolation> out;
    for (const auto& v : m_violations) {
        const double age = std::chrono::duration<double>(now - v.timestamp).count();
        if (age <= windowSeconds)
            out.push_back(v);
    }
    return out;
}

bool SafetyService::IsEmergencyStopped() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_emergency.armed;
}

EmergencyStopState SafetyService::GetEmergencyStopState() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_emergency;
}

SafetyStatus SafetyService::GetSafetyStatus() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    SafetyStatus s;
    s.emergencyStop = m_emergency.armed;
    s.totalAlerts   = m_alerts.size();
    s.violations    = m_violations.size();
    s.stats         = m_stats;
    for (const auto& a : m_alerts)
        if (!a.acknowledged)
            ++s.activeAlerts;
    return s;
}

json SafetyService::GetStatus() const
{
    const SafetyStatus s = GetSafetyStatus();
    return json{
        {"service_name", "safety_service"},
        {"safety_status", {
            {"emergency_stop", s.emergencyStop},
            {"active_alerts", s.activeAlerts},
            {"total_alerts", s.totalAlerts},
            {"safety_violations", s.violations},
            {"stats", {
                {"safety_checks", s.stats.safetyChecks},
                {"violations_detected", s.stats.violationsDetected},
                {"emergency_stops", s.stats.emergencyStops},
                {"alerts_generated", s.stats.alertsGenerated},
                {"start_time", ToUnixSeconds(s.stats.startTime)},
            }},
        }},
        {"safety_limits", m_limits.ToJson()},
        {"failsafes", m_limits.failsafes},
    };
}

void SafetyService::ResetSafetyData()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_alerts.clear();
    m_violations.clear();
    m_emergency = EmergencyStopState{};
    spdlog::info("Safety: alerts, violations and emergency stop reset");
}

} // namespace alimante::safety
