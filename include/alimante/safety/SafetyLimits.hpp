#pragma once
// include/alimante/safety/SafetyLimits.hpp
//
// Hard safety thresholds and the per-parameter checks that apply them.
// The checks are pure: they never log, emit or mutate anything.

#include "alimante/config/Config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace alimante::safety {

using json = nlohmann::json;

struct RangeLimits {
    double criticalMin = 0.0;
    double criticalMax = 0.0;
};

struct SafetyLimits {
    RangeLimits temperature{5.0, 45.0};    // degrees C
    RangeLimits humidity{10.0, 99.0};      // percent RH
    double      airQualityHazardous = 300; // AQI, violation at or above
    double      waterCriticalLevel  = 15.0; // percent, violation at or below
    json        failsafes = json::object(); // passed through untouched

    // Missing or non-numeric fields keep the defaults above.
    [[nodiscard]] static SafetyLimits FromJson(const json& doc);
    [[nodiscard]] json ToJson() const;
};

[[nodiscard]] std::expected<SafetyLimits, config::ConfigError>
LoadSafetyLimits(const std::filesystem::path& file);

enum class Parameter { Temperature, Humidity, AirQuality, WaterLevel };
enum class Severity { Critical };

[[nodiscard]] std::string_view ToString(Parameter p) noexcept;
[[nodiscard]] std::string_view ToString(Severity s) noexcept;

struct SafetyViolation {
    std::string kind;      // e.g. "temperature_critical_high"
    Parameter   parameter = Parameter::Temperature;
    double      value     = 0.0;
    double      limit     = 0.0;
    Severity    severity  = Severity::Critical;
    std::string message;
    std::chrono::system_clock::time_point timestamp{};
};

// Payload shape of `safety_alert`:
//   {type, parameter, value, limit, severity, message, timestamp}
void to_json(json& j, const SafetyViolation& v);

// Readings extracted from a sensor snapshot; absent parameters stay empty.
struct SensorReadings {
    std::optional<double> temperature;
    std::optional<double> humidity;
    std::optional<double> airQuality;
    std::optional<double> waterLevel;
};

struct ExtractionError {
    Parameter   parameter = Parameter::Temperature;
    std::string message;
};

struct NormalizedSnapshot {
    SensorReadings               readings;
    std::vector<ExtractionError> errors; // present-but-unusable values
};

// Accepts the flat shape
//   {temperature, humidity, air_quality|airQuality, water_level|waterLevel}
// and the grouped shape
//   {dht22:{temperature,humidity}, air_quality:{aqi}, water_level:{level}}
// A value that is present but not a number is reported in `errors` and that
// parameter is skipped; the others are still extracted.
[[nodiscard]] NormalizedSnapshot NormalizeSnapshot(const json& snapshot);

using TimePoint = std::chrono::system_clock::time_point;

[[nodiscard]] std::optional<SafetyViolation> CheckTemperature(double celsius, const RangeLimits& limits, TimePoint now);
[[nodiscard]] std::optional<SafetyViolation> CheckHumidity(double percent, const RangeLimits& limits, TimePoint now);
[[nodiscard]] std::optional<SafetyViolation> CheckAirQuality(double aqi, double hazardousThreshold, TimePoint now);
[[nodiscard]] std::optional<SafetyViolation> CheckWaterLevel(double percent, double criticalLevel, TimePoint now);

// Seconds since the Unix epoch, as carried in event payloads.
[[nodiscard]] double ToUnixSeconds(TimePoint t) noexcept;

} // namespace alimante::safety
