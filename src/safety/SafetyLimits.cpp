// src/safety/SafetyLimits.cpp
#include "alimante/safety/SafetyLimits.hpp"

#include <spdlog/fmt/fmt.h>

#include <initializer_list>

namespace alimante::safety {

namespace {

void ReadNumber(const json& obj, const char* key, double& dst)
{
    if (auto it = obj.find(key); it != obj.end() && it->is_number())
        dst = it->get<double>();
}

const json* Section(const json& doc, const char* key)
{
    const auto it = doc.find(key);
    if (it == doc.end() || !it->is_object())
        return nullptr;
    return &*it;
}

// Looks up the first present key. Returns:
//   - nullopt           key absent (or null)
//   - value             key holds a number
//   - unexpected(msg)   key holds something else
std::expected<std::optional<double>, std::string>
ReadReading(const json& obj, std::initializer_list<const char*> keys)
{
    for (const char* key : keys) {
        const auto it = obj.find(key);
        if (it == obj.end() || it->is_null())
            continue;
        if (!it->is_number())
            return std::unexpected(fmt::format("'{}' is not numeric ({})", key, it->dump()));
        return std::optional<double>(it->get<double>());
    }
    return std::optional<double>{};
}

// `air_quality: 120` or `air_quality: {aqi: 120}`; same for water_level/level.
std::expected<std::optional<double>, std::string>
ReadScalarOrGroup(const json& snapshot, std::initializer_list<const char*> keys, const char* innerKey)
{
    for (const char* key : keys) {
        const auto it = snapshot.find(key);
        if (it == snapshot.end() || it->is_null())
            continue;
        if (it->is_object())
            return ReadReading(*it, {innerKey});
        return ReadReading(snapshot, {key});
    }
    return std::optional<double>{};
}

void Assign(std::expected<std::optional<double>, std::string> r,
            std::optional<double>& dst, Parameter p, NormalizedSnapshot& out)
{
    if (r)
        dst = *r;
    else
        out.errors.push_back(ExtractionError{p, std::move(r.error())});
}

SafetyViolation MakeViolation(std::string kind, Parameter p, double value, double limit,
                              std::string message, TimePoint now)
{
    SafetyViolation v;
    v.kind      = std::move(kind);
    v.parameter = p;
    v.value     = value;
    v.limit     = limit;
    v.severity  = Severity::Critical;
    v.message   = std::move(message);
    v.timestamp = now;
    return v;
}

} // namespace

SafetyLimits SafetyLimits::FromJson(const json& doc)
{
    SafetyLimits out;
    if (!doc.is_object())
        return out;

    if (const json* t = Section(doc, "temperature")) {
        ReadNumber(*t, "critical_min", out.temperature.criticalMin);
        ReadNumber(*t, "critical_max", out.temperature.criticalMax);
    }
    if (const json* h = Section(doc, "humidity")) {
        ReadNumber(*h, "critical_min", out.humidity.criticalMin);
        ReadNumber(*h, "critical_max", out.humidity.criticalMax);
    }
    if (const json* a = Section(doc, "air_quality"))
        ReadNumber(*a, "hazardous_threshold", out.airQualityHazardous);
    if (const json* w = Section(doc, "water_level"))
        ReadNumber(*w, "critical_level", out.waterCriticalLevel);
    if (const json* f = Section(doc, "failsafes"))
        out.failsafes = *f;

    return out;
}

json SafetyLimits::ToJson() const
{
    return json{
        {"temperature", {{"critical_min", temperature.criticalMin}, {"critical_max", temperature.criticalMax}}},
        {"humidity", {{"critical_min", humidity.criticalMin}, {"critical_max", humidity.criticalMax}}},
        {"air_quality", {{"hazardous_threshold", airQualityHazardous}}},
        {"water_level", {{"critical_level", waterCriticalLevel}}},
        {"failsafes", failsafes},
    };
}

std::expected<SafetyLimits, config::ConfigError> LoadSafetyLimits(const std::filesystem::path& file)
{
    auto doc = config::LoadJsonObject(file);
    if (!doc)
        return std::unexpected(doc.error());
    return SafetyLimits::FromJson(*doc);
}

std::string_view ToString(Parameter p) noexcept
{
    switch (p) {
    case Parameter::Temperature: return "temperature";
    case Parameter::Humidity:    return "humidity";
    case Parameter::AirQuality:  return "air_quality";
    case Parameter::WaterLevel:  return "water_level";
    }
    return "unknown";
}

std::string_view ToString(Severity s) noexcept
{
    switch (s) {
    case Severity::Critical: return "critical";
    }
    return "unknown";
}

double ToUnixSeconds(TimePoint t) noexcept
{
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

void to_json(json& j, const SafetyViolation& v)
{
    j = json{
        {"type", v.kind},
        {"parameter", std::string(ToString(v.parameter))},
        {"value", v.value},
        {"limit", v.limit},
        {"severity", std::string(ToString(v.severity))},
        {"message", v.message},
        {"timestamp", ToUnixSeconds(v.timestamp)},
    };
}

NormalizedSnapshot NormalizeSnapshot(const json& snapshot)
{
    NormalizedSnapshot out;
    if (!snapshot.is_object())
        return out;

    // Climate readings: grouped under the DHT22 sub-reading, or flat.
    const json* climate = Section(snapshot, "dht22");
    const json& climateSrc = climate ? *climate : snapshot;
    Assign(ReadReading(climateSrc, {"temperature"}), out.readings.temperature, Parameter::Temperature, out);
    Assign(ReadReading(climateSrc, {"humidity"}), out.readings.humidity, Parameter::Humidity, out);

    Assign(ReadScalarOrGroup(snapshot, {"air_quality", "airQuality"}, "aqi"),
           out.readings.airQuality, Parameter::AirQuality, out);
    Assign(ReadScalarOrGroup(snapshot, {"water_level", "waterLevel"}, "level"),
           out.readings.waterLevel, Parameter::WaterLevel, out);

    return out;
}

std::optional<SafetyViolation> CheckTemperature(double celsius, const RangeLimits& limits, TimePoint now)
{
    if (celsius > limits.criticalMax)
        return MakeViolation("temperature_critical_high", Parameter::Temperature, celsius, limits.criticalMax,
                             fmt::format("Critical high temperature: {:.1f}C (limit: {}C)", celsius, limits.criticalMax),
                             now);
    if (celsius < limits.criticalMin)
        return MakeViolation("temperature_critical_low", Parameter::Temperature, celsius, limits.criticalMin,
                             fmt::format("Critical low temperature: {:.1f}C (limit: {}C)", celsius, limits.criticalMin),
                             now);
    return std::nullopt;
}

std::optional<SafetyViolation> CheckHumidity(double percent, const RangeLimits& limits, TimePoint now)
{
    if (percent > limits.criticalMax)
        return MakeViolation("humidity_critical_high", Parameter::Humidity, percent, limits.criticalMax,
                             fmt::format("Critical high humidity: {:.1f}% (limit: {}%)", percent, limits.criticalMax),
                             now);
    if (percent < limits.criticalMin)
        return MakeViolation("humidity_critical_low", Parameter::Humidity, percent, limits.criticalMin,
                             fmt::format("Critical low humidity: {:.1f}% (limit: {}%)", percent, limits.criticalMin),
                             now);
    return std::nullopt;
}

std::optional<SafetyViolation> CheckAirQuality(double aqi, double hazardousThreshold, TimePoint now)
{
    if (aqi >= hazardousThreshold)
        return MakeViolation("air_quality_hazardous", Parameter::AirQuality, aqi, hazardousThreshold,
                             fmt::format("Hazardous air quality: AQI {} (limit: {})", aqi, hazardousThreshold),
                             now);
    return std::nullopt;
}

std::optional<SafetyViolation> CheckWaterLevel(double percent, double criticalLevel, TimePoint now)
{
    if (percent <= criticalLevel)
        return MakeViolation("water_level_critical", Parameter::WaterLevel, percent, criticalLevel,
                             fmt::format("Critical water level: {:.1f}% (limit: {}%)", percent, criticalLevel),
                             now);
    return std::nullopt;
}

} // namespace alimante::safety
