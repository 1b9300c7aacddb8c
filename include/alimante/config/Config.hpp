#pragma once
// include/alimante/config/Config.hpp
//
// Layered JSON configuration. The runtime treats most layers (GPIO wiring,
// policies, species, terrariums) as opaque blobs handed to collaborators; only
// the `runtime` section of the main document is interpreted here.

#include <nlohmann/json.hpp>

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>

namespace alimante::config {

using json = nlohmann::json;

struct ConfigError {
    enum class Code {
        FileMissing,
        ReadFailed,
        ParseError,
        TypeError
    } code{};
    std::string message;
};

[[nodiscard]] const char* ToString(ConfigError::Code code) noexcept;

// Reads and parses one JSON document. `//` comments are accepted.
[[nodiscard]] std::expected<json, ConfigError> LoadJsonFile(const std::filesystem::path& file);

// Same as LoadJsonFile, but the top-level value must be an object.
[[nodiscard]] std::expected<json, ConfigError> LoadJsonObject(const std::filesystem::path& file);

struct SystemConfig {
    json main          = json::object(); // config.json
    json gpio          = json::object(); // gpio_config.json
    json safetyLimits  = json::object(); // safety_limits.json
    json policies      = json::object(); // policies/*.json, keyed by file stem
    json species       = json::object(); // species/**/*.json, keyed by file stem
    json terrariums    = json::object(); // terrariums/*.json, keyed by file stem
};

// Never fails as a whole: a missing or malformed layer is logged and left empty.
[[nodiscard]] SystemConfig LoadSystemConfig(const std::filesystem::path& configDir);

struct RuntimeSettings {
    std::chrono::milliseconds loopInterval{1000};
    std::chrono::milliseconds pollGranularity{100};
    std::chrono::milliseconds errorBackoff{1000};

    std::chrono::milliseconds watchdogCheckInterval{30'000};
    std::chrono::milliseconds watchdogDefaultTimeout{300'000};
    std::chrono::milliseconds watchdogRestartGrace{2000};
    int                       watchdogMaxRestarts = 3;

    std::filesystem::path logDirectory = "logs";
    std::string           logLevel     = "info";
    bool                  logAsync     = false;
};

// Reads the `runtime` section of the main config. Absent or mistyped fields
// keep their defaults; numbers are clamped to sane ranges.
[[nodiscard]] RuntimeSettings ParseRuntimeSettings(const json& mainConfig);

} // namespace alimante::config
