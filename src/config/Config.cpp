// src/config/Config.cpp
#include "alimante/config/Config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <system_error>
#include <vector>

namespace alimante::config {

namespace fs = std::filesystem;

namespace {

bool ReadFileToString(const fs::path& p, std::string& out)
{
    out.clear();
    std::ifstream f(p, std::ios::binary);
    if (!f) return false;
    f.seekg(0, std::ios::end);
    const std::streamoff sz = f.tellg();
    if (sz < 0) return false;
    f.seekg(0, std::ios::beg);
    out.resize(static_cast<std::size_t>(sz));
    f.read(out.data(), static_cast<std::streamsize>(sz));
    return static_cast<bool>(f) || f.eof();
}

std::chrono::milliseconds SecondsField(const json& obj, const char* key,
                                       std::chrono::milliseconds fallback,
                                       double minSeconds, double maxSeconds)
{
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_number())
        return fallback;

    const double s = std::clamp(it->get<double>(), minSeconds, maxSeconds);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(s * 1000.0)));
}

// Collects every *.json under `dir` into an object keyed by file stem.
json LoadDirectoryLayer(const fs::path& dir, bool recursive, const char* layerName)
{
    json out = json::object();

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        spdlog::debug("Config: no {} directory at {}", layerName, dir.string());
        return out;
    }

    std::vector<fs::path> files;
    const auto collect = [&](const fs::directory_entry& entry) {
        std::error_code fec;
        if (entry.is_regular_file(fec) && entry.path().extension() == ".json")
            files.push_back(entry.path());
    };

    if (recursive) {
        for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
            collect(*it);
    } else {
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
            collect(*it);
    }
    if (ec)
        spdlog::warn("Config: error while scanning {}: {}", dir.string(), ec.message());

    // Deterministic: later duplicates (same stem in sub-folders) overwrite earlier ones.
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        auto doc = LoadJsonFile(file);
        if (!doc) {
            spdlog::warn("Config: skipping {} entry {} ({}: {})", layerName, file.string(),
                         ToString(doc.error().code), doc.error().message);
            continue;
        }
        out[file.stem().string()] = std::move(*doc);
    }

    spdlog::debug("Config: {} {} document(s) loaded", out.size(), layerName);
    return out;
}

json LoadObjectLayer(const fs::path& file, const char* layerName)
{
    auto doc = LoadJsonObject(file);
    if (doc)
        return std::move(*doc);

    if (doc.error().code == ConfigError::Code::FileMissing)
        spdlog::warn("Config: {} not found at {}, using defaults", layerName, file.string());
    else
        spdlog::error("Config: {} unusable ({}: {}), using defaults", layerName,
                      ToString(doc.error().code), doc.error().message);
    return json::object();
}

} // namespace

const char* ToString(ConfigError::Code code) noexcept
{
    switch (code) {
    case ConfigError::Code::FileMissing: return "file missing";
    case ConfigError::Code::ReadFailed:  return "read failed";
    case ConfigError::Code::ParseError:  return "parse error";
    case ConfigError::Code::TypeError:   return "type error";
    }
    return "unknown";
}

std::expected<json, ConfigError> LoadJsonFile(const fs::path& file)
{
    std::error_code ec;
    if (!fs::exists(file, ec))
        return std::unexpected(ConfigError{ConfigError::Code::FileMissing, file.string()});

    std::string text;
    if (!ReadFileToString(file, text))
        return std::unexpected(ConfigError{ConfigError::Code::ReadFailed, file.string()});

    json j = json::parse(text, nullptr, /*allow_exceptions*/ false, /*ignore_comments*/ true);
    if (j.is_discarded())
        return std::unexpected(ConfigError{ConfigError::Code::ParseError, file.string()});

    return j;
}

std::expected<json, ConfigError> LoadJsonObject(const fs::path& file)
{
    auto j = LoadJsonFile(file);
    if (!j)
        return j;
    if (!j->is_object())
        return std::unexpected(ConfigError{ConfigError::Code::TypeError,
                                           file.string() + ": top-level value is not an object"});
    return j;
}

SystemConfig LoadSystemConfig(const fs::path& configDir)
{
    spdlog::info("Config: loading layered configuration from {}", configDir.string());

    SystemConfig cfg;
    cfg.main         = LoadObjectLayer(configDir / "config.json", "main config");
    cfg.gpio         = LoadObjectLayer(configDir / "gpio_config.json", "GPIO config");
    cfg.safetyLimits = LoadObjectLayer(configDir / "safety_limits.json", "safety limits");
    cfg.policies     = LoadDirectoryLayer(configDir / "policies", false, "policy");
    cfg.species      = LoadDirectoryLayer(configDir / "species", true, "species");
    cfg.terrariums   = LoadDirectoryLayer(configDir / "terrariums", false, "terrarium");

    spdlog::info("Config: {} policies, {} species, {} terrariums",
                 cfg.policies.size(), cfg.species.size(), cfg.terrariums.size());
    return cfg;
}

RuntimeSettings ParseRuntimeSettings(const json& mainConfig)
{
    RuntimeSettings s;
    if (!mainConfig.is_object())
        return s;

    const auto rt = mainConfig.find("runtime");
    if (rt == mainConfig.end() || !rt->is_object())
        return s;

    s.loopInterval = SecondsField(*rt, "loop_interval_s", s.loopInterval, 0.05, 60.0);
    s.errorBackoff = SecondsField(*rt, "error_backoff_s", s.errorBackoff, 0.0, 60.0);

    if (auto g = rt->find("poll_granularity_ms"); g != rt->end() && g->is_number_integer())
        s.pollGranularity = std::chrono::milliseconds(std::clamp<long long>(g->get<long long>(), 1, 1000));

    if (const auto wd = rt->find("watchdog"); wd != rt->end() && wd->is_object())
    {
        s.watchdogCheckInterval  = SecondsField(*wd, "check_interval_s", s.watchdogCheckInterval, 0.01, 3600.0);
        s.watchdogDefaultTimeout = SecondsField(*wd, "default_timeout_s", s.watchdogDefaultTimeout, 0.01, 86400.0);
        s.watchdogRestartGrace   = SecondsField(*wd, "restart_grace_s", s.watchdogRestartGrace, 0.0, 60.0);

        if (auto m = wd->find("max_restarts"); m != wd->end() && m->is_number_integer())
            s.watchdogMaxRestarts = std::clamp(m->get<int>(), 0, 100);
    }

    if (const auto lg = rt->find("logging"); lg != rt->end() && lg->is_object())
    {
        if (auto d = lg->find("directory"); d != lg->end() && d->is_string())
            s.logDirectory = d->get<std::string>();
        if (auto l = lg->find("level"); l != lg->end() && l->is_string())
            s.logLevel = l->get<std::string>();
        if (auto a = lg->find("async"); a != lg->end() && a->is_boolean())
            s.logAsync = a->get<bool>();
    }

    return s;
}

} // namespace alimante::config
