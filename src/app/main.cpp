// src/app/main.cpp
//
// alimante daemon: wires the event bus, safety service, control loop and
// watchdog together and runs until SIGINT/SIGTERM.

#include "app/CommandLineArgs.h"
#include "logging/Log.h"

#include "alimante/config/Config.hpp"
#include "alimante/events/EventBus.hpp"
#include "alimante/loop/MainLoop.hpp"
#include "alimante/loop/SimulatedControlService.hpp"
#include "alimante/safety/SafetyService.hpp"
#include "alimante/supervision/Watchdog.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;
using namespace alimante;

namespace {

constexpr const char* kControlServiceName = "control";

std::chrono::milliseconds FromSeconds(double s)
{
    return std::chrono::milliseconds(static_cast<long long>(std::llround(s * 1000.0)));
}

// Runtime settings are read before logging exists, so this load is silent.
config::RuntimeSettings ReadRuntimeSettings(const fs::path& configDir)
{
    const auto doc = config::LoadJsonObject(configDir / "config.json");
    return doc ? config::ParseRuntimeSettings(*doc) : config::RuntimeSettings{};
}

} // namespace

int main(int argc, char** argv)
{
    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);

    if (args.showHelp) {
        std::cout << app::BuildCommandLineHelpText();
        return 0;
    }
    if (!args.unknown.empty()) {
        for (const auto& u : args.unknown)
            std::cerr << "alimante: unrecognized or invalid argument: " << u << '\n';
        std::cerr << '\n' << app::BuildCommandLineHelpText();
        return 2;
    }

    const fs::path configDir = args.configDir.value_or("config");

    config::RuntimeSettings settings = ReadRuntimeSettings(configDir);
    if (args.logDir)
        settings.logDirectory = *args.logDir;
    if (args.loopIntervalSeconds)
        settings.loopInterval = std::max(FromSeconds(*args.loopIntervalSeconds), std::chrono::milliseconds(50));
    if (args.watchdogIntervalSeconds)
        settings.watchdogCheckInterval = std::max(FromSeconds(*args.watchdogIntervalSeconds), std::chrono::milliseconds(10));
    if (args.verbose)
        settings.logLevel = "debug";

    logsys::Init(logsys::LogConfig{settings.logDirectory, settings.logLevel, settings.logAsync, true});
    spdlog::info("alimante starting (config dir {})", configDir.string());

    events::EventBus bus;
    safety::SafetyService safetyService(bus, safety::LoadSafetyLimitsOrDefaults(configDir / "safety_limits.json"));

    bus.Subscribe(events::kEmergencyStop, [](const events::json& payload) {
        spdlog::critical("Operator action required: emergency stop armed ({})",
                         payload.value("reason", std::string("unknown")));
    });
    bus.Subscribe(events::kEmergencyResume, [](const events::json&) {
        spdlog::warn("Emergency stop cleared, normal control resumed");
    });

    loop::MainLoopConfig loopCfg;
    loopCfg.configDir       = configDir;
    loopCfg.loopInterval    = settings.loopInterval;
    loopCfg.pollGranularity = settings.pollGranularity;
    loopCfg.errorBackoff    = settings.errorBackoff;

    loop::MainLoop mainLoop(bus, loopCfg, loop::MakeSimulatedControlFactory(), &safetyService);
    mainLoop.InstallSignalHandlers();

    if (!mainLoop.Initialize()) {
        spdlog::critical("alimante: initialization failed");
        logsys::Shutdown();
        return 1;
    }

    supervision::WatchdogConfig wdCfg;
    wdCfg.checkInterval  = settings.watchdogCheckInterval;
    wdCfg.defaultTimeout = settings.watchdogDefaultTimeout;
    wdCfg.restartGrace   = settings.watchdogRestartGrace;
    wdCfg.maxRestarts    = settings.watchdogMaxRestarts;

    supervision::Watchdog watchdog(wdCfg);
    watchdog.AddService(kControlServiceName, mainLoop.Control());

    const events::HandlerId heartbeat = bus.Subscribe(events::kMainLoopCycle, [&watchdog](const events::json&) {
        watchdog.Heartbeat(kControlServiceName);
    });

    // The control service must be running before the first poll, and the
    // watchdog must be gone before the loop stops it.
    const bool ok = mainLoop.Start();
    if (ok) {
        watchdog.Start();
        mainLoop.RunUntilStopRequested();
        watchdog.Stop();
    } else {
        spdlog::critical("alimante: control loop failed to start");
    }

    bus.Unsubscribe(events::kMainLoopCycle, heartbeat);
    mainLoop.Stop();
    mainLoop.Cleanup();

    const auto s = safetyService.GetSafetyStatus();
    spdlog::info("alimante stopped: {} safety checks, {} violations, emergency stop {}",
                 s.stats.safetyChecks, s.stats.violationsDetected, s.emergencyStop ? "armed" : "clear");
    logsys::Shutdown();
    return ok ? 0 : 1;
}
