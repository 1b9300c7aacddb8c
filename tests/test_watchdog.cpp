// tests/test_watchdog.cpp
//
// Coverage for include/alimante/supervision/Watchdog.hpp. Time is driven by a
// ManualClock; the restart grace period advances it instead of sleeping.

#include <doctest/doctest.h>

#include "alimante/supervision/Watchdog.hpp"

#include "test_support/TestSupport.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

namespace sup = alimante::supervision;
using alimante::test::LogCapture;
using alimante::test::ManualClock;
using namespace std::chrono_literals;

namespace {

// Start/Stop plus an IsRunning() flag.
struct FlagService {
    int  starts     = 0;
    int  stops      = 0;
    bool running    = true;
    bool startFails = false;

    bool Start()
    {
        ++starts;
        running = !startFails;
        return !startFails;
    }
    void Stop()
    {
        ++stops;
        running = false;
    }
    bool IsRunning() const { return running; }
};

// Health through GetStatus().
struct StatusService {
    bool healthy = true;
    int  starts  = 0;

    sup::ServiceStatus GetStatus() const { return sup::ServiceStatus{healthy, {{"detail", "x"}}}; }
    bool Start()
    {
        ++starts;
        healthy = true;
        return true;
    }
};

// No probe, no Start(): cannot be restarted.
struct PassiveService {
    int stops = 0;
    void Stop() { ++stops; }
};

struct Harness {
    ManualClock clock;
    int         graceSleeps = 0;

    sup::Watchdog Make(sup::WatchdogConfig cfg = {})
    {
        return sup::Watchdog(
            cfg,
            [this] { return clock.now; },
            [this](std::chrono::steady_clock::duration d) {
                ++graceSleeps;
                clock.Advance(d);
            });
    }
};

} // namespace

TEST_CASE("Watchdog restarts a silent service until its budget is exhausted")
{
    LogCapture logs;
    Harness h;
    sup::Watchdog wd = h.Make();

    auto svc = std::make_shared<FlagService>();
    wd.AddService("sensor", svc, 1000ms, 2);

    // Within the timeout: nothing happens.
    h.clock.Advance(500ms);
    wd.CheckServices();
    CHECK(wd.GetServiceStatus("sensor")->restartCount == 0);
    CHECK(svc->starts == 0);

    // Missed heartbeat -> first restart.
    h.clock.Advance(600ms);
    wd.CheckServices();
    CHECK(wd.GetServiceStatus("sensor")->restartCount == 1);
    CHECK(svc->stops == 1);
    CHECK(svc->starts == 1);
    CHECK(h.graceSleeps == 1);

    // Restart resets the heartbeat; the next miss is the second restart.
    h.clock.Advance(1100ms);
    wd.CheckServices();
    CHECK(wd.GetServiceStatus("sensor")->restartCount == 2);
    CHECK(svc->starts == 2);

    // Third miss: budget exhausted, no further attempt, error logged.
    h.clock.Advance(1100ms);
    wd.CheckServices();
    CHECK(wd.GetServiceStatus("sensor")->restartCount == 2);
    CHECK(svc->starts == 2);
    CHECK(svc->stops == 2);
    CHECK(logs.Count("error", "restart budget") == 1);

    // Still registered, still ignored.
    CHECK(wd.GetStatus().services == std::vector<std::string>{"sensor"});
    h.clock.Advance(1100ms);
    wd.CheckServices();
    CHECK(svc->starts == 2);
    CHECK(logs.Count("error", "restart budget") == 2);

    const auto stats = wd.GetStatus().stats;
    CHECK(stats.restarts == 2);
    CHECK(stats.checks == 5);
    CHECK(stats.lastRestart.has_value());
}

TEST_CASE("Watchdog heartbeats keep a service alive")
{
    Harness h;
    sup::Watchdog wd = h.Make();
    auto svc = std::make_shared<FlagService>();
    wd.AddService("loop", svc, 1000ms);

    for (int i = 0; i < 10; ++i) {
        h.clock.Advance(800ms);
        wd.Heartbeat("loop");
        wd.CheckServices();
    }

    CHECK(svc->starts == 0);
    CHECK(wd.GetServiceStatus("loop")->restartCount == 0);
    CHECK(wd.GetServiceStatus("loop")->healthy);

    // Unknown names are ignored.
    CHECK_NOTHROW(wd.Heartbeat("nobody"));
}

TEST_CASE("Watchdog restarts a service whose probe reports unhealthy")
{
    Harness h;
    sup::Watchdog wd = h.Make();

    auto flag = std::make_shared<FlagService>();
    auto status = std::make_shared<StatusService>();
    wd.AddService("flag", flag, 60s);
    wd.AddService("status", status, 60s);

    flag->running = false;
    status->healthy = false;
    CHECK_FALSE(wd.GetServiceStatus("flag")->healthy);
    CHECK_FALSE(wd.GetServiceStatus("status")->healthy);

    wd.CheckServices();

    CHECK(flag->starts == 1);
    CHECK(status->starts == 1);
    CHECK(wd.GetServiceStatus("flag")->healthy);
    CHECK(wd.GetServiceStatus("status")->healthy);
    CHECK(wd.GetStatus().stats.restarts == 2);
}

TEST_CASE("Watchdog leaves state unchanged when a restart fails")
{
    LogCapture logs;
    Harness h;
    sup::Watchdog wd = h.Make();

    auto svc = std::make_shared<FlagService>();
    svc->startFails = true;
    svc->running = false;
    wd.AddService("pump", svc, 60s, 3);

    wd.CheckServices();
    wd.CheckServices();

    CHECK(svc->starts == 2);
    CHECK(wd.GetServiceStatus("pump")->restartCount == 0);
    CHECK(wd.GetStatus().stats.restarts == 0);
    CHECK(logs.Count("error", "failed to start") == 2);
}

TEST_CASE("Watchdog treats a throwing probe as unhealthy")
{
    Harness h;
    sup::Watchdog wd = h.Make();

    int starts = 0;
    sup::SupervisedService svc;
    svc.probe = sup::RunningFlagProbe{[]() -> bool { throw std::runtime_error("bus error"); }};
    svc.start = [&starts] { ++starts; return true; };
    wd.AddService("flaky", svc, 60s);

    CHECK_NOTHROW(wd.CheckServices());
    CHECK(starts == 1);
}

TEST_CASE("Watchdog without a probe assumes healthy; without Start it cannot restart")
{
    LogCapture logs;
    Harness h;
    sup::Watchdog wd = h.Make();

    auto svc = std::make_shared<PassiveService>();
    wd.AddService("display", svc, 1000ms);
    CHECK(wd.GetServiceStatus("display")->healthy);

    wd.CheckServices();
    CHECK(svc->stops == 0);

    h.clock.Advance(2s);
    wd.CheckServices();
    CHECK(svc->stops == 0);
    CHECK(wd.GetServiceStatus("display")->restartCount == 0);
    CHECK(logs.Count("warning", "cannot restart") == 1);
}

TEST_CASE("Watchdog registration: defaults, replacement and removal")
{
    Harness h;
    sup::WatchdogConfig cfg;
    cfg.defaultTimeout = 42s;
    cfg.maxRestarts    = 5;
    sup::Watchdog wd = h.Make(cfg);

    wd.AddService("a", std::make_shared<FlagService>());
    auto report = wd.GetServiceStatus("a");
    REQUIRE(report.has_value());
    CHECK(report->timeout == 42s);
    CHECK(report->maxRestarts == 5);
    CHECK(report->lastHeartbeat == h.clock.now);

    wd.AddService("a", std::make_shared<FlagService>(), 7s, 1);
    report = wd.GetServiceStatus("a");
    REQUIRE(report.has_value());
    CHECK(report->timeout == 7s);
    CHECK(report->maxRestarts == 1);
    CHECK(wd.GetStatus().services.size() == 1);

    CHECK(wd.RemoveService("a"));
    CHECK_FALSE(wd.RemoveService("a"));
    CHECK_FALSE(wd.GetServiceStatus("a").has_value());

    const auto status = wd.GetStatus();
    CHECK_FALSE(status.running);
    CHECK(status.defaultTimeout == 42s);
    CHECK(status.services.empty());
}

TEST_CASE("Watchdog background thread polls and stops promptly")
{
    sup::WatchdogConfig cfg;
    cfg.checkInterval = 10ms;
    sup::Watchdog wd(cfg);

    auto svc = std::make_shared<FlagService>();
    wd.AddService("svc", svc, 60s);

    CHECK(wd.Start());
    CHECK(wd.IsRunning());
    CHECK(wd.Start()); // already running

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (wd.GetStatus().stats.checks < 3 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);
    CHECK(wd.GetStatus().stats.checks >= 3);
    CHECK(wd.GetStatus().stats.startTime.has_value());

    const auto before = std::chrono::steady_clock::now();
    wd.Stop();
    CHECK(std::chrono::steady_clock::now() - before < 1s);
    CHECK_FALSE(wd.IsRunning());

    CHECK_NOTHROW(wd.Stop()); // idempotent
    CHECK(svc->starts == 0);
}

namespace {

// Thread-safe counters for tests that run the real poll thread.
struct SharedService {
    std::atomic<int>  starts{0};
    std::atomic<int>  stops{0};
    std::atomic<bool> healthy{true};
    mutable std::atomic<bool> probing{false};
    std::chrono::milliseconds probeDelay{0};

    bool Start()
    {
        ++starts;
        return true;
    }
    void Stop() { ++stops; }
    bool IsRunning() const
    {
        probing = true;
        if (probeDelay > 0ms)
            std::this_thread::sleep_for(probeDelay);
        return healthy.load();
    }
};

} // namespace

TEST_CASE("Watchdog stopped during the grace period does not start the service")
{
    LogCapture logs;
    sup::WatchdogConfig cfg;
    cfg.checkInterval = 10ms;
    cfg.restartGrace  = 2s;
    sup::Watchdog wd(cfg);

    auto svc = std::make_shared<SharedService>();
    svc->healthy = false;
    wd.AddService("down", svc, 60s);

    REQUIRE(wd.Start());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (svc->stops.load() == 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);
    REQUIRE(svc->stops.load() == 1); // inside the grace period now

    const auto before = std::chrono::steady_clock::now();
    wd.Stop();
    CHECK(std::chrono::steady_clock::now() - before < 1s);

    CHECK(svc->starts.load() == 0);
    CHECK(wd.GetServiceStatus("down")->restartCount == 0);
    CHECK(wd.GetStatus().stats.restarts == 0);
    CHECK(logs.Count("info", "cancelled") == 1);
}

TEST_CASE("Watchdog destroyed while a probe is stuck leaves the poll thread safe")
{
    sup::WatchdogConfig cfg;
    cfg.checkInterval = 10ms;
    cfg.joinTimeout   = 50ms;
    auto wd = std::make_unique<sup::Watchdog>(cfg);

    auto svc = std::make_shared<SharedService>();
    svc->probeDelay = 300ms;
    wd->AddService("slow", svc, 60s);

    REQUIRE(wd->Start());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!svc->probing.load() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);
    REQUIRE(svc->probing.load());

    // Stop() gives up after joinTimeout and detaches the thread mid-probe.
    wd.reset();

    // The detached thread finishes its probe on state it co-owns, then exits
    // and releases the registry (and with it the service callbacks).
    deadline = std::chrono::steady_clock::now() + 3s;
    while (svc.use_count() > 1 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);
    CHECK(svc.use_count() == 1);
    CHECK(svc->starts.load() == 0);
}
