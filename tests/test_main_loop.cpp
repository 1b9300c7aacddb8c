// tests/test_main_loop.cpp
//
// Coverage for include/alimante/loop/MainLoop.hpp and the simulated control
// service. The loop runs on a ManualClock: every sleep advances it, so several
// seconds of scheduling take no wall-clock time.

#include <doctest/doctest.h>

#include "alimante/events/EventBus.hpp"
#include "alimante/loop/ControlService.hpp"
#include "alimante/loop/MainLoop.hpp"
#include "alimante/loop/SimulatedControlService.hpp"
#include "alimante/safety/SafetyService.hpp"
#include "alimante/supervision/Watchdog.hpp"

#include "test_support/TestSupport.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <vector>

namespace loop = alimante::loop;
namespace events = alimante::events;
namespace safety = alimante::safety;
namespace sup = alimante::supervision;
using alimante::events::EventBus;
using alimante::events::json;
using alimante::test::ManualClock;
using alimante::test::TempDir;
using namespace std::chrono_literals;

namespace {

class FakeControl final : public loop::ControlService {
public:
    bool Initialize() override { ++initCalls; return initOk; }
    bool Start() override { ++startCalls; running = startOk; return startOk; }
    void Stop() override { ++stopCalls; running = false; }
    void Update() override
    {
        ++updateCalls;
        if (failingUpdates > 0) {
            --failingUpdates;
            throw std::runtime_error("sensor bus timeout");
        }
    }
    json GetSensorData() override { ++sensorReads; return sensor; }
    json GetSystemStatus() const override { return json{{"fake", true}}; }
    bool IsRunning() const override { return running; }
    void Cleanup() override { ++cleanupCalls; Stop(); }

    bool initOk  = true;
    bool startOk = true;
    bool running = false;
    int  failingUpdates = 0;
    json sensor = json::object();

    int initCalls = 0, startCalls = 0, stopCalls = 0, updateCalls = 0, sensorReads = 0, cleanupCalls = 0;
};

loop::ControlServiceFactory FactoryFor(const std::shared_ptr<FakeControl>& control)
{
    return [control](const alimante::config::SystemConfig&, EventBus&) -> std::shared_ptr<loop::ControlService> {
        return control;
    };
}

// Drives MainLoop::Run() on a manual clock and requests a stop once
// `runFor` of simulated time has elapsed.
struct LoopHarness {
    TempDir                 configDir;
    ManualClock             clock;
    std::vector<std::chrono::milliseconds> sleeps;
    loop::MainLoop*         target = nullptr;
    std::chrono::milliseconds runFor{0};

    loop::MainLoopConfig Config(std::chrono::milliseconds interval = 1000ms) const
    {
        loop::MainLoopConfig cfg;
        cfg.configDir       = configDir.Path();
        cfg.loopInterval    = interval;
        cfg.pollGranularity = 100ms;
        cfg.errorBackoff    = 1000ms;
        return cfg;
    }

    loop::MainLoop::NowFn Now()
    {
        return [this] { return clock.now; };
    }

    loop::MainLoop::SleepFn Sleep()
    {
        return [this](std::chrono::steady_clock::duration d) {
            sleeps.push_back(std::chrono::duration_cast<std::chrono::milliseconds>(d));
            clock.Advance(d);
            if (target && clock.Elapsed() >= runFor)
                target->RequestStop();
        };
    }
};

} // namespace

TEST_CASE("MainLoop runs exactly two cycles in 2.5 s at a 1 s interval")
{
    LoopHarness h;
    EventBus bus;
    auto control = std::make_shared<FakeControl>();

    std::vector<json> cycles;
    bus.Subscribe(events::kMainLoopCycle, [&](const json& p) { cycles.push_back(p); });

    loop::MainLoop ml(bus, h.Config(), FactoryFor(control), nullptr, h.Now(), h.Sleep());
    h.target = &ml;
    h.runFor = 2500ms;

    CHECK(ml.Run());

    CHECK(h.sleeps.size() == 25); // 25 polling ticks of 100 ms
    CHECK(control->updateCalls == 2);
    REQUIRE(cycles.size() == 2);
    CHECK(cycles[0]["cycle"] == 1);
    CHECK(cycles[1]["cycle"] == 2);
    CHECK(cycles[0]["timestamp"].is_number_float());

    CHECK(ml.State() == loop::LoopState::Stopped);
    CHECK(control->stopCalls == 1);
    CHECK(ml.Stats().cycles == 2);
    CHECK(ml.Stats().errors == 0);
}

TEST_CASE("MainLoop coalesces late cycles instead of catching up")
{
    LoopHarness h;
    EventBus bus;
    auto control = std::make_shared<FakeControl>();
    loop::MainLoop ml(bus, h.Config(), FactoryFor(control), nullptr, h.Now(), h.Sleep());

    REQUIRE(ml.Start());
    CHECK(ml.Poll() == loop::PollResult::NotDue);

    h.clock.Advance(5s); // stalled for five intervals
    CHECK(ml.Poll() == loop::PollResult::Completed);
    CHECK(ml.Poll() == loop::PollResult::NotDue);

    h.clock.Advance(999ms);
    CHECK(ml.Poll() == loop::PollResult::NotDue);
    h.clock.Advance(1ms);
    CHECK(ml.Poll() == loop::PollResult::Completed);

    CHECK(control->updateCalls == 2);
    ml.Stop();
}

TEST_CASE("MainLoop survives a failing cycle and backs off")
{
    LoopHarness h;
    EventBus bus;
    auto control = std::make_shared<FakeControl>();
    control->failingUpdates = 1;

    int emitted = 0;
    bus.Subscribe(events::kMainLoopCycle, [&](const json&) { ++emitted; });

    loop::MainLoop ml(bus, h.Config(), FactoryFor(control), nullptr, h.Now(), h.Sleep());
    h.target = &ml;
    h.runFor = 3500ms;

    CHECK(ml.Run());

    // t=1.0 fails (+1 s backoff), t=2.1 and t=3.1 succeed.
    CHECK(control->updateCalls == 3);
    CHECK(emitted == 2);
    CHECK(ml.Stats().errors == 1);
    CHECK(ml.Stats().cycles == 2);

    const auto backoffs = std::count(h.sleeps.begin(), h.sleeps.end(), 1000ms);
    CHECK(backoffs == 1);
}

TEST_CASE("MainLoop feeds sensor snapshots to the safety service")
{
    LoopHarness h;
    EventBus bus;
    safety::SafetyService guard(bus, safety::SafetyLimits{});

    int stops = 0;
    int alerts = 0;
    bus.Subscribe(events::kEmergencyStop, [&](const json&) { ++stops; });
    bus.Subscribe(events::kSafetyAlert, [&](const json&) { ++alerts; });

    auto control = std::make_shared<FakeControl>();
    control->sensor = json{{"dht22", {{"temperature", 50.0}, {"humidity", 60.0}}}};

    loop::MainLoop ml(bus, h.Config(), FactoryFor(control), &guard, h.Now(), h.Sleep());
    h.target = &ml;
    h.runFor = 3500ms;
    CHECK(ml.Run());

    CHECK(control->sensorReads == 3);
    CHECK(alerts == 3);
    CHECK(stops == 1);
    CHECK(guard.IsEmergencyStopped());
}

TEST_CASE("MainLoop without a safety service does not read sensors")
{
    LoopHarness h;
    EventBus bus;
    auto control = std::make_shared<FakeControl>();
    loop::MainLoop ml(bus, h.Config(), FactoryFor(control), nullptr, h.Now(), h.Sleep());
    h.target = &ml;
    h.runFor = 1500ms;

    CHECK(ml.Run());
    CHECK(control->updateCalls == 1);
    CHECK(control->sensorReads == 0);
}

TEST_CASE("MainLoop lifecycle: initialize, start, stop, cleanup")
{
    LoopHarness h;
    EventBus bus;
    auto control = std::make_shared<FakeControl>();
    loop::MainLoop ml(bus, h.Config(), FactoryFor(control), nullptr, h.Now(), h.Sleep());

    CHECK(ml.State() == loop::LoopState::Stopped);
    CHECK(ml.Poll() == loop::PollResult::NotDue);

    CHECK(ml.Initialize());
    CHECK(ml.State() == loop::LoopState::Initializing);
    CHECK(ml.Initialize()); // idempotent
    CHECK(control->initCalls == 1);

    CHECK(ml.Start());
    CHECK(ml.IsRunning());
    CHECK(control->running);
    CHECK(ml.Start()); // already running
    CHECK(control->startCalls == 1);

    const json status = ml.GetStatus();
    CHECK(status["state"] == "running");
    CHECK(status["loop_interval"].get<double>() == doctest::Approx(1.0));
    CHECK(status["system_status"]["fake"] == true);

    ml.Stop();
    ml.Stop();
    CHECK(ml.State() == loop::LoopState::Stopped);
    CHECK(control->stopCalls == 1);

    ml.Cleanup();
    CHECK(control->cleanupCalls == 1);
    CHECK(ml.Control() == nullptr);
    CHECK(ml.GetStatus()["system_status"].is_null());
}

TEST_CASE("MainLoop startup failures")
{
    LoopHarness h;
    EventBus bus;

    SUBCASE("factory returns nothing")
    {
        loop::MainLoop ml(bus, h.Config(),
                          [](const alimante::config::SystemConfig&, EventBus&) { return std::shared_ptr<loop::ControlService>(); },
                          nullptr, h.Now(), h.Sleep());
        CHECK_FALSE(ml.Run());
        CHECK(ml.State() == loop::LoopState::Stopped);
    }

    SUBCASE("factory throws")
    {
        loop::MainLoop ml(bus, h.Config(),
                          [](const alimante::config::SystemConfig&, EventBus&) -> std::shared_ptr<loop::ControlService> {
                              throw std::runtime_error("no GPIO");
                          },
                          nullptr, h.Now(), h.Sleep());
        CHECK_FALSE(ml.Initialize());
    }

    SUBCASE("control service refuses to start")
    {
        auto control = std::make_shared<FakeControl>();
        control->startOk = false;
        loop::MainLoop ml(bus, h.Config(), FactoryFor(control), nullptr, h.Now(), h.Sleep());
        CHECK_FALSE(ml.Start());
        CHECK(ml.State() == loop::LoopState::Stopped);
        CHECK(h.sleeps.empty());
    }
}

TEST_CASE("MainLoop stop requested before Run exits without cycling")
{
    LoopHarness h;
    EventBus bus;
    auto control = std::make_shared<FakeControl>();
    loop::MainLoop ml(bus, h.Config(), FactoryFor(control), nullptr, h.Now(), h.Sleep());

    ml.RequestStop();
    CHECK(ml.Run());
    CHECK(control->updateCalls == 0);
    CHECK(ml.State() == loop::LoopState::Stopped);
    CHECK_FALSE(ml.StopRequested()); // consumed by Stop()
}

TEST_CASE("MainLoop passes the layered configuration to the factory")
{
    LoopHarness h;
    h.configDir.Write("config.json", R"({"simulation": {"temperature": {"base": 30.0, "amplitude": 0.0}}})");

    EventBus bus;
    loop::MainLoop ml(bus, h.Config(), loop::MakeSimulatedControlFactory(), nullptr, h.Now(), h.Sleep());
    REQUIRE(ml.Start());

    CHECK(ml.Configuration().main.contains("simulation"));
    const json data = ml.Control()->GetSensorData();
    CHECK(data["dht22"]["temperature"].get<double>() == doctest::Approx(30.0));
    ml.Cleanup();
}

TEST_CASE("SimulatedControlService produces readings the safety service understands")
{
    loop::SimulationProfile profile;
    profile.periodCycles = 4;
    profile.temperature  = {25.0, 2.0};
    loop::SimulatedControlService sim(profile);

    CHECK_FALSE(sim.Start()); // not initialized
    REQUIRE(sim.Initialize());
    REQUIRE(sim.Start());
    CHECK(sim.IsRunning());

    sim.Update(); // quarter period: sin = 1
    const auto snap = safety::NormalizeSnapshot(sim.GetSensorData());
    CHECK(snap.errors.empty());
    REQUIRE(snap.readings.temperature);
    CHECK(*snap.readings.temperature == doctest::Approx(27.0));
    REQUIRE(snap.readings.humidity);
    REQUIRE(snap.readings.airQuality);
    REQUIRE(snap.readings.waterLevel);

    CHECK(sim.GetSystemStatus()["step"] == 1);
    sim.Stop();
    CHECK_FALSE(sim.IsRunning());

    const auto parsed = loop::SimulationProfile::FromJson(json{
        {"period_cycles", 10},
        {"humidity", {{"base", 70.0}, {"amplitude", -3.0}}},
    });
    CHECK(parsed.periodCycles == 10);
    CHECK(parsed.humidity.base == doctest::Approx(70.0));
    CHECK(parsed.humidity.amplitude == doctest::Approx(3.0));
    CHECK(parsed.temperature.base == doctest::Approx(26.0));
}

TEST_CASE("MainLoop run-until-stop keeps the control service up for its supervisor")
{
    LoopHarness h;
    EventBus bus;
    auto control = std::make_shared<FakeControl>();
    loop::MainLoop ml(bus, h.Config(), FactoryFor(control), nullptr, h.Now(), h.Sleep());
    REQUIRE(ml.Initialize());

    sup::Watchdog wd(sup::WatchdogConfig{},
                     [&h] { return h.clock.now; },
                     [&h](std::chrono::steady_clock::duration d) { h.clock.Advance(d); });
    wd.AddService("control", ml.Control());
    bus.Subscribe(events::kMainLoopCycle, [&wd](const json&) { wd.Heartbeat("control"); });

    // Before Start() the service looks down; supervising it now would restart it.
    CHECK_FALSE(wd.GetServiceStatus("control")->healthy);

    REQUIRE(ml.Start());
    wd.CheckServices();
    CHECK(control->startCalls == 1);
    CHECK(control->stopCalls == 0);
    CHECK(wd.GetServiceStatus("control")->restartCount == 0);

    h.target = &ml;
    h.runFor = 2500ms;
    ml.RunUntilStopRequested();

    CHECK(control->updateCalls == 2);
    CHECK(ml.IsRunning());
    CHECK(control->running);
    CHECK(control->stopCalls == 0);

    wd.CheckServices();
    CHECK(wd.GetServiceStatus("control")->restartCount == 0);

    ml.Stop();
    CHECK(ml.State() == loop::LoopState::Stopped);
    CHECK(control->stopCalls == 1);
    CHECK_FALSE(ml.StopRequested());
}

TEST_CASE("MainLoop stops on SIGTERM once its signal handlers are installed")
{
    const auto previousTerm = std::signal(SIGTERM, SIG_DFL);
    const auto previousInt  = std::signal(SIGINT, SIG_DFL);

    LoopHarness h;
    EventBus bus;
    auto control = std::make_shared<FakeControl>();

    int raised = 0;
    auto ml = std::make_unique<loop::MainLoop>(
        bus, h.Config(), FactoryFor(control), nullptr, h.Now(),
        [&](std::chrono::steady_clock::duration d) {
            h.clock.Advance(d);
            if (raised == 0 && h.clock.Elapsed() >= 1500ms) {
                ++raised;
                std::raise(SIGTERM);
            }
        });
    ml->InstallSignalHandlers();

    CHECK(ml->Run());
    CHECK(raised == 1);
    CHECK(ml->State() == loop::LoopState::Stopped);
    CHECK(control->updateCalls == 1);
    CHECK(control->stopCalls == 1);

    // Signals after shutdown only set the flag again.
    std::raise(SIGTERM);
    std::raise(SIGINT);
    CHECK(ml->StopRequested());
    CHECK(ml->State() == loop::LoopState::Stopped);
    CHECK(control->stopCalls == 1);

    // A destroyed loop is no longer the signal target.
    ml.reset();
    loop::MainLoop other(bus, h.Config(), FactoryFor(control), nullptr, h.Now(), h.Sleep());
    std::raise(SIGTERM);
    CHECK_FALSE(other.StopRequested());

    std::signal(SIGTERM, previousTerm);
    std::signal(SIGINT, previousInt);
}
