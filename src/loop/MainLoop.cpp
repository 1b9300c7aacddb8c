// src/loop/MainLoop.cpp
#include "alimante/loop/MainLoop.hpp"

#include "alimante/prof/Profiling.hpp"
#include "alimante/safety/SafetyService.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>
#include <thread>
#include <utility>

namespace alimante::loop {

namespace {

std::atomic<MainLoop*> g_signalTarget{nullptr};

extern "C" void OnTerminationSignal(int /*sig*/)
{
    if (MainLoop* loop = g_signalTarget.load(std::memory_order_acquire))
        loop->RequestStop();
}

} // namespace

const char* ToString(LoopState state) noexcept
{
    switch (state) {
    case LoopState::Stopped:      return "stopped";
    case LoopState::Initializing: return "initializing";
    case LoopState::Running:      return "running";
    case LoopState::Stopping:     return "stopping";
    }
    return "unknown";
}

MainLoop::MainLoop(events::EventBus& bus,
                   MainLoopConfig cfg,
                   ControlServiceFactory factory,
                   safety::SafetyService* safety,
                   NowFn now,
                   SleepFn sleep)
    : m_bus(bus)
    , m_cfg(std::move(cfg))
    , m_factory(std::move(factory))
    , m_safety(safety)
    , m_now(std::move(now))
    , m_sleep(std::move(sleep))
{
    if (!m_now)
        m_now = [] { return Clock::now(); };
    if (!m_sleep)
        m_sleep = [](Clock::duration d) { std::this_thread::sleep_for(d); };
}

MainLoop::~MainLoop()
{
    MainLoop* self = this;
    g_signalTarget.compare_exchange_strong(self, nullptr);
    Stop();
}

bool MainLoop::Initialize()
{
    if (m_control)
        return true;

    m_state.store(LoopState::Initializing, std::memory_order_release);
    spdlog::info("MainLoop: initializing (config dir {})", m_cfg.configDir.string());

    m_system = config::LoadSystemConfig(m_cfg.configDir);

    std::shared_ptr<ControlService> control;
    try {
        if (m_factory)
            control = m_factory(m_system, m_bus);
    } catch (const std::exception& ex) {
        spdlog::error("MainLoop: control service construction failed: {}", ex.what());
    }

    if (!control) {
        spdlog::error("MainLoop: no control service available");
        m_state.store(LoopState::Stopped, std::memory_order_release);
        return false;
    }

    if (!control->Initialize()) {
        spdlog::error("MainLoop: control service failed to initialize");
        m_state.store(LoopState::Stopped, std::memory_order_release);
        return false;
    }

    m_control = std::move(control);
    spdlog::info("MainLoop: initialized");
    return true;
}

bool MainLoop::Start()
{
    if (IsRunning())
        return true;

    if (!Initialize())
        return false;

    if (!m_control->Start()) {
        spdlog::error("MainLoop: control service failed to start");
        m_state.store(LoopState::Stopped, std::memory_order_release);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        m_stats.startTime = std::chrono::system_clock::now();
    }
    m_lastCycleTime = m_now();
    m_state.store(LoopState::Running, std::memory_order_release);

    spdlog::info("MainLoop: running (interval {} ms)", m_cfg.loopInterval.count());
    return true;
}

bool MainLoop::Run()
{
    if (!Start()) {
        spdlog::error("MainLoop: startup failed");
        return false;
    }

    RunUntilStopRequested();
    Stop();
    return true;
}

void MainLoop::RunUntilStopRequested()
{
    while (IsRunning() && !StopRequested()) {
        if (Poll() == PollResult::Failed)
            m_sleep(m_cfg.errorBackoff);
        m_sleep(m_cfg.pollGranularity);
    }

    if (StopRequested())
        spdlog::info("MainLoop: stop requested");
}

PollResult MainLoop::Poll()
{
    if (!IsRunning())
        return PollResult::NotDue;

    const auto now = m_now();
    if (now - m_lastCycleTime < m_cfg.loopInterval)
        return PollResult::NotDue;

    m_lastCycleTime = now;

    try {
        ExecuteCycle();
        return PollResult::Completed;
    } catch (const std::exception& ex) {
        spdlog::error("MainLoop: cycle failed: {}", ex.what());
    } catch (...) {
        spdlog::error("MainLoop: cycle failed with a non-standard exception");
    }

    std::lock_guard<std::mutex> lock(m_statsMutex);
    ++m_stats.errors;
    return PollResult::Failed;
}

void MainLoop::ExecuteCycle()
{
    ALIMANTE_ZONE("MainLoop::Cycle");

    m_control->Update();

    if (m_safety) {
        const json snapshot = m_control->GetSensorData();
        m_safety->CheckSafetyLimits(snapshot);
    }

    const auto     at = std::chrono::system_clock::now();
    std::uint64_t  cycle = 0;
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        cycle = ++m_stats.cycles;
        m_stats.lastCycle = at;
    }

    spdlog::debug("MainLoop: cycle {}", cycle);
    m_bus.Emit(events::kMainLoopCycle, json{{"cycle", cycle}, {"timestamp", safety::ToUnixSeconds(at)}});
}

void MainLoop::Stop()
{
    LoopState expected = LoopState::Running;
    if (!m_state.compare_exchange_strong(expected, LoopState::Stopping)) {
        if (expected == LoopState::Initializing)
            m_state.store(LoopState::Stopped, std::memory_order_release);
        return;
    }

    spdlog::info("MainLoop: stopping");
    if (m_control) {
        try {
            m_control->Stop();
        } catch (const std::exception& ex) {
            spdlog::error("MainLoop: control service stop failed: {}", ex.what());
        }
    }

    m_state.store(LoopState::Stopped, std::memory_order_release);
    m_stopRequested.store(false, std::memory_order_release);

    const LoopStats s = Stats();
    spdlog::info("MainLoop: stopped after {} cycles ({} errors)", s.cycles, s.errors);
}

void MainLoop::Cleanup()
{
    Stop();
    if (!m_control)
        return;

    try {
        m_control->Cleanup();
    } catch (const std::exception& ex) {
        spdlog::error("MainLoop: control service cleanup failed: {}", ex.what());
    }
    m_control.reset();
    spdlog::info("MainLoop: cleaned up");
}

void MainLoop::InstallSignalHandlers()
{
    g_signalTarget.store(this, std::memory_order_release);
    std::signal(SIGINT, OnTerminationSignal);
    std::signal(SIGTERM, OnTerminationSignal);
}

LoopStats MainLoop::Stats() const
{
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

json MainLoop::GetStatus() const
{
    const LoopStats s = Stats();

    json stats{
        {"cycles", s.cycles},
        {"errors", s.errors},
        {"start_time", s.startTime ? json(safety::ToUnixSeconds(*s.startTime)) : json()},
        {"last_cycle", s.lastCycle ? json(safety::ToUnixSeconds(*s.lastCycle)) : json()},
    };
    if (s.startTime) {
        stats["uptime"] = std::chrono::duration<double>(std::chrono::system_clock::now() - *s.startTime).count();
    }

    return json{
        {"state", ToString(State())},
        {"loop_interval", std::chrono::duration<double>(m_cfg.loopInterval).count()},
        {"stats", std::move(stats)},
        {"system_status", m_control ? m_control->GetSystemStatus() : json()},
    };
}

} // namespace alimante::loop
