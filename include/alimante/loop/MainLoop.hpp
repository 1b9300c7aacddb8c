#pragma once
// include/alimante/loop/MainLoop.hpp
//
// Fixed-interval scheduler for the control thread.
//
// Run() polls every `pollGranularity` and executes a cycle once at least
// `loopInterval` has elapsed since the previous one. Late cycles coalesce:
// after a stall, one cycle runs and the schedule restarts from there, so
// cycles never run more often than `loopInterval`. The first cycle runs one
// interval after Start().
//
// A cycle is: ControlService::Update(), then (with a SafetyService attached)
// GetSensorData() -> CheckSafetyLimits(), then `main_loop_cycle` on the bus.
// An exception inside a cycle is logged and counted, and the loop backs off
// for `errorBackoff` before polling again.
//
// Lifecycle: Stopped -> Initializing -> Running -> Stopping -> Stopped.
// Initialize/Start/Run/Stop/Cleanup belong to the owning thread; RequestStop()
// may be called from any thread or a signal handler.

#include "alimante/config/Config.hpp"
#include "alimante/events/EventBus.hpp"
#include "alimante/loop/ControlService.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace alimante::safety { class SafetyService; }

namespace alimante::loop {

enum class LoopState {
    Stopped,
    Initializing,
    Running,
    Stopping
};

[[nodiscard]] const char* ToString(LoopState state) noexcept;

struct MainLoopConfig {
    std::filesystem::path     configDir = "config";
    std::chrono::milliseconds loopInterval{1000};
    std::chrono::milliseconds pollGranularity{100};
    std::chrono::milliseconds errorBackoff{1000};
};

struct LoopStats {
    std::uint64_t cycles = 0;
    std::uint64_t errors = 0;
    std::optional<std::chrono::system_clock::time_point> startTime;
    std::optional<std::chrono::system_clock::time_point> lastCycle;
};

enum class PollResult {
    NotDue,
    Completed,
    Failed
};

class MainLoop {
public:
    using Clock   = std::chrono::steady_clock;
    using NowFn   = std::function<Clock::time_point()>;
    using SleepFn = std::function<void(Clock::duration)>;

    // `safety` is optional and not owned. `now`/`sleep` default to the steady
    // clock and std::this_thread::sleep_for.
    MainLoop(events::EventBus& bus,
             MainLoopConfig cfg,
             ControlServiceFactory factory,
             safety::SafetyService* safety = nullptr,
             NowFn now = {},
             SleepFn sleep = {});
    ~MainLoop();

    MainLoop(const MainLoop&) = delete;
    MainLoop& operator=(const MainLoop&) = delete;

    // Loads the layered configuration and builds + initializes the control
    // service. Idempotent once it has succeeded.
    bool Initialize();

    // Initializes if needed and starts the control service.
    bool Start();

    // Start(), then schedule cycles until Stop() or RequestStop(). Returns
    // false only when startup failed.
    bool Run();

    // Schedules cycles on an already started loop until Stop() or
    // RequestStop(), leaving the control service running. Lets the caller
    // stop whatever supervises the service before calling Stop().
    void RunUntilStopRequested();

    // Idempotent.
    void Stop();

    // Stop() and release the control service.
    void Cleanup();

    // Async-signal-safe: only sets a flag that Run() observes.
    void RequestStop() noexcept { m_stopRequested.store(true, std::memory_order_release); }
    [[nodiscard]] bool StopRequested() const noexcept { return m_stopRequested.load(std::memory_order_acquire); }

    // One scheduling step: runs a cycle if one is due.
    PollResult Poll();

    // SIGINT / SIGTERM -> RequestStop() on this loop.
    void InstallSignalHandlers();

    [[nodiscard]] LoopState State() const noexcept { return m_state.load(std::memory_order_acquire); }
    [[nodiscard]] bool IsRunning() const noexcept { return State() == LoopState::Running; }
    [[nodiscard]] LoopStats Stats() const;
    [[nodiscard]] json GetStatus() const;

    [[nodiscard]] std::shared_ptr<ControlService> Control() const { return m_control; }
    [[nodiscard]] const config::SystemConfig& Configuration() const noexcept { return m_system; }

private:
    void ExecuteCycle();

    events::EventBus&      m_bus;
    const MainLoopConfig   m_cfg;
    ControlServiceFactory  m_factory;
    safety::SafetyService* m_safety = nullptr;
    NowFn                  m_now;
    SleepFn                m_sleep;

    config::SystemConfig            m_system;
    std::shared_ptr<ControlService> m_control;

    std::atomic<LoopState> m_state{LoopState::Stopped};
    std::atomic<bool>      m_stopRequested{false};
    Clock::time_point      m_lastCycleTime{};

    mutable std::mutex m_statsMutex;
    LoopStats          m_stats;
};

} // namespace alimante::loop
