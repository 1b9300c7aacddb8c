#pragma once
// include/alimante/supervision/Watchdog.hpp
//
// Background supervisor. A single poll thread walks the registry every
// `checkInterval`; a service whose heartbeat is older than its timeout, or
// whose probe reports it unhealthy, is restarted (Stop, grace period, Start)
// up to `maxRestarts` times. After that it stays registered but is no longer
// restarted. Restarts are serialized on the poll thread, so a slow restart
// delays the checks of the remaining services in that poll. Stop() during a
// grace period cancels that restart.

#include "alimante/supervision/Supervisable.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace alimante::supervision {

struct WatchdogConfig {
    std::chrono::milliseconds checkInterval{30'000};
    std::chrono::milliseconds defaultTimeout{300'000};
    std::chrono::milliseconds restartGrace{2000};
    int                       maxRestarts = 3;
    std::chrono::milliseconds joinTimeout{5000};
};

struct WatchdogStats {
    std::uint64_t restarts = 0;
    std::uint64_t checks   = 0;
    std::optional<std::chrono::system_clock::time_point> lastRestart;
    std::optional<std::chrono::system_clock::time_point> startTime;
};

struct ServiceReport {
    std::string                           name;
    std::chrono::steady_clock::time_point lastHeartbeat{};
    std::chrono::milliseconds             timeout{};
    int                                   restartCount = 0;
    int                                   maxRestarts  = 0;
    bool                                  healthy      = false;
};

struct WatchdogStatus {
    bool                      running = false;
    std::chrono::milliseconds defaultTimeout{};
    std::chrono::milliseconds checkInterval{};
    std::vector<std::string>  services;
    WatchdogStats             stats;
};

enum class RestartOutcome {
    Restarted,
    BudgetExhausted,
    StartFailed,
    NotRestartable,
    Cancelled // watchdog stopped during the grace period
};

class Watchdog {
public:
    using Clock   = std::chrono::steady_clock;
    using NowFn   = std::function<Clock::time_point()>;
    using SleepFn = std::function<void(Clock::duration)>;

    // `now` and `sleep` default to the steady clock and an interruptible wait
    // on the stop signal; tests inject their own.
    explicit Watchdog(WatchdogConfig cfg = {}, NowFn now = {}, SleepFn sleep = {});
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    // Re-registering a name replaces the previous record.
    void AddService(std::string name, SupervisedService service,
                    std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                    std::optional<int> maxRestarts = std::nullopt);

    template <class T>
    void AddService(std::string name, std::shared_ptr<T> service,
                    std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                    std::optional<int> maxRestarts = std::nullopt)
    {
        AddService(std::move(name), MakeSupervised(std::move(service)), timeout, maxRestarts);
    }

    bool RemoveService(std::string_view name);

    // No-op for unknown names.
    void Heartbeat(std::string_view name);

    bool Start();

    // Waits up to `joinTimeout` for the poll thread. A thread stuck inside a
    // service is detached; it owns the shared state and exits on its own.
    void Stop();
    [[nodiscard]] bool IsRunning() const noexcept;

    // One pass over the registry. The poll thread calls this every interval;
    // exposed for callers that drive supervision themselves.
    void CheckServices();

    [[nodiscard]] WatchdogStatus GetStatus() const;
    [[nodiscard]] std::optional<ServiceReport> GetServiceStatus(std::string_view name) const;

private:
    // Registry, stats and stop signal. Shared with the poll thread so that a
    // detached thread never outlives what it touches.
    struct State;

    std::shared_ptr<State> m_state;
    std::thread            m_thread;
    std::future<void>      m_exited;
};

} // namespace alimante::supervision
