// src/supervision/Watchdog.cpp
#include "alimante/supervision/Watchdog.hpp"
#include "alimante/prof/Profiling.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <type_traits>
#include <utility>

namespace alimante::supervision {

namespace {

long long ToMs(std::chrono::steady_clock::duration d)
{
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
}

} // namespace

struct Watchdog::State {
    struct Record {
        SupervisedService         service;
        std::chrono::milliseconds timeout{};
        Clock::time_point         lastHeartbeat{};
        int                       restartCount = 0;
        int                       maxRestarts  = 0;
    };

    State(WatchdogConfig c, NowFn n, SleepFn s)
        : cfg(c)
        , now(std::move(n))
        , sleep(std::move(s))
    {
        if (!now)
            now = [] { return Clock::now(); };
        // Raw pointer: the function lives inside this State.
        if (!sleep)
            sleep = [this](Clock::duration d) { InterruptibleSleep(d); };
    }

    void InterruptibleSleep(Clock::duration d)
    {
        std::unique_lock<std::mutex> lk(wakeMutex);
        wake.wait_for(lk, d, [this] { return stopRequested; });
    }

    [[nodiscard]] bool StopRequested()
    {
        std::lock_guard<std::mutex> lk(wakeMutex);
        return stopRequested;
    }

    [[nodiscard]] bool ProbeHealthy(const std::string& name, const Record& record) const;
    RestartOutcome RestartService(const std::string& name, const std::shared_ptr<Record>& record);
    void CheckServices();
    void PollLoop();

    const WatchdogConfig cfg;
    NowFn                now;
    SleepFn              sleep;

    mutable std::mutex                                          mutex;
    std::map<std::string, std::shared_ptr<Record>, std::less<>> services;
    WatchdogStats                                               stats;

    std::atomic<bool>       running{false};
    std::mutex              wakeMutex;
    std::condition_variable wake;
    bool                    stopRequested = false; // guarded by wakeMutex
};

void Watchdog::State::PollLoop()
{
    ALIMANTE_THREAD_NAME("watchdog");
    while (running.load(std::memory_order_acquire)) {
        try {
            CheckServices();
        } catch (const std::exception& ex) {
            spdlog::error("Watchdog: poll failed: {}", ex.what());
        }

        std::unique_lock<std::mutex> lk(wakeMutex);
        wake.wait_for(lk, cfg.checkInterval, [this] { return stopRequested; });
    }
}

bool Watchdog::State::ProbeHealthy(const std::string& name, const Record& record) const
{
    try {
        return std::visit([](const auto& probe) -> bool {
            using P = std::decay_t<decltype(probe)>;
            if constexpr (std::is_same_v<P, StatusProbe>)
                return probe.getStatus().isRunning;
            else if constexpr (std::is_same_v<P, RunningFlagProbe>)
                return probe.isRunning();
            else
                return true;
        }, record.service.probe);
    } catch (const std::exception& ex) {
        spdlog::error("Watchdog: health probe of '{}' threw: {}", name, ex.what());
        return false;
    }
}

void Watchdog::State::CheckServices()
{
    std::vector<std::pair<std::string, std::shared_ptr<Record>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex);
        snapshot.reserve(services.size());
        for (const auto& [name, record] : services)
            snapshot.emplace_back(name, record);
    }

    for (const auto& [name, record] : snapshot) {
        if (StopRequested())
            break;

        const auto t = now();

        Clock::time_point         last;
        std::chrono::milliseconds timeout;
        {
            std::lock_guard<std::mutex> lock(mutex);
            last    = record->lastHeartbeat;
            timeout = record->timeout;
        }

        if (t - last > timeout) {
            spdlog::warn("Watchdog: '{}' missed its heartbeat ({} ms since last, timeout {} ms)",
                         name, ToMs(t - last), timeout.count());
            RestartService(name, record);
        } else if (!ProbeHealthy(name, *record)) {
            spdlog::warn("Watchdog: '{}' reports unhealthy", name);
            RestartService(name, record);
        } else {
            spdlog::debug("Watchdog: '{}' OK", name);
        }
    }

    std::lock_guard<std::mutex> lock(mutex);
    ++stats.checks;
}

RestartOutcome Watchdog::State::RestartService(const std::string& name, const std::shared_ptr<Record>& record)
{
    int restarts = 0;
    int budget   = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        restarts = record->restartCount;
        budget   = record->maxRestarts;
    }

    if (restarts >= budget) {
        spdlog::error("Watchdog: '{}' reached its restart budget ({}), leaving it unsupervised", name, budget);
        return RestartOutcome::BudgetExhausted;
    }

    const SupervisedService& svc = record->service;
    if (!svc.start) {
        spdlog::warn("Watchdog: '{}' has no start operation, cannot restart", name);
        return RestartOutcome::NotRestartable;
    }

    spdlog::info("Watchdog: restarting '{}' (attempt {}/{})", name, restarts + 1, budget);

    try {
        if (svc.stop)
            svc.stop();

        sleep(cfg.restartGrace);

        if (StopRequested()) {
            spdlog::info("Watchdog: restart of '{}' cancelled, watchdog is stopping", name);
            return RestartOutcome::Cancelled;
        }

        if (!svc.start()) {
            spdlog::error("Watchdog: '{}' failed to start, will retry next poll", name);
            return RestartOutcome::StartFailed;
        }
    } catch (const std::exception& ex) {
        spdlog::error("Watchdog: restart of '{}' threw: {}", name, ex.what());
        return RestartOutcome::StartFailed;
    }

    const auto t = now();
    {
        std::lock_guard<std::mutex> lock(mutex);
        ++record->restartCount;
        record->lastHeartbeat = t;
        ++stats.restarts;
        stats.lastRestart = std::chrono::system_clock::now();
    }
    spdlog::info("Watchdog: '{}' restarted", name);
    return RestartOutcome::Restarted;
}

Watchdog::Watchdog(WatchdogConfig cfg, NowFn now, SleepFn sleep)
    : m_state(std::make_shared<State>(cfg, std::move(now), std::move(sleep)))
{
}

Watchdog::~Watchdog()
{
    Stop();
}

void Watchdog::AddService(std::string name, SupervisedService service,
                          std::optional<std::chrono::milliseconds> timeout,
                          std::optional<int> maxRestarts)
{
    State& st = *m_state;

    auto record = std::make_shared<State::Record>();
    record->service       = std::move(service);
    record->timeout       = timeout.value_or(st.cfg.defaultTimeout);
    record->lastHeartbeat = st.now();
    record->restartCount  = 0;
    record->maxRestarts   = maxRestarts.value_or(st.cfg.maxRestarts);

    const auto timeoutMs = record->timeout.count();
    const int  budget    = record->maxRestarts;
    {
        std::lock_guard<std::mutex> lock(st.mutex);
        st.services.insert_or_assign(name, std::move(record));
    }
    spdlog::info("Watchdog: supervising '{}' (timeout {} ms, max {} restarts)", name, timeoutMs, budget);
}

bool Watchdog::RemoveService(std::string_view name)
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    const auto it = m_state->services.find(name);
    if (it == m_state->services.end())
        return false;
    m_state->services.erase(it);
    spdlog::info("Watchdog: '{}' removed from supervision", name);
    return true;
}

void Watchdog::Heartbeat(std::string_view name)
{
    const auto now = m_state->now();
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (const auto it = m_state->services.find(name); it != m_state->services.end()) {
        it->second->lastHeartbeat = now;
        spdlog::trace("Watchdog: heartbeat from '{}'", name);
    }
}

bool Watchdog::Start()
{
    if (m_state->running.exchange(true)) {
        spdlog::warn("Watchdog: already running");
        return true;
    }

    {
        std::lock_guard<std::mutex> lk(m_state->wakeMutex);
        m_state->stopRequested = false;
    }
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stats.startTime = std::chrono::system_clock::now();
    }

    std::promise<void> exited;
    m_exited = exited.get_future();
    m_thread = std::thread([state = m_state, done = std::move(exited)]() mutable {
        state->PollLoop();
        done.set_value();
    });

    spdlog::info("Watchdog: started (check interval {} ms)", m_state->cfg.checkInterval.count());
    return true;
}

void Watchdog::Stop()
{
    if (!m_state->running.exchange(false))
        return;

    spdlog::info("Watchdog: stopping");
    {
        std::lock_guard<std::mutex> lk(m_state->wakeMutex);
        m_state->stopRequested = true;
    }
    m_state->wake.notify_all();

    if (m_thread.joinable()) {
        if (m_exited.wait_for(m_state->cfg.joinTimeout) == std::future_status::ready) {
            m_thread.join();
        } else {
            // A probe or restart is stuck inside a service; cancellation is cooperative only.
            spdlog::error("Watchdog: poll thread did not exit within {} ms, detaching it",
                          m_state->cfg.joinTimeout.count());
            m_thread.detach();
        }
    }
    spdlog::info("Watchdog: stopped");
}

bool Watchdog::IsRunning() const noexcept
{
    return m_state->running.load(std::memory_order_acquire);
}

void Watchdog::CheckServices()
{
    m_state->CheckServices();
}

WatchdogStatus Watchdog::GetStatus() const
{
    WatchdogStatus s;
    s.running        = IsRunning();
    s.defaultTimeout = m_state->cfg.defaultTimeout;
    s.checkInterval  = m_state->cfg.checkInterval;

    std::lock_guard<std::mutex> lock(m_state->mutex);
    s.stats = m_state->stats;
    s.services.reserve(m_state->services.size());
    for (const auto& [name, _] : m_state->services)
        s.services.push_back(name);
    return s;
}

std::optional<ServiceReport> Watchdog::GetServiceStatus(std::string_view name) const
{
    std::shared_ptr<State::Record> record;
    ServiceReport report;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        const auto it = m_state->services.find(name);
        if (it == m_state->services.end())
            return std::nullopt;
        record = it->second;

        report.name          = it->first;
        report.lastHeartbeat = record->lastHeartbeat;
        report.timeout       = record->timeout;
        report.restartCount  = record->restartCount;
        report.maxRestarts   = record->maxRestarts;
    }
    report.healthy = m_state->ProbeHealthy(report.name, *record);
    return report;
}

} // namespace alimante::supervision
