#pragma once
// include/alimante/supervision/Supervisable.hpp
//
// What the watchdog needs from a service, resolved once at registration:
//   - a health probe: GetStatus().isRunning, else IsRunning(), else none
//     (assume healthy)
//   - optional Stop() and Start() -> bool used for restarts
//
// MakeSupervised() inspects the service type at compile time, so any class
// exposing some subset of those members can be registered without deriving
// from anything.

#include <nlohmann/json.hpp>

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace alimante::supervision {

struct ServiceStatus {
    bool           isRunning = false;
    nlohmann::json details   = nlohmann::json::object();
};

struct StatusProbe      { std::function<ServiceStatus()> getStatus; };
struct RunningFlagProbe { std::function<bool()> isRunning; };
struct NoProbe          {};

using HealthProbe = std::variant<NoProbe, StatusProbe, RunningFlagProbe>;

struct SupervisedService {
    HealthProbe             probe;
    std::function<void()>   stop;  // empty: nothing to stop
    std::function<bool()>   start; // empty: cannot be restarted
};

template <class T>
concept HasStatusProbe = requires(const T& t) {
    { t.GetStatus().isRunning } -> std::convertible_to<bool>;
};

template <class T>
concept HasRunningFlag = requires(const T& t) {
    { t.IsRunning() } -> std::convertible_to<bool>;
};

template <class T>
concept HasStop = requires(T& t) { t.Stop(); };

template <class T>
concept HasStart = requires(T& t) {
    { t.Start() } -> std::convertible_to<bool>;
};

// The returned callbacks share ownership of `service`.
template <class T>
[[nodiscard]] SupervisedService MakeSupervised(std::shared_ptr<T> service)
{
    SupervisedService out;

    if constexpr (HasStatusProbe<T>) {
        out.probe = StatusProbe{[service]() -> ServiceStatus {
            auto st = service->GetStatus();
            if constexpr (std::is_same_v<std::decay_t<decltype(st)>, ServiceStatus>)
                return st;
            else
                return ServiceStatus{static_cast<bool>(st.isRunning), nlohmann::json::object()};
        }};
    } else if constexpr (HasRunningFlag<T>) {
        out.probe = RunningFlagProbe{[service] { return static_cast<bool>(service->IsRunning()); }};
    }

    if constexpr (HasStop<T>)
        out.stop = [service] { service->Stop(); };

    if constexpr (HasStart<T>)
        out.start = [service] { return static_cast<bool>(service->Start()); };

    return out;
}

} // namespace alimante::supervision
