#pragma once
// include/alimante/events/EventBus.hpp
//
// Thread-safe publish/subscribe dispatcher. Every component talks through the
// bus instead of holding references to each other.
//
// Dispatch is synchronous: Emit() runs every handler on the caller's thread, in
// subscription order, and only returns once all of them ran (or threw). The
// handler list is copied under the lock and invoked with the lock released, so
// a handler may subscribe/unsubscribe without deadlocking. A slow handler still
// stalls the emitter; there is no per-handler timeout.

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace alimante::events {

using json = nlohmann::json;

// Well-known event types. The bus accepts any string; these are the ones the
// runtime itself publishes.
inline constexpr std::string_view kMainLoopCycle   = "main_loop_cycle";
inline constexpr std::string_view kSafetyAlert     = "safety_alert";
inline constexpr std::string_view kEmergencyStop   = "emergency_stop";
inline constexpr std::string_view kEmergencyResume = "emergency_resume";

using Handler   = std::function<void(const json& payload)>;
using HandlerId = std::uint64_t;

inline constexpr HandlerId kInvalidHandler = 0;

struct EventBusStats {
    std::uint64_t eventsEmitted      = 0;
    std::uint64_t handlersInvoked    = 0; // successful invocations only
    std::uint64_t handlersRegistered = 0;
    std::uint64_t errors             = 0; // handler exceptions
    double        uptimeSeconds      = 0.0;
    std::size_t   registeredTypes    = 0;
    std::size_t   totalHandlers      = 0;
};

class EventBus {
public:
    EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    // Appends `handler` to the list for `type`. Duplicates are allowed; each
    // call gets its own id.
    HandlerId Subscribe(std::string_view type, Handler handler);

    // Removes the handler with `id`, or every handler for `type` when `id` is
    // empty. Returns the number of handlers removed.
    std::size_t Unsubscribe(std::string_view type, std::optional<HandlerId> id = std::nullopt);

    // Handler that removes itself before its first invocation runs. Concurrent
    // emits never invoke it twice.
    HandlerId SubscribeOnce(std::string_view type, Handler handler);

    void Emit(std::string_view type, const json& payload = json());

    // Blocks the calling thread until `type` is emitted or `timeout` elapses.
    // Returns the payload, or nullopt on timeout.
    [[nodiscard]] std::optional<json> WaitFor(std::string_view type, std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t HandlerCount(std::string_view type) const;
    [[nodiscard]] std::size_t HandlerCount() const;
    [[nodiscard]] std::vector<std::string> RegisteredTypes() const;
    [[nodiscard]] EventBusStats Stats() const;

    // Drops every handler for every type.
    void Clear();

private:
    // Returns false when the handler declined to run (a once-handler that
    // already fired); only true results count as invocations.
    using Invoker = std::function<bool(const json& payload)>;

    struct Entry {
        HandlerId                id = kInvalidHandler;
        std::shared_ptr<Invoker> fn;
    };

    HandlerId AddLocked(std::string_view type, HandlerId id, Invoker invoker);

    mutable std::mutex                              m_mutex;
    std::map<std::string, std::vector<Entry>, std::less<>> m_handlers;
    HandlerId                                       m_nextId = 1;

    std::atomic<std::uint64_t> m_eventsEmitted{0};
    std::atomic<std::uint64_t> m_handlersInvoked{0};
    std::atomic<std::uint64_t> m_handlersRegistered{0};
    std::atomic<std::uint64_t> m_errors{0};

    const std::chrono::steady_clock::time_point m_started;
};

} // namespace alimante::events
