// src/events/EventBus.cpp
#include "alimante/events/EventBus.hpp"

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <exception>
#include <utility>

namespace alimante::events {

EventBus::EventBus()
    : m_started(std::chrono::steady_clock::now())
{
}

HandlerId EventBus::AddLocked(std::string_view type, HandlerId id, Invoker invoker)
{
    auto it = m_handlers.find(type);
    if (it == m_handlers.end())
        it = m_handlers.emplace(std::string(type), std::vector<Entry>{}).first;

    it->second.push_back(Entry{id, std::make_shared<Invoker>(std::move(invoker))});
    m_handlersRegistered.fetch_add(1, std::memory_order_relaxed);
    return id;
}

HandlerId EventBus::Subscribe(std::string_view type, Handler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const HandlerId id = AddLocked(type, m_nextId++, [fn = std::move(handler)](const json& payload) {
        fn(payload);
        return true;
    });
    spdlog::debug("EventBus: handler {} subscribed to '{}'", id, type);
    return id;
}

std::size_t EventBus::Unsubscribe(std::string_view type, std::optional<HandlerId> id)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto it = m_handlers.find(type);
    if (it == m_handlers.end())
        return 0;

    if (!id) {
        const std::size_t removed = it->second.size();
        m_handlers.erase(it);
        spdlog::debug("EventBus: all {} handlers removed from '{}'", removed, type);
        return removed;
    }

    auto& entries = it->second;
    for (auto e = entries.begin(); e != entries.end(); ++e) {
        if (e->id == *id) {
            entries.erase(e);
            if (entries.empty())
                m_handlers.erase(it);
            spdlog::debug("EventBus: handler {} removed from '{}'", *id, type);
            return 1;
        }
    }
    return 0;
}

HandlerId EventBus::SubscribeOnce(std::string_view type, Handler handler)
{
    auto fired = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lock(m_mutex);
    const HandlerId id = m_nextId++;

    Invoker wrapper = [this, fired, id, key = std::string(type), inner = std::move(handler)](const json& payload) {
        if (fired->exchange(true))
            return false;
        Unsubscribe(key, id);
        inner(payload);
        return true;
    };

    return AddLocked(type, id, std::move(wrapper));
}

void EventBus::Emit(std::string_view type, const json& payload)
{
    m_eventsEmitted.fetch_add(1, std::memory_order_relaxed);

    std::vector<std::shared_ptr<Invoker>> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto it = m_handlers.find(type);
        if (it != m_handlers.end()) {
            snapshot.reserve(it->second.size());
            for (const auto& e : it->second)
                snapshot.push_back(e.fn);
        }
    }

    for (const auto& fn : snapshot) {
        try {
            if ((*fn)(payload))
                m_handlersInvoked.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& ex) {
            m_errors.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("EventBus: handler for '{}' threw: {}", type, ex.what());
        } catch (...) {
            m_errors.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("EventBus: handler for '{}' threw a non-standard exception", type);
        }
    }

    spdlog::trace("EventBus: '{}' dispatched to {} handler(s)", type, snapshot.size());
}

std::optional<json> EventBus::WaitFor(std::string_view type, std::chrono::milliseconds timeout)
{
    struct WaitState {
        std::mutex              mutex;
        std::condition_variable cv;
        std::optional<json>     payload;
    };
    auto state = std::make_shared<WaitState>();

    const HandlerId id = SubscribeOnce(type, [state](const json& payload) {
        {
            std::lock_guard<std::mutex> lk(state->mutex);
            state->payload = payload;
        }
        state->cv.notify_all();
    });

    std::unique_lock<std::mutex> lk(state->mutex);
    if (!state->cv.wait_for(lk, timeout, [&] { return state->payload.has_value(); })) {
        lk.unlock();
        Unsubscribe(type, id);
        spdlog::warn("EventBus: timed out after {} ms waiting for '{}'", timeout.count(), type);
        return std::nullopt;
    }
    return std::move(state->payload);
}

std::size_t EventBus::HandlerCount(std::string_view type) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_handlers.find(type);
    return it == m_handlers.end() ? 0 : it->second.size();
}

std::size_t EventBus::HandlerCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t total = 0;
    for (const auto& [_, entries] : m_handlers)
        total += entries.size();
    return total;
}

std::vector<std::string> EventBus::RegisteredTypes() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    out.reserve(m_handlers.size());
    for (const auto& [type, _] : m_handlers)
        out.push_back(type);
    return out;
}

EventBusStats EventBus::Stats() const
{
    EventBusStats s;
    s.eventsEmitted      = m_eventsEmitted.load(std::memory_order_relaxed);
    s.handlersInvoked    = m_handlersInvoked.load(std::memory_order_relaxed);
    s.handlersRegistered = m_handlersRegistered.load(std::memory_order_relaxed);
    s.errors             = m_errors.load(std::memory_order_relaxed);
    s.uptimeSeconds      = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_started).count();

    std::lock_guard<std::mutex> lock(m_mutex);
    s.registeredTypes = m_handlers.size();
    for (const auto& [_, entries] : m_handlers)
        s.totalHandlers += entries.size();
    return s;
}

void EventBus::Clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers.clear();
    spdlog::info("EventBus: all handlers cleared");
}

} // namespace alimante::events
