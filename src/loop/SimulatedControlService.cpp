// src/loop/SimulatedControlService.cpp
#include "alimante/loop/SimulatedControlService.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace alimante::loop {

namespace {

void ReadChannel(const json& section, const char* key, SimulatedChannel& out)
{
    const auto it = section.find(key);
    if (it == section.end() || !it->is_object())
        return;

    if (const auto b = it->find("base"); b != it->end() && b->is_number())
        out.base = b->get<double>();
    if (const auto a = it->find("amplitude"); a != it->end() && a->is_number())
        out.amplitude = std::abs(a->get<double>());
}

} // namespace

SimulationProfile SimulationProfile::FromJson(const json& section)
{
    SimulationProfile p;
    if (!section.is_object())
        return p;

    if (const auto it = section.find("period_cycles"); it != section.end() && it->is_number_integer())
        p.periodCycles = static_cast<std::uint32_t>(std::clamp<std::int64_t>(it->get<std::int64_t>(), 2, 1'000'000));

    ReadChannel(section, "temperature", p.temperature);
    ReadChannel(section, "humidity", p.humidity);
    ReadChannel(section, "air_quality", p.airQuality);
    ReadChannel(section, "water_level", p.waterLevel);
    return p;
}

SimulatedControlService::SimulatedControlService(SimulationProfile profile)
    : m_profile(profile)
{
}

bool SimulatedControlService::Initialize()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_initialized = true;
    spdlog::info("SimulatedControl: initialized (period {} cycles)", m_profile.periodCycles);
    return true;
}

bool SimulatedControlService::Start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized)
        return false;
    m_running = true;
    ++m_starts;
    spdlog::info("SimulatedControl: started");
    return true;
}

void SimulatedControlService::Stop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running)
        spdlog::info("SimulatedControl: stopped");
    m_running = false;
}

void SimulatedControlService::Update()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running)
        ++m_step;
}

double SimulatedControlService::Sample(const SimulatedChannel& ch) const
{
    const double phase = 2.0 * std::numbers::pi * static_cast<double>(m_step % m_profile.periodCycles)
                       / static_cast<double>(m_profile.periodCycles);
    return ch.base + ch.amplitude * std::sin(phase);
}

json SimulatedControlService::GetSensorData()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return json{
        {"dht22", {
            {"temperature", Sample(m_profile.temperature)},
            {"humidity", Sample(m_profile.humidity)},
        }},
        {"air_quality", {{"aqi", std::max(0.0, Sample(m_profile.airQuality))}}},
        {"water_level", {{"level", std::clamp(Sample(m_profile.waterLevel), 0.0, 100.0)}}},
    };
}

json SimulatedControlService::GetSystemStatus() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return json{
        {"controller", "simulated"},
        {"running", m_running},
        {"step", m_step},
        {"starts", m_starts},
    };
}

bool SimulatedControlService::IsRunning() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

ControlServiceFactory MakeSimulatedControlFactory()
{
    return [](const config::SystemConfig& cfg, events::EventBus&) -> std::shared_ptr<ControlService> {
        const auto it = cfg.main.find("simulation");
        const SimulationProfile profile =
            it != cfg.main.end() ? SimulationProfile::FromJson(*it) : SimulationProfile{};
        return std::make_shared<SimulatedControlService>(profile);
    };
}

} // namespace alimante::loop
