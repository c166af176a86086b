#include "nooku/weather/WeatherCache.hpp"

#include "core/Log.h"

#include <algorithm>

namespace nooku::weather {

WeatherCache::WeatherCache(IWeatherClient& client,
                           Location location,
                           std::string apiKey,
                           const runtime::IClock& clock,
                           std::chrono::minutes cooldown)
    : m_client(client)
    , m_location(location)
    , m_apiKey(std::move(apiKey))
    , m_clock(clock)
    , m_cooldown(cooldown)
{
}

std::expected<WeatherClass, WeatherError> WeatherCache::Fetch()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto now = m_clock.Now();
    const auto sinceLast = now - m_lastFetch;
    LOG_TRACE("Time since last call to weather API: %lld min.",
              static_cast<long long>(std::chrono::duration_cast<std::chrono::minutes>(sinceLast).count()));

    if (sinceLast <= m_cooldown)
        return m_cached;

    LOG_INFO("Calling weather API for %.6f, %.6f", m_location.latitude, m_location.longitude);
    m_lastFetch = std::max(m_lastFetch, now);
    ++m_attempts;

    auto report = m_client.FetchConditionCode(m_location, m_apiKey);
    if (!report)
        return std::unexpected(std::move(report.error()));

    m_cached = ClassifyConditionCode(report->conditionCode);
    LOG_INFO("Weather id %d (%s) -> %s", report->conditionCode,
             report->description.empty() ? "-" : report->description.c_str(),
             WeatherClassName(m_cached));
    return m_cached;
}

WeatherClass WeatherCache::Cached() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cached;
}

WeatherClass WeatherCache::Playing() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_playing;
}

void WeatherCache::MarkPlaying(WeatherClass w)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_playing = w;
}

runtime::TimePoint WeatherCache::LastFetchTime() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastFetch;
}

std::size_t WeatherCache::FetchAttempts() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_attempts;
}

} // namespace nooku::weather
