#include "test_support/Fakes.h"

#include <atomic>
#include <ctime>
#include <stdexcept>
#include <system_error>

namespace nooku::test {

runtime::TimePoint At(int hour, int minute, int second)
{
    using namespace std::chrono;
    const sys_days day = year{2024} / March / 10;
    return time_point_cast<runtime::WallClock::duration>(day + hours(hour) + minutes(minute) + seconds(second));
}

runtime::TimePoint ManualClock::Now() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_now;
}

std::tm ManualClock::ToLocal(runtime::TimePoint tp) const
{
    const std::time_t t = runtime::WallClock::to_time_t(tp);
    std::tm out{};
    if (!gmtime_r(&t, &out))
        throw std::runtime_error("gmtime_r failed");
    return out;
}

void ManualClock::Set(runtime::TimePoint tp)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_now = tp;
}

void ManualClock::Advance(std::chrono::milliseconds d)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_now += d;
}

FakeWeatherClient::Result FakeWeatherClient::FetchConditionCode(const weather::Location&, std::string_view apiKey)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_calls;
    m_lastKey = std::string(apiKey);
    if (!m_script.empty())
    {
        Result r = std::move(m_script.front());
        m_script.pop_front();
        return r;
    }
    return m_fallback;
}

void FakeWeatherClient::SetCode(int conditionCode)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fallback = weather::WeatherReport{conditionCode, "scripted"};
}

void FakeWeatherClient::SetError(weather::WeatherError::Code code)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fallback = std::unexpected(weather::WeatherError{code, "scripted failure"});
}

void FakeWeatherClient::Push(Result r)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_script.push_back(std::move(r));
}

std::size_t FakeWeatherClient::Calls() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_calls;
}

std::string FakeWeatherClient::LastApiKey() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastKey;
}

std::expected<audio::TrackPtr, audio::DecodeError> FakeDecoder::Decode(const std::filesystem::path& resource)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_decoded.push_back(resource);
    if (m_failing.count(resource) != 0)
        return std::unexpected(audio::DecodeError{audio::DecodeError::Code::ReadFailed, "scripted decode failure"});

    auto track = std::make_shared<audio::DecodedTrack>();
    track->source = resource;
    track->payload = {0x49, 0x44, 0x33};
    return audio::TrackPtr(std::move(track));
}

void FakeDecoder::FailOn(const std::filesystem::path& resource)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failing.insert(resource);
}

std::size_t FakeDecoder::Calls() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_decoded.size();
}

std::vector<std::filesystem::path> FakeDecoder::Decoded() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_decoded;
}

std::uint64_t FakeSink::PlayOnly(audio::TrackPtr track)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_current = std::move(track);
    return ++m_plays;
}

void FakeSink::SetVolume(float volume)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_volume = volume;
}

void FakeSink::EnableLoop(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loop = enabled;
}

void FakeSink::Stop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_current.reset();
    ++m_stops;
}

void FakeSink::SetLoopListener(LoopListener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

bool FakeSink::FireLoop()
{
    LoopListener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listener = m_listener;
    }
    if (!listener)
        return false;
    listener();
    return true;
}

audio::TrackPtr FakeSink::Current() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
}

std::string FakeSink::CurrentName() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current ? m_current->source.filename().string() : std::string();
}

std::size_t FakeSink::Plays() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_plays;
}

std::size_t FakeSink::Stops() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stops;
}

float FakeSink::Volume() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_volume;
}

bool FakeSink::Looping() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loop;
}

bool FakeSink::HasListener() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<bool>(m_listener);
}

bool RecordingNotifier::Post(const std::string& channel, const std::string& text, notify::NotifySeverity)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_failing)
        return false;
    m_messages.emplace_back(channel, text);
    return true;
}

void RecordingNotifier::SetFailing(bool failing)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failing = failing;
}

std::vector<std::pair<std::string, std::string>> RecordingNotifier::Messages() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_messages;
}

bool RecordingNotifier::Contains(const std::string& text) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [channel, msg] : m_messages)
        if (msg == text)
            return true;
    return false;
}

std::filesystem::path SongPath(const std::string& key)
{
    return std::filesystem::path(key + " song.mp3");
}

rotation::SongCatalog CatalogOf(std::initializer_list<const char*> keys)
{
    std::vector<rotation::CatalogEntry> entries;
    for (const char* k : keys)
        entries.push_back(rotation::CatalogEntry{k, SongPath(k)});

    auto catalog = rotation::SongCatalog::FromEntries(entries, rotation::DuplicatePolicy::Reject);
    if (!catalog)
        throw std::runtime_error(catalog.error().message);
    return std::move(*catalog);
}

rotation::SongCatalog FullCatalog()
{
    std::vector<rotation::CatalogEntry> entries;
    for (int digit = 0; digit < 3; ++digit)
    {
        for (int hour = 0; hour < 24; ++hour)
        {
            std::string key = std::to_string(digit) + (hour < 10 ? "0" : "") + std::to_string(hour);
            entries.push_back(rotation::CatalogEntry{key, SongPath(key)});
        }
    }

    auto catalog = rotation::SongCatalog::FromEntries(entries, rotation::DuplicatePolicy::Reject);
    if (!catalog)
        throw std::runtime_error(catalog.error().message);
    return std::move(*catalog);
}

std::filesystem::path MakeTempDir(const std::string& tag)
{
    static std::atomic<int> counter{0};

    std::error_code ec;
    std::filesystem::path base = std::filesystem::temp_directory_path(ec);
    if (ec || base.empty())
        base = std::filesystem::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    std::filesystem::path dir = base / ("nooku_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(dir, ec);
    if (ec)
        throw std::runtime_error("cannot create " + dir.string() + ": " + ec.message());
    return dir;
}

} // namespace nooku::test
