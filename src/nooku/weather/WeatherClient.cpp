#include "nooku/weather/WeatherClient.hpp"

#include "core/Log.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <sstream>

namespace nooku::weather {

namespace {

using json = nlohmann::json;

struct CurlEasyDeleter {
    void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

void EnsureCurlGlobalInit()
{
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            LOG_ERROR("curl_global_init failed");
    });
}

std::size_t WriteCallback(char* contents, std::size_t size, std::size_t nmemb, void* userdata)
{
    const std::size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(contents, total);
    return total;
}

template <typename T>
bool SetOpt(CURL* h, CURLoption option, T value, WeatherError& err)
{
    if (const CURLcode res = curl_easy_setopt(h, option, value); res != CURLE_OK)
    {
        err = {WeatherError::Code::Network, std::string("curl_easy_setopt failed: ") + curl_easy_strerror(res)};
        return false;
    }
    return true;
}

} // namespace

const char* WeatherErrorName(WeatherError::Code code) noexcept
{
    switch (code)
    {
    case WeatherError::Code::Network: return "Network";
    case WeatherError::Code::HttpStatus: return "HttpStatus";
    case WeatherError::Code::MalformedPayload: return "MalformedPayload";
    case WeatherError::Code::MissingCredential: return "MissingCredential";
    }
    return "?";
}

std::expected<WeatherReport, WeatherError> ParseOpenWeatherPayload(std::string_view body)
{
    const json j = json::parse(body.begin(), body.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded())
        return std::unexpected(WeatherError{WeatherError::Code::MalformedPayload, "response is not JSON"});

    const auto it = j.find("weather");
    if (it == j.end() || !it->is_array() || it->empty())
        return std::unexpected(WeatherError{WeatherError::Code::MalformedPayload, "missing weather[]"});

    const json& first = (*it)[0];
    if (!first.is_object())
        return std::unexpected(WeatherError{WeatherError::Code::MalformedPayload, "weather[0] is not an object"});

    const auto id = first.find("id");
    if (id == first.end() || !id->is_number_integer())
        return std::unexpected(WeatherError{WeatherError::Code::MalformedPayload, "weather[0].id missing or not an integer"});

    const bool inRange = id->is_number_unsigned()
                             ? id->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                             : id->get<std::int64_t>() >= std::numeric_limits<int>::min()
                                   && id->get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!inRange)
        return std::unexpected(WeatherError{WeatherError::Code::MalformedPayload, "weather[0].id out of range"});

    WeatherReport report;
    report.conditionCode = id->get<int>();
    if (const auto desc = first.find("description"); desc != first.end() && desc->is_string())
        report.description = desc->get<std::string>();
    return report;
}

OpenWeatherClient::OpenWeatherClient(std::string apiUrl, std::chrono::seconds timeout)
    : m_apiUrl(std::move(apiUrl))
    , m_timeout(timeout)
{
    if (!m_apiUrl.empty() && m_apiUrl.back() != '/')
        m_apiUrl.push_back('/');
    EnsureCurlGlobalInit();
}

OpenWeatherClient::~OpenWeatherClient() = default;

std::string OpenWeatherClient::BuildRequestUrl(const Location& loc, std::string_view apiKey) const
{
    std::ostringstream oss;
    oss.precision(9);
    oss << m_apiUrl << "weather?lat=" << loc.latitude << "&lon=" << loc.longitude << "&appid=" << apiKey;
    return oss.str();
}

std::expected<WeatherReport, WeatherError>
OpenWeatherClient::FetchConditionCode(const Location& loc, std::string_view apiKey)
{
    if (apiKey.empty())
        return std::unexpected(WeatherError{WeatherError::Code::MissingCredential, "no weather API key configured"});

    CurlEasy handle(curl_easy_init());
    if (!handle)
        return std::unexpected(WeatherError{WeatherError::Code::Network, "curl_easy_init() failed"});

    const std::string url = BuildRequestUrl(loc, apiKey);
    std::string body;
    WeatherError err;

    if (!SetOpt(handle.get(), CURLOPT_URL, url.c_str(), err) ||
        !SetOpt(handle.get(), CURLOPT_WRITEFUNCTION, &WriteCallback, err) ||
        !SetOpt(handle.get(), CURLOPT_WRITEDATA, static_cast<void*>(&body), err) ||
        !SetOpt(handle.get(), CURLOPT_TIMEOUT, static_cast<long>(m_timeout.count()), err) ||
        !SetOpt(handle.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(m_timeout.count()), err) ||
        !SetOpt(handle.get(), CURLOPT_NOSIGNAL, 1L, err) ||
        !SetOpt(handle.get(), CURLOPT_USERAGENT, "nooku/1.0", err))
        return std::unexpected(std::move(err));

    if (const CURLcode res = curl_easy_perform(handle.get()); res != CURLE_OK)
        return std::unexpected(WeatherError{WeatherError::Code::Network,
                                            std::string("curl_easy_perform failed: ") + curl_easy_strerror(res)});

    long status = 0;
    if (curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status) != CURLE_OK)
        LOG_WARN("weather request: response code unavailable");
    if (status >= 400)
        return std::unexpected(WeatherError{WeatherError::Code::HttpStatus,
                                            "weather endpoint returned HTTP " + std::to_string(status)});

    return ParseOpenWeatherPayload(body);
}

} // namespace nooku::weather
